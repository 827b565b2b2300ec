#include "depviz/common/TextFile.h"
#include "depviz/common/Errors.h"

#include <fstream>
#include <sstream>

namespace depviz {

std::string readTextFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IoError("Cannot open file for reading: " + path, path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw IoError("Failed to read file: " + path, path);
    }
    return buffer.str();
}

void writeTextFile(const std::string& path, const std::string& text) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw IoError("Cannot open file for writing: " + path, path);
    }

    file << text;
    file.flush();
    if (!file) {
        throw IoError("Failed to write file: " + path, path);
    }
}

}  // namespace depviz
