#pragma once

#include <string>

namespace depviz {

/// Read a whole file into memory
/// @throws IoError if the file cannot be opened or read
std::string readTextFile(const std::string& path);

/// Write text verbatim, truncating any existing file
/// @throws IoError if the file cannot be opened or fully written
void writeTextFile(const std::string& path, const std::string& text);

}  // namespace depviz
