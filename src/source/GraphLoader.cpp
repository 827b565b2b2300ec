#include "depviz/source/GraphLoader.h"
#include "depviz/common/Errors.h"
#include "depviz/common/Logger.h"
#include "depviz/common/TextFile.h"

#include <nlohmann/json.hpp>
#include <utility>

using json = nlohmann::ordered_json;

namespace depviz {

DependencyGraph GraphLoader::fromJson(const std::string& jsonStr) {
    json j;
    try {
        j = json::parse(jsonStr);
    } catch (const json::parse_error& e) {
        throw GraphFormatError(std::string("Failed to parse graph JSON: ") + e.what());
    }

    if (!j.is_object()) {
        throw GraphFormatError("Graph description must be a JSON object");
    }

    DependencyGraph graph;
    for (const auto& [package, deps] : j.items()) {
        if (package.empty()) {
            throw GraphFormatError("Graph description contains an empty package name");
        }
        if (!deps.is_array()) {
            throw GraphFormatError("Dependencies of '" + package + "' must be an array");
        }

        PackageList list;
        list.reserve(deps.size());
        for (const auto& dep : deps) {
            if (!dep.is_string() || dep.get<std::string>().empty()) {
                throw GraphFormatError("Dependencies of '" + package +
                                       "' must be non-empty strings, got " + dep.dump());
            }
            list.push_back(dep.get<std::string>());
        }
        graph.setDependencies(package, std::move(list));
    }

    return graph;
}

std::string GraphLoader::toJson(const DependencyGraph& graph) {
    json j = json::object();
    for (const auto& entry : graph) {
        j[entry.package] = entry.dependencies;
    }
    return j.dump(2);
}

DependencyGraph GraphLoader::loadFromFile(const std::string& path) {
    DependencyGraph graph = fromJson(readTextFile(path));
    LOG_DEBUG("Loaded {} packages, {} edges from {}", graph.packageCount(), graph.edgeCount(), path);
    return graph;
}

}  // namespace depviz
