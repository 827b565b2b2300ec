#pragma once

#include "../core/DependencyGraph.h"

#include <string>

namespace depviz {

/// Reads and writes graph description files
///
/// Format: a JSON object mapping each package name to an array of its direct
/// dependency names. Key order in the file becomes declaration order.
/// @code
/// { "app": ["core", "net"], "net": ["core"], "core": [] }
/// @endcode
class GraphLoader {
public:
    /// Parse a graph description
    /// @throws GraphFormatError on malformed JSON or unexpected value types
    static DependencyGraph fromJson(const std::string& json);

    /// Serialize a graph, preserving key and list order
    static std::string toJson(const DependencyGraph& graph);

    /// Read and parse a graph description file
    /// @throws IoError if the file cannot be read
    /// @throws GraphFormatError if its content is malformed
    static DependencyGraph loadFromFile(const std::string& path);
};

}  // namespace depviz
