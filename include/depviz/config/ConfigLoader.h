#pragma once

#include "AnalysisConfig.h"

#include <string>

namespace depviz {

/// Loads and validates AnalysisConfig from JSON
///
/// Required fields: package_name, repository_url (non-empty strings),
/// test_repository_mode, ascii_tree_output (booleans).
/// Optional: reverse_mode, graph_export (booleans), output_directory,
/// graph_file (strings).
class ConfigLoader {
public:
    /// @throws ConfigFileNotFoundError if path does not exist
    /// @throws ConfigError for an uncheckable path, unreadable or invalid content
    static AnalysisConfig loadFromFile(const std::string& path);

    /// @throws ConfigError (or a subclass) for malformed or invalid content
    static AnalysisConfig fromJson(const std::string& json);

    /// Content written by --create-sample
    static std::string sampleConfigJson();

    /// @throws IoError if the file cannot be written
    static void writeSampleConfig(const std::string& path);
};

}  // namespace depviz
