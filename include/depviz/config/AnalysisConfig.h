#pragma once

#include "../analysis/AnalysisRequest.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace depviz {

/// Settings read from the configuration file
struct AnalysisConfig {
    // Required
    std::string packageName;
    std::string repositoryUrl;        ///< Recorded and displayed; never contacted
    bool testRepositoryMode = false;
    bool asciiTreeOutput = false;

    // Optional
    bool reverseMode = false;
    bool graphExport = false;
    std::string outputDirectory = ".";
    std::optional<std::string> graphFile;  ///< Graph description used instead of the sample

    /// Field name / display value pairs in file order
    std::vector<std::pair<std::string, std::string>> parameters() const;

    AnalysisRequest toRequest() const;
};

}  // namespace depviz
