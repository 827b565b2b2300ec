#pragma once

#include "../core/Types.h"

#include <string>

namespace depviz {

/// What to analyze and which outputs to produce
struct AnalysisRequest {
    PackageId packageName;
    bool useTestMode = false;         ///< Selects the sample graph source
    bool reverseMode = false;         ///< Walk dependents instead of dependencies
    bool asciiTreeEnabled = false;
    bool graphExportEnabled = false;
    std::string outputDirectory = ".";  ///< Where the .dot file is written

    Direction direction() const { return reverseMode ? Direction::Reverse : Direction::Forward; }
};

}  // namespace depviz
