#include "depviz/config/AnalysisConfig.h"

namespace depviz {

std::vector<std::pair<std::string, std::string>> AnalysisConfig::parameters() const {
    auto flag = [](bool value) { return std::string(value ? "true" : "false"); };

    std::vector<std::pair<std::string, std::string>> result = {
        {"package_name", packageName},
        {"repository_url", repositoryUrl},
        {"test_repository_mode", flag(testRepositoryMode)},
        {"ascii_tree_output", flag(asciiTreeOutput)},
        {"reverse_mode", flag(reverseMode)},
        {"graph_export", flag(graphExport)},
        {"output_directory", outputDirectory},
    };
    if (graphFile) {
        result.emplace_back("graph_file", *graphFile);
    }
    return result;
}

AnalysisRequest AnalysisConfig::toRequest() const {
    AnalysisRequest request;
    request.packageName = packageName;
    request.useTestMode = testRepositoryMode;
    request.reverseMode = reverseMode;
    request.asciiTreeEnabled = asciiTreeOutput;
    request.graphExportEnabled = graphExport;
    request.outputDirectory = outputDirectory;
    return request;
}

}  // namespace depviz
