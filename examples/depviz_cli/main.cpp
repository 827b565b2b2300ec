#include <depviz/depviz.h>

#include <exception>
#include <iostream>
#include <memory>
#include <string>

using namespace depviz;

namespace {

// Exit codes
constexpr int EXIT_CONFIG_ERROR = 1;
constexpr int EXIT_CYCLE_ERROR = 2;
constexpr int EXIT_IO_ERROR = 3;
constexpr int EXIT_UNKNOWN_ERROR = 1;

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Package dependency graph visualizer (depviz " << versionString() << ")\n\n"
              << "Options:\n"
              << "  -c, --config <path>   Path to config file (default: config.json)\n"
              << "      --create-sample   Create sample config file and exit\n"
              << "      --log-dir <dir>   Also write depviz.log into <dir>\n"
              << "  -h, --help            Show this help\n";
}

void displayParameters(const AnalysisConfig& config) {
    std::cout << "=== Configuration Parameters ===\n";
    for (const auto& [key, value] : config.parameters()) {
        std::cout << key << ": " << value << "\n";
    }
    std::cout << "================================\n";
}

std::unique_ptr<IGraphSource> makeSource(const AnalysisConfig& config) {
    if (config.graphFile) {
        return std::make_unique<StaticGraphSource>(GraphLoader::loadFromFile(*config.graphFile),
                                                   "file " + *config.graphFile);
    }
    return SampleGraphs::forMode(config.testRepositoryMode);
}

int run(const std::string& configPath, const std::string& logDir, bool createSample) {
    try {
        if (!logDir.empty()) {
            Logger::initialize(logDir, true);
        } else {
            Logger::initialize();
        }

        if (createSample) {
            ConfigLoader::writeSampleConfig(configPath);
            std::cout << "Created sample config file: " << configPath << "\n";
            return 0;
        }

        AnalysisConfig config = ConfigLoader::loadFromFile(configPath);
        displayParameters(config);

        AnalysisRequest request = config.toRequest();
        std::cout << "\nAnalyzing package: " << request.packageName << "\n"
                  << "Source: " << config.repositoryUrl << "\n"
                  << "Test mode: " << (request.useTestMode ? "enabled" : "disabled") << "\n"
                  << "Direction: " << directionName(request.direction()) << "\n\n";

        DependencyAnalyzer analyzer(makeSource(config), SampleGraphs::cyclicSource());
        AnalysisReport report = analyzer.analyze(request);
        std::cout << DependencyAnalyzer::formatReport(report);
        return 0;

    } catch (const ConfigFileNotFoundError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        std::cout << "\nTip: use --create-sample to create sample config\n";
        return EXIT_CONFIG_ERROR;
    } catch (const ConfigError& e) {
        std::cerr << "CONFIG ERROR: " << e.what() << "\n";
        return EXIT_CONFIG_ERROR;
    } catch (const CircularDependencyError& e) {
        LOG_ERROR("{}", e.what());
        std::cerr << "DEPENDENCY ERROR: " << e.what() << "\n";
        return EXIT_CYCLE_ERROR;
    } catch (const IoError& e) {
        LOG_ERROR("{}", e.what());
        std::cerr << "I/O ERROR: " << e.what() << "\n";
        return EXIT_IO_ERROR;
    } catch (const GraphFormatError& e) {
        std::cerr << "GRAPH FILE ERROR: " << e.what() << "\n";
        return EXIT_IO_ERROR;
    } catch (const std::exception& e) {
        LOG_ERROR("{}", e.what());
        std::cerr << "UNKNOWN ERROR: " << e.what() << "\n";
        return EXIT_UNKNOWN_ERROR;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string configPath = "config.json";
    std::string logDir;
    bool createSample = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg.find("--config=") == 0) {
            configPath = arg.substr(9);
        } else if (arg == "--create-sample") {
            createSample = true;
        } else if (arg == "--log-dir" && i + 1 < argc) {
            logDir = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return EXIT_CONFIG_ERROR;
        }
    }

    int status = run(configPath, logDir, createSample);
    Logger::flush();
    return status;
}
