#include "depviz/config/ConfigLoader.h"
#include "depviz/config/ConfigErrors.h"
#include "depviz/common/Errors.h"
#include "depviz/common/Logger.h"
#include "depviz/common/TextFile.h"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <system_error>

using json = nlohmann::json;

namespace depviz {

namespace {

std::string displayValue(const json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

const json& requireField(const json& j, const std::string& field) {
    auto it = j.find(field);
    if (it == j.end()) {
        throw MissingConfigFieldError(field);
    }
    return *it;
}

std::string requireNonEmptyString(const json& j, const std::string& field) {
    const json& value = requireField(j, field);
    if (!value.is_string()) {
        throw InvalidConfigError(field, displayValue(value), "must be non-empty string");
    }

    std::string str = value.get<std::string>();
    if (str.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw InvalidConfigError(field, str, "must be non-empty string");
    }
    return str;
}

bool requireBool(const json& j, const std::string& field) {
    const json& value = requireField(j, field);
    if (!value.is_boolean()) {
        throw InvalidConfigError(field, displayValue(value), "must be boolean value");
    }
    return value.get<bool>();
}

bool optionalBool(const json& j, const std::string& field, bool fallback) {
    if (!j.contains(field)) return fallback;
    return requireBool(j, field);
}

}  // namespace

AnalysisConfig ConfigLoader::loadFromFile(const std::string& path) {
    std::error_code ec;
    bool found = std::filesystem::exists(path, ec);
    if (ec) {
        throw ConfigError("Config file reading error: " + path + ": " + ec.message());
    }
    if (!found) {
        throw ConfigFileNotFoundError(path);
    }

    std::string content;
    try {
        content = readTextFile(path);
    } catch (const IoError& e) {
        throw ConfigError(std::string("Config file reading error: ") + e.what());
    }

    AnalysisConfig config = fromJson(content);
    LOG_INFO("Loaded configuration from {}", path);
    return config;
}

AnalysisConfig ConfigLoader::fromJson(const std::string& jsonStr) {
    json j;
    try {
        j = json::parse(jsonStr);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("JSON parsing error: ") + e.what());
    }

    if (!j.is_object()) {
        throw ConfigError("JSON parsing error: configuration must be a JSON object");
    }

    AnalysisConfig config;
    config.packageName = requireNonEmptyString(j, "package_name");
    config.repositoryUrl = requireNonEmptyString(j, "repository_url");
    config.testRepositoryMode = requireBool(j, "test_repository_mode");
    config.asciiTreeOutput = requireBool(j, "ascii_tree_output");

    config.reverseMode = optionalBool(j, "reverse_mode", false);
    config.graphExport = optionalBool(j, "graph_export", false);

    if (j.contains("output_directory")) {
        config.outputDirectory = requireNonEmptyString(j, "output_directory");
    }
    if (j.contains("graph_file")) {
        config.graphFile = requireNonEmptyString(j, "graph_file");
    }

    return config;
}

std::string ConfigLoader::sampleConfigJson() {
    nlohmann::ordered_json j = {
        {"package_name", "A"},
        {"repository_url", "https://github.com/example/repo"},
        {"test_repository_mode", true},
        {"ascii_tree_output", true},
        {"reverse_mode", false},
        {"graph_export", true},
        {"output_directory", "."}
    };
    return j.dump(2) + "\n";
}

void ConfigLoader::writeSampleConfig(const std::string& path) {
    writeTextFile(path, sampleConfigJson());
    LOG_INFO("Created sample config file: {}", path);
}

}  // namespace depviz
