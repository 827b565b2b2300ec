#include <gtest/gtest.h>
#include <depviz/common/TextFile.h>
#include <depviz/config/ConfigErrors.h>
#include <depviz/config/ConfigLoader.h>

#include <filesystem>

using namespace depviz;

namespace {

const char* kMinimalConfig = R"({
    "package_name": "web",
    "repository_url": "https://example.org/repo",
    "test_repository_mode": false,
    "ascii_tree_output": true
})";

}  // namespace

// ============================================================================
// ConfigLoaderTest - configuration parsing and validation
// ============================================================================

TEST(ConfigLoaderTest, RequiredFieldsOnly_OptionalDefaults) {
    AnalysisConfig config = ConfigLoader::fromJson(kMinimalConfig);

    EXPECT_EQ(config.packageName, "web");
    EXPECT_EQ(config.repositoryUrl, "https://example.org/repo");
    EXPECT_FALSE(config.testRepositoryMode);
    EXPECT_TRUE(config.asciiTreeOutput);
    EXPECT_FALSE(config.reverseMode);
    EXPECT_FALSE(config.graphExport);
    EXPECT_EQ(config.outputDirectory, ".");
    EXPECT_FALSE(config.graphFile.has_value());
}

TEST(ConfigLoaderTest, AllFields) {
    AnalysisConfig config = ConfigLoader::fromJson(R"({
        "package_name": "H",
        "repository_url": "https://example.org/repo",
        "test_repository_mode": true,
        "ascii_tree_output": false,
        "reverse_mode": true,
        "graph_export": true,
        "output_directory": "out",
        "graph_file": "graph.json"
    })");

    EXPECT_TRUE(config.reverseMode);
    EXPECT_TRUE(config.graphExport);
    EXPECT_EQ(config.outputDirectory, "out");
    EXPECT_EQ(config.graphFile, "graph.json");

    AnalysisRequest request = config.toRequest();
    EXPECT_EQ(request.packageName, "H");
    EXPECT_TRUE(request.useTestMode);
    EXPECT_EQ(request.direction(), Direction::Reverse);
    EXPECT_FALSE(request.asciiTreeEnabled);
    EXPECT_TRUE(request.graphExportEnabled);
    EXPECT_EQ(request.outputDirectory, "out");
}

TEST(ConfigLoaderTest, UnknownFieldsIgnored) {
    AnalysisConfig config = ConfigLoader::fromJson(R"({
        "package_name": "web",
        "repository_url": "https://example.org/repo",
        "test_repository_mode": false,
        "ascii_tree_output": true,
        "max_depth": 3
    })");

    EXPECT_EQ(config.packageName, "web");
}

TEST(ConfigLoaderTest, MissingRequiredField) {
    try {
        ConfigLoader::fromJson(R"({
            "package_name": "web",
            "test_repository_mode": false,
            "ascii_tree_output": true
        })");
        FAIL() << "Expected MissingConfigFieldError";
    } catch (const MissingConfigFieldError& e) {
        EXPECT_EQ(e.field(), "repository_url");
        EXPECT_STREQ(e.what(), "Missing required config field: repository_url");
    }
}

TEST(ConfigLoaderTest, EmptyPackageName) {
    try {
        ConfigLoader::fromJson(R"({
            "package_name": "   ",
            "repository_url": "https://example.org/repo",
            "test_repository_mode": false,
            "ascii_tree_output": true
        })");
        FAIL() << "Expected InvalidConfigError";
    } catch (const InvalidConfigError& e) {
        EXPECT_EQ(e.field(), "package_name");
        EXPECT_STREQ(e.what(), "Invalid value '   ' for field 'package_name': must be non-empty string");
    }
}

TEST(ConfigLoaderTest, NonBooleanFlag) {
    try {
        ConfigLoader::fromJson(R"({
            "package_name": "web",
            "repository_url": "https://example.org/repo",
            "test_repository_mode": "yes",
            "ascii_tree_output": true
        })");
        FAIL() << "Expected InvalidConfigError";
    } catch (const InvalidConfigError& e) {
        EXPECT_EQ(e.field(), "test_repository_mode");
        EXPECT_STREQ(e.what(),
                     "Invalid value 'yes' for field 'test_repository_mode': must be boolean value");
    }
}

TEST(ConfigLoaderTest, OptionalFlagMustBeBoolean) {
    EXPECT_THROW(ConfigLoader::fromJson(R"({
        "package_name": "web",
        "repository_url": "https://example.org/repo",
        "test_repository_mode": false,
        "ascii_tree_output": true,
        "reverse_mode": 1
    })"), InvalidConfigError);
}

TEST(ConfigLoaderTest, MalformedJson) {
    try {
        ConfigLoader::fromJson("{\"package_name\": ");
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("JSON parsing error: ", 0), 0);
    }
}

TEST(ConfigLoaderTest, NonObjectDocument) {
    EXPECT_THROW(ConfigLoader::fromJson("[1, 2]"), ConfigError);
}

// --- Files ---

TEST(ConfigLoaderTest, LoadFromFile_NotFound) {
    auto path = std::filesystem::temp_directory_path() / "depviz_missing_config.json";
    std::filesystem::remove(path);

    try {
        ConfigLoader::loadFromFile(path.string());
        FAIL() << "Expected ConfigFileNotFoundError";
    } catch (const ConfigFileNotFoundError& e) {
        EXPECT_EQ(std::string(e.what()), "Config file not found: " + path.string());
    }
}

TEST(ConfigLoaderTest, LoadFromFile_OverlongNameIsReadError) {
    // A 300 character component exceeds NAME_MAX, so the existence check itself fails
    auto path = std::filesystem::temp_directory_path() / std::string(300, 'c');

    try {
        ConfigLoader::loadFromFile(path.string());
        FAIL() << "Expected ConfigError";
    } catch (const ConfigFileNotFoundError&) {
        FAIL() << "Status failure reported as a missing file";
    } catch (const ConfigError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("Config file reading error: ", 0), 0);
    }
}

TEST(ConfigLoaderTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "depviz_config_test.json";
    writeTextFile(path.string(), kMinimalConfig);

    AnalysisConfig config = ConfigLoader::loadFromFile(path.string());
    EXPECT_EQ(config.packageName, "web");

    std::filesystem::remove(path);
}

TEST(ConfigLoaderTest, SampleConfig_LoadsBack) {
    auto path = std::filesystem::temp_directory_path() / "depviz_sample_config.json";
    ConfigLoader::writeSampleConfig(path.string());

    AnalysisConfig config = ConfigLoader::loadFromFile(path.string());
    EXPECT_EQ(config.packageName, "A");
    EXPECT_TRUE(config.testRepositoryMode);
    EXPECT_TRUE(config.asciiTreeOutput);
    EXPECT_FALSE(config.reverseMode);
    EXPECT_TRUE(config.graphExport);
    EXPECT_EQ(config.outputDirectory, ".");

    std::filesystem::remove(path);
}

TEST(ConfigLoaderTest, Parameters_InFileOrder) {
    AnalysisConfig config = ConfigLoader::fromJson(kMinimalConfig);
    auto params = config.parameters();

    ASSERT_EQ(params.size(), 7);
    EXPECT_EQ(params[0], (std::pair<std::string, std::string>{"package_name", "web"}));
    EXPECT_EQ(params[2], (std::pair<std::string, std::string>{"test_repository_mode", "false"}));
    EXPECT_EQ(params[6], (std::pair<std::string, std::string>{"output_directory", "."}));
}
