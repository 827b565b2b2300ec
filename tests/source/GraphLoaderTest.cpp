#include <gtest/gtest.h>
#include <depviz/common/Errors.h>
#include <depviz/common/TextFile.h>
#include <depviz/source/GraphLoader.h>

#include <filesystem>

using namespace depviz;

// ============================================================================
// GraphLoaderTest - graph description file parsing
// ============================================================================

TEST(GraphLoaderTest, FromJson_PreservesKeyOrder) {
    DependencyGraph graph = GraphLoader::fromJson(R"({
        "web": ["http", "json"],
        "http": ["socket"],
        "json": [],
        "socket": []
    })");

    EXPECT_EQ(graph.packages(), (std::vector<PackageId>{"web", "http", "json", "socket"}));
    EXPECT_EQ(graph.dependencies("web"), (PackageList{"http", "json"}));
    EXPECT_EQ(graph.edgeCount(), 3);
}

TEST(GraphLoaderTest, FromJson_UndeclaredDependencyAllowed) {
    DependencyGraph graph = GraphLoader::fromJson(R"({"app": ["libc"]})");

    EXPECT_TRUE(graph.hasDependency("app", "libc"));
    EXPECT_FALSE(graph.hasPackage("libc"));
}

TEST(GraphLoaderTest, FromJson_MalformedJsonThrows) {
    EXPECT_THROW(GraphLoader::fromJson("{\"app\": [\"core\""), GraphFormatError);
}

TEST(GraphLoaderTest, FromJson_RootMustBeObject) {
    EXPECT_THROW(GraphLoader::fromJson("[\"app\"]"), GraphFormatError);
}

TEST(GraphLoaderTest, FromJson_DependenciesMustBeArray) {
    EXPECT_THROW(GraphLoader::fromJson(R"({"app": "core"})"), GraphFormatError);
}

TEST(GraphLoaderTest, FromJson_DependencyNamesMustBeNonEmptyStrings) {
    EXPECT_THROW(GraphLoader::fromJson(R"({"app": [1]})"), GraphFormatError);
    EXPECT_THROW(GraphLoader::fromJson(R"({"app": [""]})"), GraphFormatError);
    EXPECT_THROW(GraphLoader::fromJson(R"({"": []})"), GraphFormatError);
}

TEST(GraphLoaderTest, ToJson_ParsesBackToSameGraph) {
    DependencyGraph original{
        {"b", {"c", "a"}},
        {"a", {}},
        {"c", {"a"}},
    };

    DependencyGraph restored = GraphLoader::fromJson(GraphLoader::toJson(original));
    EXPECT_EQ(restored, original);
}

TEST(GraphLoaderTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "depviz_graph_loader_test.json";
    writeTextFile(path.string(), R"({"root": ["leaf"], "leaf": []})");

    DependencyGraph graph = GraphLoader::loadFromFile(path.string());
    EXPECT_EQ(graph.packages(), (std::vector<PackageId>{"root", "leaf"}));

    std::filesystem::remove(path);
}

TEST(GraphLoaderTest, LoadFromFile_MissingFileThrowsIoError) {
    auto path = std::filesystem::temp_directory_path() / "depviz_no_such_graph.json";
    std::filesystem::remove(path);

    try {
        GraphLoader::loadFromFile(path.string());
        FAIL() << "Expected IoError";
    } catch (const IoError& e) {
        EXPECT_EQ(e.path(), path.string());
    }
}
