#include <gtest/gtest.h>
#include <depviz/core/DependencyGraph.h>

using namespace depviz;

TEST(DependencyGraphTest, AddPackage) {
    DependencyGraph graph;
    graph.addPackage("core");

    EXPECT_TRUE(graph.hasPackage("core"));
    EXPECT_EQ(graph.packageCount(), 1);
    EXPECT_TRUE(graph.dependencies("core").empty());
}

TEST(DependencyGraphTest, AddPackageTwice_KeepsSingleEntry) {
    DependencyGraph graph;
    graph.addDependency("app", "core");
    graph.addPackage("app");

    EXPECT_EQ(graph.packageCount(), 1);
    EXPECT_EQ(graph.dependencies("app"), (PackageList{"core"}));
}

TEST(DependencyGraphTest, AddDependency_PreservesOrder) {
    DependencyGraph graph;
    graph.addDependency("app", "net");
    graph.addDependency("app", "core");
    graph.addDependency("app", "log");

    EXPECT_EQ(graph.dependencies("app"), (PackageList{"net", "core", "log"}));
    EXPECT_EQ(graph.edgeCount(), 3);

    // Targets are not keys until declared
    EXPECT_FALSE(graph.hasPackage("net"));
}

TEST(DependencyGraphTest, HasDependency) {
    DependencyGraph graph{{"app", {"core"}}};

    EXPECT_TRUE(graph.hasDependency("app", "core"));
    EXPECT_FALSE(graph.hasDependency("core", "app"));
    EXPECT_FALSE(graph.hasDependency("missing", "core"));
}

TEST(DependencyGraphTest, Packages_InInsertionOrder) {
    DependencyGraph graph{
        {"zeta", {}},
        {"alpha", {"zeta"}},
        {"mid", {}},
    };

    EXPECT_EQ(graph.packages(), (std::vector<PackageId>{"zeta", "alpha", "mid"}));
}

TEST(DependencyGraphTest, SetDependencies_ReplacesWithoutMoving) {
    DependencyGraph graph{
        {"a", {"b"}},
        {"b", {"c"}},
        {"c", {}},
    };

    graph.setDependencies("b", {});

    EXPECT_EQ(graph.packages(), (std::vector<PackageId>{"a", "b", "c"}));
    EXPECT_TRUE(graph.dependencies("b").empty());
    EXPECT_EQ(graph.edgeCount(), 1);
}

TEST(DependencyGraphTest, Dependencies_UnknownPackageThrows) {
    DependencyGraph graph;
    EXPECT_THROW(graph.dependencies("nope"), std::out_of_range);
}

TEST(DependencyGraphTest, TryGetDependencies) {
    DependencyGraph graph{{"app", {"core"}}};

    auto found = graph.tryGetDependencies("app");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, (PackageList{"core"}));

    EXPECT_FALSE(graph.tryGetDependencies("core").has_value());
}

TEST(DependencyGraphTest, EmptyPackageName_Throws) {
    DependencyGraph graph;
    EXPECT_THROW(graph.addPackage(""), std::invalid_argument);
    EXPECT_THROW(graph.addDependency("app", ""), std::invalid_argument);
    EXPECT_TRUE(graph.empty());
}

TEST(DependencyGraphTest, Equality_IsOrderSensitive) {
    DependencyGraph first{{"a", {"b", "c"}}, {"b", {}}};
    DependencyGraph same{{"a", {"b", "c"}}, {"b", {}}};
    DependencyGraph swappedList{{"a", {"c", "b"}}, {"b", {}}};
    DependencyGraph swappedKeys{{"b", {}}, {"a", {"b", "c"}}};

    EXPECT_EQ(first, same);
    EXPECT_NE(first, swappedList);
    EXPECT_NE(first, swappedKeys);
}

TEST(DependencyGraphTest, Clear) {
    DependencyGraph graph{{"a", {"b"}}};
    graph.clear();

    EXPECT_TRUE(graph.empty());
    EXPECT_FALSE(graph.hasPackage("a"));
    EXPECT_EQ(graph.edgeCount(), 0);

    // Usable after clear
    graph.addPackage("a");
    EXPECT_EQ(graph.packageCount(), 1);
}
