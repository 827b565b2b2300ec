#include "depviz/source/SampleGraphs.h"
#include "depviz/source/StaticGraphSource.h"

namespace depviz {

DependencyGraph SampleGraphs::normal() {
    return DependencyGraph{
        {"A", {"B", "C"}},
        {"B", {"D", "E"}},
        {"C", {"F", "G"}},
        {"D", {"H"}},
        {"E", {"H", "I"}},
        {"F", {}},
        {"G", {"I"}},
        {"H", {}},
        {"I", {}},
    };
}

DependencyGraph SampleGraphs::cyclic() {
    return DependencyGraph{
        {"X", {"Y"}},
        {"Y", {"Z"}},
        {"Z", {"X"}},
    };
}

std::unique_ptr<IGraphSource> SampleGraphs::forMode(bool testMode) {
    return std::make_unique<StaticGraphSource>(normal(), testMode ? "sample (test mode)" : "sample");
}

std::unique_ptr<IGraphSource> SampleGraphs::cyclicSource() {
    return std::make_unique<StaticGraphSource>(cyclic(), "cyclic sample");
}

}  // namespace depviz
