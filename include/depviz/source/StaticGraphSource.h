#pragma once

#include "IGraphSource.h"
#include "../core/DependencyGraph.h"

#include <string>

namespace depviz {

/// Graph source backed by an in-memory DependencyGraph fixed at construction
class StaticGraphSource : public IGraphSource {
public:
    explicit StaticGraphSource(DependencyGraph graph, std::string name = "static");

    PackageList edgesOf(const PackageId& package) const override;
    bool contains(const PackageId& package) const override;
    std::vector<PackageId> packages() const override;
    const char* sourceName() const override { return name_.c_str(); }

    const DependencyGraph& graph() const { return graph_; }

private:
    const DependencyGraph graph_;
    const std::string name_;
};

}  // namespace depviz
