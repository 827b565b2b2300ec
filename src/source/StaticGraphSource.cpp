#include "depviz/source/StaticGraphSource.h"

#include <utility>

namespace depviz {

StaticGraphSource::StaticGraphSource(DependencyGraph graph, std::string name)
    : graph_(std::move(graph)), name_(std::move(name)) {}

PackageList StaticGraphSource::edgesOf(const PackageId& package) const {
    auto deps = graph_.tryGetDependencies(package);
    return deps ? std::move(*deps) : PackageList{};
}

bool StaticGraphSource::contains(const PackageId& package) const {
    return graph_.hasPackage(package);
}

std::vector<PackageId> StaticGraphSource::packages() const {
    return graph_.packages();
}

}  // namespace depviz
