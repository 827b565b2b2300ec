#include "depviz/resolve/ReverseIndexBuilder.h"
#include "depviz/common/Logger.h"

namespace depviz {

ReverseAdjacency ReverseIndexBuilder::buildReverseIndex(const IGraphSource& source) {
    ReverseAdjacency reverse;
    for (const PackageId& package : source.packages()) {
        for (const PackageId& dependency : source.edgesOf(package)) {
            reverse.addDependency(dependency, package);
        }
    }

    LOG_DEBUG("Reverse index over {} source: {} keys, {} edges",
              source.sourceName(), reverse.packageCount(), reverse.edgeCount());
    return reverse;
}

ReverseAdjacency ReverseIndexBuilder::buildReverseIndex(const DependencyGraph& graph) {
    ReverseAdjacency reverse;
    for (const auto& entry : graph) {
        for (const PackageId& dependency : entry.dependencies) {
            reverse.addDependency(dependency, entry.package);
        }
    }
    return reverse;
}

}  // namespace depviz
