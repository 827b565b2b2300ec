#include "depviz/resolve/TransitiveSetCollector.h"
#include "depviz/common/Logger.h"

#include <queue>
#include <utility>

namespace depviz {

PackageSet TransitiveSetCollector::allTransitiveDependencies(const IGraphSource& source,
                                                             const PackageId& root) const {
    if (!source.contains(root)) {
        LOG_DEBUG("'{}' is not declared in {} source", root, source.sourceName());
        return {};
    }
    return collect([&source](const PackageId& package) { return source.edgesOf(package); },
                   root, UNLIMITED_DEPTH);
}

PackageSet TransitiveSetCollector::allTransitiveDependencies(const DependencyGraph& graph,
                                                             const PackageId& root) const {
    return collectWithin(graph, root, UNLIMITED_DEPTH);
}

PackageSet TransitiveSetCollector::collectWithin(const DependencyGraph& graph,
                                                 const PackageId& root,
                                                 size_t maxDepth) const {
    if (!graph.hasPackage(root)) {
        return {};
    }
    return collect([&graph](const PackageId& package) {
        auto deps = graph.tryGetDependencies(package);
        return deps ? *deps : PackageList{};
    }, root, maxDepth);
}

PackageSet TransitiveSetCollector::collect(const NeighbourFn& neighbours,
                                           const PackageId& root,
                                           size_t maxDepth) const {
    VisitedSet visited{root};
    PackageSet result;

    // (package, hops from root)
    std::queue<std::pair<PackageId, size_t>> frontier;
    frontier.emplace(root, 0);

    while (!frontier.empty()) {
        auto [package, depth] = std::move(frontier.front());
        frontier.pop();

        if (maxDepth != UNLIMITED_DEPTH && depth >= maxDepth) {
            continue;
        }

        for (const PackageId& next : neighbours(package)) {
            if (visited.insert(next).second) {
                result.insert(next);
                frontier.emplace(next, depth + 1);
            }
        }
    }

    return result;
}

}  // namespace depviz
