#pragma once

#include "../core/DependencyGraph.h"
#include "../source/IGraphSource.h"

#include <cstddef>

namespace depviz {

/// Flat set of everything reachable from a package.
///
/// Breadth-first with a global visited set, so cycles simply stop the walk
/// instead of raising. The root itself is never part of the result, and a
/// root that is not declared in the graph yields an empty set.
class TransitiveSetCollector {
public:
    /// No depth limit
    static constexpr size_t UNLIMITED_DEPTH = 0;

    TransitiveSetCollector() = default;

    PackageSet allTransitiveDependencies(const IGraphSource& source, const PackageId& root) const;
    PackageSet allTransitiveDependencies(const DependencyGraph& graph, const PackageId& root) const;

    /// Packages reachable in at most maxDepth hops (UNLIMITED_DEPTH for all)
    PackageSet collectWithin(const DependencyGraph& graph, const PackageId& root,
                             size_t maxDepth) const;

private:
    PackageSet collect(const NeighbourFn& neighbours, const PackageId& root,
                       size_t maxDepth) const;
};

}  // namespace depviz
