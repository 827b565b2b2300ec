#pragma once

#include "depviz/core/DependencyGraph.h"

namespace depviz {
namespace algorithms {

/// Depth-first closure builder shared by the forward and reverse resolvers.
///
/// The active ancestor path detects cycles; the visited set stops shared
/// packages from being expanded twice. A shared package reached again
/// through another parent keeps the list recorded on its first visit.
class ClosureWalker {
public:
    explicit ClosureWalker(NeighbourFn neighbours);

    /// @throws CircularDependencyError when a package recurs on its own path
    ClosureGraph walk(const PackageId& root) const;

private:
    void visit(const PackageId& package,
               TraversalPath& path,
               VisitedSet& visited,
               ClosureGraph& closure) const;

    NeighbourFn neighbours_;
};

}  // namespace algorithms
}  // namespace depviz
