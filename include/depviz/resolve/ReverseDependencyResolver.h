#pragma once

#include "../core/DependencyGraph.h"

namespace depviz {

/// Walks a reverse index (package -> dependents) from a package.
///
/// resolveReverse() has exactly the contract of DependencyResolver::resolve()
/// with dependents in place of dependencies, cycle errors included.
class ReverseDependencyResolver {
public:
    ReverseDependencyResolver() = default;

    /// @throws CircularDependencyError when a dependent chain loops back
    ClosureGraph resolveReverse(const ReverseAdjacency& reverseIndex, const PackageId& root) const;

    /// One-hop dependents of root. Root itself is never reported and a
    /// dependent listed twice is reported once.
    PackageSet directReverseDependencies(const ReverseAdjacency& reverseIndex,
                                         const PackageId& root) const;

    /// Every package that requires root directly or transitively
    PackageSet allReverseDependencies(const ReverseAdjacency& reverseIndex,
                                      const PackageId& root) const;
};

}  // namespace depviz
