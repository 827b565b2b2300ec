#pragma once

#include "../core/DependencyGraph.h"
#include "../source/IGraphSource.h"

namespace depviz {

/// Builds the forward dependency closure of a package.
///
/// Depth-first walk from the root in declaration order. Each package is
/// expanded once; its direct dependency list is recorded exactly as the
/// source declares it. Packages the source does not know are recorded as
/// leaves with an empty list.
///
/// Example:
/// @code
/// StaticGraphSource source(SampleGraphs::normal());
/// DependencyResolver resolver;
/// ClosureGraph closure = resolver.resolve(source, "A");
/// @endcode
class DependencyResolver {
public:
    DependencyResolver() = default;

    /// @throws CircularDependencyError when a package is reached again while
    ///         it is still on the active ancestor path. No partial closure is
    ///         returned in that case.
    ClosureGraph resolve(const IGraphSource& source, const PackageId& root) const;

    /// Convenience overload walking a graph directly
    ClosureGraph resolve(const DependencyGraph& graph, const PackageId& root) const;
};

}  // namespace depviz
