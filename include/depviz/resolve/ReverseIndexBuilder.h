#pragma once

#include "../core/DependencyGraph.h"
#include "../source/IGraphSource.h"

namespace depviz {

/// Inverts a forward dependency graph into package -> dependents.
///
/// Packages are visited in declaration order and each dependency list in
/// its own order, so every dependent list keeps the order in which the
/// edges were found. Only packages that have at least one dependent become
/// keys. The index is rebuilt on every call.
class ReverseIndexBuilder {
public:
    static ReverseAdjacency buildReverseIndex(const IGraphSource& source);
    static ReverseAdjacency buildReverseIndex(const DependencyGraph& graph);
};

}  // namespace depviz
