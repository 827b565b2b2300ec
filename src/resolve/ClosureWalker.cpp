#include "ClosureWalker.h"
#include "depviz/common/Errors.h"
#include "depviz/common/Logger.h"

#include <algorithm>
#include <utility>

namespace depviz {
namespace algorithms {

ClosureWalker::ClosureWalker(NeighbourFn neighbours)
    : neighbours_(std::move(neighbours)) {}

ClosureGraph ClosureWalker::walk(const PackageId& root) const {
    ClosureGraph closure;
    TraversalPath path;
    VisitedSet visited;

    visit(root, path, visited, closure);
    return closure;
}

void ClosureWalker::visit(const PackageId& package,
                          TraversalPath& path,
                          VisitedSet& visited,
                          ClosureGraph& closure) const {
    // Path check comes first: every package on the path is also visited
    if (std::find(path.begin(), path.end(), package) != path.end()) {
        CircularDependencyError error(package, path);
        LOG_WARN("{}", error.what());
        throw error;
    }

    // Shared package: already recorded on its first visit
    if (visited.count(package) > 0) {
        return;
    }
    visited.insert(package);

    PackageList neighbours = neighbours_(package);
    closure.setDependencies(package, neighbours);

    path.push_back(package);
    for (const auto& next : neighbours) {
        visit(next, path, visited, closure);
    }
    path.pop_back();
}

}  // namespace algorithms
}  // namespace depviz
