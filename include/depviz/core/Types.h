#pragma once

#include <functional>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

namespace depviz {

/// Package identity is its name only
using PackageId = std::string;

/// Ordered list of package names (dependency or dependent lists)
using PackageList = std::vector<PackageId>;

/// Sorted set of package names, used for flat summaries
using PackageSet = std::set<PackageId>;

/// Ancestor chain from the traversal root to the node being visited
using TraversalPath = std::vector<PackageId>;

/// Packages already expanded during one traversal
using VisitedSet = std::unordered_set<PackageId>;

/// Neighbour lookup used by the traversals (dependencies or dependents)
using NeighbourFn = std::function<PackageList(const PackageId&)>;

/// Direction a closure graph was computed in
enum class Direction {
    Forward,   // package -> what it requires
    Reverse    // package -> what requires it
};

inline const char* directionName(Direction direction) {
    return direction == Direction::Forward ? "forward" : "reverse";
}

}  // namespace depviz
