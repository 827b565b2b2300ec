#pragma once

#include "../core/Types.h"

#include <vector>

namespace depviz {

/// Abstract supplier of an immutable directed dependency graph
///
/// Resolvers only ever read through this interface, so a different data
/// source (a file, a database snapshot) can be plugged in without touching
/// traversal code.
class IGraphSource {
public:
    virtual ~IGraphSource() = default;

    /// Direct dependencies of a package in declaration order.
    /// Unknown packages have no dependencies.
    virtual PackageList edgesOf(const PackageId& package) const = 0;

    /// Whether the package is declared as a key of the graph
    virtual bool contains(const PackageId& package) const = 0;

    /// Declared packages in declaration order
    virtual std::vector<PackageId> packages() const = 0;

    /// Short human-readable name for logging
    virtual const char* sourceName() const = 0;
};

}  // namespace depviz
