#pragma once

#include "Types.h"

#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace depviz {

/// One adjacency entry: a package and its ordered list of neighbours
struct PackageEntry {
    PackageId package;
    PackageList dependencies;

    PackageEntry() = default;
    PackageEntry(PackageId pkg, PackageList deps)
        : package(std::move(pkg)), dependencies(std::move(deps)) {}

    bool operator==(const PackageEntry& o) const {
        return package == o.package && dependencies == o.dependencies;
    }
};

/// Insertion-ordered adjacency mapping keyed by package name.
///
/// Used for the forward dependency graph, for per-traversal closure graphs
/// and for reverse adjacency. Keys keep the position of their first
/// insertion; replacing the list of an existing key does not move it.
/// Neighbour names do not have to be keys themselves (leaves).
class DependencyGraph {
public:
    using const_iterator = std::vector<PackageEntry>::const_iterator;

    DependencyGraph() = default;
    DependencyGraph(std::initializer_list<PackageEntry> entries);

    // Package operations
    void addPackage(const PackageId& package);
    void setDependencies(const PackageId& package, PackageList dependencies);
    void addDependency(const PackageId& from, const PackageId& to);

    bool hasPackage(const PackageId& package) const;
    bool hasDependency(const PackageId& from, const PackageId& to) const;

    // Dependency access API:
    // - dependencies(): reference return for known keys, throws std::out_of_range otherwise.
    //   The reference is invalidated by any modification of the graph.
    // - tryGetDependencies(): copy, std::nullopt for unknown keys.
    const PackageList& dependencies(const PackageId& package) const;
    std::optional<PackageList> tryGetDependencies(const PackageId& package) const;

    // Queries
    size_t packageCount() const { return entries_.size(); }
    size_t edgeCount() const;
    bool empty() const { return entries_.empty(); }

    /// Keys in insertion order
    std::vector<PackageId> packages() const;

    const std::vector<PackageEntry>& entries() const { return entries_; }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    void clear();

    /// Structural equality, including key and list order
    bool operator==(const DependencyGraph& o) const { return entries_ == o.entries_; }
    bool operator!=(const DependencyGraph& o) const { return !(*this == o); }

private:
    PackageEntry& entryFor(const PackageId& package);

    std::vector<PackageEntry> entries_;
    std::unordered_map<PackageId, size_t> index_;
};

/// Per-traversal record of visited packages and the edges observed for them
using ClosureGraph = DependencyGraph;

/// Package -> ordered list of packages that directly depend on it
using ReverseAdjacency = DependencyGraph;

}  // namespace depviz
