#include "depviz/core/DependencyGraph.h"

#include <algorithm>

namespace depviz {

DependencyGraph::DependencyGraph(std::initializer_list<PackageEntry> entries) {
    for (const auto& entry : entries) {
        setDependencies(entry.package, entry.dependencies);
    }
}

void DependencyGraph::addPackage(const PackageId& package) {
    entryFor(package);
}

void DependencyGraph::setDependencies(const PackageId& package, PackageList dependencies) {
    entryFor(package).dependencies = std::move(dependencies);
}

void DependencyGraph::addDependency(const PackageId& from, const PackageId& to) {
    if (to.empty()) {
        throw std::invalid_argument("Empty package name in dependency of " + from);
    }
    entryFor(from).dependencies.push_back(to);
}

bool DependencyGraph::hasPackage(const PackageId& package) const {
    return index_.find(package) != index_.end();
}

bool DependencyGraph::hasDependency(const PackageId& from, const PackageId& to) const {
    auto it = index_.find(from);
    if (it == index_.end()) return false;

    const PackageList& deps = entries_[it->second].dependencies;
    return std::find(deps.begin(), deps.end(), to) != deps.end();
}

const PackageList& DependencyGraph::dependencies(const PackageId& package) const {
    auto it = index_.find(package);
    if (it == index_.end()) {
        throw std::out_of_range("Unknown package: " + package);
    }
    return entries_[it->second].dependencies;
}

std::optional<PackageList> DependencyGraph::tryGetDependencies(const PackageId& package) const {
    auto it = index_.find(package);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return entries_[it->second].dependencies;
}

size_t DependencyGraph::edgeCount() const {
    size_t count = 0;
    for (const auto& entry : entries_) {
        count += entry.dependencies.size();
    }
    return count;
}

std::vector<PackageId> DependencyGraph::packages() const {
    std::vector<PackageId> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.package);
    }
    return result;
}

void DependencyGraph::clear() {
    entries_.clear();
    index_.clear();
}

PackageEntry& DependencyGraph::entryFor(const PackageId& package) {
    auto it = index_.find(package);
    if (it != index_.end()) {
        return entries_[it->second];
    }
    if (package.empty()) {
        throw std::invalid_argument("Package name must not be empty");
    }

    index_.emplace(package, entries_.size());
    entries_.emplace_back(package, PackageList{});
    return entries_.back();
}

}  // namespace depviz
