#pragma once

#include "depviz/core/Types.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace depviz {

/// Raised when a traversal reaches a package that is already on its own
/// ancestor chain.
///
/// path() holds the chain from the traversal root up to (not including) the
/// repeated package; what() reads "Circular dependency: A -> B -> C -> A".
class CircularDependencyError : public std::runtime_error {
public:
    CircularDependencyError(PackageId package, TraversalPath path);

    const PackageId& package() const noexcept { return package_; }
    const TraversalPath& path() const noexcept { return path_; }

    /// Ancestor chain followed by the repeating package
    TraversalPath cycle() const;

private:
    static std::string formatMessage(const PackageId& package, const TraversalPath& path);

    PackageId package_;
    TraversalPath path_;
};

/// File could not be opened, read or written
class IoError : public std::runtime_error {
public:
    IoError(const std::string& message, std::string path)
        : std::runtime_error(message), path_(std::move(path)) {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/// Graph description file is not a JSON object of string arrays
class GraphFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace depviz
