#include "depviz/common/Errors.h"

#include <utility>

namespace depviz {

CircularDependencyError::CircularDependencyError(PackageId package, TraversalPath path)
    : std::runtime_error(formatMessage(package, path)),
      package_(std::move(package)),
      path_(std::move(path)) {}

TraversalPath CircularDependencyError::cycle() const {
    TraversalPath result = path_;
    result.push_back(package_);
    return result;
}

std::string CircularDependencyError::formatMessage(const PackageId& package,
                                                   const TraversalPath& path) {
    std::string message = "Circular dependency: ";
    for (const auto& step : path) {
        message += step;
        message += " -> ";
    }
    message += package;
    return message;
}

}  // namespace depviz
