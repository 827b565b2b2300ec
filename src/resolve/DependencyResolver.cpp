#include "depviz/resolve/DependencyResolver.h"
#include "depviz/common/Logger.h"
#include "ClosureWalker.h"

namespace depviz {

ClosureGraph DependencyResolver::resolve(const IGraphSource& source, const PackageId& root) const {
    LOG_DEBUG("Resolving '{}' from {} source", root, source.sourceName());

    algorithms::ClosureWalker walker(
        [&source](const PackageId& package) { return source.edgesOf(package); });
    ClosureGraph closure = walker.walk(root);

    LOG_DEBUG("Resolved '{}': {} packages, {} edges", root,
              closure.packageCount(), closure.edgeCount());
    return closure;
}

ClosureGraph DependencyResolver::resolve(const DependencyGraph& graph, const PackageId& root) const {
    algorithms::ClosureWalker walker([&graph](const PackageId& package) {
        auto deps = graph.tryGetDependencies(package);
        return deps ? *deps : PackageList{};
    });
    return walker.walk(root);
}

}  // namespace depviz
