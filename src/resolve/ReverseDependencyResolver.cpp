#include "depviz/resolve/ReverseDependencyResolver.h"
#include "depviz/resolve/TransitiveSetCollector.h"
#include "depviz/common/Logger.h"
#include "ClosureWalker.h"

namespace depviz {

ClosureGraph ReverseDependencyResolver::resolveReverse(const ReverseAdjacency& reverseIndex,
                                                       const PackageId& root) const {
    LOG_DEBUG("Resolving dependents of '{}'", root);

    algorithms::ClosureWalker walker([&reverseIndex](const PackageId& package) {
        auto dependents = reverseIndex.tryGetDependencies(package);
        return dependents ? *dependents : PackageList{};
    });
    ClosureGraph closure = walker.walk(root);

    LOG_DEBUG("Resolved dependents of '{}': {} packages", root, closure.packageCount());
    return closure;
}

PackageSet ReverseDependencyResolver::directReverseDependencies(const ReverseAdjacency& reverseIndex,
                                                                const PackageId& root) const {
    return TransitiveSetCollector().collectWithin(reverseIndex, root, 1);
}

PackageSet ReverseDependencyResolver::allReverseDependencies(const ReverseAdjacency& reverseIndex,
                                                             const PackageId& root) const {
    return TransitiveSetCollector().allTransitiveDependencies(reverseIndex, root);
}

}  // namespace depviz
