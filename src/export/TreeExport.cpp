#include "depviz/export/TreeExport.h"
#include "depviz/common/TextFile.h"

#include <sstream>

namespace depviz {

namespace {

constexpr const char* BRANCH = "├── ";
constexpr const char* CORNER = "└── ";
constexpr const char* OPEN_INDENT = "│   ";
constexpr const char* CLOSED_INDENT = "    ";

}  // namespace

std::string TreeExport::renderTree(const ClosureGraph& closure, const PackageId& root) {
    std::ostringstream out;
    out << root;
    if (closure.hasPackage(root)) {
        writeChildren(out, closure, root, "");
    }
    return out.str();
}

void TreeExport::writeChildren(std::ostream& out, const ClosureGraph& closure,
                               const PackageId& package, const std::string& prefix) {
    auto children = closure.tryGetDependencies(package);
    if (!children) return;

    for (size_t i = 0; i < children->size(); ++i) {
        const PackageId& child = (*children)[i];
        bool isLast = (i + 1 == children->size());

        out << '\n' << prefix << (isLast ? CORNER : BRANCH) << child;
        writeChildren(out, closure, child, prefix + (isLast ? CLOSED_INDENT : OPEN_INDENT));
    }
}

std::string TreeExport::exportToString(const ClosureGraph& closure, const PackageId& root) {
    return renderTree(closure, root);
}

void TreeExport::exportToStream(const ClosureGraph& closure, const PackageId& root, std::ostream& out) {
    out << renderTree(closure, root) << '\n';
}

void TreeExport::exportToFile(const ClosureGraph& closure, const PackageId& root,
                              const std::string& filename) {
    writeTextFile(filename, renderTree(closure, root) + "\n");
}

}  // namespace depviz
