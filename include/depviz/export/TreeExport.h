#pragma once

#include "IExporter.h"

#include <ostream>
#include <string>

namespace depviz {

/// Renders a closure graph as an indented ASCII tree, directory-listing style:
/// @code
/// A
/// ├── B
/// │   └── D
/// └── C
/// @endcode
class TreeExport : public IExporter {
public:
    TreeExport() = default;
    ~TreeExport() override = default;

    /// Tree text without a trailing newline. A root absent from the closure
    /// renders as the root name alone.
    static std::string renderTree(const ClosureGraph& closure, const PackageId& root);

    std::string exportToString(const ClosureGraph& closure, const PackageId& root) override;
    void exportToStream(const ClosureGraph& closure, const PackageId& root, std::ostream& out) override;
    void exportToFile(const ClosureGraph& closure, const PackageId& root, const std::string& filename) override;

    std::string fileExtension() const override { return "txt"; }
    std::string mimeType() const override { return "text/plain"; }

private:
    static void writeChildren(std::ostream& out, const ClosureGraph& closure,
                              const PackageId& package, const std::string& prefix);
};

}  // namespace depviz
