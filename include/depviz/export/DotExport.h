#pragma once

#include "IExporter.h"

#include <ostream>
#include <string>

namespace depviz {

/// Options for DOT export
struct DotExportOptions {
    /// Forward draws package -> dependency top to bottom;
    /// Reverse draws dependency -> dependent bottom to top
    Direction direction = Direction::Forward;

    std::string graphName = "dependencies";

    // Node styling
    std::string nodeShape = "box";
    std::string nodeStyle = "filled";
    std::string nodeFill = "lightblue";
    std::string rootFill = "lightgreen";
};

/// Exports closure graphs as Graphviz DOT descriptions
///
/// One edge statement is emitted per (package, neighbour) pair in closure
/// order then list order, without deduplication.
class DotExport : public IExporter {
public:
    DotExport() = default;
    explicit DotExport(const DotExportOptions& options);
    ~DotExport() override = default;

    /// Render with the given direction and default styling
    static std::string exportGraph(const ClosureGraph& closure, const PackageId& root,
                                   Direction direction);

    /// Write DOT text verbatim, replacing any existing file
    /// @throws IoError if the path is not writable
    static void save(const std::string& text, const std::string& path);

    /// "<root>_<forward|reverse>.dot"
    static std::string defaultFileName(const PackageId& root, Direction direction);

    std::string exportToString(const ClosureGraph& closure, const PackageId& root) override;
    void exportToStream(const ClosureGraph& closure, const PackageId& root, std::ostream& out) override;
    void exportToFile(const ClosureGraph& closure, const PackageId& root, const std::string& filename) override;

    std::string fileExtension() const override { return "dot"; }
    std::string mimeType() const override { return "text/vnd.graphviz"; }

    void setOptions(const DotExportOptions& options) { options_ = options; }
    const DotExportOptions& options() const { return options_; }

private:
    DotExportOptions options_;

    void writeHeader(std::ostream& out);
    void writeStyles(std::ostream& out, const PackageId& root);
    void writeEdges(std::ostream& out, const ClosureGraph& closure);
    void writeFooter(std::ostream& out);

    static std::string quoteId(const std::string& id);
};

}  // namespace depviz
