#include "depviz/export/DotExport.h"
#include "depviz/common/Logger.h"
#include "depviz/common/TextFile.h"

#include <sstream>

namespace depviz {

DotExport::DotExport(const DotExportOptions& options)
    : options_(options) {}

std::string DotExport::exportGraph(const ClosureGraph& closure, const PackageId& root,
                                   Direction direction) {
    DotExportOptions options;
    options.direction = direction;
    return DotExport(options).exportToString(closure, root);
}

void DotExport::save(const std::string& text, const std::string& path) {
    writeTextFile(path, text);
    LOG_INFO("Graph description written to {}", path);
}

std::string DotExport::defaultFileName(const PackageId& root, Direction direction) {
    return root + "_" + directionName(direction) + ".dot";
}

std::string DotExport::exportToString(const ClosureGraph& closure, const PackageId& root) {
    std::ostringstream out;
    exportToStream(closure, root, out);
    return out.str();
}

void DotExport::exportToStream(const ClosureGraph& closure, const PackageId& root, std::ostream& out) {
    writeHeader(out);
    writeStyles(out, root);
    writeEdges(out, closure);
    writeFooter(out);
}

void DotExport::exportToFile(const ClosureGraph& closure, const PackageId& root,
                             const std::string& filename) {
    save(exportToString(closure, root), filename);
}

void DotExport::writeHeader(std::ostream& out) {
    out << "digraph " << quoteId(options_.graphName) << " {\n";
    out << "    rankdir=" << (options_.direction == Direction::Forward ? "TB" : "BT") << ";\n";
}

void DotExport::writeStyles(std::ostream& out, const PackageId& root) {
    out << "    node [shape=" << options_.nodeShape
        << ", style=" << options_.nodeStyle
        << ", fillcolor=" << options_.nodeFill << "];\n";
    out << "    " << quoteId(root) << " [fillcolor=" << options_.rootFill << "];\n";
}

void DotExport::writeEdges(std::ostream& out, const ClosureGraph& closure) {
    for (const auto& entry : closure) {
        for (const auto& neighbour : entry.dependencies) {
            if (options_.direction == Direction::Forward) {
                out << "    " << quoteId(entry.package) << " -> " << quoteId(neighbour) << ";\n";
            } else {
                // Reverse closures list dependents; keep arrows reading "requires"
                out << "    " << quoteId(neighbour) << " -> " << quoteId(entry.package) << ";\n";
            }
        }
    }
}

void DotExport::writeFooter(std::ostream& out) {
    out << "}\n";
}

std::string DotExport::quoteId(const std::string& id) {
    std::string result = "\"";
    for (char c : id) {
        if (c == '"' || c == '\\') {
            result += '\\';
        }
        result += c;
    }
    result += '"';
    return result;
}

}  // namespace depviz
