#pragma once

#include "../core/DependencyGraph.h"

#include <ostream>
#include <string>

namespace depviz {

/// Abstract interface for closure graph exporters
///
/// All output formats (ASCII tree, DOT) implement this interface so the
/// analyzer and the command line tool can switch formats polymorphically.
/// Closures handed to an exporter are already validated as acyclic.
class IExporter {
public:
    virtual ~IExporter() = default;

    /// Render a closure graph rooted at root
    virtual std::string exportToString(const ClosureGraph& closure, const PackageId& root) = 0;

    /// Render to an output stream
    virtual void exportToStream(const ClosureGraph& closure, const PackageId& root, std::ostream& out) = 0;

    /// Render to a file, replacing any existing content
    /// @throws IoError if the file cannot be written
    virtual void exportToFile(const ClosureGraph& closure, const PackageId& root, const std::string& filename) = 0;

    /// File extension for this format (e.g. "txt", "dot")
    virtual std::string fileExtension() const = 0;

    /// MIME type for this format
    virtual std::string mimeType() const = 0;
};

}  // namespace depviz
