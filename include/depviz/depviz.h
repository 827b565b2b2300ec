#pragma once

/// @file depviz.h
/// @brief Main header for the depviz dependency analysis library
///
/// depviz resolves the transitive dependency (or dependent) closure of a
/// package over a static dependency graph, detects cycles, and renders the
/// result as an ASCII tree or a Graphviz DOT description.
///
/// Example usage:
/// @code
/// #include <depviz/depviz.h>
///
/// depviz::StaticGraphSource source(depviz::SampleGraphs::normal());
/// depviz::ClosureGraph closure = depviz::DependencyResolver().resolve(source, "A");
///
/// std::cout << depviz::TreeExport::renderTree(closure, "A") << "\n";
/// depviz::DotExport::save(
///     depviz::DotExport::exportGraph(closure, "A", depviz::Direction::Forward),
///     "A_forward.dot");
/// @endcode

#include <string>

// Core module - Graph data structures
#include "core/Types.h"
#include "core/DependencyGraph.h"

// Common - errors and logging
#include "common/Errors.h"
#include "common/Logger.h"

// Graph sources
#include "source/IGraphSource.h"
#include "source/StaticGraphSource.h"
#include "source/SampleGraphs.h"
#include "source/GraphLoader.h"

// Resolution algorithms
#include "resolve/DependencyResolver.h"
#include "resolve/ReverseIndexBuilder.h"
#include "resolve/ReverseDependencyResolver.h"
#include "resolve/TransitiveSetCollector.h"

// Export module - Output formats
#include "export/IExporter.h"
#include "export/TreeExport.h"
#include "export/DotExport.h"

// Configuration and analysis pipeline
#include "config/ConfigErrors.h"
#include "config/AnalysisConfig.h"
#include "config/ConfigLoader.h"
#include "analysis/AnalysisRequest.h"
#include "analysis/DependencyAnalyzer.h"

namespace depviz {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace depviz
