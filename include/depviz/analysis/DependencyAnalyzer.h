#pragma once

#include "AnalysisRequest.h"
#include "../core/DependencyGraph.h"
#include "../source/IGraphSource.h"

#include <memory>
#include <optional>
#include <string>

namespace depviz {

/// Outcome of resolving the deliberately cyclic sample
struct CycleCheckResult {
    bool performed = false;
    bool cycleDetected = false;
    std::string message;        ///< Error text, or a note that no cycle was found
    TraversalPath cycle;        ///< Ancestor chain plus the repeating package
};

/// Everything one analysis produced
struct AnalysisReport {
    PackageId root;
    Direction direction = Direction::Forward;
    std::string sourceName;

    ClosureGraph closure;
    PackageSet transitive;                 ///< Dependencies, or dependents in reverse mode
    PackageSet directDependents;           ///< Reverse mode only

    std::optional<std::string> asciiTree;
    std::optional<std::string> graphDescription;
    std::optional<std::string> exportPath;

    CycleCheckResult cycleCheck;
};

/// Runs the resolve / collect / render pipeline for one request
///
/// Example:
/// @code
/// DependencyAnalyzer analyzer(SampleGraphs::forMode(true), SampleGraphs::cyclicSource());
/// AnalysisReport report = analyzer.analyze(config.toRequest());
/// std::cout << DependencyAnalyzer::formatReport(report);
/// @endcode
class DependencyAnalyzer {
public:
    /// @param source Graph the requested package is resolved against
    /// @param cycleDemoSource Optional cyclic graph for the cycle check (may be null)
    DependencyAnalyzer(std::unique_ptr<IGraphSource> source,
                       std::unique_ptr<IGraphSource> cycleDemoSource = nullptr);

    /// @throws CircularDependencyError if the requested package is part of a cycle
    /// @throws IoError if graph export is enabled and the file cannot be written
    AnalysisReport analyze(const AnalysisRequest& request) const;

    /// Resolve the cyclic sample from its first package, capturing the error
    CycleCheckResult demonstrateCycleDetection() const;

    const IGraphSource& source() const { return *source_; }

    /// One "<package>: dep, dep" line per closure entry
    static std::string formatClosure(const ClosureGraph& closure);

    /// Human-readable rendering of a whole report
    static std::string formatReport(const AnalysisReport& report);

private:
    std::unique_ptr<IGraphSource> source_;
    std::unique_ptr<IGraphSource> cycleDemoSource_;
};

}  // namespace depviz
