#include "depviz/analysis/DependencyAnalyzer.h"
#include "depviz/common/Errors.h"
#include "depviz/common/Logger.h"
#include "depviz/export/DotExport.h"
#include "depviz/export/TreeExport.h"
#include "depviz/resolve/DependencyResolver.h"
#include "depviz/resolve/ReverseDependencyResolver.h"
#include "depviz/resolve/ReverseIndexBuilder.h"
#include "depviz/resolve/TransitiveSetCollector.h"

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace depviz {

namespace {

std::string joinPackages(const PackageSet& packages) {
    std::string result;
    for (const auto& package : packages) {
        if (!result.empty()) result += ", ";
        result += package;
    }
    return result;
}

}  // namespace

DependencyAnalyzer::DependencyAnalyzer(std::unique_ptr<IGraphSource> source,
                                       std::unique_ptr<IGraphSource> cycleDemoSource)
    : source_(std::move(source)), cycleDemoSource_(std::move(cycleDemoSource)) {
    if (!source_) {
        throw std::invalid_argument("DependencyAnalyzer requires a graph source");
    }
}

AnalysisReport DependencyAnalyzer::analyze(const AnalysisRequest& request) const {
    if (request.packageName.empty()) {
        throw std::invalid_argument("Package name must not be empty");
    }

    AnalysisReport report;
    report.root = request.packageName;
    report.direction = request.direction();
    report.sourceName = source_->sourceName();

    LOG_INFO("Analyzing '{}' ({}) using {} source", report.root,
             directionName(report.direction), report.sourceName);

    if (report.direction == Direction::Forward) {
        report.closure = DependencyResolver().resolve(*source_, report.root);
        report.transitive = TransitiveSetCollector().allTransitiveDependencies(*source_, report.root);
    } else {
        ReverseAdjacency reverseIndex = ReverseIndexBuilder::buildReverseIndex(*source_);
        ReverseDependencyResolver resolver;
        report.closure = resolver.resolveReverse(reverseIndex, report.root);
        report.transitive = resolver.allReverseDependencies(reverseIndex, report.root);
        report.directDependents = resolver.directReverseDependencies(reverseIndex, report.root);
    }
    LOG_INFO("Closure has {} packages, {} transitive", report.closure.packageCount(),
             report.transitive.size());

    if (request.asciiTreeEnabled) {
        report.asciiTree = TreeExport::renderTree(report.closure, report.root);
    }

    if (request.graphExportEnabled) {
        report.graphDescription = DotExport::exportGraph(report.closure, report.root, report.direction);

        std::filesystem::path path = std::filesystem::path(request.outputDirectory) /
                                     DotExport::defaultFileName(report.root, report.direction);
        DotExport::save(*report.graphDescription, path.string());
        report.exportPath = path.string();
    }

    if (cycleDemoSource_) {
        report.cycleCheck = demonstrateCycleDetection();
    }

    return report;
}

CycleCheckResult DependencyAnalyzer::demonstrateCycleDetection() const {
    CycleCheckResult result;
    if (!cycleDemoSource_) {
        return result;
    }

    std::vector<PackageId> packages = cycleDemoSource_->packages();
    if (packages.empty()) {
        return result;
    }

    result.performed = true;
    try {
        ClosureGraph closure = DependencyResolver().resolve(*cycleDemoSource_, packages.front());
        result.message = "No cycle reachable from '" + packages.front() + "' (" +
                         std::to_string(closure.packageCount()) + " packages)";
    } catch (const CircularDependencyError& e) {
        result.cycleDetected = true;
        result.message = e.what();
        result.cycle = e.cycle();
        LOG_INFO("Cycle check on {} source detected: {}", cycleDemoSource_->sourceName(), e.what());
    }
    return result;
}

std::string DependencyAnalyzer::formatClosure(const ClosureGraph& closure) {
    std::ostringstream out;
    for (const auto& entry : closure) {
        out << entry.package << ": ";
        if (entry.dependencies.empty()) {
            out << "(none)";
        }
        for (size_t i = 0; i < entry.dependencies.size(); ++i) {
            if (i > 0) out << ", ";
            out << entry.dependencies[i];
        }
        out << '\n';
    }
    return out.str();
}

std::string DependencyAnalyzer::formatReport(const AnalysisReport& report) {
    const bool reverse = report.direction == Direction::Reverse;
    std::ostringstream out;

    out << "=== " << (reverse ? "Reverse dependency" : "Dependency") << " closure for '"
        << report.root << "' (" << report.sourceName << ") ===\n";
    out << formatClosure(report.closure);

    out << "\n" << (reverse ? "Transitive dependents" : "Transitive dependencies")
        << " (" << report.transitive.size() << "): " << joinPackages(report.transitive) << "\n";

    if (reverse) {
        out << "Direct dependents (" << report.directDependents.size() << "): "
            << joinPackages(report.directDependents) << "\n";
    }

    if (report.asciiTree) {
        out << "\nASCII tree:\n" << *report.asciiTree << "\n";
    }

    if (report.graphDescription) {
        out << "\nGraph description:\n" << *report.graphDescription;
    }
    if (report.exportPath) {
        out << "Graph description saved to " << *report.exportPath << "\n";
    }

    if (report.cycleCheck.performed) {
        out << "\nCycle detection check: " << report.cycleCheck.message << "\n";
    }

    return out.str();
}

}  // namespace depviz
