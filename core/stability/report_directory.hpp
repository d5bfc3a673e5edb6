#pragma once

#include "stability/report_parser.hpp"
#include <map>
#include <string>
#include <vector>

namespace scaffkit {

// ─── Report Directory ─────────────────────────────────────────
// The compiler writes one set of reports per module variant:
//   <variant>-classes.txt, <variant>-composables.txt, <variant>-module.json

struct ReportFiles {
    std::string directory;
    std::vector<std::string> class_reports;       // sorted
    std::vector<std::string> composable_reports;  // sorted
    std::vector<std::string> metrics_files;       // sorted

    size_t reportCount() const { return class_reports.size() + composable_reports.size(); }
};

/// Locate report files directly inside `directory`.
/// Throws IoError if the directory is missing or holds no
/// *-classes.txt / *-composables.txt file.
ReportFiles findReportFiles(const std::string& directory);

/// Parse every class report, then every composable report.
StabilityReport loadReports(const ReportFiles& files);

// ─── Module Metrics ───────────────────────────────────────────
// Numeric entries of a *-module.json file ("skippableComposables",
// "restartableComposables", ...). Non-numeric entries are skipped.

struct ModuleMetrics {
    std::string source;
    std::map<std::string, double> values;

    bool empty() const { return values.empty(); }
};

/// Throws IoError if unreadable, ValidationError if not a JSON object.
ModuleMetrics loadModuleMetrics(const std::string& path);

} // namespace scaffkit
