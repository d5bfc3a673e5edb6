#include "stability/report_directory.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace scaffkit {

namespace {

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

ReportFiles findReportFiles(const std::string& directory) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        throw IoError(directory, "Report directory not found");
    }

    ReportFiles files;
    files.directory = directory;
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        std::string name = entry.path().filename().string();
        std::string path = entry.path().string();
        if (endsWith(name, "-classes.txt")) {
            files.class_reports.push_back(path);
        } else if (endsWith(name, "-composables.txt")) {
            files.composable_reports.push_back(path);
        } else if (endsWith(name, "-module.json")) {
            files.metrics_files.push_back(path);
        }
    }
    if (ec) {
        throw IoError(directory, "Cannot list report directory (" + ec.message() + ")");
    }

    std::sort(files.class_reports.begin(), files.class_reports.end());
    std::sort(files.composable_reports.begin(), files.composable_reports.end());
    std::sort(files.metrics_files.begin(), files.metrics_files.end());

    if (files.reportCount() == 0) {
        throw IoError(directory, "No *-classes.txt or *-composables.txt report files found");
    }
    return files;
}

StabilityReport loadReports(const ReportFiles& files) {
    StabilityReport report;
    for (const auto& path : files.class_reports) {
        report.append(parseReportFile(path));
    }
    for (const auto& path : files.composable_reports) {
        report.append(parseReportFile(path));
    }
    return report;
}

ModuleMetrics loadModuleMetrics(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw IoError(path, "Cannot read module metrics");
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError("Malformed module metrics " + path + ": " + e.what());
    }
    if (!j.is_object()) {
        throw ValidationError("Module metrics " + path + " is not a JSON object");
    }

    ModuleMetrics metrics;
    metrics.source = path;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.value().is_number()) {
            metrics.values[it.key()] = it.value().get<double>();
        }
    }
    return metrics;
}

} // namespace scaffkit
