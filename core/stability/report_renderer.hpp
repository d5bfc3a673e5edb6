#pragma once

#include "common/console.hpp"
#include "stability/report_directory.hpp"
#include "stability/stability_aggregator.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace scaffkit {

struct RenderOptions {
    size_t max_culprits = 5;       // members/params listed per issue
    size_t max_composables = 10;   // non-skippable composables listed
    bool show_recommendations = true;
};

/// Human-readable report: class stability, composable skippability,
/// optional module metrics, ranked issues and recommendations.
std::string renderTextReport(const StabilitySummary& summary,
                             const std::vector<ModuleMetrics>& metrics,
                             const Style& style,
                             const RenderOptions& options = {});

/// Machine-readable form of the same summary.
nlohmann::json summaryToJson(const StabilitySummary& summary,
                             const std::vector<ModuleMetrics>& metrics = {});

/// Serializes `j`; report text is not guaranteed to be UTF-8, so invalid
/// bytes become U+FFFD instead of throwing.
std::string dumpSummaryJson(const nlohmann::json& j, int indent = -1);

/// "87%" (rounded down, as the percentage is reported).
std::string formatPercent(double rate);

} // namespace scaffkit
