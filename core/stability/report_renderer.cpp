#include "stability/report_renderer.hpp"
#include <cmath>
#include <sstream>

namespace scaffkit {

std::string formatPercent(double rate) {
    int pct = static_cast<int>(std::floor(rate * 100.0 + 1e-9));
    return std::to_string(pct) + "%";
}

namespace {

std::string bandColored(const Style& style, double rate) {
    std::string text = formatPercent(rate);
    switch (rateBand(rate)) {
        case RateBand::Good: return style.green(text);
        case RateBand::Fair: return style.yellow(text);
        case RateBand::Poor: return style.red(text);
    }
    return text;
}

std::string formatMetric(double value) {
    std::ostringstream out;
    if (value == std::floor(value) && std::fabs(value) < 1e15) {
        out << static_cast<long long>(value);
    } else {
        out << value;
    }
    return out.str();
}

void renderClasses(std::ostream& out, const StabilitySummary& summary,
                   const Style& style, const RenderOptions& options) {
    out << style.yellow("Unstable Classes:") << "\n";
    auto issues = summary.issuesOfKind(IssueKind::UnstableClass);
    if (issues.empty()) {
        out << "   " << style.green("No unstable classes found") << "\n";
    }
    for (const auto& issue : issues) {
        out << "   " << style.red("x " + issue.subject) << "\n";
        size_t shown = 0;
        for (const auto& c : issue.culprits) {
            if (shown++ == options.max_culprits) {
                out << "      └─ ... " << (issue.culprits.size() - options.max_culprits)
                    << " more\n";
                break;
            }
            out << "      └─ " << c << "\n";
        }
    }
    out << "\n";
    out << "   Total: " << summary.stable_count << " stable, "
        << summary.unstable_count << " unstable\n";
    out << "   Stability Rate: " << bandColored(style, summary.stabilityRate()) << "\n\n";
}

void renderComposables(std::ostream& out, const StabilitySummary& summary,
                       const Style& style, const RenderOptions& options) {
    out << style.yellow("Non-Skippable Composables:") << "\n";
    auto issues = summary.issuesOfKind(IssueKind::NonSkippableComposable);
    if (issues.empty()) {
        out << "   " << style.green("All composables are skippable") << "\n";
    }
    size_t listed = 0;
    for (const auto& issue : issues) {
        if (listed++ == options.max_composables) {
            out << "   ... " << (issues.size() - options.max_composables) << " more\n";
            break;
        }
        out << "   " << style.yellow("! fun " + issue.subject) << " - not skippable\n";
        size_t shown = 0;
        for (const auto& c : issue.culprits) {
            if (shown++ == options.max_culprits) break;
            out << "      └─ unstable " << c << "\n";
        }
    }
    out << "\n";
    out << "   Total: " << summary.skippable_count << " skippable, "
        << summary.non_skippable_count << " not skippable";
    if (summary.composableCount() > 0) {
        out << " (" << bandColored(style, summary.skippableRate()) << " skippable)";
    }
    out << "\n\n";
}

void renderMetrics(std::ostream& out, const std::vector<ModuleMetrics>& metrics,
                   const Style& style) {
    for (const auto& m : metrics) {
        if (m.empty()) continue;
        out << style.cyan("Module Metrics") << " (" << m.source << "):\n";
        for (const auto& [key, value] : m.values) {
            out << "   " << key << ": " << formatMetric(value) << "\n";
        }
        out << "\n";
    }
}

void renderRecommendations(std::ostream& out, const StabilitySummary& summary,
                           const Style& style) {
    out << style.cyan("Recommendations:") << "\n";
    if (summary.issues.empty()) {
        out << "   " << style.green("Nothing to fix") << "\n";
        return;
    }

    int rank = 1;
    for (const auto& issue : summary.issues) {
        const char* what = issue.kind == IssueKind::UnstableClass ? "class " : "fun ";
        out << "   " << rank++ << ". " << what << issue.subject;
        if (!issue.culprits.empty()) {
            out << " (" << issue.culprits.size() << " unstable)";
        }
        out << "\n";
        for (const auto& hint : issue.hints) {
            out << "      - " << hint << "\n";
        }
    }
}

} // namespace

std::string renderTextReport(const StabilitySummary& summary,
                             const std::vector<ModuleMetrics>& metrics,
                             const Style& style,
                             const RenderOptions& options) {
    std::ostringstream out;
    out << style.cyan("Analysis Results") << "\n";
    out << "================\n\n";

    renderClasses(out, summary, style, options);
    renderComposables(out, summary, style, options);
    renderMetrics(out, metrics, style);
    if (options.show_recommendations) {
        renderRecommendations(out, summary, style);
    }
    return out.str();
}

nlohmann::json summaryToJson(const StabilitySummary& summary,
                             const std::vector<ModuleMetrics>& metrics) {
    nlohmann::json j;
    j["classes"] = {
        {"stable", summary.stable_count},
        {"unstable", summary.unstable_count},
        {"stability_rate", summary.stabilityRate()},
        {"band", rateBandName(rateBand(summary.stabilityRate()))},
    };
    j["composables"] = {
        {"skippable", summary.skippable_count},
        {"non_skippable", summary.non_skippable_count},
        {"restartable", summary.restartable_count},
        {"skippable_rate", summary.skippableRate()},
    };

    nlohmann::json issues = nlohmann::json::array();
    for (const auto& issue : summary.issues) {
        issues.push_back({
            {"kind", issue.kind == IssueKind::UnstableClass ? "unstable_class" : "non_skippable"},
            {"subject", issue.subject},
            {"culprits", issue.culprits},
            {"hints", issue.hints},
        });
    }
    j["issues"] = issues;

    if (!metrics.empty()) {
        nlohmann::json m = nlohmann::json::object();
        for (const auto& mm : metrics) {
            m[mm.source] = mm.values;
        }
        j["metrics"] = m;
    }
    return j;
}

std::string dumpSummaryJson(const nlohmann::json& j, int indent) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace scaffkit
