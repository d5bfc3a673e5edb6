#include "stability/stability_aggregator.hpp"
#include <algorithm>

namespace scaffkit {

RateBand rateBand(double rate) {
    if (rate >= 0.90) return RateBand::Good;
    if (rate >= 0.70) return RateBand::Fair;
    return RateBand::Poor;
}

const char* rateBandName(RateBand band) {
    switch (band) {
        case RateBand::Good: return "good";
        case RateBand::Fair: return "fair";
        case RateBand::Poor: return "poor";
    }
    return "poor";
}

double StabilitySummary::stabilityRate() const {
    int total = classCount();
    if (total == 0) return 0.0;
    return static_cast<double>(stable_count) / total;
}

double StabilitySummary::skippableRate() const {
    int total = composableCount();
    if (total == 0) return 0.0;
    return static_cast<double>(skippable_count) / total;
}

std::vector<StabilityIssue> StabilitySummary::issuesOfKind(IssueKind kind) const {
    std::vector<StabilityIssue> out;
    for (const auto& issue : issues) {
        if (issue.kind == kind) out.push_back(issue);
    }
    return out;
}

namespace {

bool byCulpritsThenName(const StabilityIssue& a, const StabilityIssue& b) {
    if (a.culprits.size() != b.culprits.size()) {
        return a.culprits.size() > b.culprits.size();
    }
    return a.subject < b.subject;
}

} // namespace

StabilitySummary StabilityAggregator::summarize(const StabilityReport& report) const {
    StabilitySummary summary;
    std::vector<StabilityIssue> class_issues;
    std::vector<StabilityIssue> composable_issues;

    for (const auto& record : report.records) {
        if (const auto* cls = std::get_if<ClassRecord>(&record)) {
            if (cls->stable) {
                summary.stable_count++;
                continue;
            }
            summary.unstable_count++;

            StabilityIssue issue;
            issue.kind = IssueKind::UnstableClass;
            issue.subject = cls->name;
            for (const auto& m : cls->unstable_members) {
                issue.culprits.push_back(m.name + ": " + m.type);
            }
            issue.hints = rules_.hintsFor(*cls);
            class_issues.push_back(std::move(issue));
        } else if (const auto* fn = std::get_if<ComposableRecord>(&record)) {
            if (fn->restartable) summary.restartable_count++;
            if (fn->skippable) {
                summary.skippable_count++;
                continue;
            }
            summary.non_skippable_count++;

            StabilityIssue issue;
            issue.kind = IssueKind::NonSkippableComposable;
            issue.subject = fn->name;
            for (const auto& p : fn->unstable_params) {
                issue.culprits.push_back(p.name + ": " + p.type);
            }
            issue.hints = rules_.hintsFor(*fn);
            composable_issues.push_back(std::move(issue));
        }
    }

    std::stable_sort(class_issues.begin(), class_issues.end(), byCulpritsThenName);
    std::stable_sort(composable_issues.begin(), composable_issues.end(), byCulpritsThenName);

    summary.issues = std::move(class_issues);
    summary.issues.insert(summary.issues.end(),
                          composable_issues.begin(), composable_issues.end());
    return summary;
}

} // namespace scaffkit
