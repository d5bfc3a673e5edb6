#pragma once

#include "stability/hint_rules.hpp"
#include "stability/report_parser.hpp"
#include <string>
#include <utility>
#include <vector>

namespace scaffkit {

// ─── Stability Issue ──────────────────────────────────────────
// One entry of the ranked issue list: an unstable class or a
// non-skippable composable, with the members/parameters that made
// it so and the hints chosen for it.

struct StabilityIssue {
    IssueKind kind = IssueKind::UnstableClass;
    std::string subject;                  // class or function name
    std::vector<std::string> culprits;    // "items: List<Item>"
    std::vector<std::string> hints;
};

enum class RateBand { Good, Fair, Poor };

/// Good ≥ 0.90, Fair ≥ 0.70, otherwise Poor.
RateBand rateBand(double rate);
const char* rateBandName(RateBand band);

// ─── Stability Summary ────────────────────────────────────────
// Derived fresh from a report on every run; never persisted.

struct StabilitySummary {
    int stable_count = 0;
    int unstable_count = 0;
    int skippable_count = 0;
    int non_skippable_count = 0;
    int restartable_count = 0;
    std::vector<StabilityIssue> issues;

    /// stable / (stable + unstable); 0 when no classes were reported.
    double stabilityRate() const;

    /// skippable / (skippable + non-skippable); 0 when no composables.
    double skippableRate() const;

    int classCount() const { return stable_count + unstable_count; }
    int composableCount() const { return skippable_count + non_skippable_count; }

    std::vector<StabilityIssue> issuesOfKind(IssueKind kind) const;
};

// ─── Stability Aggregator ─────────────────────────────────────
// Counts records and ranks issues:
// 1. unstable classes, most unstable members first, then by name;
// 2. non-skippable composables, most unstable parameters first,
//    then by name.

class StabilityAggregator {
public:
    explicit StabilityAggregator(HintRuleTable rules = defaultHintRules())
        : rules_(std::move(rules)) {}

    StabilitySummary summarize(const StabilityReport& report) const;

    const HintRuleTable& rules() const { return rules_; }

private:
    HintRuleTable rules_;
};

} // namespace scaffkit
