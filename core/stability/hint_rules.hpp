#pragma once

#include "stability/report_parser.hpp"
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace scaffkit {

enum class IssueKind {
    UnstableClass,
    NonSkippableComposable
};

// ─── Hint Rule ────────────────────────────────────────────────
// One row of the remediation table. A class rule sees the class
// record, a composable rule the composable record; the predicate
// decides whether the hint applies.

struct HintRule {
    std::string id;
    IssueKind kind = IssueKind::UnstableClass;
    std::function<bool(const ClassRecord&)> class_predicate;
    std::function<bool(const ComposableRecord&)> composable_predicate;
    std::string text;
};

class HintRuleTable {
public:
    HintRuleTable() = default;

    void addClassRule(const std::string& id,
                      std::function<bool(const ClassRecord&)> predicate,
                      const std::string& text);

    void addComposableRule(const std::string& id,
                           std::function<bool(const ComposableRecord&)> predicate,
                           const std::string& text);

    /// Texts of every matching rule, in table order, without duplicates.
    std::vector<std::string> hintsFor(const ClassRecord& record) const;
    std::vector<std::string> hintsFor(const ComposableRecord& record) const;

    const std::vector<HintRule>& rules() const { return rules_; }
    size_t count() const { return rules_.size(); }

private:
    std::vector<HintRule> rules_;
};

/// List/Map/Set/Collection/Array types and their mutable forms.
bool isCollectionType(const std::string& type);

/// Kotlin function types: "() -> Unit", "Function1<...>", "(Int) -> Unit".
bool isFunctionType(const std::string& type);

/// Built-in remediation table.
HintRuleTable defaultHintRules();

} // namespace scaffkit
