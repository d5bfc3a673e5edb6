#include "stability/hint_rules.hpp"
#include <algorithm>
#include <regex>

namespace scaffkit {

void HintRuleTable::addClassRule(const std::string& id,
                                 std::function<bool(const ClassRecord&)> predicate,
                                 const std::string& text) {
    HintRule rule;
    rule.id = id;
    rule.kind = IssueKind::UnstableClass;
    rule.class_predicate = std::move(predicate);
    rule.text = text;
    rules_.push_back(std::move(rule));
}

void HintRuleTable::addComposableRule(const std::string& id,
                                      std::function<bool(const ComposableRecord&)> predicate,
                                      const std::string& text) {
    HintRule rule;
    rule.id = id;
    rule.kind = IssueKind::NonSkippableComposable;
    rule.composable_predicate = std::move(predicate);
    rule.text = text;
    rules_.push_back(std::move(rule));
}

namespace {

void addUnique(std::vector<std::string>& hints, const std::string& text) {
    if (std::find(hints.begin(), hints.end(), text) == hints.end()) {
        hints.push_back(text);
    }
}

} // namespace

std::vector<std::string> HintRuleTable::hintsFor(const ClassRecord& record) const {
    std::vector<std::string> hints;
    for (const auto& rule : rules_) {
        if (rule.kind != IssueKind::UnstableClass || !rule.class_predicate) continue;
        if (rule.class_predicate(record)) addUnique(hints, rule.text);
    }
    return hints;
}

std::vector<std::string> HintRuleTable::hintsFor(const ComposableRecord& record) const {
    std::vector<std::string> hints;
    for (const auto& rule : rules_) {
        if (rule.kind != IssueKind::NonSkippableComposable || !rule.composable_predicate) continue;
        if (rule.composable_predicate(record)) addUnique(hints, rule.text);
    }
    return hints;
}

bool isCollectionType(const std::string& type) {
    static const std::regex kCollection(
        R"(^(kotlin\.collections\.)?(Mutable)?(List|Map|Set|Collection|Iterable)\b|^(Array|ArrayList|HashMap|HashSet|LinkedHashMap|LinkedHashSet)\b|^[A-Z]\w*Array\b)");
    return std::regex_search(type, kCollection);
}

bool isFunctionType(const std::string& type) {
    return type.find("->") != std::string::npos ||
           type.rfind("Function", 0) == 0 ||
           type.rfind("kotlin.Function", 0) == 0;
}

// ─── Default Rules ────────────────────────────────────────────

HintRuleTable defaultHintRules() {
    HintRuleTable table;

    table.addClassRule("collection-member",
        [](const ClassRecord& c) {
            return std::any_of(c.unstable_members.begin(), c.unstable_members.end(),
                [](const MemberInfo& m) { return isCollectionType(m.type); });
        },
        "Replace List/Map/Set members with ImmutableList/ImmutableMap/ImmutableSet "
        "(kotlinx.collections.immutable)");

    table.addClassRule("mutable-member",
        [](const ClassRecord& c) {
            return std::any_of(c.unstable_members.begin(), c.unstable_members.end(),
                [](const MemberInfo& m) { return m.is_mutable; });
        },
        "Turn `var` members into `val`, or hold observable state in mutableStateOf");

    table.addClassRule("function-member",
        [](const ClassRecord& c) {
            return std::any_of(c.unstable_members.begin(), c.unstable_members.end(),
                [](const MemberInfo& m) { return isFunctionType(m.type); });
        },
        "Keep lambdas out of state classes, or remember them at the call site");

    table.addClassRule("annotate-class",
        [](const ClassRecord&) { return true; },
        "Annotate UI state classes with @Immutable (or @Stable when fields are observable)");

    table.addComposableRule("function-param",
        [](const ComposableRecord& f) {
            return std::any_of(f.unstable_params.begin(), f.unstable_params.end(),
                [](const ParamInfo& p) { return isFunctionType(p.type); });
        },
        "Wrap lambda callbacks in remember { } before passing them down");

    table.addComposableRule("collection-param",
        [](const ComposableRecord& f) {
            return std::any_of(f.unstable_params.begin(), f.unstable_params.end(),
                [](const ParamInfo& p) { return isCollectionType(p.type); });
        },
        "Pass ImmutableList/ImmutableMap instead of List/Map parameters");

    table.addComposableRule("stabilize-params",
        [](const ComposableRecord&) { return true; },
        "Make every parameter stable and hoist state to the parent composable");

    return table;
}

} // namespace scaffkit
