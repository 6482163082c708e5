//! # Rule Engine Implementation

#include "strata/rules/rule_engine.hpp"

#include "strata/log/log.hpp"

#include <algorithm>

namespace strata::rules {

auto builtin_rules() -> std::vector<Box<Rule>> {
    std::vector<Box<Rule>> rules;
    rules.push_back(make_box<DependencyDirectionRule>());
    rules.push_back(make_box<IoIsolationRule>());
    rules.push_back(make_box<ModuleBoundaryRule>());
    rules.push_back(make_box<ErrorShapeRule>());
    rules.push_back(make_box<CircularDependencyRule>());
    rules.push_back(make_box<ParseFailureRule>());
    rules.push_back(make_box<ConfigGapRule>());
    rules.push_back(make_box<AmbiguousImportRule>());
    return rules;
}

auto is_builtin_rule(std::string_view id) -> bool {
    static const auto RULES = builtin_rules();
    return std::any_of(RULES.begin(), RULES.end(), [&](const Box<Rule>& r) { return r->id() == id; });
}

auto RuleEngine::is_enabled(const Rule& rule) const -> bool {
    auto it = toggles_.find(std::string(rule.id()));
    return it == toggles_.end() || it->second.enabled;
}

auto RuleEngine::severity_of(const Rule& rule) const -> Severity {
    auto it = toggles_.find(std::string(rule.id()));
    if (it != toggles_.end() && it->second.severity) {
        return *it->second.severity;
    }
    return rule.default_severity();
}

auto RuleEngine::evaluate(const RuleContext& ctx, const Deadline& deadline) const
    -> std::vector<Violation> {
    if (!ctx.graph.is_classified()) {
        throw InternalError("rules evaluated on an unclassified graph");
    }

    std::vector<Violation> all;
    for (const auto& rule : rules_) {
        deadline.check("rule " + std::string(rule->id()));
        if (!is_enabled(*rule)) {
            STRATA_LOG_DEBUG("rules", "Skipping disabled rule " << rule->id());
            continue;
        }

        auto found = rule->evaluate(ctx, severity_of(*rule));
        for (const auto& v : found) {
            validate(*rule, v, ctx.graph);
        }
        STRATA_LOG_DEBUG("rules", rule->id() << ": " << found.size() << " violations");
        all.insert(all.end(), std::make_move_iterator(found.begin()),
                   std::make_move_iterator(found.end()));
    }
    return all;
}

void RuleEngine::validate(const Rule& rule, const Violation& v,
                          const graph::ModuleGraph& graph) const {
    auto fail = [&](const std::string& what) {
        STRATA_LOG_FATAL("rules", "Rule " << rule.id() << " produced an invalid violation: "
                                          << what);
        throw InternalError("rule '" + std::string(rule.id()) + "' produced an invalid violation (" +
                            what + ") for '" + v.path + "'");
    };

    if (v.rule_id != rule.id()) {
        fail("rule id '" + v.rule_id + "'");
    }
    if (v.category != rule.category() || report::detail_category(v.detail) != v.category) {
        fail("category mismatch");
    }
    if (!report::is_valid_severity(v.severity)) {
        fail("severity out of range: " + std::to_string(static_cast<int>(v.severity)));
    }
    if (v.path.empty() || !graph.find(v.path)) {
        fail("unknown module path");
    }
    if (v.line_range && (v.line_range->begin == 0 || v.line_range->end < v.line_range->begin)) {
        fail("line range " + std::to_string(v.line_range->begin) + "-" +
             std::to_string(v.line_range->end));
    }
}

} // namespace strata::rules
