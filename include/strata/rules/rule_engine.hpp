//! # Rule Engine
//!
//! Runs a set of rules over a classified graph. Configuration may switch a
//! rule off or override its severity. Every violation a rule returns is
//! checked before it is accepted:
//!
//! - `rule_id` and `category` match the producing rule
//! - the detail alternative matches the category
//! - the severity is a defined level
//! - the path names a module of the graph
//! - a line range, when present, is 1-based and not reversed
//!
//! A failed check is a programming error and throws `InternalError`.

#ifndef STRATA_RULES_RULE_ENGINE_HPP
#define STRATA_RULES_RULE_ENGINE_HPP

#include "strata/deadline.hpp"
#include "strata/rules/rule.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace strata::rules {

/// Per-rule configuration.
struct RuleToggle {
    bool enabled = true;
    std::optional<Severity> severity;
};

class RuleEngine {
public:
    explicit RuleEngine(std::vector<Box<Rule>> rules, std::map<std::string, RuleToggle> toggles = {})
        : rules_(std::move(rules)), toggles_(std::move(toggles)) {}

    /// Evaluates every enabled rule in order, checking the deadline before
    /// each one. The result is the unsorted union of all rule outputs.
    [[nodiscard]] auto evaluate(const RuleContext& ctx, const Deadline& deadline) const
        -> std::vector<Violation>;

    [[nodiscard]] auto rules() const -> const std::vector<Box<Rule>>& {
        return rules_;
    }

    [[nodiscard]] auto is_enabled(const Rule& rule) const -> bool;
    [[nodiscard]] auto severity_of(const Rule& rule) const -> Severity;

private:
    void validate(const Rule& rule, const Violation& violation,
                  const graph::ModuleGraph& graph) const;

    std::vector<Box<Rule>> rules_;
    std::map<std::string, RuleToggle> toggles_;
};

} // namespace strata::rules

#endif // STRATA_RULES_RULE_ENGINE_HPP
