//! # Rules
//!
//! A rule inspects the classified graph and returns violations. Rules are
//! independent: none reads another's output, and none mutates the graph.
//!
//! ## Built-in Rules
//!
//! | Rule id                | Category         | Default  |
//! |------------------------|------------------|----------|
//! | `dependency-direction` | direction        | error    |
//! | `io-isolation`         | io-isolation     | error    |
//! | `module-boundary`      | boundary         | error    |
//! | `error-shape`          | error-shape      | warning  |
//! | `circular-dependency`  | cycle            | error    |
//! | `parse-failure`        | parse-failure    | warning  |
//! | `config-gap`           | config-gap       | warning  |
//! | `ambiguous-import`     | ambiguous-import | warning  |

#ifndef STRATA_RULES_RULE_HPP
#define STRATA_RULES_RULE_HPP

#include "strata/common.hpp"
#include "strata/graph/module_graph.hpp"
#include "strata/ingest/file_facts.hpp"
#include "strata/policy/layer_policy.hpp"
#include "strata/report/violation.hpp"

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace strata::rules {

using report::Category;
using report::Severity;
using report::Violation;

/// When an edge into a module counts as type-only coupling.
struct TypeOnlyPolicy {
    bool enabled = true;
    /// Most call sites a type-only target may contain.
    uint32_t max_call_sites = 0;
};

/// Rule inputs beyond the layer policy.
struct RuleSettings {
    std::set<policy::Layer> io_isolated_layers = {policy::Layer::Business};
    /// Wildcard patterns over external import specifiers, per language.
    std::map<ingest::Language, std::vector<std::string>> io_deny_imports;
    /// Glob over the file name of a feature's public entry point.
    std::string public_api_pattern = "index.*";
    /// Per-feature public-API patterns, keyed by feature directory name.
    std::map<std::string, std::string> public_api_overrides;
    TypeOnlyPolicy type_only;
};

/// Everything a rule may read.
struct RuleContext {
    const graph::ModuleGraph& graph;
    const policy::LayerPolicy& policy;
    const RuleSettings& settings;
};

class Rule {
public:
    virtual ~Rule() = default;

    [[nodiscard]] virtual auto id() const -> std::string_view = 0;
    [[nodiscard]] virtual auto category() const -> Category = 0;
    [[nodiscard]] virtual auto default_severity() const -> Severity = 0;
    [[nodiscard]] virtual auto description() const -> std::string_view = 0;

    /// Produces this rule's violations. `severity` is the configured
    /// severity of the rule.
    [[nodiscard]] virtual auto evaluate(const RuleContext& ctx, Severity severity) const
        -> std::vector<Violation> = 0;
};

// ============================================================================
// Built-in Rules
// ============================================================================

class DependencyDirectionRule : public Rule {
public:
    auto id() const -> std::string_view override {
        return "dependency-direction";
    }
    auto category() const -> Category override {
        return Category::Direction;
    }
    auto default_severity() const -> Severity override {
        return Severity::Error;
    }
    auto description() const -> std::string_view override {
        return "Edges between layers must follow the allowed-target relation";
    }
    auto evaluate(const RuleContext& ctx, Severity severity) const
        -> std::vector<Violation> override;
};

class IoIsolationRule : public Rule {
public:
    auto id() const -> std::string_view override {
        return "io-isolation";
    }
    auto category() const -> Category override {
        return Category::IoIsolation;
    }
    auto default_severity() const -> Severity override {
        return Severity::Error;
    }
    auto description() const -> std::string_view override {
        return "I/O-isolated layers may not call or import I/O primitives";
    }
    auto evaluate(const RuleContext& ctx, Severity severity) const
        -> std::vector<Violation> override;
};

class ModuleBoundaryRule : public Rule {
public:
    auto id() const -> std::string_view override {
        return "module-boundary";
    }
    auto category() const -> Category override {
        return Category::Boundary;
    }
    auto default_severity() const -> Severity override {
        return Severity::Error;
    }
    auto description() const -> std::string_view override {
        return "Features may only import another feature's public API file";
    }
    auto evaluate(const RuleContext& ctx, Severity severity) const
        -> std::vector<Violation> override;
};

class ErrorShapeRule : public Rule {
public:
    auto id() const -> std::string_view override {
        return "error-shape";
    }
    auto category() const -> Category override {
        return Category::ErrorShape;
    }
    auto default_severity() const -> Severity override {
        return Severity::Warning;
    }
    auto description() const -> std::string_view override {
        return "Error handlers must recover, log or rethrow";
    }
    auto evaluate(const RuleContext& ctx, Severity severity) const
        -> std::vector<Violation> override;
};

class CircularDependencyRule : public Rule {
public:
    auto id() const -> std::string_view override {
        return "circular-dependency";
    }
    auto category() const -> Category override {
        return Category::Cycle;
    }
    auto default_severity() const -> Severity override {
        return Severity::Error;
    }
    auto description() const -> std::string_view override {
        return "Modules may not take part in import cycles";
    }
    auto evaluate(const RuleContext& ctx, Severity severity) const
        -> std::vector<Violation> override;
};

class ParseFailureRule : public Rule {
public:
    auto id() const -> std::string_view override {
        return "parse-failure";
    }
    auto category() const -> Category override {
        return Category::ParseFailure;
    }
    auto default_severity() const -> Severity override {
        return Severity::Warning;
    }
    auto description() const -> std::string_view override {
        return "Files that could not be read or scanned completely";
    }
    auto evaluate(const RuleContext& ctx, Severity severity) const
        -> std::vector<Violation> override;
};

class ConfigGapRule : public Rule {
public:
    auto id() const -> std::string_view override {
        return "config-gap";
    }
    auto category() const -> Category override {
        return Category::ConfigGap;
    }
    auto default_severity() const -> Severity override {
        return Severity::Warning;
    }
    auto description() const -> std::string_view override {
        return "Modules that match no layer pattern";
    }
    auto evaluate(const RuleContext& ctx, Severity severity) const
        -> std::vector<Violation> override;
};

class AmbiguousImportRule : public Rule {
public:
    auto id() const -> std::string_view override {
        return "ambiguous-import";
    }
    auto category() const -> Category override {
        return Category::AmbiguousImport;
    }
    auto default_severity() const -> Severity override {
        return Severity::Warning;
    }
    auto description() const -> std::string_view override {
        return "Imports matching more than one file";
    }
    auto evaluate(const RuleContext& ctx, Severity severity) const
        -> std::vector<Violation> override;
};

/// One instance of every built-in rule, in table order.
[[nodiscard]] auto builtin_rules() -> std::vector<Box<Rule>>;

/// True when `id` names a built-in rule.
[[nodiscard]] auto is_builtin_rule(std::string_view id) -> bool;

/// True when every export of `facts` is a contract kind, there is at least
/// one, and the call-site count is within the policy threshold.
[[nodiscard]] auto is_type_only(const ingest::FileFacts& facts, const TypeOnlyPolicy& policy)
    -> bool;

} // namespace strata::rules

#endif // STRATA_RULES_RULE_HPP
