//! # Per-Module Rules
//!
//! Rules that read one module's facts at a time: I/O isolation, error
//! shape, parse failures, configuration gaps and ambiguous imports.

#include "strata/policy/glob.hpp"
#include "strata/rules/rule.hpp"

#include <algorithm>
#include <cstdlib>

namespace strata::rules {

namespace {

auto make(const Rule& rule, Severity severity, const std::string& path) -> Violation {
    Violation v;
    v.rule_id = std::string(rule.id());
    v.category = rule.category();
    v.severity = severity;
    v.path = path;
    return v;
}

/// Line number from a scanner diagnostic of the form "line N: ...".
auto diagnostic_line(const std::string& reason) -> uint32_t {
    if (!reason.starts_with("line ")) {
        return 0;
    }
    char* end = nullptr;
    auto line = std::strtoul(reason.c_str() + 5, &end, 10);
    if (end == reason.c_str() + 5 || *end != ':') {
        return 0;
    }
    return static_cast<uint32_t>(line);
}

auto describe_construct(const std::string& construct) -> std::string {
    if (construct == "except") {
        return "empty except block";
    }
    if (construct == "if err != nil") {
        return "empty error check";
    }
    if (construct == "Err(_) =>") {
        return "empty Err arm";
    }
    if (construct == ".catch()") {
        return "empty promise rejection handler";
    }
    return "empty catch block";
}

} // namespace

// ============================================================================
// io-isolation
// ============================================================================

auto IoIsolationRule::evaluate(const RuleContext& ctx, Severity severity) const
    -> std::vector<Violation> {
    std::vector<Violation> out;

    for (const auto& module : ctx.graph.modules()) {
        if (ctx.settings.io_isolated_layers.count(module.layer) == 0) {
            continue;
        }
        const auto layer = policy::layer_name(module.layer);

        for (const auto& site : module.facts.io_call_sites) {
            auto v = make(*this, severity, module.path);
            v.line_range = report::LineRange{site.line, std::max(site.line, site.end_line)};
            v.column = site.column;
            v.message = "calls I/O primitive '" + site.callee + "' (matches '" +
                        site.matched_pattern + "') in " + layer + " layer";
            v.detail = report::IoIsolationDetail{site.matched_pattern, site.callee, false};
            out.push_back(std::move(v));
        }

        auto deny = ctx.settings.io_deny_imports.find(module.facts.language);
        if (deny == ctx.settings.io_deny_imports.end()) {
            continue;
        }
        for (const auto& dep : module.external_deps) {
            for (const auto& pattern : deny->second) {
                if (!policy::wildcard_match(pattern, dep.specifier)) {
                    continue;
                }
                auto v = make(*this, severity, module.path);
                if (dep.line > 0) {
                    v.line_range = report::LineRange::at(dep.line);
                }
                v.message = "imports I/O module '" + dep.specifier + "' (matches '" + pattern +
                            "') in " + layer + " layer";
                v.detail = report::IoIsolationDetail{pattern, dep.specifier, true};
                out.push_back(std::move(v));
                break;
            }
        }
    }
    return out;
}

// ============================================================================
// error-shape
// ============================================================================

auto ErrorShapeRule::evaluate(const RuleContext& ctx, Severity severity) const
    -> std::vector<Violation> {
    std::vector<Violation> out;
    for (const auto& module : ctx.graph.modules()) {
        for (const auto& site : module.facts.empty_handler_sites) {
            auto v = make(*this, severity, module.path);
            v.line_range = report::LineRange{site.line, std::max(site.line, site.end_line)};
            v.column = site.column;
            v.message = describe_construct(site.matched_pattern) +
                        " discards the error without recovery, logging or rethrow";
            v.detail = report::ErrorShapeDetail{site.matched_pattern};
            out.push_back(std::move(v));
        }
    }
    return out;
}

// ============================================================================
// parse-failure
// ============================================================================

auto ParseFailureRule::evaluate(const RuleContext& ctx, Severity severity) const
    -> std::vector<Violation> {
    std::vector<Violation> out;
    for (const auto& module : ctx.graph.modules()) {
        if (module.facts.parse_ok) {
            continue;
        }
        const auto& reason = module.facts.parse_error;
        auto v = make(*this, severity, module.path);
        if (auto line = diagnostic_line(reason); line > 0) {
            v.line_range = report::LineRange::at(line);
        }
        v.message = "could not be parsed completely: " +
                    (reason.empty() ? std::string("unknown error") : reason);
        v.detail = report::ParseFailureDetail{reason};
        out.push_back(std::move(v));
    }
    return out;
}

// ============================================================================
// config-gap
// ============================================================================

auto ConfigGapRule::evaluate(const RuleContext& ctx, Severity severity) const
    -> std::vector<Violation> {
    std::vector<Violation> out;
    for (const auto& module : ctx.graph.modules()) {
        if (module.layer != policy::Layer::Unclassified) {
            continue;
        }
        auto v = make(*this, severity, module.path);
        v.message = "matches no layer pattern; excluded from dependency-direction checks";
        v.detail = report::ConfigGapDetail{};
        out.push_back(std::move(v));
    }
    return out;
}

// ============================================================================
// ambiguous-import
// ============================================================================

auto AmbiguousImportRule::evaluate(const RuleContext& ctx, Severity severity) const
    -> std::vector<Violation> {
    std::vector<Violation> out;
    const auto& modules = ctx.graph.modules();
    for (const auto& amb : ctx.graph.ambiguous()) {
        auto v = make(*this, severity, modules[amb.module].path);
        if (amb.line > 0) {
            v.line_range = report::LineRange::at(amb.line);
        }
        std::string list;
        for (const auto& c : amb.candidates) {
            list += (list.empty() ? "" : ", ") + c;
        }
        v.message = "import '" + amb.specifier + "' matches " +
                    std::to_string(amb.candidates.size()) + " files (" + list +
                    "); treated as external";
        v.detail = report::AmbiguousImportDetail{amb.specifier, amb.candidates};
        out.push_back(std::move(v));
    }
    return out;
}

} // namespace strata::rules
