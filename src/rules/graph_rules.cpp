//! # Edge Rules
//!
//! Rules that walk the edge set: dependency direction, module boundary and
//! circular dependencies.

#include "strata/log/log.hpp"
#include "strata/policy/glob.hpp"
#include "strata/policy/layer_classifier.hpp"
#include "strata/rules/rule.hpp"

#include <algorithm>
#include <optional>
#include <set>
#include <string_view>

namespace strata::rules {

namespace {

auto join_layers(const std::set<policy::Layer>& layers) -> std::string {
    if (layers.empty()) {
        return "none";
    }
    std::string out;
    for (auto layer : layers) {
        if (!out.empty()) {
            out += ", ";
        }
        out += policy::layer_name(layer);
    }
    return out;
}

auto file_name(const std::string& path) -> std::string {
    auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

auto parent_dir(const std::string& path) -> std::string {
    auto slash = path.rfind('/');
    return slash == std::string::npos ? "" : path.substr(0, slash);
}

/// The feature of `module`, unless its directory is itself a layer
/// directory: the module is classified, and classifying the path below the
/// directory finds no layer.
auto effective_feature(const graph::Module& module, const policy::LayerClassifier& classifier)
    -> const std::optional<std::string>& {
    static const std::optional<std::string> none;
    if (!module.feature || module.layer == policy::Layer::Unclassified) {
        return module.feature;
    }
    auto below = std::string_view(module.path).substr(module.feature->size() + 1);
    return classifier.classify(below) == policy::Layer::Unclassified ? none : module.feature;
}

auto line_of(uint32_t line) -> std::optional<report::LineRange> {
    if (line == 0) {
        return std::nullopt;
    }
    return report::LineRange::at(line);
}

} // namespace

auto is_type_only(const ingest::FileFacts& facts, const TypeOnlyPolicy& policy) -> bool {
    if (!policy.enabled || facts.exports.empty()) {
        return false;
    }
    if (facts.call_site_count > policy.max_call_sites) {
        return false;
    }
    return std::all_of(facts.exports.begin(), facts.exports.end(),
                       [](const ingest::Symbol& s) { return ingest::is_contract_kind(s.kind); });
}

// ============================================================================
// dependency-direction
// ============================================================================

auto DependencyDirectionRule::evaluate(const RuleContext& ctx, Severity severity) const
    -> std::vector<Violation> {
    std::vector<Violation> out;
    const auto& modules = ctx.graph.modules();

    for (const auto& edge : ctx.graph.edges()) {
        const auto& from = modules[edge.from];
        const auto& to = modules[edge.to];
        if (from.layer == policy::Layer::Unclassified || to.layer == policy::Layer::Unclassified) {
            continue;
        }
        if (ctx.policy.allows(from.layer, to.layer)) {
            continue;
        }

        bool type_only = is_type_only(to.facts, ctx.settings.type_only);
        Violation v;
        v.rule_id = std::string(id());
        v.category = category();
        v.severity = type_only ? report::downgrade(severity) : severity;
        v.path = from.path;
        v.line_range = line_of(edge.line);
        v.message = std::string(policy::layer_name(from.layer)) + " module depends on " +
                    policy::layer_name(to.layer) + " module '" + to.path + "' (allowed: " +
                    join_layers(ctx.policy.allowed_targets(from.layer)) + ")" +
                    (type_only ? "; target declares types only" : "");
        v.detail = report::DirectionDetail{to.path, from.layer, to.layer, type_only};
        out.push_back(std::move(v));
    }
    return out;
}

// ============================================================================
// module-boundary
// ============================================================================

auto ModuleBoundaryRule::evaluate(const RuleContext& ctx, Severity severity) const
    -> std::vector<Violation> {
    std::vector<Violation> out;
    const auto& modules = ctx.graph.modules();
    policy::LayerClassifier classifier(ctx.policy);

    for (const auto& edge : ctx.graph.edges()) {
        const auto& from = modules[edge.from];
        const auto& to = modules[edge.to];
        const auto& from_feature = effective_feature(from, classifier);
        const auto& to_feature = effective_feature(to, classifier);
        if (!from_feature || !to_feature || *from_feature == *to_feature) {
            continue;
        }

        auto feature_name = file_name(*to_feature);
        auto pattern = ctx.settings.public_api_pattern;
        if (auto it = ctx.settings.public_api_overrides.find(feature_name);
            it != ctx.settings.public_api_overrides.end()) {
            pattern = it->second;
        }

        if (policy::glob_match(pattern, file_name(to.path))) {
            continue;
        }
        // A package import of the feature directory itself is its public surface
        if (edge.package_edge && parent_dir(to.path) == *to_feature) {
            continue;
        }

        Violation v;
        v.rule_id = std::string(id());
        v.category = category();
        v.severity = severity;
        v.path = from.path;
        v.line_range = line_of(edge.line);
        v.message = "imports '" + to.path + "', an internal file of feature '" + feature_name +
                    "' (public API: " + pattern + ")";
        v.detail = report::BoundaryDetail{to.path, file_name(*from_feature), feature_name, pattern};
        out.push_back(std::move(v));
    }
    return out;
}

// ============================================================================
// circular-dependency
// ============================================================================

auto CircularDependencyRule::evaluate(const RuleContext& ctx, Severity severity) const
    -> std::vector<Violation> {
    std::vector<Violation> out;
    const auto& modules = ctx.graph.modules();
    const auto& edges = ctx.graph.edges();

    for (const auto& group : ctx.graph.cycles()) {
        std::set<size_t> members(group.begin(), group.end());
        std::vector<std::string> paths;
        for (size_t m : group) {
            paths.push_back(modules[m].path);
        }

        for (size_t m : group) {
            // The earliest import of this module that stays inside the cycle
            const graph::DependencyEdge* next = nullptr;
            for (size_t e : ctx.graph.out_edges(m)) {
                const auto& edge = edges[e];
                if (members.count(edge.to) == 0 || !ctx.graph.counts_for_cycles(edge)) {
                    continue;
                }
                if (!next || edge.line < next->line) {
                    next = &edge;
                }
            }
            if (!next) {
                throw InternalError("cycle member '" + modules[m].path +
                                    "' has no edge inside its cycle");
            }

            Violation v;
            v.rule_id = std::string(id());
            v.category = category();
            v.severity = severity;
            v.path = modules[m].path;
            v.line_range = line_of(next->line);
            v.message = "import of '" + modules[next->to].path + "' closes a cycle of " +
                        std::to_string(group.size()) + " modules";
            v.detail = report::CycleDetail{paths, modules[next->to].path};
            out.push_back(std::move(v));
        }
    }
    STRATA_LOG_DEBUG("rules", id() << ": " << ctx.graph.cycles().size() << " cycle groups");
    return out;
}

} // namespace strata::rules
