//! # Layer Policy Validation
//!
//! Compiles patterns, resolves layer names and rejects cyclic
//! allowed-target relations. The cycle search is a colouring DFS over the
//! five configurable layers.

#include "strata/policy/layer_policy.hpp"

#include "strata/log/log.hpp"

#include <algorithm>

namespace strata::policy {

namespace {

enum class Mark { White, Grey, Black };

/// Returns the layers of a cycle reachable from `start`, first layer repeated
/// at the end, or an empty vector.
auto find_cycle(Layer start, const std::map<Layer, std::set<Layer>>& allowed,
                std::map<Layer, Mark>& marks, std::vector<Layer>& path) -> std::vector<Layer> {
    marks[start] = Mark::Grey;
    path.push_back(start);
    if (auto it = allowed.find(start); it != allowed.end()) {
        for (auto next : it->second) {
            if (next == start) {
                continue;
            }
            if (marks[next] == Mark::Grey) {
                auto from = std::find(path.begin(), path.end(), next);
                std::vector<Layer> cycle(from, path.end());
                cycle.push_back(next);
                return cycle;
            }
            if (marks[next] == Mark::White) {
                auto cycle = find_cycle(next, allowed, marks, path);
                if (!cycle.empty()) {
                    return cycle;
                }
            }
        }
    }
    path.pop_back();
    marks[start] = Mark::Black;
    return {};
}

} // namespace

auto LayerPolicy::create(const std::vector<LayerPatternSpec>& patterns,
                         const AllowedTargetSpec& allowed) -> Result<LayerPolicy, ConfigError> {
    LayerPolicy policy;

    for (size_t i = 0; i < patterns.size(); ++i) {
        auto key = "layers[" + std::to_string(i) + "]";
        auto glob = Glob::compile(patterns[i].pattern);
        if (is_err(glob)) {
            return ConfigError::make(key + ".pattern", "invalid glob '" + patterns[i].pattern +
                                                           "': " + unwrap_err(glob));
        }
        auto layer = parse_layer(patterns[i].layer);
        if (!layer) {
            return ConfigError::make(key + ".layer", "unknown layer '" + patterns[i].layer + "'");
        }
        policy.patterns_.push_back(LayerPattern{std::move(unwrap(glob)), *layer});
    }

    for (const auto& [source_name, targets] : allowed) {
        auto key = "allowed_targets." + source_name;
        auto source = parse_layer(source_name);
        if (!source) {
            return ConfigError::make(key, "unknown layer '" + source_name + "'");
        }
        auto& set = policy.allowed_[*source];
        for (size_t j = 0; j < targets.size(); ++j) {
            auto target = parse_layer(targets[j]);
            if (!target) {
                return ConfigError::make(key + "[" + std::to_string(j) + "]",
                                         "unknown layer '" + targets[j] + "'");
            }
            set.insert(*target);
        }
    }

    std::map<Layer, Mark> marks;
    for (const auto& [source_name, targets] : allowed) {
        auto source = *parse_layer(source_name);
        if (marks[source] != Mark::White) {
            continue;
        }
        std::vector<Layer> path;
        auto cycle = find_cycle(source, policy.allowed_, marks, path);
        if (!cycle.empty()) {
            std::string chain;
            for (size_t k = 0; k < cycle.size(); ++k) {
                chain += (k > 0 ? " -> " : "") + std::string(layer_name(cycle[k]));
            }
            return ConfigError::make("allowed_targets." + std::string(layer_name(cycle.front())),
                                     "allowed targets form a cycle: " + chain);
        }
    }

    STRATA_LOG_DEBUG("classify", "Layer policy: " << policy.patterns_.size() << " patterns, "
                                                  << policy.allowed_.size()
                                                  << " layers with allowed targets");
    return policy;
}

auto LayerPolicy::canonical_patterns() -> std::vector<LayerPatternSpec> {
    return {
        {"**/{contracts,ports}/**", "contracts"},
        {"**/{business,domain}/**", "business"},
        {"**/{infra,infrastructure,adapters}/**", "infrastructure"},
        {"**/{presentation,ui}/**", "presentation"},
        {"**/{shared,common}/**", "shared"},
    };
}

auto LayerPolicy::canonical_allowed() -> AllowedTargetSpec {
    return {
        {"shared", {}},
        {"contracts", {"shared"}},
        {"business", {"contracts", "shared"}},
        {"infrastructure", {"business", "contracts", "shared"}},
        {"presentation", {"business", "contracts", "shared"}},
    };
}

auto LayerPolicy::canonical() -> LayerPolicy {
    auto policy = create(canonical_patterns(), canonical_allowed());
    if (is_err(policy)) {
        throw InternalError("canonical layer policy rejected: " + unwrap_err(policy).to_string());
    }
    return std::move(unwrap(policy));
}

auto LayerPolicy::allows(Layer from, Layer to) const -> bool {
    if (from == to) {
        return true;
    }
    auto it = allowed_.find(from);
    return it != allowed_.end() && it->second.count(to) > 0;
}

auto LayerPolicy::allowed_targets(Layer from) const -> std::set<Layer> {
    auto it = allowed_.find(from);
    return it == allowed_.end() ? std::set<Layer>{} : it->second;
}

} // namespace strata::policy
