//! # Layer Policy
//!
//! The validated architectural policy: an ordered pattern list assigning
//! layers to paths, and the allowed-target relation between layers.
//!
//! ## Validation
//!
//! `LayerPolicy::create` rejects, with the offending key:
//!
//! | Problem                        | Key                            |
//! |--------------------------------|--------------------------------|
//! | Malformed glob                 | `layers[i].pattern`            |
//! | Unknown layer name             | `layers[i].layer`              |
//! | Unknown source layer           | `allowed_targets.<name>`       |
//! | Unknown target layer           | `allowed_targets.<name>[j]`    |
//! | Cycle in the allowed relation  | `allowed_targets.<name>`       |
//!
//! Self entries (`business -> business`) are ignored by the cycle check;
//! same-layer dependencies are always allowed anyway.
//!
//! A policy is an explicit value: classifier and rules receive it by
//! reference, so several policies can be analyzed in one process.

#ifndef STRATA_POLICY_LAYER_POLICY_HPP
#define STRATA_POLICY_LAYER_POLICY_HPP

#include "strata/common.hpp"
#include "strata/policy/glob.hpp"
#include "strata/policy/layer.hpp"

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace strata::policy {

/// A `{pattern, layer}` entry as written in configuration.
struct LayerPatternSpec {
    std::string pattern;
    std::string layer;
};

/// `allowed_targets` as written in configuration, in key order.
using AllowedTargetSpec = std::vector<std::pair<std::string, std::vector<std::string>>>;

/// A compiled pattern entry.
struct LayerPattern {
    Glob glob;
    Layer layer;
};

class LayerPolicy {
public:
    /// Validates a policy. Layers absent from `allowed` may depend on
    /// nothing but themselves.
    [[nodiscard]] static auto create(const std::vector<LayerPatternSpec>& patterns,
                                     const AllowedTargetSpec& allowed)
        -> Result<LayerPolicy, ConfigError>;

    /// The canonical policy: directory-name patterns and the relation
    /// presentation/infrastructure -> business -> contracts -> shared.
    [[nodiscard]] static auto canonical() -> LayerPolicy;

    [[nodiscard]] static auto canonical_patterns() -> std::vector<LayerPatternSpec>;
    [[nodiscard]] static auto canonical_allowed() -> AllowedTargetSpec;

    [[nodiscard]] auto patterns() const -> const std::vector<LayerPattern>& {
        return patterns_;
    }

    /// True when `from` may depend on `to`. Always true for equal layers.
    [[nodiscard]] auto allows(Layer from, Layer to) const -> bool;

    [[nodiscard]] auto allowed_targets(Layer from) const -> std::set<Layer>;

private:
    std::vector<LayerPattern> patterns_;
    std::map<Layer, std::set<Layer>> allowed_;
};

} // namespace strata::policy

#endif // STRATA_POLICY_LAYER_POLICY_HPP
