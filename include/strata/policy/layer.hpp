//! # Architectural Layers
//!
//! | Layer            | Config name        | Canonical allowed targets       |
//! |------------------|--------------------|---------------------------------|
//! | `Shared`         | `shared`           | (none)                          |
//! | `Contracts`      | `contracts`        | shared                          |
//! | `Business`       | `business`         | contracts, shared               |
//! | `Infrastructure` | `infrastructure`   | business, contracts, shared     |
//! | `Presentation`   | `presentation`     | business, contracts, shared     |
//! | `Unclassified`   | (not configurable) | exempt from direction checks    |

#ifndef STRATA_POLICY_LAYER_HPP
#define STRATA_POLICY_LAYER_HPP

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace strata::policy {

enum class Layer : uint8_t { Unclassified, Shared, Contracts, Business, Infrastructure, Presentation };

/// Configuration name of a layer; "unclassified" for `Unclassified`.
[[nodiscard]] auto layer_name(Layer layer) -> const char*;

/// Parses a configuration layer name. `unclassified` is not accepted.
[[nodiscard]] auto parse_layer(std::string_view name) -> std::optional<Layer>;

/// Every configurable layer, in declaration order.
[[nodiscard]] auto configurable_layers() -> const std::vector<Layer>&;

} // namespace strata::policy

#endif // STRATA_POLICY_LAYER_HPP
