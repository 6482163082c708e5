#include "strata/policy/layer.hpp"

namespace strata::policy {

auto layer_name(Layer layer) -> const char* {
    switch (layer) {
    case Layer::Unclassified:
        return "unclassified";
    case Layer::Shared:
        return "shared";
    case Layer::Contracts:
        return "contracts";
    case Layer::Business:
        return "business";
    case Layer::Infrastructure:
        return "infrastructure";
    case Layer::Presentation:
        return "presentation";
    }
    return "unknown";
}

auto parse_layer(std::string_view name) -> std::optional<Layer> {
    for (auto layer : configurable_layers()) {
        if (name == layer_name(layer)) {
            return layer;
        }
    }
    return std::nullopt;
}

auto configurable_layers() -> const std::vector<Layer>& {
    static const std::vector<Layer> LAYERS = {Layer::Shared, Layer::Contracts, Layer::Business,
                                              Layer::Infrastructure, Layer::Presentation};
    return LAYERS;
}

} // namespace strata::policy
