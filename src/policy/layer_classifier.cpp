#include "strata/policy/layer_classifier.hpp"

#include "strata/log/log.hpp"

namespace strata::policy {

auto LayerClassifier::classify(std::string_view path) const -> Layer {
    for (const auto& entry : policy_.patterns()) {
        if (entry.glob.matches(path)) {
            return entry.layer;
        }
    }
    return Layer::Unclassified;
}

void LayerClassifier::apply(graph::ModuleGraph& graph) const {
    std::vector<Layer> layers;
    layers.reserve(graph.modules().size());
    size_t unclassified = 0;
    for (const auto& module : graph.modules()) {
        auto layer = classify(module.path);
        if (layer == Layer::Unclassified) {
            ++unclassified;
        }
        STRATA_LOG_TRACE("classify", module.path << " -> " << layer_name(layer));
        layers.push_back(layer);
    }
    graph.assign_layers(layers);
    STRATA_LOG_DEBUG("classify", "Classified " << layers.size() << " modules, " << unclassified
                                               << " unclassified");
}

} // namespace strata::policy
