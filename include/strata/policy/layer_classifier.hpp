//! # Layer Classifier
//!
//! Maps module paths to layers: the first policy pattern matching the path
//! wins; no match leaves the module `Unclassified`. File content is never
//! consulted.

#ifndef STRATA_POLICY_LAYER_CLASSIFIER_HPP
#define STRATA_POLICY_LAYER_CLASSIFIER_HPP

#include "strata/graph/module_graph.hpp"
#include "strata/policy/layer_policy.hpp"

#include <string_view>

namespace strata::policy {

class LayerClassifier {
public:
    explicit LayerClassifier(const LayerPolicy& policy) : policy_(policy) {}

    [[nodiscard]] auto classify(std::string_view path) const -> Layer;

    /// Labels every module of `graph`. A graph is labelled once.
    void apply(graph::ModuleGraph& graph) const;

private:
    const LayerPolicy& policy_;
};

} // namespace strata::policy

#endif // STRATA_POLICY_LAYER_CLASSIFIER_HPP
