//! # Layer Policy Tests
//!
//! Policy validation with key paths, the canonical policy, the allowed-target
//! relation and first-match classification.

#include "strata/policy/layer_classifier.hpp"
#include "strata/policy/layer_policy.hpp"

#include <gtest/gtest.h>

using namespace strata;
using namespace strata::policy;

namespace {

ConfigError create_error(const std::vector<LayerPatternSpec>& patterns,
                         const AllowedTargetSpec& allowed) {
    auto result = LayerPolicy::create(patterns, allowed);
    EXPECT_TRUE(is_err(result));
    if (is_ok(result)) {
        return ConfigError{};
    }
    return unwrap_err(result);
}

} // namespace

// ============================================================================
// Layer Names
// ============================================================================

TEST(LayerTest, NamesRoundTrip) {
    for (auto layer : configurable_layers()) {
        EXPECT_EQ(parse_layer(layer_name(layer)), layer);
    }
    EXPECT_EQ(configurable_layers().size(), 5u);
}

TEST(LayerTest, UnclassifiedIsNotConfigurable) {
    EXPECT_STREQ(layer_name(Layer::Unclassified), "unclassified");
    EXPECT_FALSE(parse_layer("unclassified").has_value());
    EXPECT_FALSE(parse_layer("domain").has_value());
    EXPECT_FALSE(parse_layer("").has_value());
}

// ============================================================================
// Validation
// ============================================================================

TEST(LayerPolicyTest, AcceptsValidPolicy) {
    auto result = LayerPolicy::create({{"src/core/**", "business"}, {"src/db/**", "infrastructure"}},
                                      {{"infrastructure", {"business"}}});
    ASSERT_TRUE(is_ok(result));
    const auto& policy = unwrap(result);
    EXPECT_EQ(policy.patterns().size(), 2u);
    EXPECT_TRUE(policy.allows(Layer::Infrastructure, Layer::Business));
    EXPECT_FALSE(policy.allows(Layer::Business, Layer::Infrastructure));
}

TEST(LayerPolicyTest, RejectsMalformedGlob) {
    auto error = create_error({{"src/{a,b/**", "business"}}, {});
    EXPECT_EQ(error.key, "layers[0].pattern");
    EXPECT_NE(error.message.find("invalid glob"), std::string::npos);
}

TEST(LayerPolicyTest, RejectsUnknownLayerName) {
    auto error = create_error({{"src/a/**", "business"}, {"src/b/**", "core"}}, {});
    EXPECT_EQ(error.key, "layers[1].layer");
    EXPECT_NE(error.message.find("'core'"), std::string::npos);
}

TEST(LayerPolicyTest, RejectsUnknownSourceLayer) {
    auto error = create_error({}, {{"core", {"shared"}}});
    EXPECT_EQ(error.key, "allowed_targets.core");
}

TEST(LayerPolicyTest, RejectsUnknownTargetLayer) {
    auto error = create_error({}, {{"business", {"shared", "database"}}});
    EXPECT_EQ(error.key, "allowed_targets.business[1]");
}

TEST(LayerPolicyTest, RejectsCyclicRelation) {
    auto error = create_error({}, {{"business", {"contracts"}}, {"contracts", {"business"}}});
    EXPECT_EQ(error.key, "allowed_targets.business");
    EXPECT_NE(error.message.find("allowed targets form a cycle: business -> contracts -> business"),
              std::string::npos);
}

TEST(LayerPolicyTest, RejectsLongerCycle) {
    auto error = create_error({}, {{"presentation", {"business"}},
                                   {"business", {"shared"}},
                                   {"shared", {"presentation"}}});
    EXPECT_NE(error.message.find("cycle"), std::string::npos);
}

TEST(LayerPolicyTest, SelfEntryIsNotACycle) {
    auto result = LayerPolicy::create({}, {{"business", {"business", "shared"}}});
    EXPECT_TRUE(is_ok(result));
}

// ============================================================================
// Relation
// ============================================================================

TEST(LayerPolicyTest, SameLayerAlwaysAllowed) {
    auto result = LayerPolicy::create({}, {});
    ASSERT_TRUE(is_ok(result));
    for (auto layer : configurable_layers()) {
        EXPECT_TRUE(unwrap(result).allows(layer, layer));
    }
}

TEST(LayerPolicyTest, CanonicalRelation) {
    auto policy = LayerPolicy::canonical();
    EXPECT_TRUE(policy.allows(Layer::Business, Layer::Contracts));
    EXPECT_TRUE(policy.allows(Layer::Business, Layer::Shared));
    EXPECT_TRUE(policy.allows(Layer::Infrastructure, Layer::Business));
    EXPECT_TRUE(policy.allows(Layer::Presentation, Layer::Contracts));
    EXPECT_FALSE(policy.allows(Layer::Business, Layer::Infrastructure));
    EXPECT_FALSE(policy.allows(Layer::Contracts, Layer::Business));
    EXPECT_FALSE(policy.allows(Layer::Shared, Layer::Contracts));
    EXPECT_FALSE(policy.allows(Layer::Infrastructure, Layer::Presentation));
    EXPECT_EQ(policy.allowed_targets(Layer::Contracts), (std::set<Layer>{Layer::Shared}));
    EXPECT_TRUE(policy.allowed_targets(Layer::Shared).empty());
}

// ============================================================================
// Classification
// ============================================================================

TEST(LayerClassifierTest, CanonicalDirectoryNames) {
    auto policy = LayerPolicy::canonical();
    LayerClassifier classifier(policy);
    EXPECT_EQ(classifier.classify("src/domain/order.ts"), Layer::Business);
    EXPECT_EQ(classifier.classify("app/business/rules.py"), Layer::Business);
    EXPECT_EQ(classifier.classify("src/ports/repository.ts"), Layer::Contracts);
    EXPECT_EQ(classifier.classify("src/adapters/pg.ts"), Layer::Infrastructure);
    EXPECT_EQ(classifier.classify("internal/infra/db.go"), Layer::Infrastructure);
    EXPECT_EQ(classifier.classify("src/ui/page.tsx"), Layer::Presentation);
    EXPECT_EQ(classifier.classify("src/shared/money.ts"), Layer::Shared);
    EXPECT_EQ(classifier.classify("src/main.ts"), Layer::Unclassified);
}

TEST(LayerClassifierTest, FirstMatchingPatternWins) {
    auto policy = LayerPolicy::canonical();
    LayerClassifier classifier(policy);
    // contracts is listed before business
    EXPECT_EQ(classifier.classify("src/domain/ports/repository.ts"), Layer::Contracts);

    auto custom = LayerPolicy::create({{"src/domain/legacy/**", "infrastructure"},
                                       {"src/domain/**", "business"}},
                                      {});
    ASSERT_TRUE(is_ok(custom));
    LayerClassifier ordered(unwrap(custom));
    EXPECT_EQ(ordered.classify("src/domain/legacy/db.ts"), Layer::Infrastructure);
    EXPECT_EQ(ordered.classify("src/domain/order.ts"), Layer::Business);
}

TEST(LayerClassifierTest, ApplyLabelsEveryModuleOnce) {
    ingest::FileFacts a;
    a.path = "src/domain/order.ts";
    ingest::FileFacts b;
    b.path = "src/tools/script.ts";
    auto graph = graph::ModuleGraphBuilder(graph::GraphOptions{}).build({a, b});

    auto policy = LayerPolicy::canonical();
    LayerClassifier classifier(policy);
    classifier.apply(graph);

    EXPECT_TRUE(graph.is_classified());
    EXPECT_EQ(graph.modules()[*graph.find("src/domain/order.ts")].layer, Layer::Business);
    EXPECT_EQ(graph.modules()[*graph.find("src/tools/script.ts")].layer, Layer::Unclassified);
    EXPECT_THROW(classifier.apply(graph), InternalError);
}
