// test_attribution.cpp - TreeSHAP attributions and top-k ranking

#include <gtest/gtest.h>

#include "TestSupport.hpp"

#include "fris/core/Errors.hpp"
#include "fris/explain/AttributionEngine.hpp"

#include <cmath>
#include <numeric>

using namespace fris;
using nlohmann::json;

namespace {

// Two stumps on independent features: contributions are exactly
// leaf(x) - E[leaf] per stump.
json additiveStumps() {
    json trees = json::array();
    trees.push_back({{"nodes", {test::split(0, 1.0, 1, 2, 1, 100.0),
                                test::leaf(-1.0, 50.0), test::leaf(1.0, 50.0)}}});
    trees.push_back({{"nodes", {test::split(1, 1.0, 1, 2, 1, 100.0),
                                test::leaf(-0.2, 50.0), test::leaf(0.2, 50.0)}}});
    return {{"num_features", 3}, {"base_score", 0.5}, {"trees", trees}};
}

// Depth-two tree where feature 1 only matters on one side of feature 0.
json interactionTree() {
    json trees = json::array();
    trees.push_back({{"nodes", {
        test::split(0, 4.0, 1, 2, 1, 100.0),
        test::leaf(-0.4, 60.0),
        test::split(1, 12.0, 3, 4, 4, 40.0),
        test::leaf(0.3, 25.0),
        test::leaf(0.9, 15.0)
    }}});
    return {{"num_features", 2}, {"base_score", 0.5}, {"trees", trees}};
}

} // namespace

TEST(AttributionEngineTest, IndependentStumpsGiveExactDifferences) {
    const auto model = TreeEnsemble::fromJson(additiveStumps());
    const auto phi = model.contributions({0.0, 5.0, 7.0});
    ASSERT_EQ(phi.size(), 3u);
    EXPECT_NEAR(phi[0], -1.0, 1e-12);
    EXPECT_NEAR(phi[1], 0.2, 1e-12);
    EXPECT_DOUBLE_EQ(phi[2], 0.0);
}

TEST(AttributionEngineTest, InteractionSplitsCreditAsShapleyValues) {
    const auto model = TreeEnsemble::fromJson(interactionTree());
    const auto phi = model.contributions({5.0, 20.0});
    // v({}) = -0.03, v({0}) = 0.525, v({1}) = 0.12, v({0,1}) = 0.9
    EXPECT_NEAR(phi[0], 0.6675, 1e-12);
    EXPECT_NEAR(phi[1], 0.2625, 1e-12);
}

TEST(AttributionEngineTest, ContributionsSumToMarginMinusBaseline) {
    const auto model = TreeEnsemble::fromJson(test::classifierJson(4));
    const std::vector<std::vector<double>> inputs = {
        {2.0, 20.0, 0.01, -1.0},
        {5.0, 20.0, 0.5, 1.0},
        {4.5, 3.0, 0.0, -0.5},
        {2.9, 12.0, 0.02, 0.0},
        {std::nan(""), 1.0, 1.0, -1.0}
    };
    for (const auto& x : inputs) {
        const auto phi = model.contributions(x);
        const double sum = std::accumulate(phi.begin(), phi.end(), 0.0);
        EXPECT_NEAR(sum, model.margin(x) - model.expectedMargin(), 1e-9);
    }
}

TEST(AttributionEngineTest, ExplainRanksByMagnitudeAndTruncates) {
    const auto model = TreeEnsemble::fromJson(additiveStumps());
    const auto ex = AttributionEngine::explain(model, {0.0, 5.0, 7.0}, {"a", "b", "c"}, 2);

    EXPECT_NEAR(ex.baseline, 0.0, 1e-12);
    EXPECT_NEAR(ex.prediction, -0.8, 1e-12);
    EXPECT_NEAR(ex.contribution_sum, ex.prediction - ex.baseline, 1e-12);

    ASSERT_EQ(ex.attributions.size(), 2u);
    EXPECT_EQ(ex.attributions[0].feature, "a");
    EXPECT_DOUBLE_EQ(ex.attributions[0].value, 0.0);
    EXPECT_EQ(ex.attributions[1].feature, "b");
    EXPECT_DOUBLE_EQ(ex.attributions[1].value, 5.0);
}

TEST(AttributionEngineTest, EqualMagnitudesKeepSliceOrder) {
    json j = additiveStumps();
    j["trees"][1]["nodes"][1]["leaf"] = -1.0;
    j["trees"][1]["nodes"][2]["leaf"] = 1.0;
    const auto model = TreeEnsemble::fromJson(j);

    const auto ex = AttributionEngine::explain(model, {5.0, 0.0, 0.0}, {"a", "b", "c"}, 10);
    ASSERT_EQ(ex.attributions.size(), 3u);
    EXPECT_EQ(ex.attributions[0].feature, "a");
    EXPECT_EQ(ex.attributions[1].feature, "b");
    EXPECT_EQ(ex.attributions[2].feature, "c");
}

TEST(AttributionEngineTest, RejectsMismatchedNamesAndZeroK) {
    const auto model = TreeEnsemble::fromJson(additiveStumps());
    EXPECT_THROW(AttributionEngine::explain(model, {0.0, 1.0, 2.0}, {"a", "b"}, 1), ContractViolation);
    EXPECT_THROW(AttributionEngine::explain(model, {0.0, 1.0, 2.0}, {"a", "b", "c"}, 0), InputError);
}
