// test_decision.cpp - Stacked decision and offline threshold selection

#include <gtest/gtest.h>

#include "TestSupport.hpp"

#include "fris/core/Errors.hpp"
#include "fris/decision/StackedDecision.hpp"

#include <cmath>

using namespace fris;

namespace {

LogisticStacker stacker(size_t width = 3) {
    return LogisticStacker::fromJson(test::stackerJson(width, false));
}

} // namespace

TEST(StackedDecisionTest, ProbabilityAtThresholdIsFraud) {
    const LogisticStacker s = stacker();
    const std::vector<double> meta = {0.4, 1.0, 2.0};
    const double p = s.predictProba(meta);

    const Decision at = StackedDecision::decide(s, meta, p);
    EXPECT_DOUBLE_EQ(at.probability, p);
    EXPECT_EQ(at.label, DecisionLabel::FRAUD);

    const Decision above = StackedDecision::decide(s, meta, std::nextafter(p, 1.0));
    EXPECT_EQ(above.label, DecisionLabel::LEGIT);
    EXPECT_STREQ(labelToString(above.label), "legit");
    EXPECT_STREQ(labelToString(at.label), "fraud");
}

TEST(StackedDecisionTest, MetaVectorMustMatchFrozenOrder) {
    const StackedDecision d(stacker(), {"xgb_oof_proba", "anomaly_score", "cluster_id"}, 0.5);

    MetaFeatureVector meta;
    meta.names = {"xgb_oof_proba", "anomaly_score", "cluster_id"};
    meta.values = {0.9, 0.1, 1.0};
    EXPECT_NO_THROW(d.decide(meta));

    meta.names = {"anomaly_score", "xgb_oof_proba", "cluster_id"};
    EXPECT_THROW(d.decide(meta), ContractViolation);

    EXPECT_THROW(StackedDecision::decide(stacker(), {0.1, 0.2}, 0.5), ContractViolation);
}

TEST(StackedDecisionTest, RejectsInconsistentConfiguration) {
    EXPECT_THROW(StackedDecision(stacker(4), {"a", "b", "c"}, 0.5), ArtifactError);
    EXPECT_THROW(StackedDecision(stacker(3), {"a", "b", "c"}, 1.2), ArtifactError);
    EXPECT_THROW(StackedDecision(stacker(3), {"a", "b", "c"}, -0.1), ArtifactError);
}

TEST(StackedDecisionTest, LoadsStackerAndThresholdFromStore) {
    MemoryArtifactStore store;
    test::populateStore(store);
    const BundlePtr bundle = FittedArtifactBundle::load(store, test::VERSION);
    const auto d = StackedDecision::load(store, *bundle);

    EXPECT_DOUBLE_EQ(d->threshold(), test::THRESHOLD);
    EXPECT_EQ(d->metaOrder(), test::defaultMetaFeatures());
    EXPECT_FALSE(d->stacker().calibrated());
}

// =============================================================================
// ThresholdSelector
// =============================================================================

TEST(ThresholdSelectorTest, TiesResolveToTheLowestThreshold) {
    const auto best = ThresholdSelector::select({0.1, 0.4, 0.6, 0.9}, {0, 0, 1, 1}, 1.0, 1.0);
    EXPECT_DOUBLE_EQ(best.threshold, 0.41);
    EXPECT_DOUBLE_EQ(best.cost, 0.0);
    EXPECT_EQ(best.false_negatives, 0u);
    EXPECT_EQ(best.false_positives, 0u);
}

TEST(ThresholdSelectorTest, CostsShiftTheChosenThreshold) {
    const std::vector<double> probs = {0.2, 0.3, 0.7};
    const std::vector<int> labels = {1, 0, 0};

    const auto missExpensive = ThresholdSelector::select(probs, labels, 10.0, 1.0);
    EXPECT_DOUBLE_EQ(missExpensive.threshold, 0.01);
    EXPECT_EQ(missExpensive.false_positives, 2u);
    EXPECT_DOUBLE_EQ(missExpensive.cost, 2.0);

    const auto alarmExpensive = ThresholdSelector::select(probs, labels, 1.0, 10.0);
    EXPECT_DOUBLE_EQ(alarmExpensive.threshold, 0.71);
    EXPECT_EQ(alarmExpensive.false_negatives, 1u);
    EXPECT_DOUBLE_EQ(alarmExpensive.cost, 1.0);
}

TEST(ThresholdSelectorTest, RejectsBadInput) {
    EXPECT_THROW(ThresholdSelector::select({}, {}, 1.0, 1.0), InputError);
    EXPECT_THROW(ThresholdSelector::select({0.5}, {1, 0}, 1.0, 1.0), InputError);
    EXPECT_THROW(ThresholdSelector::select({0.5}, {1}, -1.0, 1.0), InputError);
}
