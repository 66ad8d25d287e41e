// test_feature_stages.cpp - Individual stages on hand-built frames

#include <gtest/gtest.h>

#include "TestSupport.hpp"

#include "fris/core/Errors.hpp"
#include "fris/features/FeatureStages.hpp"

#include <algorithm>
#include <cmath>

using namespace fris;

namespace S = FeatureStages;

namespace {

FeatureFrame timeFrame(const std::vector<double>& times) {
    FeatureFrame frame(times.size());
    frame.addNumeric(Fields::TIME, times);
    return frame;
}

// Time / Amount / account_id only, enough for the rolling stage.
FeatureFrame accountFrame(const std::vector<double>& accounts,
                          const std::vector<double>& times,
                          const std::vector<double>& amounts) {
    FeatureFrame frame(times.size());
    frame.addNumeric(Fields::TIME, times);
    frame.addNumeric(Fields::AMOUNT, amounts);
    frame.addNumeric(Fields::ACCOUNT_ID, accounts);
    return frame;
}

} // namespace

// =============================================================================
// Column discovery
// =============================================================================

TEST(FeatureStagesTest, NaturalOrderComparesDigitRunsByValue) {
    EXPECT_TRUE(S::naturalLess("V2", "V10"));
    EXPECT_FALSE(S::naturalLess("V10", "V2"));
    EXPECT_TRUE(S::naturalLess("V1", "V2"));
    EXPECT_TRUE(S::naturalLess("V9", "V10"));
    EXPECT_TRUE(S::naturalLess("V", "V1"));
    EXPECT_FALSE(S::naturalLess("V3", "V3"));
}

TEST(FeatureStagesTest, PassthroughExcludesReservedAndPartialFields) {
    auto records = test::referenceRecords(6, true);
    records[3].set("sometimes", 1.0);
    records[0].set("label_text", std::string("x"));

    const auto cols = S::discoverPassthrough(records, "Class", "transaction_id", 5);
    EXPECT_EQ(cols, (std::vector<std::string>{"V1", "V2", "V10"}));
}

TEST(FeatureStagesTest, EngineeredColumnsFollowWindow) {
    const auto cols = S::engineeredColumns(3);
    EXPECT_NE(std::find(cols.begin(), cols.end(), "last_3_mean_amount"), cols.end());
    EXPECT_NE(std::find(cols.begin(), cols.end(), "last_3_count"), cols.end());
    EXPECT_NE(std::find(cols.begin(), cols.end(), "merchant_id_missing"), cols.end());
    EXPECT_NE(std::find(cols.begin(), cols.end(), "device_type_fe"), cols.end());
}

// =============================================================================
// Stage 1: temporal
// =============================================================================

TEST(FeatureStagesTest, TemporalUsesFixedReferenceEpoch) {
    FeatureFrame frame = timeFrame({0.0, 100000.0, 6.0 * 86400.0 + 3599.9});
    S::temporal(frame);

    EXPECT_EQ(frame.text(Columns::TIMESTAMP)[0], "2024-01-01 00:00:00");
    EXPECT_EQ(frame.text(Columns::TIMESTAMP)[1], "2024-01-02 03:46:40");
    EXPECT_DOUBLE_EQ(frame.numeric(Columns::HOUR)[1], 3.0);

    // Monday is 0, Sunday is 6.
    EXPECT_DOUBLE_EQ(frame.numeric(Columns::DAYOFWEEK)[0], 0.0);
    EXPECT_DOUBLE_EQ(frame.numeric(Columns::DAYOFWEEK)[1], 1.0);
    EXPECT_DOUBLE_EQ(frame.numeric(Columns::DAYOFWEEK)[2], 6.0);
    EXPECT_DOUBLE_EQ(frame.numeric(Columns::HOUR)[2], 0.0);
}

// =============================================================================
// Stage 2: amount
// =============================================================================

TEST(FeatureStagesTest, RobustScalerUsesMedianAndInterquartileRange) {
    const auto p = RobustScalerParams::fit({5.0, 1.0, 4.0, 2.0, 3.0});
    EXPECT_DOUBLE_EQ(p.center, 3.0);
    EXPECT_DOUBLE_EQ(p.scale, 2.0);
    EXPECT_DOUBLE_EQ(p.apply(7.0), 2.0);
}

TEST(FeatureStagesTest, RobustScalerFallsBackToUnitScale) {
    const auto p = RobustScalerParams::fit({4.0, 4.0, 4.0});
    EXPECT_DOUBLE_EQ(p.center, 4.0);
    EXPECT_DOUBLE_EQ(p.scale, 1.0);
    EXPECT_THROW(RobustScalerParams::fit({}), PipelineError);
}

TEST(FeatureStagesTest, AmountLogIsLog1p) {
    FeatureFrame frame(2);
    frame.addNumeric(Fields::AMOUNT, {0.0, 149.62});
    RobustScalerParams scaler;
    scaler.center = 10.0;
    scaler.scale = 2.0;
    S::amount(frame, scaler);

    EXPECT_DOUBLE_EQ(frame.numeric(Columns::AMOUNT_LOG)[0], 0.0);
    EXPECT_NEAR(frame.numeric(Columns::AMOUNT_LOG)[1], std::log(150.62), 1e-12);
    EXPECT_DOUBLE_EQ(frame.numeric(Columns::AMOUNT_SCALED)[0], -5.0);
}

// =============================================================================
// Stage 4: frequency tables
// =============================================================================

TEST(FeatureStagesTest, FrequencyTableCountsAndUnseenZero) {
    const auto t = FrequencyTable::fit({"a", "b", "a", "c"});
    EXPECT_EQ(t.count("a"), 2u);
    EXPECT_DOUBLE_EQ(t.frequency("a"), 0.5);
    EXPECT_EQ(t.count("zzz"), 0u);
    EXPECT_DOUBLE_EQ(t.frequency("zzz"), 0.0);
}

// =============================================================================
// Stage 5: rolling aggregates
// =============================================================================

TEST(FeatureStagesTest, RollingWindowSeesOnlyStrictlyPriorRows) {
    FeatureFrame frame = accountFrame(std::vector<double>(7, 11.0),
                                      {1, 2, 3, 4, 5, 6, 7},
                                      {10, 20, 30, 40, 50, 60, 70});
    S::rollingAggregates(frame, 3);

    const auto& mean = frame.numeric("last_3_mean_amount");
    const auto& count = frame.numeric("last_3_count");
    const std::vector<double> want_count = {0, 1, 2, 3, 3, 3, 3};
    const std::vector<double> want_mean = {0, 10, 15, 20, 30, 40, 50};
    for (size_t i = 0; i < 7; ++i) {
        EXPECT_DOUBLE_EQ(count[i], want_count[i]) << "row " << i;
        EXPECT_DOUBLE_EQ(mean[i], want_mean[i]) << "row " << i;
    }
}

TEST(FeatureStagesTest, DefaultWindowAtSixthRowCoversExactlyTheFirstFive) {
    FeatureFrame frame = accountFrame(std::vector<double>(7, 11.0),
                                      {1, 2, 3, 4, 5, 6, 7},
                                      {10, 20, 30, 40, 50, 60, 70});
    S::rollingAggregates(frame, 5);

    const auto& mean = frame.numeric(Columns::rollingMean(5));
    const auto& count = frame.numeric(Columns::rollingCount(5));
    const std::vector<double> want_count = {0, 1, 2, 3, 4, 5, 5};
    const std::vector<double> want_mean = {0, 10, 15, 20, 25, 30, 40};
    for (size_t i = 0; i < 7; ++i) {
        EXPECT_DOUBLE_EQ(count[i], want_count[i]) << "row " << i;
        EXPECT_DOUBLE_EQ(mean[i], want_mean[i]) << "row " << i;
    }
}

TEST(FeatureStagesTest, RollingWindowOrdersByTimeWithinAccount) {
    // Rows arrive out of time order and interleaved across two accounts.
    FeatureFrame frame = accountFrame({1, 2, 1, 2, 1},
                                      {30, 5, 10, 15, 20},
                                      {300, 5, 100, 15, 200});
    S::rollingAggregates(frame, 5);

    const auto& mean = frame.numeric("last_5_mean_amount");
    const auto& count = frame.numeric("last_5_count");

    EXPECT_DOUBLE_EQ(count[2], 0.0);  // account 1, t=10
    EXPECT_DOUBLE_EQ(count[4], 1.0);  // account 1, t=20
    EXPECT_DOUBLE_EQ(mean[4], 100.0);
    EXPECT_DOUBLE_EQ(count[0], 2.0);  // account 1, t=30
    EXPECT_DOUBLE_EQ(mean[0], 150.0);
    EXPECT_DOUBLE_EQ(count[1], 0.0);  // account 2, t=5
    EXPECT_DOUBLE_EQ(mean[3], 5.0);   // account 2, t=15
}

TEST(FeatureStagesTest, RollingWindowRejectsNonPositiveWidth) {
    FeatureFrame frame = accountFrame({1}, {1}, {1});
    EXPECT_THROW(S::rollingAggregates(frame, 0), PipelineError);
}

// =============================================================================
// Raw columns
// =============================================================================

TEST(FeatureStagesTest, RawColumnsRejectNegativeAndMissingCoreFields) {
    {
        FeatureFrame frame(1);
        EXPECT_THROW(S::rawColumns(frame, {RawRecord{{"Time", -1.0}, {"Amount", 1.0}}}, {}), InputError);
    }
    {
        FeatureFrame frame(1);
        EXPECT_THROW(S::rawColumns(frame, {RawRecord{{"Time", 1.0}}}, {}), InputError);
    }
    {
        FeatureFrame frame(1);
        EXPECT_THROW(S::rawColumns(frame, {RawRecord{{"Time", 1.0}, {"Amount", 1.0}}}, {"V1"}), InputError);
    }
}
