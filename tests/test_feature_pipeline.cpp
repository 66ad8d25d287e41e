// test_feature_pipeline.cpp - FIT/APPLY behaviour of the full pipeline

#include <gtest/gtest.h>

#include "TestSupport.hpp"

#include "fris/core/Errors.hpp"
#include "fris/features/FeatureContract.hpp"
#include "fris/features/FeatureParityCheck.hpp"
#include "fris/features/FeaturePipeline.hpp"
#include "fris/features/FeatureStages.hpp"

#include <nlohmann/json.hpp>

#include <cmath>

using namespace fris;

namespace {

class FeaturePipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        records_ = test::referenceRecords();
        fit_ = pipeline_.transformBatch(records_, PipelineMode::FIT, nullptr).artifacts;
    }

    EngineeredFeatureVector apply(const RawRecord& r) const {
        return pipeline_.transform(r, PipelineMode::APPLY, fit_).vector;
    }

    FeaturePipeline pipeline_{test::testOptions()};
    std::vector<RawRecord> records_;
    BundlePtr fit_;
};

} // namespace

TEST_F(FeaturePipelineTest, FitIsDeterministic) {
    const auto again = pipeline_.transformBatch(records_, PipelineMode::FIT, nullptr);
    EXPECT_EQ(fit_->toJson().dump(), again.artifacts->toJson().dump());

    const auto first = pipeline_.transformBatch(records_, PipelineMode::FIT, nullptr);
    for (size_t i = 0; i < records_.size(); ++i) {
        EXPECT_EQ(first.frame.row(i).dump(), again.frame.row(i).dump()) << "row " << i;
    }
}

TEST_F(FeaturePipelineTest, ApplyIsDeterministicAndReturnsSameBundle) {
    const auto a = pipeline_.transform(records_[7], PipelineMode::APPLY, fit_);
    const auto b = pipeline_.transform(records_[7], PipelineMode::APPLY, fit_);
    EXPECT_EQ(a.vector.dump(), b.vector.dump());
    EXPECT_EQ(a.artifacts.get(), fit_.get());
}

TEST_F(FeaturePipelineTest, OutputMatchesFrozenSchemaExactly) {
    EXPECT_FALSE(fit_->frozen_schema.empty());
    const auto v = apply(records_[3]);
    EXPECT_EQ(v.columnNames(), fit_->frozen_schema);
    EXPECT_NO_THROW(FeatureContract::enforce(v, fit_->frozen_schema));

    for (const auto& col : {"Time", "Amount", "timestamp", "hour", "dayofweek", "amount_log",
                            "amount_scaled", "merchant_id", "device_type", "geo_bucket",
                            "account_id", "account_age_days", "merchant_freq", "device_freq",
                            "account_txn_count", "last_5_mean_amount", "last_5_count",
                            "merchant_id_missing", "account_age_days_missing",
                            "merchant_id_fe", "account_id_fe", "amount_times_age",
                            "is_new_merchant", "pca_x", "pca_y"}) {
        EXPECT_TRUE(v.has(col)) << col;
    }
    EXPECT_FALSE(v.has("Class"));
    EXPECT_FALSE(v.has("transaction_id"));
}

TEST_F(FeaturePipelineTest, BatchApplyReproducesFitRows) {
    const auto fitted = pipeline_.transformBatch(records_, PipelineMode::FIT, nullptr);
    const auto applied = pipeline_.transformBatch(records_, PipelineMode::APPLY, fitted.artifacts);
    for (size_t i = 0; i < records_.size(); ++i) {
        const auto report = FeatureParityCheck::compare(fitted.frame.row(i), applied.frame.row(i));
        EXPECT_TRUE(report.ok()) << "row " << i << ": " << report.summary();
    }
}

TEST_F(FeaturePipelineTest, SingleRecordApplyMatchesFitForFirstOfAccount) {
    const auto fitted = pipeline_.transformBatch(records_, PipelineMode::FIT, nullptr);
    const auto& counts = fitted.frame.numeric(Columns::rollingCount(5));

    size_t checked = 0;
    for (size_t i = 0; i < records_.size(); ++i) {
        if (counts[i] != 0.0) continue;
        const auto report = FeatureParityCheck::compare(fitted.frame.row(i),
                                                        apply(records_[i]));
        EXPECT_TRUE(report.ok()) << "row " << i << ": " << report.summary();
        ++checked;
    }
    EXPECT_GT(checked, 0u);
}

TEST_F(FeaturePipelineTest, ReferenceScenario) {
    const auto v = apply(RawRecord{{"Time", 100000.0}, {"Amount", 149.62}});

    EXPECT_EQ(std::get<std::string>(v.at(Columns::TIMESTAMP)), "2024-01-02 03:46:40");
    EXPECT_DOUBLE_EQ(v.number(Columns::HOUR), 3.0);
    EXPECT_DOUBLE_EQ(v.number(Columns::DAYOFWEEK), 1.0);
    EXPECT_NEAR(v.number(Columns::AMOUNT_LOG), std::log(150.62), 1e-12);

    for (const auto& f : FeatureStages::contextFields()) {
        EXPECT_DOUBLE_EQ(v.number(f + Columns::MISSING_SUFFIX), 1.0) << f;
    }
    EXPECT_TRUE(std::isfinite(v.number(Columns::PCA_X)));
    EXPECT_TRUE(std::isfinite(v.number(Columns::PCA_Y)));
}

TEST_F(FeaturePipelineTest, FirstTransactionRollingFeaturesAreNeutral) {
    const auto v = apply(RawRecord{{"Time", 5.0}, {"Amount", 20.0}, {"account_id", 77.0}});
    EXPECT_DOUBLE_EQ(v.number(Columns::rollingMean(5)), 0.0);
    EXPECT_DOUBLE_EQ(v.number(Columns::rollingCount(5)), 0.0);
}

TEST_F(FeaturePipelineTest, SuppliedContextIsKeptAndNotFlagged) {
    const auto v = apply(RawRecord{{"Time", 5.0}, {"Amount", 20.0},
                                   {"merchant_id", 123456789.0},
                                   {"device_type", std::string("smartwatch")},
                                   {"geo_bucket", 3.0},
                                   {"account_id", 999999.0},
                                   {"account_age_days", 10.0}});

    EXPECT_DOUBLE_EQ(v.number("merchant_id"), 123456789.0);
    EXPECT_EQ(std::get<std::string>(v.at("device_type")), "smartwatch");
    EXPECT_DOUBLE_EQ(v.number("account_age_days"), 10.0);
    for (const auto& f : FeatureStages::contextFields()) {
        EXPECT_DOUBLE_EQ(v.number(f + Columns::MISSING_SUFFIX), 0.0) << f;
    }

    // Categories never seen at fit time resolve to zero, never an error.
    EXPECT_DOUBLE_EQ(v.number(Columns::MERCHANT_FREQ), 0.0);
    EXPECT_DOUBLE_EQ(v.number(Columns::DEVICE_FREQ), 0.0);
    EXPECT_DOUBLE_EQ(v.number(Columns::ACCOUNT_TXN_COUNT), 0.0);
    EXPECT_DOUBLE_EQ(v.number("merchant_id_fe"), 0.0);
    EXPECT_DOUBLE_EQ(v.number("device_type_fe"), 0.0);
    EXPECT_DOUBLE_EQ(v.number(Columns::IS_NEW_MERCHANT), 1.0);
    EXPECT_DOUBLE_EQ(v.number(Columns::AMOUNT_TIMES_AGE), 200.0);
}

TEST_F(FeaturePipelineTest, MissingCoreFieldIsInputError) {
    EXPECT_THROW(apply(RawRecord{{"Amount", 1.0}}), InputError);
    EXPECT_THROW(apply(RawRecord{{"Time", 1.0}}), InputError);
    EXPECT_THROW(apply(RawRecord{{"Time", 1.0}, {"Amount", std::string("12")}}), InputError);
}

TEST_F(FeaturePipelineTest, TimeBeyondCalendarIsInputError) {
    for (double t : {1e17, 1e19, 1e300}) {
        EXPECT_THROW(apply(RawRecord{{"Time", t}, {"Amount", 1.0}}), InputError) << t;
    }
    EXPECT_THROW(apply(RawRecord{{"Time", 251698233600.0}, {"Amount", 1.0}}), InputError);

    const auto last = apply(RawRecord{{"Time", 251698233599.0}, {"Amount", 1.0}});
    EXPECT_EQ(std::get<std::string>(last.at(Columns::TIMESTAMP)), "9999-12-31 23:59:59");
}

TEST_F(FeaturePipelineTest, ModeMisuseIsRejected) {
    EXPECT_THROW(pipeline_.transform(records_[0], PipelineMode::APPLY, nullptr), ArtifactError);
    EXPECT_THROW(pipeline_.transform(records_[0], PipelineMode::FIT, fit_), ContractViolation);
    EXPECT_THROW(pipeline_.transformBatch({}, PipelineMode::FIT, nullptr), InputError);
}

TEST(FeaturePipelinePassthroughTest, DeclaredPassthroughIsMandatoryAtApply) {
    FeaturePipeline pipeline(test::testOptions());
    const auto records = test::referenceRecords(30, true);
    const auto fit = pipeline.transformBatch(records, PipelineMode::FIT, nullptr).artifacts;
    EXPECT_EQ(fit->passthrough_columns, (std::vector<std::string>{"V1", "V2", "V10"}));

    RawRecord partial = records[4];
    RawRecord stripped;
    for (const auto& f : partial.fields()) {
        if (f.first != "V2") stripped.set(f.first, f.second);
    }
    EXPECT_NO_THROW(pipeline.transform(partial, PipelineMode::APPLY, fit));
    EXPECT_THROW(pipeline.transform(stripped, PipelineMode::APPLY, fit), InputError);
}

TEST(FeaturePipelineOptionsTest, RollingWindowMustBePositive) {
    PipelineOptions o = test::testOptions();
    o.rolling_window = 0;
    EXPECT_THROW(FeaturePipeline{o}, PipelineError);
}
