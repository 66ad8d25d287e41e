// test_feature_contract.cpp - Schema enforcement and parity reports

#include <gtest/gtest.h>

#include "fris/core/Errors.hpp"
#include "fris/features/FeatureContract.hpp"
#include "fris/features/FeatureParityCheck.hpp"

using namespace fris;

namespace {

EngineeredFeatureVector vectorOf(const std::vector<std::pair<std::string, FeatureValue>>& cols) {
    EngineeredFeatureVector v;
    for (const auto& c : cols) v.append(c.first, c.second);
    return v;
}

} // namespace

TEST(FeatureContractTest, ExactSchemaPasses) {
    const auto v = vectorOf({{"a", 1.0}, {"b", 2.0}});
    const auto check = FeatureContract::validate(v, {"a", "b"});
    EXPECT_TRUE(check.ok());
    EXPECT_TRUE(check.order_matches);
    EXPECT_NO_THROW(FeatureContract::enforce(v, {"a", "b"}));
}

TEST(FeatureContractTest, ReorderedColumnsAreStillTheSameSet) {
    const auto check = FeatureContract::validate(vectorOf({{"b", 2.0}, {"a", 1.0}}), {"a", "b"});
    EXPECT_TRUE(check.ok());
    EXPECT_FALSE(check.order_matches);
}

TEST(FeatureContractTest, EnforceReportsMissingAndExtraColumns) {
    const auto v = vectorOf({{"a", 1.0}, {"surprise", 0.0}});
    try {
        FeatureContract::enforce(v, {"a", "b", "c"});
        FAIL() << "expected ContractViolation";
    } catch (const ContractViolation& e) {
        EXPECT_EQ(e.missing(), (ContractViolation::ColumnSet{"b", "c"}));
        EXPECT_EQ(e.extra(), (ContractViolation::ColumnSet{"surprise"}));
    }
}

TEST(FeatureContractTest, EmptySchemaNeverPasses) {
    EXPECT_THROW(FeatureContract::enforce(vectorOf({{"a", 1.0}}), {}), ContractViolation);
}

TEST(EngineeredFeatureVectorTest, SliceReportsEveryAbsentColumn) {
    const auto v = vectorOf({{"a", 1.0}, {"t", std::string("x")}, {"b", 2.0}});
    EXPECT_EQ(v.slice({"b", "a"}), (std::vector<double>{2.0, 1.0}));
    try {
        v.slice({"a", "yy", "zz"});
        FAIL() << "expected ContractViolation";
    } catch (const ContractViolation& e) {
        EXPECT_EQ(e.missing(), (ContractViolation::ColumnSet{"yy", "zz"}));
    }
    EXPECT_THROW(v.slice({"a", "t"}), ContractViolation);
}

TEST(EngineeredFeatureVectorTest, DuplicateColumnIsPipelineError) {
    EngineeredFeatureVector v;
    v.append("a", 1.0);
    EXPECT_THROW(v.append("a", 2.0), PipelineError);
}

TEST(FeatureParityCheckTest, ToleranceAndTextEquality) {
    const auto a = vectorOf({{"x", 1.0}, {"t", std::string("mobile")}});
    const auto b = vectorOf({{"x", 1.0 + 1e-13}, {"t", std::string("mobile")}});
    EXPECT_TRUE(FeatureParityCheck::compare(a, b).ok());
    EXPECT_EQ(FeatureParityCheck::compare(a, b).summary(), "parity OK");

    const auto c = vectorOf({{"x", 1.1}, {"t", std::string("pos")}});
    const auto report = FeatureParityCheck::compare(a, c);
    ASSERT_EQ(report.mismatches.size(), 2u);
    EXPECT_EQ(report.mismatches[0].column, "x");
    EXPECT_EQ(report.mismatches[1].left, "mobile");
    EXPECT_EQ(report.mismatches[1].right, "pos");
}

TEST(FeatureParityCheckTest, ReportsOneSidedColumns) {
    const auto report = FeatureParityCheck::compare(vectorOf({{"x", 1.0}, {"y", 2.0}}),
                                                    vectorOf({{"x", 1.0}, {"z", 3.0}}));
    EXPECT_FALSE(report.ok());
    EXPECT_EQ(report.only_left, (ContractViolation::ColumnSet{"y"}));
    EXPECT_EQ(report.only_right, (ContractViolation::ColumnSet{"z"}));
    EXPECT_NE(report.summary().find("-y"), std::string::npos);
}
