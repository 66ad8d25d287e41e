// test_raw_record.cpp - RawRecord parsing, canonical text, CSV ingestion

#include <gtest/gtest.h>

#include "fris/core/CsvReader.hpp"
#include "fris/core/Errors.hpp"
#include "fris/core/RawRecord.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <limits>
#include <sstream>

using namespace fris;

TEST(RawRecordTest, FromJsonMapsScalarKinds) {
    const auto j = nlohmann::json::parse(R"({"Time": 10, "Amount": 2.5, "device_type": "pos",
                                             "flag": true, "merchant_id": null})");
    const RawRecord r = RawRecord::fromJson(j);

    EXPECT_DOUBLE_EQ(*r.number("Time"), 10.0);
    EXPECT_DOUBLE_EQ(*r.number("Amount"), 2.5);
    EXPECT_EQ(std::get<std::string>(*r.find("device_type")), "pos");
    EXPECT_DOUBLE_EQ(*r.number("flag"), 1.0);
    EXPECT_FALSE(r.has("merchant_id"));
    EXPECT_EQ(r.size(), 4u);
}

TEST(RawRecordTest, FromJsonRejectsNonScalars) {
    EXPECT_THROW(RawRecord::fromJson(nlohmann::json::parse(R"({"Time": [1, 2]})")), InputError);
    EXPECT_THROW(RawRecord::fromJson(nlohmann::json::parse(R"([1, 2])")), InputError);
}

TEST(RawRecordTest, RequireNumberRejectsAbsentTextualAndNonFinite) {
    RawRecord r{{"Time", 1.0}, {"Amount", std::string("abc")}};
    EXPECT_DOUBLE_EQ(r.requireNumber("Time"), 1.0);
    EXPECT_THROW(r.requireNumber("Amount"), InputError);
    EXPECT_THROW(r.requireNumber("missing"), InputError);

    r.set("Time", std::numeric_limits<double>::quiet_NaN());
    EXPECT_THROW(r.requireNumber("Time"), InputError);
}

TEST(RawRecordTest, SetReplacesInPlaceKeepingOrder) {
    RawRecord r{{"a", 1.0}, {"b", 2.0}};
    r.set("a", 5.0);
    ASSERT_EQ(r.fields().size(), 2u);
    EXPECT_EQ(r.fields()[0].first, "a");
    EXPECT_DOUBLE_EQ(std::get<double>(r.fields()[0].second), 5.0);
}

TEST(CanonicalTextTest, IntegralNumbersPrintWithoutDecimals) {
    EXPECT_EQ(formatNumber(42.0), "42");
    EXPECT_EQ(formatNumber(-3.0), "-3");
    EXPECT_EQ(formatNumber(149.62), "149.62");
    EXPECT_EQ(formatNumber(0.1), "0.1");
    EXPECT_EQ(canonicalText(FieldValue(std::string("mobile"))), "mobile");
}

TEST(CanonicalTextTest, ShortestTextRoundTrips) {
    const double v = 1.0 / 3.0;
    EXPECT_EQ(std::strtod(formatNumber(v).c_str(), nullptr), v);
}

TEST(CsvReaderTest, ParsesNumbersTextAndEmptyCells) {
    std::istringstream in("Time,Amount,device_type,V1\n"
                          "0,1.5,mobile,0.25\n"
                          "60,2,,-1\n");
    const auto rows = CsvReader::read(in);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_DOUBLE_EQ(*rows[0].number("Amount"), 1.5);
    EXPECT_EQ(std::get<std::string>(*rows[0].find("device_type")), "mobile");
    EXPECT_FALSE(rows[1].has("device_type"));
    EXPECT_DOUBLE_EQ(*rows[1].number("V1"), -1.0);
}

TEST(CsvReaderTest, CellCountMismatchIsInputError) {
    std::istringstream in("Time,Amount\n1,2,3\n");
    EXPECT_THROW(CsvReader::read(in), InputError);
}
