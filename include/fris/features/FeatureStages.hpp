// =============================================================================
// FeatureStages.hpp - The nine ordered feature stages
// =============================================================================
// PURPOSE: Each stage appends its columns to a FeatureFrame and may read any
//          column written before it. Stages never fit anything: all fitted
//          state is read from the bundle passed in.
//
// ORDER (fixed):
//   raw       Time, Amount, passthrough columns
//   1 temporal     timestamp, hour, dayofweek
//   2 amount       amount_log, amount_scaled
//   3 context      merchant_id, device_type, geo_bucket, account_id, account_age_days
//   4 frequency    merchant_freq, device_freq, account_txn_count
//   5 rolling      last_<w>_mean_amount, last_<w>_count
//   6 missing      <context>_missing
//   7 encodings    <categorical>_fe
//   8 interactions amount_times_age, is_new_merchant
//   9 projection   pca_x, pca_y
// =============================================================================
#pragma once

#include "fris/features/ArtifactBundle.hpp"
#include "fris/features/FeatureFrame.hpp"
#include "fris/features/SyntheticContext.hpp"
#include "fris/core/RawRecord.hpp"

#include <ctime>
#include <string>
#include <vector>

namespace fris {

namespace Columns {
    constexpr const char* TIMESTAMP         = "timestamp";
    constexpr const char* HOUR              = "hour";
    constexpr const char* DAYOFWEEK         = "dayofweek";
    constexpr const char* AMOUNT_LOG        = "amount_log";
    constexpr const char* AMOUNT_SCALED     = "amount_scaled";
    constexpr const char* MERCHANT_FREQ     = "merchant_freq";
    constexpr const char* DEVICE_FREQ       = "device_freq";
    constexpr const char* ACCOUNT_TXN_COUNT = "account_txn_count";
    constexpr const char* AMOUNT_TIMES_AGE  = "amount_times_age";
    constexpr const char* IS_NEW_MERCHANT   = "is_new_merchant";
    constexpr const char* PCA_X             = "pca_x";
    constexpr const char* PCA_Y             = "pca_y";

    constexpr const char* MISSING_SUFFIX  = "_missing";
    constexpr const char* ENCODED_SUFFIX  = "_fe";

    std::string rollingMean(int window);
    std::string rollingCount(int window);
} // namespace Columns

namespace FeatureStages {

// 2024-01-01 00:00:00 UTC, a Monday.
constexpr std::time_t REFERENCE_EPOCH = 1704067200;

// Context fields in emission order; also the order of the missing flags.
const std::vector<std::string>& contextFields();

// Categorical columns with a frequency table, in stage 7 emission order.
const std::vector<std::string>& categoricalFields();

// FIT-time discovery: numeric fields present in every record, minus the
// reserved and engineered names, in digit-aware natural order (V2 before V10).
std::vector<std::string> discoverPassthrough(const std::vector<RawRecord>& records,
                                             const std::string& label_column,
                                             const std::string& id_column,
                                             int window);

// Every column name a stage may emit for the given rolling window.
std::vector<std::string> engineeredColumns(int window);

bool naturalLess(const std::string& a, const std::string& b);

// Canonical category key of one frame cell.
std::string categoryKey(const FeatureFrame& frame, const std::string& column, size_t row);
std::vector<std::string> categoryKeys(const FeatureFrame& frame, const std::string& column);

void rawColumns(FeatureFrame& frame, const std::vector<RawRecord>& records,
                const std::vector<std::string>& passthrough);

void temporal(FeatureFrame& frame);
void amount(FeatureFrame& frame, const RobustScalerParams& scaler);

// Returns per-row context with its synthesis flags for stage 6.
std::vector<TransactionContext> syntheticContext(FeatureFrame& frame,
                                                 const std::vector<RawRecord>& records,
                                                 const SyntheticContextGenerator& generator);

void frequencyAggregates(FeatureFrame& frame, const FittedArtifactBundle& bundle);
void rollingAggregates(FeatureFrame& frame, int window);
void missingFlags(FeatureFrame& frame, const std::vector<TransactionContext>& contexts);
void frequencyEncodings(FeatureFrame& frame, const FittedArtifactBundle& bundle);
void interactions(FeatureFrame& frame, const FittedArtifactBundle& bundle);
void projection(FeatureFrame& frame, const LinearProjection& proj);

} // namespace FeatureStages
} // namespace fris
