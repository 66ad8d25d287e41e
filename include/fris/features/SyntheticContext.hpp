// =============================================================================
// SyntheticContext.hpp - Deterministic merchant/device/geo/account context
// =============================================================================
// PURPOSE: Stand in for upstream enrichment that is not integrated yet.
//
// DETERMINISM:
//   - Catalogues (merchant, geo, account popularity; account ages) derive from
//     the bundle seed alone.
//   - Per-record draws derive from SHA-256("<seed>|<field>|<record key>").
//     The record key is the id column when present, else "t=<Time>|a=<Amount>".
//     Row position and wall clock never enter, so a record gets the same
//     context in a training batch and alone at serving time.
//   - Engine output is mapped to [0,1) by its top 53 bits; std distributions
//     are avoided because their output differs between standard libraries.
// =============================================================================
#pragma once

#include "fris/core/RawRecord.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace fris {

struct SyntheticCatalog {
    static constexpr size_t NUM_MERCHANTS = 1000;
    static constexpr size_t NUM_GEO = 50;
    static constexpr size_t NUM_ACCOUNTS = 10000;
    static constexpr int MAX_ACCOUNT_AGE_DAYS = 2000;

    static constexpr std::array<const char*, 4> DEVICE_TYPES = {"mobile", "desktop", "pos", "tablet"};
    static constexpr std::array<double, 4> DEVICE_CDF = {0.60, 0.85, 0.95, 1.00};

    uint64_t seed = 0;
    std::vector<double> merchant_cdf;
    std::vector<double> geo_cdf;
    std::vector<double> account_cdf;
    std::vector<int> account_age;

    static std::shared_ptr<const SyntheticCatalog> build(uint64_t seed);
};

// Context fields after synthesis, plus which ones had to be synthesized.
struct TransactionContext {
    double merchant_id = 0.0;
    std::string device_type;
    double geo_bucket = 0.0;
    double account_id = 0.0;
    double account_age_days = 0.0;

    bool merchant_synthesized = false;
    bool device_synthesized = false;
    bool geo_synthesized = false;
    bool account_synthesized = false;
    bool account_age_synthesized = false;
};

class SyntheticContextGenerator {
public:
    SyntheticContextGenerator(std::shared_ptr<const SyntheticCatalog> catalog, std::string id_column);

    // Stable per-record key used to seed the draws.
    std::string recordKey(const RawRecord& rec) const;

    // Supplied fields are kept; absent ones are synthesized. Supplied fields of
    // the wrong kind (text merchant id, numeric device type) are InputErrors.
    TransactionContext resolve(const RawRecord& rec) const;

private:
    double uniform(const std::string& field, const std::string& key) const;

    std::shared_ptr<const SyntheticCatalog> catalog_;
    std::string id_column_;
};

} // namespace fris
