// =============================================================================
// ArtifactBundle.hpp - Frozen training-time artifacts
// =============================================================================
// PURPOSE: Everything serving needs to rebuild training features exactly.
// DESIGN:
//   - Produced once by a FIT pass, then shared read-only as BundlePtr
//   - Passed explicitly into every pipeline call (no process-wide state)
//   - Feature artifacts come from FIT; model contracts (per-model feature
//     lists, meta-feature order, threshold) come from the training run and
//     are merged with withModelContracts()
//   - Stored as "<model_version>/artifacts.json" in an ArtifactStore
// =============================================================================
#pragma once

#include "fris/features/LinearProjection.hpp"
#include "fris/features/SyntheticContext.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fris {

class ArtifactStore;

// Median / IQR rescaling fitted on Amount.
struct RobustScalerParams {
    double center = 0.0;
    double scale = 1.0;

    static RobustScalerParams fit(std::vector<double> values);
    double apply(double x) const { return (x - center) / scale; }
};

// Fit-time category occurrence counts. Unseen keys resolve to zero.
struct FrequencyTable {
    uint64_t total_rows = 0;
    std::map<std::string, uint64_t> counts;

    static FrequencyTable fit(const std::vector<std::string>& keys);

    uint64_t count(const std::string& key) const;
    double frequency(const std::string& key) const;
};

namespace Members {
    constexpr const char* CLASSIFIER     = "classifier";
    constexpr const char* ANOMALY        = "anomaly";
    constexpr const char* RECONSTRUCTION = "reconstruction";
    constexpr const char* CLUSTER        = "cluster";
} // namespace Members

struct ModelContracts {
    std::map<std::string, std::vector<std::string>> model_features;
    std::vector<std::string> meta_features;
    std::optional<double> threshold;

    bool complete() const;
    static ModelContracts fromJson(const nlohmann::json& j);
};

struct FittedArtifactBundle {
    static constexpr int FORMAT_VERSION = 1;
    static constexpr const char* BLOB_NAME = "artifacts.json";

    int format_version = FORMAT_VERSION;
    std::string model_version;

    uint64_t seed = 42;
    std::string label_column = "Class";
    std::string id_column = "transaction_id";
    int rolling_window = 5;

    std::vector<std::string> passthrough_columns;
    RobustScalerParams amount_scaler;
    std::map<std::string, FrequencyTable> frequency_tables;
    LinearProjection projection;
    std::vector<std::string> frozen_schema;

    ModelContracts contracts;

    // Derived from seed; rebuilt on load, never serialized.
    std::shared_ptr<const SyntheticCatalog> catalog;

    // ArtifactError on any absent member.
    const FrequencyTable& table(const std::string& column) const;
    const SyntheticCatalog& syntheticCatalog() const;
    const std::vector<std::string>& modelFeatures(const std::string& member) const;
    double threshold() const;

    // Feature artifacts always; model contracts too when requireContracts.
    void validate(bool requireContracts) const;

    std::shared_ptr<const FittedArtifactBundle> withModelContracts(ModelContracts c) const;

    nlohmann::json toJson() const;
    static FittedArtifactBundle fromJson(const nlohmann::json& j);

    static std::string blobKey(const std::string& version);
    static std::shared_ptr<const FittedArtifactBundle> load(const ArtifactStore& store,
                                                            const std::string& version,
                                                            bool requireContracts = true);
    static void save(ArtifactStore& store, const FittedArtifactBundle& bundle);
};

using BundlePtr = std::shared_ptr<const FittedArtifactBundle>;

} // namespace fris
