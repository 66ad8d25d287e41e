// =============================================================================
// MetaFeatureAssembler.hpp - Fixed-order stacker input
// =============================================================================
// PURPOSE: Merge base signals and selected engineered columns into the exact
//          positional order the stacker was trained on.
//
// SLOTS:
//   xgb_oof_proba   supervised signal (see below)
//   anomaly_score   isolation forest, sign-flipped
//   ae_recon_error  autoencoder MSE
//   cluster_id      k-means id
//   ae_latent_<i>   autoencoder latent component i
//   <anything else> engineered column of the same name
//
// TRAINING vs SERVING:
//   The supervised slot is filled from two named paths. Training passes the
//   out-of-fold probability (a model that never saw the row); serving has no
//   such estimate and passes the live classifier probability instead. Both
//   paths write the same slot; only the value source differs.
// =============================================================================
#pragma once

#include "fris/ensemble/SignalEnsemble.hpp"
#include "fris/features/FeatureVector.hpp"

#include <string>
#include <vector>

namespace fris {

namespace MetaSlots {
    constexpr const char* SUPERVISED     = "xgb_oof_proba";
    constexpr const char* ANOMALY        = "anomaly_score";
    constexpr const char* RECONSTRUCTION = "ae_recon_error";
    constexpr const char* CLUSTER        = "cluster_id";
    constexpr const char* LATENT_PREFIX  = "ae_latent_";
} // namespace MetaSlots

struct MetaFeatureVector {
    std::vector<std::string> names;
    std::vector<double> values;

    size_t size() const { return values.size(); }
};

class MetaFeatureAssembler {
public:
    // ContractViolation on an empty or duplicated order.
    explicit MetaFeatureAssembler(std::vector<std::string> frozen_order);

    // named_subset is the caller's view of the order. Any divergence from
    // fixed_order, including a pure reordering, is a ContractViolation.
    static MetaFeatureVector assemble(const BaseSignalSet& signals,
                                      const EngineeredFeatureVector& vector,
                                      const std::vector<std::string>& named_subset,
                                      const std::vector<std::string>& fixed_order,
                                      double supervised_value);

    MetaFeatureVector assembleForTraining(const BaseSignalSet& signals,
                                          const EngineeredFeatureVector& vector,
                                          double oof_proba) const;

    MetaFeatureVector assembleForServing(const BaseSignalSet& signals,
                                         const EngineeredFeatureVector& vector) const;

    const std::vector<std::string>& order() const { return order_; }

    // Position of a slot; ContractViolation when the order does not name it.
    size_t slotOf(const std::string& name) const;

private:
    std::vector<std::string> order_;
};

} // namespace fris
