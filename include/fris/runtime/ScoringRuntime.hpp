// =============================================================================
// ScoringRuntime.hpp - The one scoring path
// =============================================================================
// PURPOSE: Load once, then score and explain raw records.
//
// PATH (score and explain alike, no bypass):
//   raw -> FeaturePipeline APPLY -> FeatureContract -> per-member slices
//       -> SignalEnsemble -> MetaFeatureAssembler (serving) -> StackedDecision
//   explain: same vector -> classifier slice -> AttributionEngine
//
// THREADING:
//   Every member is immutable after load(). Share one ScoringRuntime across
//   threads; calls take no locks and perform no I/O.
// =============================================================================
#pragma once

#include "fris/decision/StackedDecision.hpp"
#include "fris/ensemble/MetaFeatureAssembler.hpp"
#include "fris/ensemble/SignalEnsemble.hpp"
#include "fris/explain/AttributionEngine.hpp"
#include "fris/features/ArtifactBundle.hpp"
#include "fris/features/FeaturePipeline.hpp"
#include "fris/features/FeatureVector.hpp"
#include "fris/core/RawRecord.hpp"

#include <memory>
#include <string>
#include <vector>

namespace fris {

class ArtifactStore;

struct HealthStatus {
    bool bundle_loaded = false;
    bool classifier_loaded = false;
    bool anomaly_loaded = false;
    bool reconstruction_loaded = false;
    bool cluster_loaded = false;
    bool stacker_loaded = false;
    std::string model_version;
    std::vector<std::string> errors;

    bool ready() const {
        return bundle_loaded && classifier_loaded && anomaly_loaded &&
               reconstruction_loaded && cluster_loaded && stacker_loaded;
    }
};

// Audit view of one scoring call.
struct ScoredTransaction {
    EngineeredFeatureVector vector;
    BaseSignalSet signals;
    MetaFeatureVector meta;
    Decision decision;
};

class ScoringRuntime {
public:
    ScoringRuntime(BundlePtr bundle,
                   std::shared_ptr<const SignalEnsemble> ensemble,
                   std::shared_ptr<const StackedDecision> decision);

    // ArtifactError when anything is missing or inconsistent.
    static std::shared_ptr<const ScoringRuntime> load(const ArtifactStore& store,
                                                      const std::string& version);

    // Loads each piece separately and reports which ones failed. Never
    // throws for load failures; they are returned in HealthStatus::errors.
    static HealthStatus probe(const ArtifactStore& store, const std::string& version);

    Decision score(const RawRecord& raw) const;
    ScoredTransaction scoreDetailed(const RawRecord& raw) const;
    Explanation explain(const RawRecord& raw, size_t k) const;

    // Independent single-record pipelines; no state crosses records.
    std::vector<Decision> scoreBatch(const std::vector<RawRecord>& records) const;

    HealthStatus health() const;

    const FittedArtifactBundle& bundle() const { return *bundle_; }
    const SignalEnsemble& ensemble() const { return *ensemble_; }

private:
    // APPLY transform plus schema gate.
    EngineeredFeatureVector engineer(const RawRecord& raw) const;

    BundlePtr bundle_;
    std::shared_ptr<const SignalEnsemble> ensemble_;
    std::shared_ptr<const StackedDecision> decision_;
    FeaturePipeline pipeline_;
    MetaFeatureAssembler assembler_;
};

} // namespace fris
