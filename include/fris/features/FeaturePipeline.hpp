// =============================================================================
// FeaturePipeline.hpp - raw record x mode x artifacts -> engineered vector
// =============================================================================
// PURPOSE: The single transformation used by training (FIT) and serving
//          (APPLY). Both modes run the same stage code; FIT only additionally
//          fits each artifact just before the stage that reads it.
//
// CONTRACT:
//   FIT    bundle must be null; returns a freshly fitted bundle (no model
//          contracts yet, see FittedArtifactBundle::withModelContracts)
//   APPLY  bundle required; returns the same pointer it was given
//
// USAGE:
//   auto fit = pipeline.transformBatch(training, PipelineMode::FIT, nullptr);
//   auto out = pipeline.transform(record, PipelineMode::APPLY, fit.artifacts);
// =============================================================================
#pragma once

#include "fris/features/ArtifactBundle.hpp"
#include "fris/features/FeatureFrame.hpp"
#include "fris/features/FeatureVector.hpp"
#include "fris/core/RawRecord.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace fris {

enum class PipelineMode : uint8_t {
    FIT   = 0,
    APPLY = 1
};

inline const char* modeToString(PipelineMode m) {
    switch (m) {
        case PipelineMode::FIT:   return "FIT";
        case PipelineMode::APPLY: return "APPLY";
        default:                  return "UNKNOWN";
    }
}

// FIT-time knobs. APPLY reads all of these from the bundle instead.
struct PipelineOptions {
    uint64_t seed = 42;
    int rolling_window = 5;
    std::string label_column = "Class";
    std::string id_column = "transaction_id";
    std::string model_version;
};

struct TransformResult {
    EngineeredFeatureVector vector;
    BundlePtr artifacts;
};

struct BatchTransformResult {
    FeatureFrame frame;
    BundlePtr artifacts;
};

class FeaturePipeline {
public:
    FeaturePipeline() = default;
    explicit FeaturePipeline(PipelineOptions options);

    const PipelineOptions& options() const { return options_; }

    TransformResult transform(const RawRecord& record, PipelineMode mode, BundlePtr artifacts) const;

    // Rows come back in input order; rolling aggregates see the whole batch.
    BatchTransformResult transformBatch(const std::vector<RawRecord>& records,
                                        PipelineMode mode, BundlePtr artifacts) const;

private:
    FeatureFrame runStages(const std::vector<RawRecord>& records,
                           const FittedArtifactBundle& bundle,
                           FittedArtifactBundle* fitting) const;

    PipelineOptions options_;
};

} // namespace fris
