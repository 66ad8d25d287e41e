#include "fris/features/FeaturePipeline.hpp"
#include "fris/features/FeatureStages.hpp"
#include "fris/features/SyntheticContext.hpp"
#include "fris/core/Errors.hpp"
#include "fris/core/Log.hpp"

#include <memory>

namespace fris {

FeaturePipeline::FeaturePipeline(PipelineOptions options)
    : options_(std::move(options)) {
    if (options_.rolling_window < 1) {
        throw PipelineError("rolling_window must be >= 1");
    }
}

TransformResult FeaturePipeline::transform(const RawRecord& record, PipelineMode mode,
                                           BundlePtr artifacts) const {
    BatchTransformResult batch = transformBatch({record}, mode, std::move(artifacts));
    return TransformResult{batch.frame.row(0), std::move(batch.artifacts)};
}

BatchTransformResult FeaturePipeline::transformBatch(const std::vector<RawRecord>& records,
                                                     PipelineMode mode, BundlePtr artifacts) const {
    if (records.empty()) {
        throw InputError("empty batch");
    }

    if (mode == PipelineMode::APPLY) {
        if (!artifacts) {
            throw ArtifactError("APPLY requires a fitted artifact bundle");
        }
        FeatureFrame frame = runStages(records, *artifacts, nullptr);
        return BatchTransformResult{std::move(frame), std::move(artifacts)};
    }

    if (artifacts) {
        throw ContractViolation("FIT must not be given an existing bundle; refitting frozen artifacts is forbidden");
    }

    auto fitted = std::make_shared<FittedArtifactBundle>();
    fitted->model_version = options_.model_version;
    fitted->seed = options_.seed;
    fitted->label_column = options_.label_column;
    fitted->id_column = options_.id_column;
    fitted->rolling_window = options_.rolling_window;
    fitted->catalog = SyntheticCatalog::build(options_.seed);

    FeatureFrame frame = runStages(records, *fitted, fitted.get());
    fitted->frozen_schema = frame.columnNames();
    fitted->validate(false);

    FRIS_LOG_INFO("FeaturePipeline", "FIT %zu rows -> %zu columns (%zu passthrough), projection over %zu inputs",
                  frame.rows(), frame.columns(), fitted->passthrough_columns.size(),
                  fitted->projection.input_columns.size());

    return BatchTransformResult{std::move(frame), std::move(fitted)};
}

// In FIT, `fitting` aliases `bundle` and each artifact is fitted right before
// the stage that reads it. In APPLY it is null and nothing is written.
FeatureFrame FeaturePipeline::runStages(const std::vector<RawRecord>& records,
                                        const FittedArtifactBundle& bundle,
                                        FittedArtifactBundle* fitting) const {
    namespace S = FeatureStages;

    if (fitting) {
        fitting->passthrough_columns = S::discoverPassthrough(records, bundle.label_column,
                                                              bundle.id_column, bundle.rolling_window);
    }

    FeatureFrame frame(records.size());
    S::rawColumns(frame, records, bundle.passthrough_columns);
    S::temporal(frame);

    if (fitting) {
        fitting->amount_scaler = RobustScalerParams::fit(frame.numeric(Fields::AMOUNT));
    }
    S::amount(frame, bundle.amount_scaler);

    SyntheticContextGenerator generator(bundle.catalog, bundle.id_column);
    const auto contexts = S::syntheticContext(frame, records, generator);

    if (fitting) {
        for (const auto& field : S::categoricalFields()) {
            fitting->frequency_tables[field] = FrequencyTable::fit(S::categoryKeys(frame, field));
        }
    }
    S::frequencyAggregates(frame, bundle);
    S::rollingAggregates(frame, bundle.rolling_window);
    S::missingFlags(frame, contexts);
    S::frequencyEncodings(frame, bundle);
    S::interactions(frame, bundle);

    if (fitting) {
        fitting->projection = LinearProjection::fit(frame, frame.numericColumnNames());
    }
    S::projection(frame, bundle.projection);

    if (!fitting && frame.columnNames() != bundle.frozen_schema) {
        // Checked again by FeatureContract; here it means the stages drifted.
        const auto produced = frame.columnNames();
        ContractViolation::ColumnSet missing(bundle.frozen_schema.begin(), bundle.frozen_schema.end());
        ContractViolation::ColumnSet extra;
        for (const auto& c : produced) {
            if (!missing.erase(c)) extra.insert(c);
        }
        if (!missing.empty() || !extra.empty()) {
            throw ContractViolation("pipeline output diverges from frozen schema", missing, extra);
        }
    }
    return frame;
}

} // namespace fris
