#include "fris/runtime/ScoringRuntime.hpp"
#include "fris/features/FeatureContract.hpp"
#include "fris/models/ModelJson.hpp"
#include "fris/store/ArtifactStore.hpp"
#include "fris/core/Errors.hpp"
#include "fris/core/Log.hpp"

namespace fris {

namespace {

const std::vector<std::string>& metaOrderOf(const BundlePtr& bundle) {
    if (!bundle) {
        throw ArtifactError("scoring runtime needs an artifact bundle");
    }
    bundle->validate(true);
    return bundle->contracts.meta_features;
}

template <typename Fn>
bool tryLoad(const char* what, HealthStatus& status, Fn&& fn) {
    try {
        fn();
        return true;
    } catch (const FrisError& e) {
        FRIS_LOG_ERROR("ScoringRuntime", "%s failed to load: %s", what, e.what());
        status.errors.push_back(std::string(what) + ": " + e.what());
        return false;
    }
}

} // namespace

ScoringRuntime::ScoringRuntime(BundlePtr bundle,
                               std::shared_ptr<const SignalEnsemble> ensemble,
                               std::shared_ptr<const StackedDecision> decision)
    : bundle_(std::move(bundle))
    , ensemble_(std::move(ensemble))
    , decision_(std::move(decision))
    , assembler_(metaOrderOf(bundle_)) {
    if (!ensemble_ || !decision_) {
        throw ArtifactError("scoring runtime needs an ensemble and a stacker");
    }
    if (decision_->metaOrder() != assembler_.order()) {
        throw ArtifactError("stacker meta order differs from the bundle's meta order");
    }
}

std::shared_ptr<const ScoringRuntime> ScoringRuntime::load(const ArtifactStore& store,
                                                           const std::string& version) {
    BundlePtr bundle = FittedArtifactBundle::load(store, version, true);
    auto ensemble = SignalEnsemble::load(store, *bundle);
    auto decision = StackedDecision::load(store, *bundle);
    auto runtime = std::make_shared<const ScoringRuntime>(bundle, ensemble, decision);

    FRIS_LOG_INFO("ScoringRuntime", "Ready: version=%s schema=%zu columns threshold=%.2f",
                  version.c_str(), bundle->frozen_schema.size(), bundle->threshold());
    return runtime;
}

HealthStatus ScoringRuntime::probe(const ArtifactStore& store, const std::string& version) {
    HealthStatus status;
    status.model_version = version;

    BundlePtr bundle;
    status.bundle_loaded = tryLoad("bundle", status, [&] {
        bundle = FittedArtifactBundle::load(store, version, true);
    });
    if (!bundle) return status;

    const auto& mf = bundle->contracts.model_features;
    auto widthCheck = [&](const char* member, size_t width) {
        const size_t expected = mf.at(member).size();
        if (width != expected) {
            throw ArtifactError(std::string(member) + " takes " + std::to_string(width) +
                                " inputs, contract lists " + std::to_string(expected));
        }
    };
    auto keyOf = [&](const char* file) { return ModelJson::modelKey(version, file); };

    status.classifier_loaded = tryLoad(Members::CLASSIFIER, status, [&] {
        const auto k = keyOf(SignalEnsemble::CLASSIFIER_BLOB);
        widthCheck(Members::CLASSIFIER, TreeEnsemble::fromJson(ModelJson::fetch(store, k), k).numFeatures());
    });
    status.anomaly_loaded = tryLoad(Members::ANOMALY, status, [&] {
        const auto k = keyOf(SignalEnsemble::ANOMALY_BLOB);
        widthCheck(Members::ANOMALY, IsolationForest::fromJson(ModelJson::fetch(store, k), k).numFeatures());
    });
    status.reconstruction_loaded = tryLoad(Members::RECONSTRUCTION, status, [&] {
        const auto k = keyOf(SignalEnsemble::RECONSTRUCTION_BLOB);
        widthCheck(Members::RECONSTRUCTION, Autoencoder::fromJson(ModelJson::fetch(store, k), k).numFeatures());
    });
    status.cluster_loaded = tryLoad(Members::CLUSTER, status, [&] {
        const auto k = keyOf(SignalEnsemble::CLUSTER_BLOB);
        widthCheck(Members::CLUSTER, KMeansModel::fromJson(ModelJson::fetch(store, k), k).numFeatures());
    });
    status.stacker_loaded = tryLoad("stacker", status, [&] {
        StackedDecision::load(store, *bundle);
    });
    return status;
}

EngineeredFeatureVector ScoringRuntime::engineer(const RawRecord& raw) const {
    TransformResult result = pipeline_.transform(raw, PipelineMode::APPLY, bundle_);
    if (result.artifacts != bundle_) {
        throw ContractViolation("APPLY returned a different artifact bundle");
    }
    FeatureContract::enforce(result.vector, bundle_->frozen_schema);
    return std::move(result.vector);
}

ScoredTransaction ScoringRuntime::scoreDetailed(const RawRecord& raw) const {
    ScoredTransaction out;
    out.vector = engineer(raw);
    out.signals = ensemble_->score(out.vector);
    out.meta = assembler_.assembleForServing(out.signals, out.vector);
    out.decision = decision_->decide(out.meta);
    return out;
}

Decision ScoringRuntime::score(const RawRecord& raw) const {
    return scoreDetailed(raw).decision;
}

Explanation ScoringRuntime::explain(const RawRecord& raw, size_t k) const {
    const EngineeredFeatureVector vector = engineer(raw);
    const auto& member = ensemble_->classifier();
    return AttributionEngine::explain(member.model, member.slice(vector), member.features, k);
}

std::vector<Decision> ScoringRuntime::scoreBatch(const std::vector<RawRecord>& records) const {
    std::vector<Decision> out;
    out.reserve(records.size());
    for (const auto& r : records) out.push_back(score(r));
    return out;
}

HealthStatus ScoringRuntime::health() const {
    HealthStatus status;
    status.bundle_loaded = static_cast<bool>(bundle_);
    status.classifier_loaded = static_cast<bool>(ensemble_);
    status.anomaly_loaded = static_cast<bool>(ensemble_);
    status.reconstruction_loaded = static_cast<bool>(ensemble_);
    status.cluster_loaded = static_cast<bool>(ensemble_);
    status.stacker_loaded = static_cast<bool>(decision_);
    status.model_version = bundle_->model_version;
    return status;
}

} // namespace fris
