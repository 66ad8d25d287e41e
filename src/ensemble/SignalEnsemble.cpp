#include "fris/ensemble/SignalEnsemble.hpp"
#include "fris/models/ModelJson.hpp"
#include "fris/store/ArtifactStore.hpp"
#include "fris/core/Errors.hpp"
#include "fris/core/Log.hpp"

#include <cmath>

namespace fris {

namespace {

void checkWidth(const std::string& member, size_t model_width, size_t contract_width) {
    if (model_width != contract_width) {
        throw ArtifactError("model '" + member + "' takes " + std::to_string(model_width) +
                            " inputs but its frozen feature list has " + std::to_string(contract_width));
    }
}

// Slices first (ContractViolation propagates untouched), then runs the model
// and re-labels any failure with the member name.
template <typename Model, typename Fn>
auto invoke(const EnsembleMember<Model>& member, const EngineeredFeatureVector& vector, Fn&& fn)
    -> decltype(fn(member.model, std::vector<double>{})) {
    const std::vector<double> x = member.slice(vector);
    try {
        return fn(member.model, x);
    } catch (const std::exception& e) {
        throw ModelError(member.name, e.what());
    }
}

} // namespace

SignalEnsemble::SignalEnsemble(TreeEnsemble classifier, IsolationForest anomaly,
                               Autoencoder reconstruction, KMeansModel cluster,
                               const FittedArtifactBundle& bundle)
    : classifier_{Members::CLASSIFIER, std::move(classifier), bundle.modelFeatures(Members::CLASSIFIER)}
    , anomaly_{Members::ANOMALY, std::move(anomaly), bundle.modelFeatures(Members::ANOMALY)}
    , reconstruction_{Members::RECONSTRUCTION, std::move(reconstruction), bundle.modelFeatures(Members::RECONSTRUCTION)}
    , cluster_{Members::CLUSTER, std::move(cluster), bundle.modelFeatures(Members::CLUSTER)} {
    checkWidth(classifier_.name, classifier_.model.numFeatures(), classifier_.features.size());
    checkWidth(anomaly_.name, anomaly_.model.numFeatures(), anomaly_.features.size());
    checkWidth(reconstruction_.name, reconstruction_.model.numFeatures(), reconstruction_.features.size());
    checkWidth(cluster_.name, cluster_.model.numFeatures(), cluster_.features.size());
}

std::shared_ptr<const SignalEnsemble> SignalEnsemble::load(const ArtifactStore& store,
                                                           const FittedArtifactBundle& bundle) {
    const std::string& v = bundle.model_version;

    const std::string ck = ModelJson::modelKey(v, CLASSIFIER_BLOB);
    const std::string ak = ModelJson::modelKey(v, ANOMALY_BLOB);
    const std::string rk = ModelJson::modelKey(v, RECONSTRUCTION_BLOB);
    const std::string kk = ModelJson::modelKey(v, CLUSTER_BLOB);

    auto ensemble = std::make_shared<const SignalEnsemble>(
        TreeEnsemble::fromJson(ModelJson::fetch(store, ck), ck),
        IsolationForest::fromJson(ModelJson::fetch(store, ak), ak),
        Autoencoder::fromJson(ModelJson::fetch(store, rk), rk),
        KMeansModel::fromJson(ModelJson::fetch(store, kk), kk),
        bundle);

    FRIS_LOG_INFO("SignalEnsemble", "Loaded %s: %zu trees, iforest, autoencoder (latent %zu), kmeans k=%zu",
                  v.c_str(), ensemble->classifier_.model.numTrees(),
                  ensemble->reconstruction_.model.latentWidth(),
                  ensemble->cluster_.model.numClusters());
    return ensemble;
}

BaseSignalSet SignalEnsemble::score(const EngineeredFeatureVector& vector) const {
    BaseSignalSet s;

    s.supervised_proba = invoke(classifier_, vector, [](const TreeEnsemble& m, const std::vector<double>& x) {
        return m.predictProba(x);
    });
    s.anomaly_score = invoke(anomaly_, vector, [](const IsolationForest& m, const std::vector<double>& x) {
        return m.anomalyScore(x);
    });

    Reconstruction r = invoke(reconstruction_, vector, [](const Autoencoder& m, const std::vector<double>& x) {
        return m.reconstruct(x);
    });
    s.reconstruction_error = r.error;
    s.latent = std::move(r.latent);

    s.cluster_id = invoke(cluster_, vector, [](const KMeansModel& m, const std::vector<double>& x) {
        return m.assign(x);
    });
    return s;
}

} // namespace fris
