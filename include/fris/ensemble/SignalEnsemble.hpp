// =============================================================================
// SignalEnsemble.hpp - Base signal generators behind frozen feature contracts
// =============================================================================
// PURPOSE: Turn one validated engineered vector into the base signal set.
// DESIGN:
//   - Each member is (model, frozen feature list); the member slices the
//     vector itself, so no model ever sees the full vector
//   - Input widths are checked against the feature lists at load time
//   - A model failure surfaces as ModelError naming the member; slice
//     failures surface as ContractViolation
//   - Immutable after load; shared across threads without locking
//
// MODEL BLOBS ("<version>/models/..."):
//   classifier.json, isolation_forest.json, autoencoder.json, kmeans.json
// =============================================================================
#pragma once

#include "fris/features/ArtifactBundle.hpp"
#include "fris/features/FeatureVector.hpp"
#include "fris/models/Autoencoder.hpp"
#include "fris/models/IsolationForest.hpp"
#include "fris/models/KMeansModel.hpp"
#include "fris/models/TreeEnsemble.hpp"

#include <memory>
#include <string>
#include <vector>

namespace fris {

class ArtifactStore;

struct BaseSignalSet {
    double supervised_proba = 0.0;      // classifier probability, [0,1]
    double anomaly_score = 0.0;         // larger = more anomalous
    double reconstruction_error = 0.0;  // [0, inf)
    int cluster_id = -1;
    std::vector<double> latent;         // only used if the meta contract names it
};

template <typename Model>
struct EnsembleMember {
    std::string name;
    Model model;
    std::vector<std::string> features;

    std::vector<double> slice(const EngineeredFeatureVector& v) const { return v.slice(features); }
};

class SignalEnsemble {
public:
    static constexpr const char* CLASSIFIER_BLOB     = "classifier.json";
    static constexpr const char* ANOMALY_BLOB        = "isolation_forest.json";
    static constexpr const char* RECONSTRUCTION_BLOB = "autoencoder.json";
    static constexpr const char* CLUSTER_BLOB        = "kmeans.json";

    SignalEnsemble(TreeEnsemble classifier, IsolationForest anomaly,
                   Autoencoder reconstruction, KMeansModel cluster,
                   const FittedArtifactBundle& bundle);

    static std::shared_ptr<const SignalEnsemble> load(const ArtifactStore& store,
                                                      const FittedArtifactBundle& bundle);

    BaseSignalSet score(const EngineeredFeatureVector& vector) const;

    const EnsembleMember<TreeEnsemble>& classifier() const { return classifier_; }
    const EnsembleMember<IsolationForest>& anomaly() const { return anomaly_; }
    const EnsembleMember<Autoencoder>& reconstruction() const { return reconstruction_; }
    const EnsembleMember<KMeansModel>& cluster() const { return cluster_; }

private:
    EnsembleMember<TreeEnsemble> classifier_;
    EnsembleMember<IsolationForest> anomaly_;
    EnsembleMember<Autoencoder> reconstruction_;
    EnsembleMember<KMeansModel> cluster_;
};

} // namespace fris
