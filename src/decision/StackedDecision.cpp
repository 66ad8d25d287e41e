#include "fris/decision/StackedDecision.hpp"
#include "fris/models/ModelJson.hpp"
#include "fris/store/ArtifactStore.hpp"
#include "fris/core/Errors.hpp"
#include "fris/core/Log.hpp"

#include <cmath>

namespace fris {

StackedDecision::StackedDecision(LogisticStacker stacker, std::vector<std::string> meta_order,
                                 double threshold)
    : stacker_(std::move(stacker)), meta_order_(std::move(meta_order)), threshold_(threshold) {
    if (stacker_.numFeatures() != meta_order_.size()) {
        throw ArtifactError("stacker takes " + std::to_string(stacker_.numFeatures()) +
                            " meta features but the frozen order has " +
                            std::to_string(meta_order_.size()));
    }
    if (!(threshold_ >= 0.0 && threshold_ <= 1.0)) {
        throw ArtifactError("decision threshold outside [0,1]");
    }
}

std::shared_ptr<const StackedDecision> StackedDecision::load(const ArtifactStore& store,
                                                             const FittedArtifactBundle& bundle) {
    const std::string key = ModelJson::modelKey(bundle.model_version, STACKER_BLOB);
    auto decision = std::make_shared<const StackedDecision>(
        LogisticStacker::fromJson(ModelJson::fetch(store, key), key),
        bundle.contracts.meta_features,
        bundle.threshold());

    FRIS_LOG_INFO("StackedDecision", "Loaded %s: %zu meta features, %s, threshold=%.2f",
                  key.c_str(), decision->meta_order_.size(),
                  decision->stacker_.calibrated() ? "platt-calibrated" : "uncalibrated",
                  decision->threshold_);
    return decision;
}

Decision StackedDecision::decide(const LogisticStacker& stacker, const std::vector<double>& meta,
                                 double threshold) {
    if (meta.size() != stacker.numFeatures()) {
        throw ContractViolation("meta vector length " + std::to_string(meta.size()) +
                                " differs from stacker width " + std::to_string(stacker.numFeatures()));
    }
    Decision d;
    d.probability = stacker.predictProba(meta);
    d.label = (d.probability >= threshold) ? DecisionLabel::FRAUD : DecisionLabel::LEGIT;
    return d;
}

Decision StackedDecision::decide(const MetaFeatureVector& meta) const {
    if (meta.names != meta_order_) {
        throw ContractViolation("meta vector was not assembled in the stacker's frozen order");
    }
    return decide(stacker_, meta.values, threshold_);
}

// -----------------------------------------------------------------------------
// ThresholdSelector
// -----------------------------------------------------------------------------
ThresholdSweep ThresholdSelector::select(const std::vector<double>& probabilities,
                                         const std::vector<int>& labels,
                                         double fn_cost, double fp_cost) {
    if (probabilities.empty() || probabilities.size() != labels.size()) {
        throw InputError("threshold sweep needs equally sized, non-empty probabilities and labels");
    }
    if (fn_cost < 0.0 || fp_cost < 0.0) {
        throw InputError("threshold sweep costs must be >= 0");
    }

    ThresholdSweep best;
    bool first = true;
    for (int step = 1; step <= GRID_STEPS; ++step) {
        const double t = step / 100.0;
        uint64_t fn = 0;
        uint64_t fp = 0;
        for (size_t i = 0; i < probabilities.size(); ++i) {
            const bool predicted = probabilities[i] >= t;
            const bool actual = labels[i] != 0;
            if (actual && !predicted) ++fn;
            if (!actual && predicted) ++fp;
        }
        const double cost = fn_cost * static_cast<double>(fn) + fp_cost * static_cast<double>(fp);
        if (first || cost < best.cost) {
            best = ThresholdSweep{t, cost, fn, fp};
            first = false;
        }
    }
    return best;
}

} // namespace fris
