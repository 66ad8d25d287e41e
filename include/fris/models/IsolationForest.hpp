// =============================================================================
// IsolationForest.hpp - Frozen isolation forest anomaly scorer
// =============================================================================
// FORMAT (isolation_forest.json):
//   { "num_features": n, "max_samples": 256, "offset": -0.5,
//     "trees": [ { "nodes": [ {"feature":i,"threshold":t,"left":a,"right":b},
//                             {"n_samples":k}, ... ] }, ... ] }
//   x[i] <= t goes left.
//
// SCORE:
//   h(x)          = depth of reached leaf + c(n_samples at leaf)
//   score_samples = -2^(-mean h / c(max_samples))
//   decision      = score_samples - offset        (negative = outlier)
//   anomalyScore  = -decision                     (larger = more anomalous)
// =============================================================================
#pragma once

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <vector>

namespace fris {

class IsolationForest {
public:
    struct Node {
        int feature = -1;       // -1 for a leaf
        double threshold = 0.0;
        int left = -1;
        int right = -1;
        double n_samples = 0.0;
    };

    static IsolationForest fromJson(const nlohmann::json& j, const std::string& doc = "isolation_forest");

    // Average path length of an unsuccessful BST search over n points.
    static double averagePathLength(double n);

    size_t numFeatures() const { return num_features_; }

    double scoreSamples(const std::vector<double>& x) const;
    double decisionFunction(const std::vector<double>& x) const;
    double anomalyScore(const std::vector<double>& x) const;

private:
    size_t num_features_ = 0;
    double max_samples_ = 0.0;
    double offset_ = 0.0;
    std::vector<std::vector<Node>> trees_;
};

} // namespace fris
