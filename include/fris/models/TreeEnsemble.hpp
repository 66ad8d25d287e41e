// =============================================================================
// TreeEnsemble.hpp - Frozen gradient-boosted tree classifier
// =============================================================================
// PURPOSE: Supervised fraud probability plus exact per-feature attributions.
//
// FORMAT (classifier.json):
//   { "num_features": n, "base_score": 0.5,
//     "trees": [ { "nodes": [ {"split":i,"threshold":t,"yes":a,"no":b,"missing":c,"cover":w},
//                             {"leaf":v,"cover":w}, ... ] }, ... ] }
//   Node 0 is the root. x[i] < t goes to "yes"; NaN goes to "missing".
//   Children always have a larger index than their parent.
//
// OUTPUT:
//   margin      = logit(base_score) + sum of reached leaves
//   probability = sigmoid(margin)
//
// ATTRIBUTION:
//   Path-dependent TreeSHAP in margin space. Baseline is the cover-weighted
//   expected margin, so sum(contributions) == margin(x) - baseline.
// =============================================================================
#pragma once

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <vector>

namespace fris {

struct TreeNode {
    int split = -1;             // feature index; -1 for a leaf
    double threshold = 0.0;
    int yes = -1;
    int no = -1;
    int missing = -1;
    double leaf = 0.0;
    double cover = 0.0;

    bool isLeaf() const { return split < 0; }
};

struct DecisionTree {
    std::vector<TreeNode> nodes;
    int max_depth = 0;
};

class TreeEnsemble {
public:
    static TreeEnsemble fromJson(const nlohmann::json& j, const std::string& doc = "classifier");

    size_t numFeatures() const { return num_features_; }
    size_t numTrees() const { return trees_.size(); }

    double margin(const std::vector<double>& x) const;
    double predictProba(const std::vector<double>& x) const;

    // Cover-weighted expected margin over the training population.
    double expectedMargin() const { return expected_margin_; }

    // One value per feature; sums to margin(x) - expectedMargin().
    std::vector<double> contributions(const std::vector<double>& x) const;

private:
    int nextNode(const TreeNode& node, double value) const;
    void checkWidth(const std::vector<double>& x) const;

    size_t num_features_ = 0;
    double base_margin_ = 0.0;
    double expected_margin_ = 0.0;
    std::vector<DecisionTree> trees_;
};

} // namespace fris
