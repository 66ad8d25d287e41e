#include "fris/models/IsolationForest.hpp"
#include "fris/models/ModelJson.hpp"
#include "fris/core/Errors.hpp"

#include <cmath>

using json = nlohmann::json;

namespace fris {

namespace {
constexpr double EULER_GAMMA = 0.5772156649015329;
const char* MODEL_NAME = "isolation_forest";
} // namespace

double IsolationForest::averagePathLength(double n) {
    if (n <= 1.0) return 0.0;
    if (n <= 2.0) return 1.0;
    return 2.0 * (std::log(n - 1.0) + EULER_GAMMA) - 2.0 * (n - 1.0) / n;
}

IsolationForest IsolationForest::fromJson(const json& j, const std::string& doc) {
    IsolationForest model;

    const int nf = ModelJson::integer(j, "num_features", doc);
    if (nf <= 0) {
        throw ArtifactError(doc + ": num_features must be positive");
    }
    model.num_features_ = static_cast<size_t>(nf);
    model.max_samples_ = ModelJson::number(j, "max_samples", doc);
    if (model.max_samples_ < 2.0) {
        throw ArtifactError(doc + ": max_samples must be >= 2");
    }
    model.offset_ = ModelJson::number(j, "offset", doc);

    const json& trees = ModelJson::member(j, "trees", doc);
    if (!trees.is_array() || trees.empty()) {
        throw ArtifactError(doc + ": 'trees' must be a non-empty array");
    }

    for (size_t t = 0; t < trees.size(); ++t) {
        const std::string where = doc + ":trees[" + std::to_string(t) + "]";
        const json& nodes = ModelJson::member(trees[t], "nodes", where);
        if (!nodes.is_array() || nodes.empty()) {
            throw ArtifactError(where + ": 'nodes' must be a non-empty array");
        }

        std::vector<Node> tree;
        const int count = static_cast<int>(nodes.size());
        for (int i = 0; i < count; ++i) {
            const json& nj = nodes[static_cast<size_t>(i)];
            const std::string at = where + ".nodes[" + std::to_string(i) + "]";
            Node node;
            if (nj.contains("n_samples")) {
                node.n_samples = ModelJson::number(nj, "n_samples", at);
                if (node.n_samples < 1.0) {
                    throw ArtifactError(at + ": n_samples must be >= 1");
                }
            } else {
                node.feature = ModelJson::integer(nj, "feature", at);
                node.threshold = ModelJson::number(nj, "threshold", at);
                node.left = ModelJson::integer(nj, "left", at);
                node.right = ModelJson::integer(nj, "right", at);
                if (node.feature < 0 || node.feature >= nf) {
                    throw ArtifactError(at + ": feature out of range");
                }
                for (int child : {node.left, node.right}) {
                    if (child <= i || child >= count) {
                        throw ArtifactError(at + ": child index must point forward inside the tree");
                    }
                }
            }
            tree.push_back(node);
        }
        model.trees_.push_back(std::move(tree));
    }
    return model;
}

double IsolationForest::scoreSamples(const std::vector<double>& x) const {
    if (x.size() != num_features_) {
        throw ModelError(MODEL_NAME, "expected " + std::to_string(num_features_) +
                         " features, got " + std::to_string(x.size()));
    }
    for (double v : x) {
        if (!std::isfinite(v)) {
            throw ModelError(MODEL_NAME, "input is not finite");
        }
    }

    double total = 0.0;
    for (const auto& tree : trees_) {
        size_t idx = 0;
        int depth = 0;
        while (tree[idx].feature >= 0) {
            const Node& n = tree[idx];
            idx = static_cast<size_t>(x[static_cast<size_t>(n.feature)] <= n.threshold ? n.left : n.right);
            ++depth;
        }
        total += depth + averagePathLength(tree[idx].n_samples);
    }
    const double mean_depth = total / static_cast<double>(trees_.size());
    return -std::pow(2.0, -mean_depth / averagePathLength(max_samples_));
}

double IsolationForest::decisionFunction(const std::vector<double>& x) const {
    return scoreSamples(x) - offset_;
}

double IsolationForest::anomalyScore(const std::vector<double>& x) const {
    return -decisionFunction(x);
}

} // namespace fris
