#include "fris/models/TreeEnsemble.hpp"
#include "fris/models/ModelJson.hpp"
#include "fris/core/Errors.hpp"

#include <algorithm>
#include <cmath>

using json = nlohmann::json;

namespace fris {

namespace {

const char* MODEL_NAME = "tree_ensemble";

double sigmoid(double z) {
    return 1.0 / (1.0 + std::exp(-z));
}

// -----------------------------------------------------------------------------
// TreeSHAP path bookkeeping (Lundberg et al., Algorithm 2)
// -----------------------------------------------------------------------------
struct PathElement {
    int feature = -1;
    double zero_fraction = 0.0;
    double one_fraction = 0.0;
    double pweight = 0.0;
};

using Path = std::vector<PathElement>;

void extendPath(Path& path, int depth, double zero_fraction, double one_fraction, int feature) {
    path[depth].feature = feature;
    path[depth].zero_fraction = zero_fraction;
    path[depth].one_fraction = one_fraction;
    path[depth].pweight = (depth == 0) ? 1.0 : 0.0;
    for (int i = depth - 1; i >= 0; --i) {
        path[i + 1].pweight += one_fraction * path[i].pweight * (i + 1) / static_cast<double>(depth + 1);
        path[i].pweight = zero_fraction * path[i].pweight * (depth - i) / static_cast<double>(depth + 1);
    }
}

void unwindPath(Path& path, int depth, int index) {
    const double one_fraction = path[index].one_fraction;
    const double zero_fraction = path[index].zero_fraction;
    double next_one_portion = path[depth].pweight;

    for (int i = depth - 1; i >= 0; --i) {
        if (one_fraction != 0.0) {
            const double tmp = path[i].pweight;
            path[i].pweight = next_one_portion * (depth + 1) / ((i + 1) * one_fraction);
            next_one_portion = tmp - path[i].pweight * zero_fraction * (depth - i) / static_cast<double>(depth + 1);
        } else {
            path[i].pweight = path[i].pweight * (depth + 1) / (zero_fraction * (depth - i));
        }
    }
    for (int i = index; i < depth; ++i) {
        path[i].feature = path[i + 1].feature;
        path[i].zero_fraction = path[i + 1].zero_fraction;
        path[i].one_fraction = path[i + 1].one_fraction;
    }
}

double unwoundPathSum(const Path& path, int depth, int index) {
    const double one_fraction = path[index].one_fraction;
    const double zero_fraction = path[index].zero_fraction;
    double next_one_portion = path[depth].pweight;
    double total = 0.0;

    for (int i = depth - 1; i >= 0; --i) {
        if (one_fraction != 0.0) {
            const double tmp = next_one_portion * (depth + 1) / ((i + 1) * one_fraction);
            total += tmp;
            next_one_portion = path[i].pweight - tmp * zero_fraction * (depth - i) / static_cast<double>(depth + 1);
        } else if (zero_fraction != 0.0) {
            total += (path[i].pweight / zero_fraction) / ((depth - i) / static_cast<double>(depth + 1));
        }
    }
    return total;
}

struct ShapWalker {
    const DecisionTree& tree;
    const std::vector<double>& x;
    std::vector<double>& phi;

    int hotChild(const TreeNode& n) const {
        const double v = x[static_cast<size_t>(n.split)];
        if (std::isnan(v)) return n.missing;
        return v < n.threshold ? n.yes : n.no;
    }

    void walk(int node_index, int depth, const Path& parent,
              double zero_fraction, double one_fraction, int feature) {
        Path path(parent.begin(), parent.begin() + depth);
        path.resize(static_cast<size_t>(depth) + 1);
        extendPath(path, depth, zero_fraction, one_fraction, feature);

        const TreeNode& node = tree.nodes[static_cast<size_t>(node_index)];
        if (node.isLeaf()) {
            for (int i = 1; i <= depth; ++i) {
                const double w = unwoundPathSum(path, depth, i);
                const PathElement& el = path[static_cast<size_t>(i)];
                phi[static_cast<size_t>(el.feature)] += w * (el.one_fraction - el.zero_fraction) * node.leaf;
            }
            return;
        }

        const int hot = hotChild(node);
        const int cold = (hot == node.yes) ? node.no : node.yes;
        const double hot_zero = tree.nodes[static_cast<size_t>(hot)].cover / node.cover;
        const double cold_zero = tree.nodes[static_cast<size_t>(cold)].cover / node.cover;

        double incoming_zero = 1.0;
        double incoming_one = 1.0;

        // A feature already on the path is unwound so it appears only once.
        int index = 0;
        for (; index <= depth; ++index) {
            if (path[static_cast<size_t>(index)].feature == node.split) break;
        }
        if (index != depth + 1) {
            incoming_zero = path[static_cast<size_t>(index)].zero_fraction;
            incoming_one = path[static_cast<size_t>(index)].one_fraction;
            unwindPath(path, depth, index);
            depth -= 1;
        }

        walk(hot, depth + 1, path, hot_zero * incoming_zero, incoming_one, node.split);
        walk(cold, depth + 1, path, cold_zero * incoming_zero, 0.0, node.split);
    }
};

double expectedValue(const DecisionTree& tree, int index) {
    const TreeNode& n = tree.nodes[static_cast<size_t>(index)];
    if (n.isLeaf()) return n.leaf;
    const TreeNode& yes = tree.nodes[static_cast<size_t>(n.yes)];
    const TreeNode& no = tree.nodes[static_cast<size_t>(n.no)];
    return (yes.cover * expectedValue(tree, n.yes) + no.cover * expectedValue(tree, n.no)) / n.cover;
}

int depthOf(const DecisionTree& tree, int index) {
    const TreeNode& n = tree.nodes[static_cast<size_t>(index)];
    if (n.isLeaf()) return 0;
    return 1 + std::max(depthOf(tree, n.yes), depthOf(tree, n.no));
}

} // namespace

// -----------------------------------------------------------------------------
// Loading
// -----------------------------------------------------------------------------
TreeEnsemble TreeEnsemble::fromJson(const json& j, const std::string& doc) {
    TreeEnsemble model;

    const int nf = ModelJson::integer(j, "num_features", doc);
    if (nf <= 0) {
        throw ArtifactError(doc + ": num_features must be positive");
    }
    model.num_features_ = static_cast<size_t>(nf);

    const double base_score = ModelJson::number(j, "base_score", doc);
    if (!(base_score > 0.0 && base_score < 1.0)) {
        throw ArtifactError(doc + ": base_score must be a probability in (0,1)");
    }
    model.base_margin_ = std::log(base_score / (1.0 - base_score));

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

        DecisionTree tree;
        const int count = static_cast<int>(nodes.size());
        for (int i = 0; i < count; ++i) {
            const json& nj = nodes[static_cast<size_t>(i)];
            const std::string at = where + ".nodes[" + std::to_string(i) + "]";
            TreeNode node;
            node.cover = ModelJson::number(nj, "cover", at);
            if (!(node.cover > 0.0)) {
                throw ArtifactError(at + ": cover must be positive");
            }
            if (nj.contains("leaf")) {
                node.leaf = ModelJson::number(nj, "leaf", at);
            } else {
                node.split = ModelJson::integer(nj, "split", at);
                node.threshold = ModelJson::number(nj, "threshold", at);
                node.yes = ModelJson::integer(nj, "yes", at);
                node.no = ModelJson::integer(nj, "no", at);
                node.missing = ModelJson::integer(nj, "missing", at);
                if (node.split < 0 || node.split >= nf) {
                    throw ArtifactError(at + ": split feature out of range");
                }
                for (int child : {node.yes, node.no}) {
                    if (child <= i || child >= count) {
                        throw ArtifactError(at + ": child index must point forward inside the tree");
                    }
                }
                if (node.yes == node.no) {
                    throw ArtifactError(at + ": yes and no must differ");
                }
                if (node.missing != node.yes && node.missing != node.no) {
                    throw ArtifactError(at + ": missing must equal yes or no");
                }
            }
            tree.nodes.push_back(node);
        }

        for (int i = 0; i < count; ++i) {
            const TreeNode& n = tree.nodes[static_cast<size_t>(i)];
            if (n.isLeaf()) continue;
            const double sum = tree.nodes[static_cast<size_t>(n.yes)].cover +
                               tree.nodes[static_cast<size_t>(n.no)].cover;
            if (std::fabs(sum - n.cover) > 1e-6 * std::max(1.0, n.cover)) {
                throw ArtifactError(where + ": node " + std::to_string(i) +
                                    " cover differs from the sum of its children");
            }
        }

        tree.max_depth = depthOf(tree, 0);
        model.expected_margin_ += expectedValue(tree, 0);
        model.trees_.push_back(std::move(tree));
    }
    model.expected_margin_ += model.base_margin_;
    return model;
}

// -----------------------------------------------------------------------------
// Inference
// -----------------------------------------------------------------------------
void TreeEnsemble::checkWidth(const std::vector<double>& x) const {
    if (x.size() != num_features_) {
        throw ModelError(MODEL_NAME, "expected " + std::to_string(num_features_) +
                         " features, got " + std::to_string(x.size()));
    }
}

int TreeEnsemble::nextNode(const TreeNode& node, double value) const {
    if (std::isnan(value)) return node.missing;
    return value < node.threshold ? node.yes : node.no;
}

double TreeEnsemble::margin(const std::vector<double>& x) const {
    checkWidth(x);
    double m = base_margin_;
    for (const auto& tree : trees_) {
        int idx = 0;
        while (!tree.nodes[static_cast<size_t>(idx)].isLeaf()) {
            const TreeNode& n = tree.nodes[static_cast<size_t>(idx)];
            idx = nextNode(n, x[static_cast<size_t>(n.split)]);
        }
        m += tree.nodes[static_cast<size_t>(idx)].leaf;
    }
    return m;
}

double TreeEnsemble::predictProba(const std::vector<double>& x) const {
    const double p = sigmoid(margin(x));
    if (!std::isfinite(p)) {
        throw ModelError(MODEL_NAME, "probability is not finite");
    }
    return p;
}

std::vector<double> TreeEnsemble::contributions(const std::vector<double>& x) const {
    checkWidth(x);
    std::vector<double> phi(num_features_, 0.0);
    for (const auto& tree : trees_) {
        ShapWalker walker{tree, x, phi};
        Path root;
        root.reserve(static_cast<size_t>(tree.max_depth) + 2);
        walker.walk(0, 0, root, 1.0, 1.0, -1);
    }
    return phi;
}

} // namespace fris
