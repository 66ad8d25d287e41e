#include "fris/models/KMeansModel.hpp"
#include "fris/models/ModelJson.hpp"
#include "fris/core/Errors.hpp"

#include <cmath>
#include <limits>

namespace fris {

KMeansModel KMeansModel::fromJson(const nlohmann::json& j, const std::string& doc) {
    KMeansModel model;
    model.centroids_ = ModelJson::matrix(j, "centroids", doc);
    return model;
}

int KMeansModel::assign(const std::vector<double>& x) const {
    if (x.size() != numFeatures()) {
        throw ModelError("kmeans", "expected " + std::to_string(numFeatures()) +
                         " features, got " + std::to_string(x.size()));
    }

    int best = -1;
    double best_dist = std::numeric_limits<double>::infinity();
    for (size_t c = 0; c < centroids_.size(); ++c) {
        double d = 0.0;
        for (size_t i = 0; i < x.size(); ++i) {
            const double diff = x[i] - centroids_[c][i];
            d += diff * diff;
        }
        if (d < best_dist) {
            best_dist = d;
            best = static_cast<int>(c);
        }
    }
    if (best < 0) {
        throw ModelError("kmeans", "no finite centroid distance");
    }
    return best;
}

} // namespace fris
