#pragma once
// =============================================================================
// KMeansModel.hpp - Frozen centroid assignment
// =============================================================================
// kmeans.json: { "centroids": [[..], ..] }. Nearest centroid by squared
// Euclidean distance; ties go to the lowest index. Ids carry no ordering.
// =============================================================================

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <vector>

namespace fris {

class KMeansModel {
public:
    static KMeansModel fromJson(const nlohmann::json& j, const std::string& doc = "kmeans");

    size_t numFeatures() const { return centroids_.front().size(); }
    size_t numClusters() const { return centroids_.size(); }

    int assign(const std::vector<double>& x) const;

private:
    std::vector<std::vector<double>> centroids_;
};

} // namespace fris
