// =============================================================================
// LinearProjection.hpp - Frozen 2-component principal projection
// =============================================================================
// fit():     mean-centre the numeric columns, eigen-decompose the covariance
//            (cyclic Jacobi), keep the top components. Each component's sign
//            is fixed so its largest-magnitude loading is positive.
// project(): (x - mean) . component_k  -- never refits.
// =============================================================================
#pragma once

#include <string>
#include <vector>

namespace fris {

class FeatureFrame;

struct LinearProjection {
    static constexpr size_t DEFAULT_COMPONENTS = 2;

    std::vector<std::string> input_columns;
    std::vector<double> mean;
    std::vector<std::vector<double>> components;   // [component][input]
    std::vector<double> explained_variance;

    static LinearProjection fit(const FeatureFrame& frame,
                                const std::vector<std::string>& columns,
                                size_t n_components = DEFAULT_COMPONENTS);

    // ArtifactError when x does not match input_columns in width.
    std::vector<double> project(const std::vector<double>& x) const;

    bool empty() const { return components.empty(); }
};

} // namespace fris
