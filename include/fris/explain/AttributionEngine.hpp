// =============================================================================
// AttributionEngine.hpp - Per-feature explanation of the supervised signal
// =============================================================================
// PURPOSE: Explain the classifier on exactly the slice it scored.
// DESIGN:
//   - Contributions are TreeSHAP values in margin (log-odds) space
//   - baseline   = expected margin over the training population
//   - prediction = margin of this slice
//   - sum of ALL contributions == prediction - baseline (contribution_sum)
//   - Output ranked by |contribution| descending, ties in slice order,
//     truncated to k, each entry paired with the observed slice value
//   - Reads only; never triggers recomputation of any signal
// =============================================================================
#pragma once

#include "fris/models/TreeEnsemble.hpp"

#include <string>
#include <vector>

namespace fris {

struct Attribution {
    std::string feature;
    double contribution = 0.0;
    double value = 0.0;
};

struct Explanation {
    double baseline = 0.0;
    double prediction = 0.0;
    double contribution_sum = 0.0;          // over every feature, before truncation
    std::vector<Attribution> attributions;  // top-k
};

class AttributionEngine {
public:
    static Explanation explain(const TreeEnsemble& classifier,
                               const std::vector<double>& slice,
                               const std::vector<std::string>& names,
                               size_t k);
};

} // namespace fris
