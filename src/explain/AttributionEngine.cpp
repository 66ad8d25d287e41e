#include "fris/explain/AttributionEngine.hpp"
#include "fris/core/Errors.hpp"

#include <algorithm>
#include <cmath>

namespace fris {

Explanation AttributionEngine::explain(const TreeEnsemble& classifier,
                                       const std::vector<double>& slice,
                                       const std::vector<std::string>& names,
                                       size_t k) {
    if (names.size() != slice.size()) {
        throw ContractViolation("attribution names (" + std::to_string(names.size()) +
                                ") do not match slice width (" + std::to_string(slice.size()) + ")");
    }
    if (k == 0) {
        throw InputError("attribution top-k must be >= 1");
    }

    const std::vector<double> phi = classifier.contributions(slice);

    Explanation ex;
    ex.baseline = classifier.expectedMargin();
    ex.prediction = classifier.margin(slice);

    std::vector<Attribution> all;
    all.reserve(phi.size());
    for (size_t i = 0; i < phi.size(); ++i) {
        ex.contribution_sum += phi[i];
        all.push_back({names[i], phi[i], slice[i]});
    }

    std::stable_sort(all.begin(), all.end(), [](const Attribution& a, const Attribution& b) {
        return std::fabs(a.contribution) > std::fabs(b.contribution);
    });
    if (all.size() > k) all.resize(k);
    ex.attributions = std::move(all);
    return ex;
}

} // namespace fris
