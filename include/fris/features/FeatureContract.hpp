// =============================================================================
// FeatureContract.hpp - Frozen schema gate
// =============================================================================
// Runs after every APPLY transform and before any model sees the vector.
// Column-set equality is the contract; order is reported but not enforced.
// Nothing is ever truncated, padded or reordered here.
// =============================================================================
#pragma once

#include "fris/features/FeatureVector.hpp"
#include "fris/core/Errors.hpp"

#include <string>
#include <vector>

namespace fris {

struct ContractCheck {
    ContractViolation::ColumnSet missing;
    ContractViolation::ColumnSet extra;
    bool order_matches = false;

    bool ok() const { return missing.empty() && extra.empty(); }
};

class FeatureContract {
public:
    static ContractCheck validate(const EngineeredFeatureVector& vector,
                                  const std::vector<std::string>& frozen_schema);

    // Throws ContractViolation carrying the exact diff.
    static void enforce(const EngineeredFeatureVector& vector,
                        const std::vector<std::string>& frozen_schema);
};

} // namespace fris
