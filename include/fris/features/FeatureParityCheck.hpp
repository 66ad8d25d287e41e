#pragma once
// =============================================================================
// FeatureParityCheck.hpp - Compare two engineered vectors value by value
// =============================================================================
// Used to prove that APPLY with frozen artifacts reproduces the FIT output.
// Numeric cells match when |a-b| <= atol + rtol*|b|; text cells must be equal.
// =============================================================================

#include "fris/features/FeatureVector.hpp"
#include "fris/core/Errors.hpp"

#include <string>
#include <vector>

namespace fris {

struct ValueMismatch {
    std::string column;
    std::string left;
    std::string right;
};

struct ParityReport {
    ContractViolation::ColumnSet only_left;
    ContractViolation::ColumnSet only_right;
    std::vector<ValueMismatch> mismatches;

    bool ok() const { return only_left.empty() && only_right.empty() && mismatches.empty(); }
    std::string summary() const;
};

class FeatureParityCheck {
public:
    static constexpr double DEFAULT_RTOL = 1e-9;
    static constexpr double DEFAULT_ATOL = 1e-12;

    static ParityReport compare(const EngineeredFeatureVector& a,
                                const EngineeredFeatureVector& b,
                                double rtol = DEFAULT_RTOL,
                                double atol = DEFAULT_ATOL);
};

} // namespace fris
