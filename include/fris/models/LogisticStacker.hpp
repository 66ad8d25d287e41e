#pragma once
// =============================================================================
// LogisticStacker.hpp - Calibrated linear meta-classifier
// =============================================================================
// stacker.json: { "coef": [..], "intercept": b0, "calibration": {"a":A,"b":B} }
//   f = coef . meta + intercept
//   p = 1 / (1 + exp(A*f + B))   with calibration (Platt)
//   p = sigmoid(f)               without
// =============================================================================

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>
#include <vector>

namespace fris {

struct PlattCalibration {
    double a = -1.0;
    double b = 0.0;
};

class LogisticStacker {
public:
    static LogisticStacker fromJson(const nlohmann::json& j, const std::string& doc = "stacker");

    size_t numFeatures() const { return coef_.size(); }
    bool calibrated() const { return calibration_.has_value(); }

    double decisionValue(const std::vector<double>& meta) const;
    double predictProba(const std::vector<double>& meta) const;

private:
    std::vector<double> coef_;
    double intercept_ = 0.0;
    std::optional<PlattCalibration> calibration_;
};

} // namespace fris
