#include "fris/models/LogisticStacker.hpp"
#include "fris/models/ModelJson.hpp"
#include "fris/core/Errors.hpp"

#include <cmath>

namespace fris {

namespace {
const char* MODEL_NAME = "stacker";
} // namespace

LogisticStacker LogisticStacker::fromJson(const nlohmann::json& j, const std::string& doc) {
    LogisticStacker model;
    model.coef_ = ModelJson::vector(j, "coef", doc);
    if (model.coef_.empty()) {
        throw ArtifactError(doc + ": 'coef' is empty");
    }
    model.intercept_ = ModelJson::number(j, "intercept", doc);

    if (j.contains("calibration") && !j.at("calibration").is_null()) {
        const auto& cal = j.at("calibration");
        PlattCalibration p;
        p.a = ModelJson::number(cal, "a", doc + ":calibration");
        p.b = ModelJson::number(cal, "b", doc + ":calibration");
        model.calibration_ = p;
    }
    return model;
}

double LogisticStacker::decisionValue(const std::vector<double>& meta) const {
    if (meta.size() != coef_.size()) {
        throw ModelError(MODEL_NAME, "expected " + std::to_string(coef_.size()) +
                         " meta features, got " + std::to_string(meta.size()));
    }
    double f = intercept_;
    for (size_t i = 0; i < meta.size(); ++i) f += coef_[i] * meta[i];
    return f;
}

double LogisticStacker::predictProba(const std::vector<double>& meta) const {
    const double f = decisionValue(meta);
    const double p = calibration_
        ? 1.0 / (1.0 + std::exp(calibration_->a * f + calibration_->b))
        : 1.0 / (1.0 + std::exp(-f));
    if (!std::isfinite(p)) {
        throw ModelError(MODEL_NAME, "probability is not finite");
    }
    return p;
}

} // namespace fris
