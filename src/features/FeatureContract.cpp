#include "fris/features/FeatureContract.hpp"

namespace fris {

ContractCheck FeatureContract::validate(const EngineeredFeatureVector& vector,
                                        const std::vector<std::string>& frozen_schema) {
    ContractCheck check;
    const auto produced = vector.columnNames();

    check.missing.insert(frozen_schema.begin(), frozen_schema.end());
    for (const auto& name : produced) {
        if (!check.missing.erase(name)) check.extra.insert(name);
    }
    check.order_matches = (produced == frozen_schema);
    return check;
}

void FeatureContract::enforce(const EngineeredFeatureVector& vector,
                              const std::vector<std::string>& frozen_schema) {
    if (frozen_schema.empty()) {
        throw ContractViolation("frozen schema is empty");
    }
    ContractCheck check = validate(vector, frozen_schema);
    if (!check.ok()) {
        throw ContractViolation("engineered vector does not match frozen schema",
                                std::move(check.missing), std::move(check.extra));
    }
}

} // namespace fris
