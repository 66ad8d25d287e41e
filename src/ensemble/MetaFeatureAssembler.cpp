#include "fris/ensemble/MetaFeatureAssembler.hpp"
#include "fris/core/Errors.hpp"

#include <cmath>
#include <cstdlib>
#include <set>

namespace fris {

namespace {

bool latentIndex(const std::string& name, size_t& index) {
    const std::string prefix = MetaSlots::LATENT_PREFIX;
    if (name.compare(0, prefix.size(), prefix) != 0 || name.size() == prefix.size()) return false;
    const std::string digits = name.substr(prefix.size());
    if (digits.find_first_not_of("0123456789") != std::string::npos) return false;
    index = static_cast<size_t>(std::strtoul(digits.c_str(), nullptr, 10));
    return true;
}

void checkOrder(const std::vector<std::string>& named_subset,
                const std::vector<std::string>& fixed_order) {
    if (named_subset == fixed_order) return;

    ContractViolation::ColumnSet missing(fixed_order.begin(), fixed_order.end());
    ContractViolation::ColumnSet extra;
    for (const auto& n : named_subset) {
        if (!missing.erase(n)) extra.insert(n);
    }
    if (!missing.empty() || !extra.empty()) {
        throw ContractViolation("meta-feature set differs from the stacker's frozen order", missing, extra);
    }
    if (named_subset.size() != fixed_order.size()) {
        throw ContractViolation("meta-feature length " + std::to_string(named_subset.size()) +
                                " differs from frozen length " + std::to_string(fixed_order.size()));
    }
    for (size_t i = 0; i < fixed_order.size(); ++i) {
        if (named_subset[i] != fixed_order[i]) {
            throw ContractViolation("meta-feature order differs at position " + std::to_string(i) +
                                    ": got '" + named_subset[i] + "', frozen '" + fixed_order[i] + "'");
        }
    }
}

} // namespace

MetaFeatureAssembler::MetaFeatureAssembler(std::vector<std::string> frozen_order)
    : order_(std::move(frozen_order)) {
    if (order_.empty()) {
        throw ContractViolation("meta-feature order is empty");
    }
    std::set<std::string> seen;
    for (const auto& n : order_) {
        if (!seen.insert(n).second) {
            throw ContractViolation("meta-feature order names '" + n + "' twice");
        }
    }
}

MetaFeatureVector MetaFeatureAssembler::assemble(const BaseSignalSet& signals,
                                                 const EngineeredFeatureVector& vector,
                                                 const std::vector<std::string>& named_subset,
                                                 const std::vector<std::string>& fixed_order,
                                                 double supervised_value) {
    checkOrder(named_subset, fixed_order);

    MetaFeatureVector meta;
    meta.names = fixed_order;
    meta.values.reserve(fixed_order.size());

    ContractViolation::ColumnSet missing;
    for (const auto& name : fixed_order) {
        size_t li = 0;
        if (name == MetaSlots::SUPERVISED) {
            meta.values.push_back(supervised_value);
        } else if (name == MetaSlots::ANOMALY) {
            meta.values.push_back(signals.anomaly_score);
        } else if (name == MetaSlots::RECONSTRUCTION) {
            meta.values.push_back(signals.reconstruction_error);
        } else if (name == MetaSlots::CLUSTER) {
            meta.values.push_back(static_cast<double>(signals.cluster_id));
        } else if (latentIndex(name, li)) {
            if (li >= signals.latent.size()) {
                missing.insert(name);
                continue;
            }
            meta.values.push_back(signals.latent[li]);
        } else if (vector.has(name)) {
            meta.values.push_back(vector.number(name));
        } else {
            missing.insert(name);
        }
    }
    if (!missing.empty()) {
        throw ContractViolation("meta-feature inputs unavailable", missing);
    }
    return meta;
}

MetaFeatureVector MetaFeatureAssembler::assembleForTraining(const BaseSignalSet& signals,
                                                            const EngineeredFeatureVector& vector,
                                                            double oof_proba) const {
    if (!(oof_proba >= 0.0 && oof_proba <= 1.0)) {
        throw InputError("out-of-fold probability must be in [0,1]");
    }
    return assemble(signals, vector, order_, order_, oof_proba);
}

MetaFeatureVector MetaFeatureAssembler::assembleForServing(const BaseSignalSet& signals,
                                                           const EngineeredFeatureVector& vector) const {
    // No out-of-fold estimate exists at serving time: the live probability
    // takes the same slot.
    return assemble(signals, vector, order_, order_, signals.supervised_proba);
}

size_t MetaFeatureAssembler::slotOf(const std::string& name) const {
    for (size_t i = 0; i < order_.size(); ++i) {
        if (order_[i] == name) return i;
    }
    throw ContractViolation("meta-feature order has no slot '" + name + "'", {name});
}

} // namespace fris
