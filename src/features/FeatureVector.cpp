#include "fris/features/FeatureVector.hpp"
#include "fris/core/Errors.hpp"

#include <nlohmann/json.hpp>

namespace fris {

void EngineeredFeatureVector::append(const std::string& name, FeatureValue value) {
    if (index_.count(name)) {
        throw PipelineError("duplicate engineered column '" + name + "'");
    }
    index_.emplace(name, entries_.size());
    entries_.emplace_back(name, std::move(value));
}

bool EngineeredFeatureVector::has(const std::string& name) const {
    return index_.count(name) > 0;
}

const FeatureValue& EngineeredFeatureVector::at(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        throw ContractViolation("engineered vector has no column '" + name + "'", {name});
    }
    return entries_[it->second].second;
}

double EngineeredFeatureVector::number(const std::string& name) const {
    const FeatureValue& v = at(name);
    if (const auto* d = std::get_if<double>(&v)) return *d;
    throw ContractViolation("column '" + name + "' is not numeric");
}

std::vector<double> EngineeredFeatureVector::slice(const std::vector<std::string>& names) const {
    std::vector<double> out;
    out.reserve(names.size());

    ContractViolation::ColumnSet missing;
    std::string textual;
    for (const auto& name : names) {
        auto it = index_.find(name);
        if (it == index_.end()) {
            missing.insert(name);
            continue;
        }
        const FeatureValue& v = entries_[it->second].second;
        if (const auto* d = std::get_if<double>(&v)) {
            out.push_back(*d);
        } else {
            if (!textual.empty()) textual += ", ";
            textual += name;
        }
    }

    if (!missing.empty()) {
        throw ContractViolation("feature slice references absent columns", missing);
    }
    if (!textual.empty()) {
        throw ContractViolation("feature slice references text columns: " + textual);
    }
    return out;
}

std::vector<std::string> EngineeredFeatureVector::columnNames() const {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& e : entries_) names.push_back(e.first);
    return names;
}

nlohmann::ordered_json EngineeredFeatureVector::toJson() const {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (const auto& e : entries_) {
        if (const auto* d = std::get_if<double>(&e.second)) {
            j[e.first] = *d;
        } else {
            j[e.first] = std::get<std::string>(e.second);
        }
    }
    return j;
}

std::string EngineeredFeatureVector::dump() const {
    return toJson().dump();
}

} // namespace fris
