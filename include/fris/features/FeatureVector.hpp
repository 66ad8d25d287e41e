// =============================================================================
// FeatureVector.hpp - Engineered feature row
// =============================================================================
// One row of engineered columns, kept in pipeline order. Values are numeric
// except the two text columns (timestamp, device_type). Models never see this
// directly: they receive slice(required_features) only.
// =============================================================================
#pragma once

#include "fris/core/RawRecord.hpp"

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fris {

using FeatureValue = FieldValue;

class EngineeredFeatureVector {
public:
    using Entry = std::pair<std::string, FeatureValue>;

    // PipelineError on a duplicate column name.
    void append(const std::string& name, FeatureValue value);

    bool has(const std::string& name) const;

    // ContractViolation when the column is absent.
    const FeatureValue& at(const std::string& name) const;

    // ContractViolation when absent or textual.
    double number(const std::string& name) const;

    // Numeric values in exactly the requested order. Every absent or textual
    // name is collected and reported in one ContractViolation.
    std::vector<double> slice(const std::vector<std::string>& names) const;

    std::vector<std::string> columnNames() const;
    const std::vector<Entry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }

    // Order-preserving document; identical vectors dump to identical bytes.
    nlohmann::ordered_json toJson() const;
    std::string dump() const;

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace fris
