// =============================================================================
// RawRecord.hpp - One transaction as it arrives from upstream
// =============================================================================
// Field name -> scalar, insertion ordered. Only Time and Amount are mandatory;
// merchant/device/geo/account context is synthesized downstream when absent.
// =============================================================================
#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace fris {

using FieldValue = std::variant<double, std::string>;

// Canonical text of a scalar: integral numbers print without decimals, other
// numbers use the shortest text that round-trips, strings are unchanged.
std::string canonicalText(const FieldValue& v);
std::string formatNumber(double v);

namespace Fields {
    constexpr const char* TIME            = "Time";
    constexpr const char* AMOUNT          = "Amount";
    constexpr const char* MERCHANT_ID     = "merchant_id";
    constexpr const char* DEVICE_TYPE     = "device_type";
    constexpr const char* GEO_BUCKET      = "geo_bucket";
    constexpr const char* ACCOUNT_ID      = "account_id";
    constexpr const char* ACCOUNT_AGE     = "account_age_days";
} // namespace Fields

class RawRecord {
public:
    using Field = std::pair<std::string, FieldValue>;

    RawRecord() = default;
    RawRecord(std::initializer_list<Field> fields);

    // Parses one JSON object. Numbers -> double, strings kept, booleans -> 0/1,
    // null -> absent. Arrays/objects are rejected with InputError.
    static RawRecord fromJson(const nlohmann::json& j);

    RawRecord& set(const std::string& name, FieldValue value);

    bool has(const std::string& name) const;
    const FieldValue* find(const std::string& name) const;

    // Numeric view of a field; nullopt when absent or textual.
    std::optional<double> number(const std::string& name) const;

    // Mandatory numeric field; InputError when absent, textual or non-finite.
    double requireNumber(const std::string& name) const;

    const std::vector<Field>& fields() const { return fields_; }
    size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }

private:
    std::vector<Field> fields_;
};

} // namespace fris
