#include "fris/core/RawRecord.hpp"
#include "fris/core/Errors.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace fris {

std::string formatNumber(double v) {
    if (std::isfinite(v) && v == std::floor(v) && std::fabs(v) < 1e15) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(v));
        return buf;
    }
    char buf[40];
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, v);
        if (std::strtod(buf, nullptr) == v) break;
    }
    return buf;
}

std::string canonicalText(const FieldValue& v) {
    if (const auto* d = std::get_if<double>(&v)) return formatNumber(*d);
    return std::get<std::string>(v);
}

RawRecord::RawRecord(std::initializer_list<Field> fields) {
    for (const auto& f : fields) set(f.first, f.second);
}

RawRecord RawRecord::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw InputError("raw record must be a JSON object");
    }

    RawRecord rec;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const auto& v = it.value();
        if (v.is_null()) continue;
        if (v.is_number()) {
            rec.set(it.key(), v.get<double>());
        } else if (v.is_boolean()) {
            rec.set(it.key(), v.get<bool>() ? 1.0 : 0.0);
        } else if (v.is_string()) {
            rec.set(it.key(), v.get<std::string>());
        } else {
            throw InputError("field '" + it.key() + "' is not a scalar");
        }
    }
    return rec;
}

RawRecord& RawRecord::set(const std::string& name, FieldValue value) {
    for (auto& f : fields_) {
        if (f.first == name) {
            f.second = std::move(value);
            return *this;
        }
    }
    fields_.emplace_back(name, std::move(value));
    return *this;
}

bool RawRecord::has(const std::string& name) const {
    return find(name) != nullptr;
}

const FieldValue* RawRecord::find(const std::string& name) const {
    for (const auto& f : fields_) {
        if (f.first == name) return &f.second;
    }
    return nullptr;
}

std::optional<double> RawRecord::number(const std::string& name) const {
    const FieldValue* v = find(name);
    if (!v) return std::nullopt;
    if (const auto* d = std::get_if<double>(v)) return *d;
    return std::nullopt;
}

double RawRecord::requireNumber(const std::string& name) const {
    const FieldValue* v = find(name);
    if (!v) {
        throw InputError("missing mandatory field '" + name + "'");
    }
    const auto* d = std::get_if<double>(v);
    if (!d) {
        throw InputError("field '" + name + "' must be numeric");
    }
    if (!std::isfinite(*d)) {
        throw InputError("field '" + name + "' is not finite");
    }
    return *d;
}

} // namespace fris
