#include "fris/models/ModelJson.hpp"
#include "fris/store/ArtifactStore.hpp"
#include "fris/core/Errors.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

using json = nlohmann::json;

namespace fris {
namespace ModelJson {

std::string modelKey(const std::string& version, const std::string& file) {
    return version + "/models/" + file;
}

json fetch(const ArtifactStore& store, const std::string& key) {
    return parse(store.get(key), key);
}

json parse(const std::string& bytes, const std::string& doc) {
    try {
        json j = json::parse(bytes);
        if (!j.is_object()) {
            throw ArtifactError(doc + ": document must be a JSON object");
        }
        return j;
    } catch (const json::parse_error& e) {
        throw ArtifactError(doc + ": not valid JSON: " + e.what());
    }
}

const json& member(const json& j, const char* key, const std::string& doc) {
    auto it = j.find(key);
    if (it == j.end()) {
        throw ArtifactError(doc + ": missing '" + key + "'");
    }
    return *it;
}

double number(const json& j, const char* key, const std::string& doc) {
    const json& v = member(j, key, doc);
    if (!v.is_number()) {
        throw ArtifactError(doc + ": '" + key + "' must be a number");
    }
    const double d = v.get<double>();
    if (!std::isfinite(d)) {
        throw ArtifactError(doc + ": '" + key + "' is not finite");
    }
    return d;
}

int integer(const json& j, const char* key, const std::string& doc) {
    const json& v = member(j, key, doc);
    if (!v.is_number_integer()) {
        throw ArtifactError(doc + ": '" + key + "' must be an integer");
    }
    const bool fits = v.is_number_unsigned()
        ? v.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
        : v.get<int64_t>() >= std::numeric_limits<int>::min() &&
          v.get<int64_t>() <= std::numeric_limits<int>::max();
    if (!fits) {
        throw ArtifactError(doc + ": '" + key + "' is out of int range");
    }
    return static_cast<int>(v.get<int64_t>());
}

std::vector<double> vector(const json& j, const char* key, const std::string& doc) {
    const json& v = member(j, key, doc);
    if (!v.is_array()) {
        throw ArtifactError(doc + ": '" + key + "' must be an array");
    }
    std::vector<double> out;
    out.reserve(v.size());
    for (const auto& e : v) {
        if (!e.is_number() || !std::isfinite(e.get<double>())) {
            throw ArtifactError(doc + ": '" + key + "' must hold finite numbers");
        }
        out.push_back(e.get<double>());
    }
    return out;
}

std::vector<std::vector<double>> matrix(const json& j, const char* key, const std::string& doc) {
    const json& v = member(j, key, doc);
    if (!v.is_array() || v.empty()) {
        throw ArtifactError(doc + ": '" + key + "' must be a non-empty array of rows");
    }
    std::vector<std::vector<double>> out;
    out.reserve(v.size());
    for (size_t r = 0; r < v.size(); ++r) {
        json wrapper = {{"row", v[r]}};
        out.push_back(vector(wrapper, "row", doc + ":" + key + "[" + std::to_string(r) + "]"));
        if (out.back().empty() || out.back().size() != out.front().size()) {
            throw ArtifactError(doc + ": '" + key + "' is not rectangular");
        }
    }
    return out;
}

} // namespace ModelJson
} // namespace fris
