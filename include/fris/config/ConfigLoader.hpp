#pragma once
// =============================================================================
// ConfigLoader.hpp - INI File Parser for FRIS Configuration
// =============================================================================
// Loads fris.ini: [section] headers, key = value, '#'/';' comments.
// Typed getters fall back to the supplied default only when the key is absent;
// a present but unparseable value is a ConfigError.
// =============================================================================

#include "fris/core/Errors.hpp"

#include <cstdint>
#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

namespace fris {

class ConfigError : public FrisError {
public:
    explicit ConfigError(const std::string& what) : FrisError("[CONFIG] " + what) {}
};

class ConfigLoader {
public:
    ConfigLoader() = default;

    // Tries path, then ../path, then ../../path. Returns false if none exists.
    bool load(const std::string& path = "fris.ini");
    bool loadFromStream(std::istream& in);

    std::string get(const std::string& section, const std::string& key,
                    const std::string& defaultVal = "") const;
    int getInt(const std::string& section, const std::string& key, int defaultVal = 0) const;
    double getDouble(const std::string& section, const std::string& key, double defaultVal = 0.0) const;
    bool getBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

    bool has(const std::string& section, const std::string& key) const;

private:
    bool parse(std::istream& in);

    std::unordered_map<std::string, std::string> values_;
};

// =============================================================================
// Typed view of the keys the tools read
// =============================================================================
struct FrisConfig {
    std::string artifact_root = "artifacts";
    std::string model_version;

    uint64_t seed = 42;
    int rolling_window = 5;
    std::string label_column = "Class";
    std::string id_column = "transaction_id";

    int top_k = 5;
    bool quiet = false;

    static FrisConfig fromLoader(const ConfigLoader& cfg);

    // ConfigError when the file cannot be found or a value is invalid.
    static FrisConfig load(const std::string& path);
};

} // namespace fris
