#include "fris/config/ConfigLoader.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fris {

bool ConfigLoader::load(const std::string& path) {
    std::vector<std::string> paths = {
        path,
        "../" + path,
        "../../" + path
    };

    for (const auto& p : paths) {
        std::ifstream file(p);
        if (file.is_open()) {
            return parse(file);
        }
    }

    std::cerr << "[ConfigLoader] ERROR: " << path << " not found!\n";
    std::cerr << "[ConfigLoader] Searched paths:\n";
    for (const auto& p : paths) {
        std::cerr << "  - " << p << "\n";
    }
    return false;
}

bool ConfigLoader::loadFromStream(std::istream& in) {
    return parse(in);
}

std::string ConfigLoader::get(const std::string& section, const std::string& key,
                              const std::string& defaultVal) const {
    auto it = values_.find(section + "." + key);
    if (it != values_.end()) {
        return it->second;
    }
    return defaultVal;
}

bool ConfigLoader::has(const std::string& section, const std::string& key) const {
    return values_.count(section + "." + key) > 0;
}

int ConfigLoader::getInt(const std::string& section, const std::string& key, int defaultVal) const {
    std::string val = get(section, key);
    if (val.empty()) return defaultVal;
    try {
        size_t used = 0;
        int parsed = std::stoi(val, &used);
        if (used != val.size()) throw std::invalid_argument(val);
        return parsed;
    } catch (const std::exception&) {
        throw ConfigError(section + "." + key + " is not an integer: '" + val + "'");
    }
}

double ConfigLoader::getDouble(const std::string& section, const std::string& key, double defaultVal) const {
    std::string val = get(section, key);
    if (val.empty()) return defaultVal;
    try {
        size_t used = 0;
        double parsed = std::stod(val, &used);
        if (used != val.size()) throw std::invalid_argument(val);
        return parsed;
    } catch (const std::exception&) {
        throw ConfigError(section + "." + key + " is not a number: '" + val + "'");
    }
}

bool ConfigLoader::getBool(const std::string& section, const std::string& key, bool defaultVal) const {
    std::string val = get(section, key);
    if (val.empty()) return defaultVal;
    return (val == "true" || val == "1" || val == "yes" || val == "on");
}

bool ConfigLoader::parse(std::istream& file) {
    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        size_t start = line.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) continue;
        line = line.substr(start);

        size_t end = line.find_last_not_of(" \t\r\n");
        if (end != std::string::npos) {
            line = line.substr(0, end + 1);
        }

        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[') {
            size_t closePos = line.find(']');
            if (closePos != std::string::npos) {
                currentSection = line.substr(1, closePos - 1);
            }
            continue;
        }

        size_t eqPos = line.find('=');
        if (eqPos != std::string::npos) {
            std::string key = line.substr(0, eqPos);
            std::string value = line.substr(eqPos + 1);

            end = key.find_last_not_of(" \t");
            if (end != std::string::npos) key = key.substr(0, end + 1);

            start = value.find_first_not_of(" \t");
            value = (start != std::string::npos) ? value.substr(start) : "";
            end = value.find_last_not_of(" \t\r\n");
            if (end != std::string::npos) value = value.substr(0, end + 1);

            values_[currentSection + "." + key] = value;
        }
    }

    return !values_.empty();
}

FrisConfig FrisConfig::fromLoader(const ConfigLoader& cfg) {
    FrisConfig out;
    out.artifact_root = cfg.get("artifacts", "root", out.artifact_root);
    out.model_version = cfg.get("artifacts", "version", out.model_version);

    int seed = cfg.getInt("pipeline", "seed", static_cast<int>(out.seed));
    if (seed < 0) throw ConfigError("pipeline.seed must be non-negative");
    out.seed = static_cast<uint64_t>(seed);

    out.rolling_window = cfg.getInt("pipeline", "rolling_window", out.rolling_window);
    if (out.rolling_window < 1) throw ConfigError("pipeline.rolling_window must be >= 1");
    out.label_column = cfg.get("pipeline", "label_column", out.label_column);
    out.id_column = cfg.get("pipeline", "id_column", out.id_column);

    out.top_k = cfg.getInt("explain", "top_k", out.top_k);
    if (out.top_k < 1) throw ConfigError("explain.top_k must be >= 1");

    out.quiet = cfg.getBool("runtime", "quiet", out.quiet);
    return out;
}

FrisConfig FrisConfig::load(const std::string& path) {
    ConfigLoader cfg;
    if (!cfg.load(path)) {
        throw ConfigError("cannot read " + path);
    }
    return fromLoader(cfg);
}

} // namespace fris
