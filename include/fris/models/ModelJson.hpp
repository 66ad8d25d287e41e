#pragma once
// =============================================================================
// ModelJson.hpp - Strict readers for frozen model documents
// =============================================================================
// Every malformed or missing member becomes an ArtifactError naming the
// document, so a bad blob fails at load time and never at scoring time.
// =============================================================================

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace fris {

class ArtifactStore;

namespace ModelJson {

// "<version>/models/<file>"
std::string modelKey(const std::string& version, const std::string& file);

// Reads and parses one model blob; ArtifactError when absent or malformed.
nlohmann::json fetch(const ArtifactStore& store, const std::string& key);

nlohmann::json parse(const std::string& bytes, const std::string& doc);

const nlohmann::json& member(const nlohmann::json& j, const char* key, const std::string& doc);

double number(const nlohmann::json& j, const char* key, const std::string& doc);
int integer(const nlohmann::json& j, const char* key, const std::string& doc);

std::vector<double> vector(const nlohmann::json& j, const char* key, const std::string& doc);

// Rectangular matrix; every row must have the same width.
std::vector<std::vector<double>> matrix(const nlohmann::json& j, const char* key, const std::string& doc);

} // namespace ModelJson
} // namespace fris
