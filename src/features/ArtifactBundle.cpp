#include "fris/features/ArtifactBundle.hpp"
#include "fris/store/ArtifactStore.hpp"
#include "fris/core/Errors.hpp"
#include "fris/core/Log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <set>

using json = nlohmann::json;

namespace fris {

namespace {

// Linear interpolation between closest ranks on sorted data.
double quantile(const std::vector<double>& sorted, double q) {
    const double pos = q * static_cast<double>(sorted.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = std::min(lo + 1, sorted.size() - 1);
    const double frac = pos - static_cast<double>(lo);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

const json& member(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) {
        throw ArtifactError(std::string("bundle member '") + key + "' is missing");
    }
    return *it;
}

std::vector<std::string> stringList(const json& j, const char* key) {
    const json& v = member(j, key);
    if (!v.is_array()) {
        throw ArtifactError(std::string("bundle member '") + key + "' must be a list");
    }
    std::vector<std::string> out;
    for (const auto& e : v) {
        if (!e.is_string()) {
            throw ArtifactError(std::string("bundle member '") + key + "' must list strings");
        }
        out.push_back(e.get<std::string>());
    }
    return out;
}

void requireUnique(const std::vector<std::string>& names, const std::string& what) {
    std::set<std::string> seen;
    for (const auto& n : names) {
        if (!seen.insert(n).second) {
            throw ArtifactError(what + " lists '" + n + "' twice");
        }
    }
}

} // namespace

// -----------------------------------------------------------------------------
// RobustScalerParams / FrequencyTable
// -----------------------------------------------------------------------------
RobustScalerParams RobustScalerParams::fit(std::vector<double> values) {
    if (values.empty()) {
        throw PipelineError("cannot fit amount scaler on an empty column");
    }
    std::sort(values.begin(), values.end());
    RobustScalerParams p;
    p.center = quantile(values, 0.5);
    const double iqr = quantile(values, 0.75) - quantile(values, 0.25);
    p.scale = (iqr > 0.0) ? iqr : 1.0;
    return p;
}

FrequencyTable FrequencyTable::fit(const std::vector<std::string>& keys) {
    FrequencyTable t;
    t.total_rows = keys.size();
    for (const auto& k : keys) t.counts[k]++;
    return t;
}

uint64_t FrequencyTable::count(const std::string& key) const {
    auto it = counts.find(key);
    return it == counts.end() ? 0 : it->second;
}

double FrequencyTable::frequency(const std::string& key) const {
    if (total_rows == 0) return 0.0;
    return static_cast<double>(count(key)) / static_cast<double>(total_rows);
}

// -----------------------------------------------------------------------------
// ModelContracts
// -----------------------------------------------------------------------------
bool ModelContracts::complete() const {
    for (const char* m : {Members::CLASSIFIER, Members::ANOMALY, Members::RECONSTRUCTION, Members::CLUSTER}) {
        auto it = model_features.find(m);
        if (it == model_features.end() || it->second.empty()) return false;
    }
    return !meta_features.empty() && threshold.has_value();
}

ModelContracts ModelContracts::fromJson(const json& j) {
    ModelContracts c;
    if (j.contains("model_features")) {
        const json& mf = j.at("model_features");
        if (!mf.is_object()) {
            throw ArtifactError("model_features must be an object");
        }
        for (auto it = mf.begin(); it != mf.end(); ++it) {
            c.model_features[it.key()] = stringList(mf, it.key().c_str());
        }
    }
    if (j.contains("meta_features")) {
        c.meta_features = stringList(j, "meta_features");
    }
    if (j.contains("threshold") && !j.at("threshold").is_null()) {
        if (!j.at("threshold").is_number()) {
            throw ArtifactError("threshold must be a number");
        }
        c.threshold = j.at("threshold").get<double>();
    }
    return c;
}

// -----------------------------------------------------------------------------
// FittedArtifactBundle
// -----------------------------------------------------------------------------
const FrequencyTable& FittedArtifactBundle::table(const std::string& column) const {
    auto it = frequency_tables.find(column);
    if (it == frequency_tables.end()) {
        throw ArtifactError("no frequency table for '" + column + "'");
    }
    return it->second;
}

const SyntheticCatalog& FittedArtifactBundle::syntheticCatalog() const {
    if (!catalog || catalog->seed != seed) {
        throw ArtifactError("synthetic catalogue missing or built for another seed");
    }
    return *catalog;
}

const std::vector<std::string>& FittedArtifactBundle::modelFeatures(const std::string& name) const {
    auto it = contracts.model_features.find(name);
    if (it == contracts.model_features.end() || it->second.empty()) {
        throw ArtifactError("no frozen feature list for model '" + name + "'");
    }
    return it->second;
}

double FittedArtifactBundle::threshold() const {
    if (!contracts.threshold) {
        throw ArtifactError("decision threshold is not part of this bundle");
    }
    return *contracts.threshold;
}

void FittedArtifactBundle::validate(bool requireContracts) const {
    if (format_version != FORMAT_VERSION) {
        throw ArtifactError("unsupported bundle format_version " + std::to_string(format_version));
    }
    if (frozen_schema.empty()) {
        throw ArtifactError("frozen schema is empty");
    }
    requireUnique(frozen_schema, "frozen schema");
    if (rolling_window < 1) {
        throw ArtifactError("rolling_window must be >= 1");
    }
    if (!(amount_scaler.scale > 0.0) || !std::isfinite(amount_scaler.center)) {
        throw ArtifactError("amount scaler is degenerate");
    }
    for (const char* col : {Fields::MERCHANT_ID, Fields::DEVICE_TYPE, Fields::GEO_BUCKET, Fields::ACCOUNT_ID}) {
        if (table(col).total_rows == 0) {
            throw ArtifactError(std::string("frequency table '") + col + "' has no rows");
        }
    }
    if (projection.empty() || projection.mean.size() != projection.input_columns.size()) {
        throw ArtifactError("projection is empty or inconsistent");
    }
    for (const auto& comp : projection.components) {
        if (comp.size() != projection.input_columns.size()) {
            throw ArtifactError("projection component width mismatch");
        }
    }
    syntheticCatalog();

    const std::set<std::string> schema(frozen_schema.begin(), frozen_schema.end());
    for (const auto& col : projection.input_columns) {
        if (!schema.count(col)) {
            throw ArtifactError("projection input '" + col + "' is not in the frozen schema");
        }
    }

    if (!requireContracts) return;

    if (!contracts.complete()) {
        throw ArtifactError("model contracts incomplete (features, meta_features, threshold)");
    }
    for (const auto& kv : contracts.model_features) {
        requireUnique(kv.second, "feature list '" + kv.first + "'");
        for (const auto& col : kv.second) {
            if (!schema.count(col)) {
                throw ArtifactError("model '" + kv.first + "' requires '" + col +
                                    "' which the frozen schema does not produce");
            }
        }
    }
    requireUnique(contracts.meta_features, "meta feature order");
    const double t = *contracts.threshold;
    if (!(t >= 0.0 && t <= 1.0)) {
        throw ArtifactError("threshold " + std::to_string(t) + " outside [0,1]");
    }
}

std::shared_ptr<const FittedArtifactBundle>
FittedArtifactBundle::withModelContracts(ModelContracts c) const {
    auto merged = std::make_shared<FittedArtifactBundle>(*this);
    merged->contracts = std::move(c);
    merged->validate(true);
    return merged;
}

json FittedArtifactBundle::toJson() const {
    json j;
    j["format_version"] = format_version;
    j["model_version"] = model_version;
    j["seed"] = seed;
    j["label_column"] = label_column;
    j["id_column"] = id_column;
    j["rolling_window"] = rolling_window;
    j["passthrough_columns"] = passthrough_columns;
    j["amount_scaler"] = {{"center", amount_scaler.center}, {"scale", amount_scaler.scale}};

    json tables = json::object();
    for (const auto& kv : frequency_tables) {
        json counts = json::object();
        for (const auto& c : kv.second.counts) counts[c.first] = c.second;
        tables[kv.first] = {{"total_rows", kv.second.total_rows}, {"counts", counts}};
    }
    j["frequency_tables"] = tables;

    j["projection"] = {
        {"input_columns", projection.input_columns},
        {"mean", projection.mean},
        {"components", projection.components},
        {"explained_variance", projection.explained_variance}
    };
    j["frozen_schema"] = frozen_schema;

    j["model_features"] = contracts.model_features;
    j["meta_features"] = contracts.meta_features;
    if (contracts.threshold) {
        j["threshold"] = *contracts.threshold;
    } else {
        j["threshold"] = nullptr;
    }
    return j;
}

FittedArtifactBundle FittedArtifactBundle::fromJson(const json& j) {
    if (!j.is_object()) {
        throw ArtifactError("bundle document must be a JSON object");
    }

    FittedArtifactBundle b;
    try {
        b.format_version = member(j, "format_version").get<int>();
        b.model_version = member(j, "model_version").get<std::string>();
        b.seed = member(j, "seed").get<uint64_t>();
        b.label_column = member(j, "label_column").get<std::string>();
        b.id_column = member(j, "id_column").get<std::string>();
        b.rolling_window = member(j, "rolling_window").get<int>();
        b.passthrough_columns = stringList(j, "passthrough_columns");

        const json& sc = member(j, "amount_scaler");
        b.amount_scaler.center = member(sc, "center").get<double>();
        b.amount_scaler.scale = member(sc, "scale").get<double>();

        const json& tables = member(j, "frequency_tables");
        for (auto it = tables.begin(); it != tables.end(); ++it) {
            FrequencyTable t;
            t.total_rows = member(it.value(), "total_rows").get<uint64_t>();
            const json& counts = member(it.value(), "counts");
            for (auto c = counts.begin(); c != counts.end(); ++c) {
                t.counts[c.key()] = c.value().get<uint64_t>();
            }
            b.frequency_tables[it.key()] = std::move(t);
        }

        const json& proj = member(j, "projection");
        b.projection.input_columns = stringList(proj, "input_columns");
        b.projection.mean = member(proj, "mean").get<std::vector<double>>();
        b.projection.components = member(proj, "components").get<std::vector<std::vector<double>>>();
        if (proj.contains("explained_variance")) {
            b.projection.explained_variance = proj.at("explained_variance").get<std::vector<double>>();
        }

        b.frozen_schema = stringList(j, "frozen_schema");
        b.contracts = ModelContracts::fromJson(j);
    } catch (const json::exception& e) {
        throw ArtifactError(std::string("bundle document malformed: ") + e.what());
    }

    b.catalog = SyntheticCatalog::build(b.seed);
    return b;
}

std::string FittedArtifactBundle::blobKey(const std::string& version) {
    return version + "/" + BLOB_NAME;
}

BundlePtr FittedArtifactBundle::load(const ArtifactStore& store, const std::string& version,
                                     bool requireContracts) {
    if (version.empty()) {
        throw ArtifactError("no model version given");
    }
    const std::string raw = store.get(blobKey(version));

    json doc;
    try {
        doc = json::parse(raw);
    } catch (const json::parse_error& e) {
        throw ArtifactError("bundle " + blobKey(version) + " is not valid JSON: " + e.what());
    }

    auto bundle = std::make_shared<FittedArtifactBundle>(fromJson(doc));
    if (bundle->model_version != version) {
        throw ArtifactError("bundle under '" + version + "' declares version '" +
                            bundle->model_version + "'");
    }
    bundle->validate(requireContracts);

    FRIS_LOG_INFO("ArtifactBundle", "Loaded %s: %zu columns, %zu passthrough, seed=%llu",
                  blobKey(version).c_str(), bundle->frozen_schema.size(),
                  bundle->passthrough_columns.size(),
                  static_cast<unsigned long long>(bundle->seed));
    return bundle;
}

void FittedArtifactBundle::save(ArtifactStore& store, const FittedArtifactBundle& bundle) {
    if (bundle.model_version.empty()) {
        throw ArtifactError("cannot save a bundle without model_version");
    }
    bundle.validate(false);
    store.put(blobKey(bundle.model_version), bundle.toJson().dump(2));
    FRIS_LOG_INFO("ArtifactBundle", "Saved %s to %s",
                  blobKey(bundle.model_version).c_str(), store.describe().c_str());
}

} // namespace fris
