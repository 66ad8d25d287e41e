// =============================================================================
// fris_score - Score (and optionally explain) one raw record
// =============================================================================
// USAGE: fris_score <config.ini> <record.json> [--explain]
// Prints a JSON document: {"score","label"} plus "explanation" on --explain.
// =============================================================================
#include "fris/config/ConfigLoader.hpp"
#include "fris/core/Errors.hpp"
#include "fris/core/Log.hpp"
#include "fris/runtime/ScoringRuntime.hpp"
#include "fris/store/ArtifactStore.hpp"

#include <nlohmann/json.hpp>

#include <cstring>
#include <fstream>
#include <iostream>

using namespace fris;

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: fris_score <config.ini> <record.json> [--explain]\n";
        return 1;
    }
    const bool withExplain = argc > 3 && std::strcmp(argv[3], "--explain") == 0;

    try {
        const FrisConfig cfg = FrisConfig::load(argv[1]);
        Log::setQuiet(cfg.quiet);

        std::ifstream in(argv[2]);
        if (!in) {
            throw InputError(std::string("cannot open ") + argv[2]);
        }
        nlohmann::json doc;
        try {
            in >> doc;
        } catch (const nlohmann::json::parse_error& e) {
            throw InputError(std::string("record is not valid JSON: ") + e.what());
        }
        const RawRecord record = RawRecord::fromJson(doc);

        FileArtifactStore store(cfg.artifact_root);
        auto runtime = ScoringRuntime::load(store, cfg.model_version);

        const Decision d = runtime->score(record);
        nlohmann::ordered_json out;
        out["score"] = d.probability;
        out["label"] = labelToString(d.label);

        if (withExplain) {
            const Explanation ex = runtime->explain(record, static_cast<size_t>(cfg.top_k));
            nlohmann::ordered_json items = nlohmann::ordered_json::array();
            for (const auto& a : ex.attributions) {
                items.push_back({{"feature", a.feature}, {"contribution", a.contribution}, {"value", a.value}});
            }
            out["explanation"] = {
                {"baseline", ex.baseline},
                {"prediction", ex.prediction},
                {"attributions", items}
            };
        }
        std::cout << out.dump(2) << "\n";
        return 0;
    } catch (const InputError& e) {
        FRIS_LOG_ERROR("Score", "%s", e.what());
        return 2;
    } catch (const FrisError& e) {
        FRIS_LOG_ERROR("Score", "%s", e.what());
        return 1;
    }
}
