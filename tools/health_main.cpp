// =============================================================================
// fris_health - Report whether the bundle and every model load
// =============================================================================
// USAGE: fris_health <config.ini>
// Exit code 0 when ready to serve, 1 otherwise.
// =============================================================================
#include "fris/config/ConfigLoader.hpp"
#include "fris/core/Errors.hpp"
#include "fris/core/Log.hpp"
#include "fris/runtime/ScoringRuntime.hpp"
#include "fris/store/ArtifactStore.hpp"

#include <iostream>

using namespace fris;

namespace {
const char* mark(bool ok) { return ok ? "OK" : "FAIL"; }
} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: fris_health <config.ini>\n";
        return 1;
    }

    try {
        const FrisConfig cfg = FrisConfig::load(argv[1]);
        Log::setQuiet(cfg.quiet);

        FileArtifactStore store(cfg.artifact_root);
        const HealthStatus h = ScoringRuntime::probe(store, cfg.model_version);

        std::cout << "version        " << h.model_version << "\n"
                  << "bundle         " << mark(h.bundle_loaded) << "\n"
                  << "classifier     " << mark(h.classifier_loaded) << "\n"
                  << "anomaly        " << mark(h.anomaly_loaded) << "\n"
                  << "reconstruction " << mark(h.reconstruction_loaded) << "\n"
                  << "cluster        " << mark(h.cluster_loaded) << "\n"
                  << "stacker        " << mark(h.stacker_loaded) << "\n"
                  << "status         " << (h.ready() ? "READY" : "NOT READY") << "\n";
        return h.ready() ? 0 : 1;
    } catch (const FrisError& e) {
        FRIS_LOG_ERROR("Health", "%s", e.what());
        return 1;
    }
}
