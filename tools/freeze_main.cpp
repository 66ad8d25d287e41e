// =============================================================================
// fris_freeze - Fit feature artifacts on a training CSV and freeze them
// =============================================================================
// USAGE: fris_freeze <config.ini> <train.csv> [contracts.json]
//
//   1. FIT over the CSV (passthrough discovery, scaler, frequency tables,
//      projection, frozen schema)
//   2. Re-run the batch in APPLY mode with the fitted bundle and require
//      every row to match the FIT output
//   3. Merge model contracts (feature lists, meta order, threshold) if given
//   4. Write <version>/artifacts.json and its digest into the store
// =============================================================================
#include "fris/config/ConfigLoader.hpp"
#include "fris/core/CsvReader.hpp"
#include "fris/core/Errors.hpp"
#include "fris/core/Log.hpp"
#include "fris/features/FeatureParityCheck.hpp"
#include "fris/features/FeaturePipeline.hpp"
#include "fris/models/ModelJson.hpp"
#include "fris/store/ArtifactStore.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

using namespace fris;

namespace {

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ArtifactError("cannot open " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: fris_freeze <config.ini> <train.csv> [contracts.json]\n";
        return 1;
    }

    try {
        const FrisConfig cfg = FrisConfig::load(argv[1]);
        Log::setQuiet(cfg.quiet);
        if (cfg.model_version.empty()) {
            throw ConfigError("artifacts.version must be set to freeze a bundle");
        }

        const auto records = CsvReader::readFile(argv[2]);
        FRIS_LOG_INFO("Freeze", "Read %zu rows from %s", records.size(), argv[2]);

        PipelineOptions opts;
        opts.seed = cfg.seed;
        opts.rolling_window = cfg.rolling_window;
        opts.label_column = cfg.label_column;
        opts.id_column = cfg.id_column;
        opts.model_version = cfg.model_version;
        FeaturePipeline pipeline(opts);

        BatchTransformResult fit = pipeline.transformBatch(records, PipelineMode::FIT, nullptr);
        BatchTransformResult apply = pipeline.transformBatch(records, PipelineMode::APPLY, fit.artifacts);

        size_t failures = 0;
        for (size_t i = 0; i < fit.frame.rows(); ++i) {
            const ParityReport report = FeatureParityCheck::compare(fit.frame.row(i), apply.frame.row(i));
            if (!report.ok()) {
                if (failures < 5) {
                    FRIS_LOG_ERROR("Freeze", "row %zu: %s", i, report.summary().c_str());
                }
                ++failures;
            }
        }
        if (failures) {
            FRIS_LOG_ERROR("Freeze", "FIT/APPLY parity failed on %zu of %zu rows", failures, fit.frame.rows());
            return 2;
        }
        FRIS_LOG_INFO("Freeze", "FIT/APPLY parity OK on %zu rows", fit.frame.rows());

        BundlePtr bundle = fit.artifacts;
        if (argc > 3) {
            const ModelContracts contracts = ModelContracts::fromJson(ModelJson::parse(readFile(argv[3]), argv[3]));
            bundle = bundle->withModelContracts(contracts);
            FRIS_LOG_INFO("Freeze", "Merged model contracts from %s (threshold=%.2f)", argv[3], bundle->threshold());
        } else {
            FRIS_LOG_INFO("Freeze", "No contracts given; bundle is not servable until they are merged");
        }

        FileArtifactStore store(cfg.artifact_root);
        FittedArtifactBundle::save(store, *bundle);

        std::cout << "Engineered shape: " << fit.frame.rows() << " x " << fit.frame.columns() << "\n";
        for (const auto& col : bundle->frozen_schema) std::cout << "  " << col << "\n";
        return 0;
    } catch (const FrisError& e) {
        FRIS_LOG_ERROR("Freeze", "%s", e.what());
        return 1;
    }
}
