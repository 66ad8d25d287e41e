// =============================================================================
// StackedDecision.hpp - Final probability and label
// =============================================================================
// PURPOSE: The only place a FRAUD/LEGIT label is assigned.
// DESIGN:
//   - Stacker width is checked against the frozen meta order at load
//   - The threshold is read from the bundle; it is never defaulted
//   - probability >= threshold -> FRAUD
// =============================================================================
#pragma once

#include "fris/ensemble/MetaFeatureAssembler.hpp"
#include "fris/features/ArtifactBundle.hpp"
#include "fris/models/LogisticStacker.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace fris {

class ArtifactStore;

enum class DecisionLabel : uint8_t {
    LEGIT = 0,
    FRAUD = 1
};

inline const char* labelToString(DecisionLabel l) {
    switch (l) {
        case DecisionLabel::LEGIT: return "legit";
        case DecisionLabel::FRAUD: return "fraud";
        default:                   return "unknown";
    }
}

struct Decision {
    double probability = 0.0;
    DecisionLabel label = DecisionLabel::LEGIT;
};

class StackedDecision {
public:
    static constexpr const char* STACKER_BLOB = "stacker.json";

    StackedDecision(LogisticStacker stacker, std::vector<std::string> meta_order, double threshold);

    static std::shared_ptr<const StackedDecision> load(const ArtifactStore& store,
                                                       const FittedArtifactBundle& bundle);

    // Stateless form: stacker probability compared against a frozen threshold.
    static Decision decide(const LogisticStacker& stacker, const std::vector<double>& meta,
                           double threshold);

    // ContractViolation when meta.names differs from the frozen order.
    Decision decide(const MetaFeatureVector& meta) const;

    const LogisticStacker& stacker() const { return stacker_; }
    const std::vector<std::string>& metaOrder() const { return meta_order_; }
    double threshold() const { return threshold_; }

private:
    LogisticStacker stacker_;
    std::vector<std::string> meta_order_;
    double threshold_;
};

// =============================================================================
// ThresholdSelector - offline cost-weighted sweep
// =============================================================================
struct ThresholdSweep {
    double threshold = 0.5;
    double cost = 0.0;
    uint64_t false_negatives = 0;
    uint64_t false_positives = 0;
};

class ThresholdSelector {
public:
    static constexpr int GRID_STEPS = 99;   // 0.01 .. 0.99

    // Minimises fn_cost*FN + fp_cost*FP; ties go to the lower threshold.
    static ThresholdSweep select(const std::vector<double>& probabilities,
                                 const std::vector<int>& labels,
                                 double fn_cost, double fp_cost);
};

} // namespace fris
