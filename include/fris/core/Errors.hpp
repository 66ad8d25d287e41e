// =============================================================================
// Errors.hpp - FRIS Failure Taxonomy
// =============================================================================
// Every failure in the scoring core is one of these. Callers map each class to
// a distinct response; nothing here is retried.
//
//   InputError        - raw record rejected (missing Time/Amount, bad values)
//   ContractViolation - engineered columns or meta-feature order drifted
//   ArtifactError     - bundle/model blob missing, malformed or corrupt
//   ModelError        - a frozen model failed while scoring
//   PipelineError     - an intermediate feature table is empty or malformed
// =============================================================================
#pragma once

#include <set>
#include <stdexcept>
#include <string>

namespace fris {

class FrisError : public std::runtime_error {
public:
    explicit FrisError(const std::string& what) : std::runtime_error(what) {}
};

class InputError : public FrisError {
public:
    explicit InputError(const std::string& what)
        : FrisError("[INPUT] " + what) {}
};

class ArtifactError : public FrisError {
public:
    explicit ArtifactError(const std::string& what)
        : FrisError("[ARTIFACT] " + what) {}
};

class PipelineError : public FrisError {
public:
    explicit PipelineError(const std::string& what)
        : FrisError("[PIPELINE] " + what) {}
};

class ModelError : public FrisError {
public:
    ModelError(const std::string& member, const std::string& what)
        : FrisError("[MODEL:" + member + "] " + what), member_(member) {}

    const std::string& member() const noexcept { return member_; }

private:
    std::string member_;
};

// =============================================================================
// ContractViolation - carries the exact column diff
// =============================================================================
class ContractViolation : public FrisError {
public:
    using ColumnSet = std::set<std::string>;

    ContractViolation(const std::string& what,
                      ColumnSet missing = {},
                      ColumnSet extra = {})
        : FrisError(describe(what, missing, extra))
        , missing_(std::move(missing))
        , extra_(std::move(extra)) {}

    const ColumnSet& missing() const noexcept { return missing_; }
    const ColumnSet& extra() const noexcept { return extra_; }

private:
    static std::string join(const ColumnSet& cols) {
        std::string out;
        for (const auto& c : cols) {
            if (!out.empty()) out += ", ";
            out += c;
        }
        return out;
    }

    static std::string describe(const std::string& what,
                                const ColumnSet& missing,
                                const ColumnSet& extra) {
        std::string msg = "[CONTRACT] " + what;
        if (!missing.empty()) msg += " | missing: [" + join(missing) + "]";
        if (!extra.empty()) msg += " | extra: [" + join(extra) + "]";
        return msg;
    }

    ColumnSet missing_;
    ColumnSet extra_;
};

} // namespace fris
