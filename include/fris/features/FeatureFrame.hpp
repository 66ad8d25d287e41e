#pragma once
// =============================================================================
// FeatureFrame.hpp - Columnar working table for the feature stages
// =============================================================================
// Each stage reads columns written by earlier stages and appends its own.
// Columns are either numeric or text and always have exactly rows() entries.
// An empty frame is never constructed: zero rows is a PipelineError.
// =============================================================================

#include "fris/features/FeatureVector.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace fris {

enum class ColumnKind : uint8_t {
    NUMERIC = 0,
    TEXT    = 1
};

struct FeatureColumn {
    std::string name;
    ColumnKind kind = ColumnKind::NUMERIC;
    std::vector<double> numbers;
    std::vector<std::string> texts;

    size_t size() const { return kind == ColumnKind::NUMERIC ? numbers.size() : texts.size(); }
};

class FeatureFrame {
public:
    explicit FeatureFrame(size_t rows);

    size_t rows() const { return rows_; }
    size_t columns() const { return cols_.size(); }

    void addNumeric(const std::string& name, std::vector<double> values);
    void addText(const std::string& name, std::vector<std::string> values);

    bool has(const std::string& name) const;
    const FeatureColumn& column(const std::string& name) const;
    const std::vector<double>& numeric(const std::string& name) const;
    const std::vector<std::string>& text(const std::string& name) const;

    std::vector<std::string> columnNames() const;
    std::vector<std::string> numericColumnNames() const;

    EngineeredFeatureVector row(size_t i) const;

private:
    void checkNew(const std::string& name, size_t size) const;

    size_t rows_;
    std::vector<FeatureColumn> cols_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace fris
