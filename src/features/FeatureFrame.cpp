#include "fris/features/FeatureFrame.hpp"
#include "fris/core/Errors.hpp"

namespace fris {

FeatureFrame::FeatureFrame(size_t rows) : rows_(rows) {
    if (rows_ == 0) {
        throw PipelineError("feature frame has no rows");
    }
}

void FeatureFrame::checkNew(const std::string& name, size_t size) const {
    if (index_.count(name)) {
        throw PipelineError("column '" + name + "' written twice");
    }
    if (size != rows_) {
        throw PipelineError("column '" + name + "' has " + std::to_string(size) +
                            " rows, frame has " + std::to_string(rows_));
    }
}

void FeatureFrame::addNumeric(const std::string& name, std::vector<double> values) {
    checkNew(name, values.size());
    FeatureColumn col;
    col.name = name;
    col.kind = ColumnKind::NUMERIC;
    col.numbers = std::move(values);
    index_.emplace(name, cols_.size());
    cols_.push_back(std::move(col));
}

void FeatureFrame::addText(const std::string& name, std::vector<std::string> values) {
    checkNew(name, values.size());
    FeatureColumn col;
    col.name = name;
    col.kind = ColumnKind::TEXT;
    col.texts = std::move(values);
    index_.emplace(name, cols_.size());
    cols_.push_back(std::move(col));
}

bool FeatureFrame::has(const std::string& name) const {
    return index_.count(name) > 0;
}

const FeatureColumn& FeatureFrame::column(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        throw PipelineError("stage input column '" + name + "' not present");
    }
    return cols_[it->second];
}

const std::vector<double>& FeatureFrame::numeric(const std::string& name) const {
    const FeatureColumn& col = column(name);
    if (col.kind != ColumnKind::NUMERIC) {
        throw PipelineError("column '" + name + "' is not numeric");
    }
    return col.numbers;
}

const std::vector<std::string>& FeatureFrame::text(const std::string& name) const {
    const FeatureColumn& col = column(name);
    if (col.kind != ColumnKind::TEXT) {
        throw PipelineError("column '" + name + "' is not text");
    }
    return col.texts;
}

std::vector<std::string> FeatureFrame::columnNames() const {
    std::vector<std::string> names;
    names.reserve(cols_.size());
    for (const auto& c : cols_) names.push_back(c.name);
    return names;
}

std::vector<std::string> FeatureFrame::numericColumnNames() const {
    std::vector<std::string> names;
    for (const auto& c : cols_) {
        if (c.kind == ColumnKind::NUMERIC) names.push_back(c.name);
    }
    return names;
}

EngineeredFeatureVector FeatureFrame::row(size_t i) const {
    if (i >= rows_) {
        throw PipelineError("row " + std::to_string(i) + " out of range");
    }
    EngineeredFeatureVector v;
    for (const auto& c : cols_) {
        if (c.kind == ColumnKind::NUMERIC) {
            v.append(c.name, c.numbers[i]);
        } else {
            v.append(c.name, c.texts[i]);
        }
    }
    return v;
}

} // namespace fris
