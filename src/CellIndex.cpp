#include "CellIndex.h"
#include "CommonUtils.h"
#include "EquilibExceptions.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <unordered_set>

namespace {
constexpr size_t kMaxProtectedAttributes = std::numeric_limits<size_t>::digits - 2;

AttributeLevels encodeColumn(const TypedDataset& data, size_t columnIndex, std::vector<size_t>& codes) {
    const auto& col = data.columns()[columnIndex];
    AttributeLevels out;
    out.name = col.name;
    out.columnIndex = columnIndex;
    codes.assign(data.rowCount(), 0);

    if (col.type == ColumnType::NUMERIC) {
        const auto& values = std::get<std::vector<double>>(col.values);
        const std::set<double> distinct(values.begin(), values.end());
        const std::vector<double> sorted(distinct.begin(), distinct.end());
        for (size_t r = 0; r < values.size(); ++r) {
            codes[r] = static_cast<size_t>(std::lower_bound(sorted.begin(), sorted.end(), values[r]) - sorted.begin());
        }
        for (double v : sorted) out.levels.push_back(CommonUtils::formatDouble(v));
    } else {
        const auto& values = std::get<std::vector<std::string>>(col.values);
        const std::set<std::string> distinct(values.begin(), values.end());
        const std::vector<std::string> sorted(distinct.begin(), distinct.end());
        for (size_t r = 0; r < values.size(); ++r) {
            codes[r] = static_cast<size_t>(std::lower_bound(sorted.begin(), sorted.end(), values[r]) - sorted.begin());
        }
        out.levels = sorted;
    }
    return out;
}

void requireNoMissing(const TypedDataset& data, size_t columnIndex, const std::string& role) {
    const auto& col = data.columns()[columnIndex];
    const auto it = std::find(col.missing.begin(), col.missing.end(), static_cast<uint8_t>(1));
    if (it != col.missing.end()) {
        const size_t row = static_cast<size_t>(it - col.missing.begin());
        throw Equilib::DatasetException(role + " column '" + col.name + "' has a missing value at row " + std::to_string(row));
    }
    if (col.type != ColumnType::NUMERIC) return;

    // Level ordering needs a strict weak order, which NaN breaks.
    const auto& values = std::get<std::vector<double>>(col.values);
    for (size_t r = 0; r < values.size(); ++r) {
        if (!std::isfinite(values[r])) {
            throw Equilib::DatasetException(role + " column '" + col.name + "' has a non-finite value at row " + std::to_string(r));
        }
    }
}
}

CellIndex CellIndex::build(const TypedDataset& data,
                           const std::vector<std::string>& protectedAttributes,
                           const std::string& labelName) {
    if (data.rowCount() == 0) {
        throw Equilib::DatasetException("Dataset is empty");
    }

    std::unordered_set<std::string> seen;
    for (const auto& name : protectedAttributes) {
        if (!seen.insert(name).second) {
            throw Equilib::SchemaError("Protected attribute listed twice: " + name);
        }
        if (name == labelName) {
            throw Equilib::SchemaError("Label '" + labelName + "' cannot also be a protected attribute");
        }
    }

    const int labelIdx = data.findColumnIndex(labelName);
    if (labelIdx < 0) {
        throw Equilib::SchemaError("Label column '" + labelName + "' not found");
    }
    std::vector<size_t> protectedIdx;
    protectedIdx.reserve(protectedAttributes.size());
    for (const auto& name : protectedAttributes) {
        const int idx = data.findColumnIndex(name);
        if (idx < 0) {
            throw Equilib::SchemaError("Protected attribute column '" + name + "' not found");
        }
        protectedIdx.push_back(static_cast<size_t>(idx));
    }

    requireNoMissing(data, static_cast<size_t>(labelIdx), "Label");
    for (size_t idx : protectedIdx) requireNoMissing(data, idx, "Protected");

    CellIndex index;
    index.rowCount_ = data.rowCount();

    const size_t k = protectedIdx.size();
    if (k > kMaxProtectedAttributes) {
        throw Equilib::DatasetException("Too many protected attributes: " + std::to_string(k));
    }

    std::vector<std::vector<size_t>> attributeCodes(k);
    for (size_t i = 0; i < k; ++i) {
        AttributeLevels levels = encodeColumn(data, protectedIdx[i], attributeCodes[i]);
        if (levels.levels.size() != 2) {
            throw Equilib::UnsupportedCardinalityError(
                "Protected attribute '" + levels.name + "' has " + std::to_string(levels.levels.size()) +
                " distinct values; exactly 2 are required");
        }
        index.attributes_.push_back(std::move(levels));
    }

    const size_t combinations = size_t{1} << k;
    if (combinations > index.rowCount_) {
        throw Equilib::DivisionByZeroError(
            std::to_string(index.rowCount_) + " rows cannot cover all " + std::to_string(combinations) +
            " protected-attribute combinations; at least one combination has no rows");
    }

    index.label_ = encodeColumn(data, static_cast<size_t>(labelIdx), index.labelOfRow_);
    const size_t labels = index.label_.levels.size();
    if (labels > index.rowCount_ / combinations) {
        throw Equilib::DivisionByZeroError(
            std::to_string(index.rowCount_) + " rows cannot cover all " + std::to_string(combinations * labels) +
            " (combination, label) cells; at least one cell has no rows");
    }

    index.combinationOfRow_.assign(index.rowCount_, 0);
    index.combinationCounts_.assign(combinations, 0);
    index.labelCounts_.assign(labels, 0);
    index.cellRows_.assign(combinations * labels, std::vector<size_t>{});

    for (size_t r = 0; r < index.rowCount_; ++r) {
        size_t combination = 0;
        for (size_t i = 0; i < k; ++i) {
            combination = (combination << 1) | attributeCodes[i][r];
        }
        index.combinationOfRow_[r] = combination;
        ++index.combinationCounts_[combination];
        ++index.labelCounts_[index.labelOfRow_[r]];
        index.cellRows_[index.cellId(combination, index.labelOfRow_[r])].push_back(r);
    }

    return index;
}

std::vector<std::string> CellIndex::combinationValues(size_t combination) const {
    std::vector<std::string> out;
    const size_t k = attributes_.size();
    out.reserve(k);
    for (size_t i = 0; i < k; ++i) {
        const size_t bit = (combination >> (k - 1 - i)) & size_t{1};
        out.push_back(attributes_[i].levels[bit]);
    }
    return out;
}

std::string CellIndex::describeCombination(size_t combination) const {
    if (attributes_.empty()) return "(all rows)";
    const auto values = combinationValues(combination);
    std::vector<std::string> parts;
    parts.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        parts.push_back(attributes_[i].name + "=" + values[i]);
    }
    return CommonUtils::joinList(parts);
}
