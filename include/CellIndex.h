#pragma once
#include "TypedDataset.h"
#include <string>
#include <vector>

/**
 * @brief Distinct observed values of one column, ascending.
 * @details Numeric columns sort numerically, categorical columns by byte order.
 */
struct AttributeLevels {
    std::string name;
    size_t columnIndex = 0;
    std::vector<std::string> levels;
};

/**
 * @brief Partition of a dataset into (protected-attribute combination, label level) cells.
 *
 * Combination c pins protected attribute i to level bit (c >> (k-1-i)) & 1, so the
 * first attribute is the most significant bit and the "0" branch of every attribute
 * comes first. Cell id is c * labelLevelCount() + l.
 */
class CellIndex {
public:
    /**
     * @brief Validates the schema and assigns every row to its cell.
     * @throws Equilib::DatasetException for an empty dataset, missing values in the label or a
     *         protected column, or too many protected attributes.
     * @throws Equilib::SchemaError when a column is absent or listed inconsistently.
     * @throws Equilib::UnsupportedCardinalityError when a protected attribute does not have
     *         exactly two observed values.
     */
    static CellIndex build(const TypedDataset& data,
                           const std::vector<std::string>& protectedAttributes,
                           const std::string& labelName);

    size_t rowCount() const noexcept { return rowCount_; }
    size_t attributeCount() const noexcept { return attributes_.size(); }
    size_t combinationCount() const noexcept { return combinationCounts_.size(); }
    size_t labelLevelCount() const noexcept { return label_.levels.size(); }
    size_t cellCount() const noexcept { return cellRows_.size(); }

    const std::vector<AttributeLevels>& attributes() const noexcept { return attributes_; }
    const AttributeLevels& label() const noexcept { return label_; }

    size_t combinationOfRow(size_t row) const { return combinationOfRow_.at(row); }
    size_t labelOfRow(size_t row) const { return labelOfRow_.at(row); }

    size_t combinationRowCount(size_t combination) const { return combinationCounts_.at(combination); }
    size_t labelRowCount(size_t label) const { return labelCounts_.at(label); }

    size_t cellId(size_t combination, size_t label) const noexcept { return combination * labelLevelCount() + label; }
    const std::vector<size_t>& cellRows(size_t cell) const { return cellRows_.at(cell); }

    /**
     * @brief Level text of every protected attribute for one combination.
     */
    std::vector<std::string> combinationValues(size_t combination) const;

    /**
     * @brief Human readable form, e.g. "sex=0, race=1"; "(all rows)" without protected attributes.
     */
    std::string describeCombination(size_t combination) const;

private:
    size_t rowCount_ = 0;
    std::vector<AttributeLevels> attributes_;
    AttributeLevels label_;
    std::vector<size_t> combinationOfRow_;
    std::vector<size_t> labelOfRow_;
    std::vector<size_t> combinationCounts_;
    std::vector<size_t> labelCounts_;
    std::vector<std::vector<size_t>> cellRows_;
};
