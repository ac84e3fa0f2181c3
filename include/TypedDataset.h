#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

enum class ColumnType { NUMERIC, CATEGORICAL };
using ColumnStorage = std::variant<std::vector<double>, std::vector<std::string>>;
using MissingMask = std::vector<uint8_t>;

struct TypedColumn {
    std::string name;
    ColumnType type = ColumnType::CATEGORICAL;
    ColumnStorage values = std::vector<std::string>{};
    MissingMask missing;

    size_t size() const noexcept;
};

TypedColumn makeNumericColumn(std::string name, std::vector<double> values);
TypedColumn makeCategoricalColumn(std::string name, std::vector<std::string> values);

class TypedDataset {
public:
    TypedDataset() = default;
    explicit TypedDataset(std::string filename, char delimiter = ',');

    /**
     * @brief Builds an in-memory dataset from already typed columns.
     * @throws Equilib::DatasetException when column lengths differ, a missing mask is
     *         misaligned, or two columns share a name.
     */
    static TypedDataset fromColumns(std::vector<TypedColumn> columns);

    void setColumnTypeOverride(std::string columnNameLower, ColumnType type) { columnTypeOverrides_[std::move(columnNameLower)] = type; }
    void setColumnTypeOverrides(std::unordered_map<std::string, ColumnType> overrides) { columnTypeOverrides_ = std::move(overrides); }

    /**
     * @brief Loads CSV content and infers per-column types.
     * @details CSV tokenization is delegated to CSVUtils; this class owns type inference and typed storage.
     * @pre file exists and is readable.
     * @post columns() is populated with aligned typed vectors and missing masks.
     * @throws Equilib::IOException / Equilib::DatasetException on IO or parse failure.
     */
    void load();

    /**
     * @brief Writes header and rows as CSV. Missing values become empty fields.
     * @throws Equilib::IOException when the file cannot be written.
     */
    void save(const std::string& path, char delimiter = ',') const;

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }
    const std::string& filename() const noexcept { return filename_; }

    const std::vector<TypedColumn>& columns() const noexcept { return columns_; }
    std::vector<TypedColumn>& columns() noexcept { return columns_; }

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;

    bool isMissing(size_t column, size_t row) const;

    /**
     * @brief Canonical text of one value; empty for missing values.
     */
    std::string cellText(size_t column, size_t row) const;

    /**
     * @brief Gathers rows by index into a new dataset with the same schema.
     * @details Indices may repeat; row i of the result is a copy of row rowIndices[i].
     * @throws Equilib::DatasetException when an index is out of range.
     */
    TypedDataset selectRows(const std::vector<size_t>& rowIndices) const;

private:
    std::string filename_;
    char delimiter_ = ',';
    std::unordered_map<std::string, ColumnType> columnTypeOverrides_;
    size_t rowCount_ = 0;
    std::vector<TypedColumn> columns_;

    bool parseDouble(const std::string& v, double& out) const;
};
