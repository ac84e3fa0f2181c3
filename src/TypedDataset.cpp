#include "TypedDataset.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "EquilibExceptions.h"
#include <charconv>
#include <cmath>
#include <fstream>
#include <limits>
#include <unordered_set>

namespace {
bool isMissingToken(const std::string& raw) {
    std::string s = CommonUtils::trim(raw);
    if (s.empty()) return true;
    s = CommonUtils::toLower(s);
    return s == "na" || s == "n/a" || s == "null" || s == "none" || s == "nan" || s == "missing";
}

template <typename T>
std::vector<T> gather(const std::vector<T>& values, const std::vector<size_t>& rowIndices) {
    std::vector<T> out;
    out.reserve(rowIndices.size());
    for (size_t idx : rowIndices) out.push_back(values[idx]);
    return out;
}
}

size_t TypedColumn::size() const noexcept {
    return std::visit([](const auto& v) { return v.size(); }, values);
}

TypedColumn makeNumericColumn(std::string name, std::vector<double> values) {
    TypedColumn col;
    col.name = std::move(name);
    col.type = ColumnType::NUMERIC;
    col.values = std::move(values);
    return col;
}

TypedColumn makeCategoricalColumn(std::string name, std::vector<std::string> values) {
    TypedColumn col;
    col.name = std::move(name);
    col.type = ColumnType::CATEGORICAL;
    col.values = std::move(values);
    return col;
}

TypedDataset::TypedDataset(std::string filename, char delimiter)
    : filename_(std::move(filename)), delimiter_(delimiter) {}

TypedDataset TypedDataset::fromColumns(std::vector<TypedColumn> columns) {
    TypedDataset data;
    std::unordered_set<std::string> names;
    const size_t rows = columns.empty() ? 0 : columns.front().size();

    for (auto& col : columns) {
        if (!names.insert(col.name).second) {
            throw Equilib::DatasetException("Duplicate column name: " + col.name);
        }
        if (col.size() != rows) {
            throw Equilib::DatasetException("Column '" + col.name + "' has " + std::to_string(col.size()) +
                                            " rows, expected " + std::to_string(rows));
        }
        const bool maskGiven = !col.missing.empty();
        if (maskGiven && col.missing.size() != rows) {
            throw Equilib::DatasetException("Missing mask size mismatch for column '" + col.name + "'");
        }
        if (!maskGiven) col.missing.assign(rows, static_cast<uint8_t>(0));

        // Non-finite numbers are always missing, whatever the caller's mask says.
        if (col.type == ColumnType::NUMERIC) {
            const auto& values = std::get<std::vector<double>>(col.values);
            for (size_t r = 0; r < rows; ++r) {
                if (!std::isfinite(values[r])) col.missing[r] = static_cast<uint8_t>(1);
            }
        } else if (!maskGiven) {
            const auto& values = std::get<std::vector<std::string>>(col.values);
            for (size_t r = 0; r < rows; ++r) {
                if (values[r].empty()) col.missing[r] = static_cast<uint8_t>(1);
            }
        }
    }

    data.rowCount_ = rows;
    data.columns_ = std::move(columns);
    return data;
}

bool TypedDataset::parseDouble(const std::string& v, double& out) const {
    std::string cleaned = CommonUtils::trim(v);
    if (isMissingToken(cleaned)) return false;
    if (!cleaned.empty() && cleaned.front() == '+') {
        cleaned.erase(cleaned.begin());
    }
    if (cleaned.empty()) return false;

    const char* b = cleaned.data();
    const char* e = b + cleaned.size();
    auto [p, ec] = std::from_chars(b, e, out, std::chars_format::general);
    return ec == std::errc{} && p == e && std::isfinite(out);
}

void TypedDataset::load() {
    std::ifstream in(filename_, std::ios::binary);
    if (!in) throw Equilib::IOException("Could not open file: " + filename_);

    CSVUtils::skipBOM(in);

    bool malformed = false;
    auto header = CSVUtils::parseCSVLine(in, delimiter_, &malformed);
    if (malformed || header.empty()) throw Equilib::DatasetException("Malformed or empty CSV header");
    header = CSVUtils::normalizeHeader(header);

    std::vector<std::vector<std::string>> records;
    size_t recordNo = 1;
    while (in.peek() != EOF) {
        ++recordNo;
        auto row = CSVUtils::parseCSVLine(in, delimiter_, &malformed);
        if (malformed) {
            throw Equilib::DatasetException("Unterminated quote or oversized field in record " + std::to_string(recordNo));
        }
        if (row.empty()) continue;
        if (row.size() > header.size()) {
            throw Equilib::DatasetException("Record " + std::to_string(recordNo) + " has " + std::to_string(row.size()) +
                                            " fields but the header has " + std::to_string(header.size()));
        }
        row.resize(header.size());
        records.push_back(std::move(row));
    }

    rowCount_ = records.size();
    columns_.clear();
    columns_.reserve(header.size());

    for (size_t c = 0; c < header.size(); ++c) {
        TypedColumn col;
        col.name = header[c];
        col.missing.assign(rowCount_, static_cast<uint8_t>(0));

        size_t nonMissing = 0;
        size_t numericHits = 0;
        for (const auto& row : records) {
            if (isMissingToken(row[c])) continue;
            ++nonMissing;
            double dv = 0.0;
            if (parseDouble(row[c], dv)) ++numericHits;
        }

        const auto it = columnTypeOverrides_.find(CommonUtils::toLower(CommonUtils::trim(header[c])));
        if (it != columnTypeOverrides_.end()) {
            col.type = it->second;
        } else {
            col.type = (nonMissing > 0 && numericHits == nonMissing) ? ColumnType::NUMERIC : ColumnType::CATEGORICAL;
        }

        if (col.type == ColumnType::NUMERIC) {
            std::vector<double> values(rowCount_, std::numeric_limits<double>::quiet_NaN());
            for (size_t r = 0; r < rowCount_; ++r) {
                double dv = 0.0;
                if (parseDouble(records[r][c], dv)) {
                    values[r] = dv;
                } else {
                    col.missing[r] = static_cast<uint8_t>(1);
                }
            }
            col.values = std::move(values);
        } else {
            std::vector<std::string> values(rowCount_);
            for (size_t r = 0; r < rowCount_; ++r) {
                if (isMissingToken(records[r][c])) {
                    col.missing[r] = static_cast<uint8_t>(1);
                    continue;
                }
                values[r] = records[r][c];
            }
            col.values = std::move(values);
        }
        columns_.push_back(std::move(col));
    }
}

void TypedDataset::save(const std::string& path, char delimiter) const {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw Equilib::IOException("Could not open file for writing: " + path);

    std::vector<std::string> fields;
    fields.reserve(columns_.size());
    for (const auto& col : columns_) fields.push_back(col.name);
    CSVUtils::writeCSVRow(out, fields, delimiter);

    for (size_t r = 0; r < rowCount_; ++r) {
        fields.clear();
        for (size_t c = 0; c < columns_.size(); ++c) fields.push_back(cellText(c, r));
        CSVUtils::writeCSVRow(out, fields, delimiter);
    }

    out.flush();
    if (!out.good()) throw Equilib::IOException("Failed while writing file: " + path);
}

int TypedDataset::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].name == name) return static_cast<int>(i);
    return -1;
}

bool TypedDataset::isMissing(size_t column, size_t row) const {
    return columns_.at(column).missing.at(row) != 0;
}

std::string TypedDataset::cellText(size_t column, size_t row) const {
    const auto& col = columns_.at(column);
    if (col.missing.at(row)) return "";
    if (col.type == ColumnType::NUMERIC) {
        return CommonUtils::formatDouble(std::get<std::vector<double>>(col.values)[row]);
    }
    return std::get<std::vector<std::string>>(col.values)[row];
}

TypedDataset TypedDataset::selectRows(const std::vector<size_t>& rowIndices) const {
    for (size_t idx : rowIndices) {
        if (idx >= rowCount_) {
            throw Equilib::DatasetException("Row index " + std::to_string(idx) + " out of range for " +
                                            std::to_string(rowCount_) + " rows");
        }
    }

    TypedDataset out;
    out.filename_ = filename_;
    out.delimiter_ = delimiter_;
    out.columnTypeOverrides_ = columnTypeOverrides_;
    out.rowCount_ = rowIndices.size();
    out.columns_.reserve(columns_.size());

    for (const auto& col : columns_) {
        TypedColumn next;
        next.name = col.name;
        next.type = col.type;
        next.values = std::visit([&](const auto& v) -> ColumnStorage { return gather(v, rowIndices); }, col.values);
        next.missing = gather(col.missing, rowIndices);
        out.columns_.push_back(std::move(next));
    }
    return out;
}
