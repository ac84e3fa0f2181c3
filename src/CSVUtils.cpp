#include "CSVUtils.h"

#include <unordered_set>

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    if (value.empty()) return value;
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    if (!is.good()) return;

    const int first = is.peek();
    if (first == EOF || static_cast<unsigned char>(first) != 0xEF) {
        return;
    }

    is.get();
    const int second = is.peek();
    if (second == EOF || static_cast<unsigned char>(second) != 0xBB) {
        is.clear(is.rdstate() & ~std::ios::eofbit);
        is.unget();
        return;
    }

    is.get();
    const int third = is.peek();
    if (third == EOF || static_cast<unsigned char>(third) != 0xBF) {
        is.clear(is.rdstate() & ~std::ios::eofbit);
        is.unget();
        is.unget();
        return;
    }

    is.get();
}

std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      bool* malformed,
                                      const ParseLimits& limits) {
    if (malformed) *malformed = false;
    if (is.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string val;
    bool inQuotes = false;
    bool currentFieldQuoted = false;
    bool hadDelimiter = false;
    bool overLimit = false;
    char c;

    auto pushField = [&]() {
        row.push_back(currentFieldQuoted ? val : trimUnquotedField(val));
        if (limits.maxColumns > 0 && row.size() > limits.maxColumns) overLimit = true;
        val.clear();
        currentFieldQuoted = false;
    };

    auto append = [&](char ch) {
        val += ch;
        if (limits.maxFieldBytes > 0 && val.size() > limits.maxFieldBytes) overLimit = true;
    };

    while (!overLimit && is.get(c)) {
        if (c == '"') {
            if (!inQuotes && !currentFieldQuoted && trimUnquotedField(val).empty()) {
                val.clear();
                inQuotes = true;
                currentFieldQuoted = true;
            } else if (inQuotes) {
                if (is.peek() == '"') {
                    is.get();
                    append('"');
                } else {
                    inQuotes = false;
                }
            } else {
                append(c);
            }
        } else if (c == delimiter && !inQuotes) {
            pushField();
            hadDelimiter = true;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            if (!inQuotes) break;
            append('\n');
        } else if (currentFieldQuoted && !inQuotes) {
            // Text after a closing quote is kept, as most spreadsheet exporters do.
            if (c != ' ' && c != '\t') append(c);
        } else {
            append(c);
        }
    }

    if (malformed && (inQuotes || overLimit)) {
        *malformed = true;
    }

    if (!hadDelimiter && !currentFieldQuoted && trimUnquotedField(val).empty()) {
        return {};
    }
    pushField();
    return row;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out = header;
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i].empty()) {
            out[i] = "column_" + std::to_string(i + 1);
        }

        std::string original = out[i];
        if (seen.find(out[i]) != seen.end()) {
            size_t suffix = 2;
            while (seen.find(original + "_" + std::to_string(suffix)) != seen.end()) {
                ++suffix;
            }
            out[i] = original + "_" + std::to_string(suffix);
        }
        seen.insert(out[i]);
    }

    return out;
}

std::string quoteField(const std::string& value, char delimiter) {
    const bool needsQuotes = value.find(delimiter) != std::string::npos ||
                             value.find('"') != std::string::npos ||
                             value.find('\n') != std::string::npos ||
                             value.find('\r') != std::string::npos ||
                             (!value.empty() && (value.front() == ' ' || value.back() == ' '));
    if (!needsQuotes) return value;

    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char ch : value) {
        if (ch == '"') out.push_back('"');
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

void writeCSVRow(std::ostream& os, const std::vector<std::string>& fields, char delimiter) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) os << delimiter;
        os << quoteField(fields[i], delimiter);
    }
    os << '\n';
}
} // namespace CSVUtils
