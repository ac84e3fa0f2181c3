#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace CSVUtils {
// Low-level CSV tokenization and writing.
// This module does not infer semantic types.
struct ParseLimits {
	size_t maxFieldBytes = 8 * 1024 * 1024;           // 8 MiB
	size_t maxColumns = 20000;
};

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one CSV record, which may span several physical lines inside quotes.
 * @post *malformed is true when the record ends inside an open quote or a limit is exceeded.
 * @return Empty vector at EOF or for a blank line.
 */
std::vector<std::string> parseCSVLine(std::istream& is,
									  char delimiter,
									  bool* malformed = nullptr,
									  const ParseLimits& limits = ParseLimits{});
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);

std::string quoteField(const std::string& value, char delimiter);
void writeCSVRow(std::ostream& os, const std::vector<std::string>& fields, char delimiter);
}
