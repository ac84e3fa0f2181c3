#include "EquilibConfig.h"
#include "CommonUtils.h"
#include "EquilibExceptions.h"
#include <algorithm>
#include <fstream>
#include <limits>
#include <unordered_set>

namespace {
constexpr int kMaxTolerance = 15;

template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Equilib::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Equilib::EquilibException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Equilib::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            out.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) {
            continue;
        }
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(std::string key) {
    key = CommonUtils::trim(key);
    const std::string lowered = CommonUtils::toLower(key);
    if (lowered.rfind("type.", 0) == 0) {
        return "type." + key.substr(5);
    }

    std::string out = lowered;
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw Equilib::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

uint32_t parseUIntStrict(const std::string& value, const std::string& key) {
    if (!value.empty() && value.front() == '-') {
        throw Equilib::ConfigurationException("Invalid unsigned integer for " + key + ": " + value);
    }
    unsigned long parsed = parseNumericStrict<unsigned long>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoul(v, pos); });
    if (parsed > static_cast<unsigned long>(std::numeric_limits<uint32_t>::max())) {
        throw Equilib::ConfigurationException("Value for " + key + " exceeds uint32 range");
    }
    return static_cast<uint32_t>(parsed);
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Equilib::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

int parseTolerance(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "exact" || v == "none") return -1;
    return parseIntStrict(v, key, -1);
}

char parseDelimiter(const std::string& value, const std::string& key) {
    if (value == "\\t" || CommonUtils::toLower(value) == "tab") return '\t';
    if (value.size() != 1) throw Equilib::ConfigurationException(key + " expects a single character");
    return value[0];
}

ColumnType parseColumnType(const std::string& value, const std::string& column) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "numeric") return ColumnType::NUMERIC;
    if (v == "categorical") return ColumnType::CATEGORICAL;
    throw Equilib::ConfigurationException("Invalid type override for column '" + column + "': " + value +
                                          " (allowed: numeric, categorical)");
}

void assignKeyValue(EquilibConfig& config, const std::string& key, const std::string& value) {
    if (key.rfind("type.", 0) == 0) {
        const std::string columnName = CommonUtils::trim(key.substr(5));
        if (columnName.empty()) {
            throw Equilib::ConfigurationException("type.<column> requires a non-empty column name");
        }
        config.columnTypeOverrides[CommonUtils::toLower(columnName)] = parseColumnType(value, columnName);
        return;
    }
    if (key == "delimiter") {
        config.delimiter = parseDelimiter(value, key);
        return;
    }
    if (key == "protected" || key == "protected_attributes") {
        config.protectedAttributes = CommonUtils::splitList(value);
        return;
    }
    if (key == "tolerance") {
        config.tolerance = parseTolerance(value, key);
        return;
    }

    struct IntRule {
        int EquilibConfig::*member;
        int minValue;
    };

    static const std::unordered_map<std::string, std::string EquilibConfig::*> stringFields = {
        {"dataset", &EquilibConfig::datasetPath},
        {"output", &EquilibConfig::outputPath},
        {"trace_file", &EquilibConfig::traceFile},
        {"label", &EquilibConfig::labelColumn}
    };
    static const std::unordered_map<std::string, bool EquilibConfig::*> boolFields = {
        {"debug", &EquilibConfig::debug},
        {"verbose", &EquilibConfig::verbose}
    };
    static const std::unordered_map<std::string, IntRule> intFields = {
        {"stop", {&EquilibConfig::stop, -1}},
        {"threads", {&EquilibConfig::threads, 0}},
        {"sweep_step", {&EquilibConfig::sweepStep, 0}},
        {"sweep_max", {&EquilibConfig::sweepMax, -1}}
    };

    if (const auto it = stringFields.find(key); it != stringFields.end()) {
        config.*(it->second) = value;
        return;
    }
    if (const auto it = boolFields.find(key); it != boolFields.end()) {
        config.*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (const auto it = intFields.find(key); it != intFields.end()) {
        config.*(it->second.member) = parseIntStrict(value, key, it->second.minValue);
        return;
    }
    if (key == "seed") {
        config.seed = parseUIntStrict(value, key);
        return;
    }
    throw Equilib::ConfigurationException("Unknown key: " + key);
}
}

std::string EquilibConfig::usage() {
    return "Usage: equilib <dataset.csv> --label <col> [--protected a,b,...] [--config path] "
           "[--output balanced.csv] [--tolerance N|exact] [--stop N|-1] [--seed N] [--threads N] "
           "[--debug true|false] [--verbose true|false] [--trace-file path] "
           "[--sweep-step N] [--sweep-max N|-1] [--delimiter ,] [--type col:numeric|categorical]";
}

EquilibConfig EquilibConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2) {
        throw Equilib::ConfigurationException(usage());
    }

    EquilibConfig config;
    config.datasetPath = argv[1];

    std::string configPath;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            throw Equilib::ConfigurationException("Unexpected argument: " + arg);
        }
        if (i + 1 >= argc) {
            throw Equilib::ConfigurationException(arg + " expects a value");
        }
        const std::string value = argv[++i];

        if (arg == "--config") {
            configPath = value;
        } else if (arg == "--type") {
            const size_t sep = value.find(':');
            if (sep == std::string::npos || sep == 0 || sep + 1 >= value.size()) {
                throw Equilib::ConfigurationException("--type expects <column>:<numeric|categorical>");
            }
            const std::string columnName = CommonUtils::trim(value.substr(0, sep));
            config.columnTypeOverrides[CommonUtils::toLower(columnName)] = parseColumnType(value.substr(sep + 1), columnName);
        } else if (arg == "--dataset") {
            throw Equilib::ConfigurationException("the dataset path is positional; --dataset is only valid in a config file");
        } else {
            try {
                assignKeyValue(config, normalizeConfigKey(arg.substr(2)), value);
            } catch (const Equilib::ConfigurationException& ex) {
                throw Equilib::ConfigurationException(arg + ": " + ex.what());
            }
        }
    }

    if (!configPath.empty()) {
        config = fromFile(configPath, config);
        if (config.datasetPath.empty()) config.datasetPath = argv[1];
    }

    config.validate();
    return config;
}

EquilibConfig EquilibConfig::fromFile(const std::string& configPath, const EquilibConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Equilib::ConfigurationException("Could not open config file: " + configPath);

    EquilibConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Loose YAML (key: value) and loose JSON-ish ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) {
            throw Equilib::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) + ": expected 'key: value'");
        }

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            assignKeyValue(config, key, value);
        } catch (const Equilib::EquilibException& ex) {
            throw Equilib::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }

    return config;
}

void EquilibConfig::validate() const {
    if (datasetPath.empty()) {
        throw Equilib::ConfigurationException("dataset path is required");
    }
    if (labelColumn.empty()) {
        throw Equilib::ConfigurationException("label column is required (--label)");
    }
    if (outputPath.empty()) {
        throw Equilib::ConfigurationException("output path must not be empty");
    }

    std::unordered_set<std::string> seen;
    for (const auto& name : protectedAttributes) {
        if (name == labelColumn) {
            throw Equilib::ConfigurationException("label '" + labelColumn + "' cannot also be protected");
        }
        if (!seen.insert(name).second) {
            throw Equilib::ConfigurationException("protected attribute listed twice: " + name);
        }
    }

    if (tolerance < -1 || tolerance > kMaxTolerance) {
        throw Equilib::ConfigurationException("tolerance must be 'exact' or within [0," + std::to_string(kMaxTolerance) + "]");
    }
    if (stop < -1) throw Equilib::ConfigurationException("stop must be >= -1");
    if (threads < 0) throw Equilib::ConfigurationException("threads must be >= 0");
    if (sweepStep < 0) throw Equilib::ConfigurationException("sweep_step must be >= 0");
    if (sweepMax < -1) throw Equilib::ConfigurationException("sweep_max must be >= -1");
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r') {
        throw Equilib::ConfigurationException("delimiter cannot be a quote or newline");
    }
}

DebiasOptions EquilibConfig::debiasOptions() const {
    DebiasOptions options;
    if (tolerance >= 0) options.tolerance = tolerance;
    options.stop = stop;
    options.seed = seed;
    options.debug = debug;
    options.threads = threads;
    return options;
}

std::vector<std::string> EquilibConfig::warnings() const {
    std::vector<std::string> out;
    const std::string precision = tolerance >= 0 ? std::to_string(tolerance) + " decimal places" : "exact tolerance";
    if (stop < 0) {
        out.push_back(precision + " with no stop cap may never converge; pass --stop to bound each group");
    }
    if (sweepStep > 0 && sweepMax < 0 && stop < 0) {
        out.push_back("the sweep range comes from an unbounded run; pass --sweep-max to fix it");
    }
    return out;
}
