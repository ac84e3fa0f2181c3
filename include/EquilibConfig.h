#pragma once
#include "Debiaser.h"
#include "TypedDataset.h"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

struct EquilibConfig {
    std::string datasetPath;
    std::string outputPath = "balanced.csv";
    std::string traceFile;                  // empty => no trace export
    std::string labelColumn;
    std::vector<std::string> protectedAttributes;
    char delimiter = ',';

    int tolerance = -1;                     // -1 => exact comparison
    int stop = -1;                          // -1 => unbounded
    uint32_t seed = 1337;
    int threads = 0;                        // 0 => OpenMP default
    bool debug = false;
    bool verbose = true;

    int sweepStep = 0;                      // 0 => no sweep
    int sweepMax = -1;                      // -1 => from an unbounded run

    std::unordered_map<std::string, ColumnType> columnTypeOverrides;  // keys lower-cased

    /**
     * @brief Builds config from CLI args and optional config file override.
     * @pre argc/argv contain at least dataset path in argv[1].
     * @post Returns a validated config object.
     * @throws Equilib::ConfigurationException on invalid arguments or values.
     */
    static EquilibConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @pre configPath points to a readable text file.
     * @post Returns merged config using `base` as defaults.
     * @throws Equilib::ConfigurationException on parse/validation failures.
     */
    static EquilibConfig fromFile(const std::string& configPath, const EquilibConfig& base);

    /**
     * @brief Validates merged configuration invariants.
     * @throws Equilib::ConfigurationException on invalid values.
     */
    void validate() const;

    DebiasOptions debiasOptions() const;

    /**
     * @brief Non-fatal problems with a valid config, one message each.
     * @details Any run without a stop cap is reported; a group can oscillate around 1 forever.
     */
    std::vector<std::string> warnings() const;

    static std::string usage();
};
