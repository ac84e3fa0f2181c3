#include "BalanceReport.h"
#include "CommonUtils.h"
#include "Debiaser.h"
#include "EquilibConfig.h"
#include "EquilibExceptions.h"
#include "StopSweep.h"
#include "TypedDataset.h"
#include <iostream>
#include <string>

namespace {
int runSweep(const EquilibConfig& config, const TypedDataset& data) {
    std::cout << "[Equilib][Sweep] step=" << config.sweepStep
              << (config.sweepMax >= 0 ? " max=" + std::to_string(config.sweepMax) : std::string(" max=<unbounded run>"))
              << "\n";
    const auto points = StopSweep::sweepStops(data,
                                              config.protectedAttributes,
                                              config.labelColumn,
                                              config.debiasOptions(),
                                              config.sweepStep,
                                              config.sweepMax);
    BalanceReport::printSweepTable(points, std::cout);
    return 0;
}

int runBalance(const EquilibConfig& config, const TypedDataset& data) {
    Debiaser debiaser(config.debiasOptions());
    const TypedDataset balanced = debiaser.fitTransform(data, config.protectedAttributes, config.labelColumn);

    if (config.verbose) {
        std::cout << "[Equilib][Balance] " << debiaser.cells().size() << " cells, "
                  << data.rowCount() << " -> " << balanced.rowCount() << " rows, max steps "
                  << debiaser.getIters() << "\n";
        BalanceReport::printCellTable(debiaser.cells(), config.labelColumn, std::cout);
    }

    balanced.save(config.outputPath, config.delimiter);
    if (config.verbose) std::cout << "[Equilib] Balanced dataset written to " << config.outputPath << "\n";

    if (!config.traceFile.empty()) {
        BalanceReport::writeTraceCsv(config.traceFile, debiaser.cells(), config.delimiter);
        if (config.verbose) std::cout << "[Equilib] Disparity traces written to " << config.traceFile << "\n";
    }
    return 0;
}
}

int main(int argc, char* argv[]) {
    if (argc >= 2 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        std::cout << EquilibConfig::usage() << "\n";
        return 0;
    }

    EquilibConfig config;
    try {
        config = EquilibConfig::fromArgs(argc, argv);
    } catch (const Equilib::EquilibException& e) {
        std::cerr << "[Equilib][Error] " << e.what() << "\n";
        return 1;
    }

    try {
        TypedDataset data(config.datasetPath, config.delimiter);
        data.setColumnTypeOverrides(config.columnTypeOverrides);
        data.load();
        if (config.verbose) {
            std::cout << "[Equilib][Load] " << data.rowCount() << " rows x " << data.colCount()
                      << " columns from " << config.datasetPath << "\n";
            std::cout << "[Equilib][Load] label=" << config.labelColumn << " protected=["
                      << CommonUtils::joinList(config.protectedAttributes) << "] tolerance="
                      << (config.tolerance >= 0 ? std::to_string(config.tolerance) : std::string("exact"))
                      << " stop=" << config.stop << " seed=" << config.seed << "\n";
        }
        for (const auto& warning : config.warnings()) {
            std::cerr << "[Equilib][Warning] " << warning << "\n";
        }

        if (config.sweepStep > 0) return runSweep(config, data);
        return runBalance(config, data);
    } catch (const Equilib::EquilibException& e) {
        std::cerr << "[Equilib][Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Equilib][Error] Unexpected failure: " << e.what() << "\n";
        return 1;
    }
}
