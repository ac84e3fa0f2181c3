#include "Debiaser.h"
#include "CellIndex.h"
#include "EquilibExceptions.h"
#include "GroupBalancer.h"
#include <algorithm>
#include <exception>
#include <iomanip>
#include <iostream>
#include <random>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
void printDebugTraces(const std::vector<CellResult>& cells) {
    for (const auto& cell : cells) {
        std::cout << "[Equilib][Debug] cell " << cell.cell << " (" << cell.combinationText
                  << " | label=" << cell.labelValue << ") " << cell.iterations << " steps\n";
        for (size_t step = 1; step < cell.disparityTrace.size(); ++step) {
            std::cout << "[Equilib][Debug]   step " << step << ": "
                      << std::setprecision(10) << cell.disparityTrace[step] << "\n";
        }
    }
}
}

std::vector<std::vector<double>> DebiasResult::disparityTraces() const {
    std::vector<std::vector<double>> out;
    out.reserve(cells.size());
    for (const auto& cell : cells) out.push_back(cell.disparityTrace);
    return out;
}

DebiasResult debias(const TypedDataset& data,
                    const std::vector<std::string>& protectedAttributes,
                    const std::string& labelName,
                    const DebiasOptions& options) {
    const CellIndex index = CellIndex::build(data, protectedAttributes, labelName);
    const size_t n = index.rowCount();
    const double total = static_cast<double>(n);
    const size_t cellCount = index.cellCount();

    BalanceOptions balance;
    balance.tolerance = options.tolerance;
    balance.maxIterations = options.stop;

    // Degenerate cells fail here, in cell order, before any resampling starts.
    std::vector<CellResult> cells(cellCount);
    for (size_t combination = 0; combination < index.combinationCount(); ++combination) {
        for (size_t label = 0; label < index.labelLevelCount(); ++label) {
            const size_t id = index.cellId(combination, label);
            CellResult& cell = cells[id];
            cell.cell = id;
            cell.combination = combination;
            cell.labelLevel = label;
            cell.combinationText = index.describeCombination(combination);
            cell.attributeValues = index.combinationValues(combination);
            cell.labelValue = index.label().levels[label];
            cell.originalSize = index.cellRows(id).size();

            if (index.combinationRowCount(combination) == 0) {
                throw Equilib::DivisionByZeroError("combination " + cell.combinationText + " does not occur in the dataset");
            }
            if (cell.originalSize == 0) {
                throw Equilib::DivisionByZeroError("no rows with " + cell.combinationText + " and " + labelName +
                                                   "=" + cell.labelValue);
            }

            cell.expectedWeight = (static_cast<double>(index.combinationRowCount(combination)) / total) *
                                  (static_cast<double>(index.labelRowCount(label)) / total);
            cell.initialObservedWeight = static_cast<double>(cell.originalSize) / total;
        }
    }

    std::vector<std::exception_ptr> failures(cellCount);

#ifdef USE_OPENMP
    const int threadCount = options.threads > 0 ? options.threads : omp_get_max_threads();
    #pragma omp parallel for schedule(dynamic) num_threads(threadCount)
#endif
    for (size_t id = 0; id < cellCount; ++id) {
        try {
            CellResult& cell = cells[id];
            std::mt19937 cellRng(static_cast<uint32_t>(options.seed + id * 104729u + 31u));
            BalanceOutcome outcome = GroupBalancer::balanceGroup(cell.expectedWeight,
                                                                 cell.initialObservedWeight,
                                                                 index.cellRows(id),
                                                                 n,
                                                                 balance,
                                                                 cellRng);
            cell.rows = std::move(outcome.rows);
            cell.disparityTrace = std::move(outcome.disparityTrace);
            cell.iterations = outcome.iterations;
            cell.finalObservedWeight = static_cast<double>(cell.rows.size()) / total;
        } catch (...) {
            failures[id] = std::current_exception();
        }
    }

    for (const auto& failure : failures) {
        if (failure) std::rethrow_exception(failure);
    }

    if (options.debug) printDebugTraces(cells);

    DebiasResult result;
    size_t combinedRows = 0;
    for (const auto& cell : cells) {
        combinedRows += cell.rows.size();
        result.maxIterations = std::max(result.maxIterations, cell.iterations);
    }

    std::vector<size_t> order;
    order.reserve(combinedRows);
    for (const auto& cell : cells) order.insert(order.end(), cell.rows.begin(), cell.rows.end());

    std::mt19937 shuffleRng(options.seed);
    std::shuffle(order.begin(), order.end(), shuffleRng);

    result.dataset = data.selectRows(order);
    result.cells = std::move(cells);
    return result;
}

Debiaser::Debiaser(DebiasOptions options) : options_(std::move(options)) {}

TypedDataset Debiaser::fitTransform(const TypedDataset& data,
                                    const std::vector<std::string>& protectedAttributes,
                                    const std::string& labelName) {
    DebiasResult result = debias(data, protectedAttributes, labelName, options_);
    maxIterations_ = result.maxIterations;
    disparities_ = result.disparityTraces();
    cells_ = std::move(result.cells);
    return std::move(result.dataset);
}
