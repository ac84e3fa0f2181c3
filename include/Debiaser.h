#pragma once
#include "TypedDataset.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct DebiasOptions {
    // Decimal places for convergence rounding; unset => exact comparison with 1.
    std::optional<int> tolerance;
    // Per-group step cap; -1 => unbounded.
    int stop = -1;
    uint32_t seed = 1337;
    // Prints every cell's per-step disparity after balancing.
    bool debug = false;
    // OpenMP threads for cell balancing; 0 => runtime default.
    int threads = 0;
};

struct CellResult {
    size_t cell = 0;
    size_t combination = 0;
    size_t labelLevel = 0;
    std::string combinationText;
    std::vector<std::string> attributeValues;
    std::string labelValue;

    double expectedWeight = 0.0;
    double initialObservedWeight = 0.0;
    double finalObservedWeight = 0.0;
    size_t originalSize = 0;

    std::vector<size_t> rows;
    std::vector<double> disparityTrace;
    size_t iterations = 0;
};

struct DebiasResult {
    TypedDataset dataset;
    std::vector<CellResult> cells;
    size_t maxIterations = 0;

    std::vector<std::vector<double>> disparityTraces() const;
};

/**
 * @brief Balances every (protected-attribute combination, label value) cell and reassembles.
 * @details Cells are independent; each uses a private generator derived from options.seed
 *          and its cell id, so the output does not depend on the thread count. The balanced
 *          row lists are concatenated in cell order and shuffled once with options.seed.
 * @throws Equilib::SchemaError, Equilib::UnsupportedCardinalityError, Equilib::DatasetException
 *         on invalid input, before any balancing.
 * @throws Equilib::DivisionByZeroError / Equilib::EmptyGroupError from a degenerate cell.
 */
DebiasResult debias(const TypedDataset& data,
                    const std::vector<std::string>& protectedAttributes,
                    const std::string& labelName,
                    const DebiasOptions& options = DebiasOptions{});

/**
 * @brief Stateful front end that keeps the last run's traces for inspection.
 */
class Debiaser {
public:
    explicit Debiaser(DebiasOptions options = DebiasOptions{});

    /**
     * @brief Returns the balanced dataset. State is updated only when the run succeeds.
     */
    TypedDataset fitTransform(const TypedDataset& data,
                              const std::vector<std::string>& protectedAttributes,
                              const std::string& labelName);

    size_t getIters() const noexcept { return maxIterations_; }
    const std::vector<std::vector<double>>& disparities() const noexcept { return disparities_; }
    const std::vector<CellResult>& cells() const noexcept { return cells_; }
    const DebiasOptions& options() const noexcept { return options_; }

private:
    DebiasOptions options_;
    size_t maxIterations_ = 0;
    std::vector<std::vector<double>> disparities_;
    std::vector<CellResult> cells_;
};
