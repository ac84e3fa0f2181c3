#pragma once
#include <optional>
#include <random>
#include <vector>

struct BalanceOptions {
    // Decimal places the disparity is rounded to before comparing with 1; unset => exact.
    std::optional<int> tolerance;
    // Cap on add/remove steps; negative => unbounded.
    int maxIterations = -1;
};

struct BalanceOutcome {
    std::vector<size_t> rows;
    std::vector<double> disparityTrace;
    size_t iterations = 0;
};

namespace GroupBalancer {

/**
 * @brief Expected/observed weight ratio under the rounding policy of `tolerance`.
 * @throws Equilib::DivisionByZeroError when observedWeight is not positive.
 */
double disparity(double expectedWeight, double observedWeight, const std::optional<int>& tolerance);

/**
 * @brief Resamples one group, one row per step, until its disparity reaches 1 or the cap is hit.
 * @param rows Row indices of the group into the full dataset; duplicates are allowed.
 * @param fullDatasetSize Denominator of the observed weight; constant for the whole run.
 * @details A disparity above 1 appends a uniformly drawn copy of a group row; below 1 it
 *          removes a uniformly drawn row. The rounded disparity drives both the loop and the
 *          branch. Trace element 0 is the initial disparity.
 * @throws Equilib::DivisionByZeroError when the observed weight is or becomes zero.
 * @throws Equilib::EmptyGroupError when a step must sample from an empty group.
 */
BalanceOutcome balanceGroup(double expectedWeight,
                            double observedWeight,
                            std::vector<size_t> rows,
                            size_t fullDatasetSize,
                            const BalanceOptions& options,
                            std::mt19937& rng);

} // namespace GroupBalancer
