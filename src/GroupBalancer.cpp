#include "GroupBalancer.h"
#include "CommonUtils.h"
#include "EquilibExceptions.h"
#include <string>

namespace GroupBalancer {

double disparity(double expectedWeight, double observedWeight, const std::optional<int>& tolerance) {
    if (!(observedWeight > 0.0)) {
        throw Equilib::DivisionByZeroError("observed weight is zero; the group has no rows");
    }
    const double ratio = expectedWeight / observedWeight;
    return tolerance ? CommonUtils::roundToPlaces(ratio, *tolerance) : ratio;
}

BalanceOutcome balanceGroup(double expectedWeight,
                            double observedWeight,
                            std::vector<size_t> rows,
                            size_t fullDatasetSize,
                            const BalanceOptions& options,
                            std::mt19937& rng) {
    if (fullDatasetSize == 0) {
        throw Equilib::DivisionByZeroError("full dataset size is zero");
    }

    BalanceOutcome out;
    double disp = disparity(expectedWeight, observedWeight, options.tolerance);
    out.disparityTrace.push_back(disp);

    const auto capReached = [&]() {
        return options.maxIterations >= 0 && out.iterations >= static_cast<size_t>(options.maxIterations);
    };

    while (disp != 1.0 && !capReached()) {
        if (rows.empty()) {
            throw Equilib::EmptyGroupError("cannot sample a row from an empty group");
        }
        std::uniform_int_distribution<size_t> pick(0, rows.size() - 1);
        const size_t pos = pick(rng);
        if (disp > 1.0) {
            rows.push_back(rows[pos]);
        } else {
            rows[pos] = rows.back();
            rows.pop_back();
        }

        observedWeight = static_cast<double>(rows.size()) / static_cast<double>(fullDatasetSize);
        if (rows.empty()) {
            throw Equilib::DivisionByZeroError("undersampling emptied the group after " +
                                               std::to_string(out.iterations + 1) + " steps");
        }
        disp = disparity(expectedWeight, observedWeight, options.tolerance);
        out.disparityTrace.push_back(disp);
        ++out.iterations;
    }

    out.rows = std::move(rows);
    return out;
}

} // namespace GroupBalancer
