#include "StopSweep.h"
#include "EquilibExceptions.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace StopSweep {

double maxResidualDisparity(const std::vector<CellResult>& cells) {
    double worst = 0.0;
    for (const auto& cell : cells) {
        if (cell.disparityTrace.empty()) continue;
        worst = std::max(worst, std::abs(cell.disparityTrace.back() - 1.0));
    }
    return worst;
}

std::vector<SweepPoint> sweepStops(const TypedDataset& data,
                                   const std::vector<std::string>& protectedAttributes,
                                   const std::string& labelName,
                                   const DebiasOptions& baseOptions,
                                   int step,
                                   int maxStop) {
    if (step <= 0) {
        throw Equilib::ConfigurationException("sweep step must be > 0, got " + std::to_string(step));
    }

    if (maxStop < 0) {
        Debiaser probe(baseOptions);
        probe.fitTransform(data, protectedAttributes, labelName);
        const size_t iters = probe.getIters();
        maxStop = iters > static_cast<size_t>(std::numeric_limits<int>::max())
            ? std::numeric_limits<int>::max()
            : static_cast<int>(iters);
        std::cout << "[Equilib][Sweep] Unbounded run needed " << iters << " steps; sweeping 0.." << maxStop << "\n";
    }

    std::vector<SweepPoint> points;
    points.reserve(static_cast<size_t>(maxStop / step) + 1);
    for (long long stop = 0; stop <= maxStop; stop += step) {
        DebiasOptions options = baseOptions;
        options.stop = static_cast<int>(stop);
        options.debug = false;

        Debiaser run(options);
        const TypedDataset balanced = run.fitTransform(data, protectedAttributes, labelName);

        SweepPoint point;
        point.stop = options.stop;
        point.maxIterations = run.getIters();
        point.rowCount = balanced.rowCount();
        point.maxResidualDisparity = maxResidualDisparity(run.cells());
        points.push_back(point);
    }
    return points;
}

} // namespace StopSweep
