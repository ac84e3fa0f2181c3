#pragma once
#include "Debiaser.h"
#include <string>
#include <vector>

struct SweepPoint {
    int stop = 0;
    size_t maxIterations = 0;
    size_t rowCount = 0;
    // Largest |final disparity - 1| over all cells.
    double maxResidualDisparity = 0.0;
};

namespace StopSweep {

double maxResidualDisparity(const std::vector<CellResult>& cells);

/**
 * @brief Re-runs the debiaser with stop = 0, step, 2*step, ... up to maxStop.
 * @param maxStop Upper bound; negative => taken from one run with baseOptions unchanged.
 * @throws Equilib::ConfigurationException when step is not positive.
 */
std::vector<SweepPoint> sweepStops(const TypedDataset& data,
                                   const std::vector<std::string>& protectedAttributes,
                                   const std::string& labelName,
                                   const DebiasOptions& baseOptions,
                                   int step,
                                   int maxStop = -1);

} // namespace StopSweep
