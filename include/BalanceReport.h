#pragma once
#include "Debiaser.h"
#include "StopSweep.h"
#include <ostream>
#include <string>
#include <vector>

class BalanceReport {
public:
    static void printCellTable(const std::vector<CellResult>& cells, const std::string& labelName, std::ostream& out);
    static void printSweepTable(const std::vector<SweepPoint>& points, std::ostream& out);

    /**
     * @brief Writes every trace in long format: cell,combination,label,step,disparity.
     * @throws Equilib::IOException when the file cannot be written.
     */
    static void writeTraceCsv(const std::string& path, const std::vector<CellResult>& cells, char delimiter = ',');
};
