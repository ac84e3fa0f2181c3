#include "BalanceReport.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "EquilibExceptions.h"
#include <algorithm>
#include <fstream>
#include <iomanip>

void BalanceReport::printCellTable(const std::vector<CellResult>& cells, const std::string& labelName, std::ostream& out) {
    size_t maxComboLen = 15;
    size_t maxLabelLen = std::max<size_t>(8, labelName.size());
    for (const auto& cell : cells) {
        maxComboLen = std::max(maxComboLen, cell.combinationText.size());
        maxLabelLen = std::max(maxLabelLen, cell.labelValue.size());
    }

    const int wc = static_cast<int>(maxComboLen) + 2;
    const int wl = static_cast<int>(maxLabelLen) + 2;
    const std::string rule(static_cast<size_t>(wc + wl) + 12 * 7, '=');
    const std::ios::fmtflags oldFlags = out.flags();
    const std::streamsize oldPrecision = out.precision();

    out << "\n" << rule << "\n";
    out << std::left
        << std::setw(wc) << "Combination"
        << std::setw(wl) << labelName
        << std::setw(12) << "w_exp"
        << std::setw(12) << "w_obs(in)"
        << std::setw(12) << "w_obs(out)"
        << std::setw(12) << "Rows(in)"
        << std::setw(12) << "Rows(out)"
        << std::setw(12) << "Steps"
        << std::setw(12) << "Disparity" << "\n";
    out << std::string(rule.size(), '-') << "\n";

    for (const auto& cell : cells) {
        out << std::left << std::setw(wc) << cell.combinationText
            << std::setw(wl) << cell.labelValue
            << std::right << std::fixed << std::setprecision(4)
            << std::setw(10) << cell.expectedWeight << "  "
            << std::setw(10) << cell.initialObservedWeight << "  "
            << std::setw(10) << cell.finalObservedWeight << "  "
            << std::setw(10) << cell.originalSize << "  "
            << std::setw(10) << cell.rows.size() << "  "
            << std::setw(10) << cell.iterations << "  "
            << std::setw(10) << (cell.disparityTrace.empty() ? 0.0 : cell.disparityTrace.back()) << "\n";
    }
    out << rule << "\n";
    out.flags(oldFlags);
    out.precision(oldPrecision);
}

void BalanceReport::printSweepTable(const std::vector<SweepPoint>& points, std::ostream& out) {
    const std::ios::fmtflags oldFlags = out.flags();
    const std::streamsize oldPrecision = out.precision();
    out << "\n=================== STOP SWEEP ===================\n";
    out << std::left
        << std::setw(10) << "Stop"
        << std::setw(12) << "MaxSteps"
        << std::setw(12) << "Rows"
        << "Residual\n";
    out << "--------------------------------------------------\n";
    for (const auto& p : points) {
        out << std::left << std::setw(10) << p.stop
            << std::setw(12) << p.maxIterations
            << std::setw(12) << p.rowCount
            << std::fixed << std::setprecision(6) << p.maxResidualDisparity << "\n";
    }
    out << "==================================================\n";
    out.flags(oldFlags);
    out.precision(oldPrecision);
}

void BalanceReport::writeTraceCsv(const std::string& path, const std::vector<CellResult>& cells, char delimiter) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw Equilib::IOException("Could not open trace file for writing: " + path);

    CSVUtils::writeCSVRow(out, {"cell", "combination", "label", "step", "disparity"}, delimiter);
    for (const auto& cell : cells) {
        for (size_t step = 0; step < cell.disparityTrace.size(); ++step) {
            CSVUtils::writeCSVRow(out,
                                  {std::to_string(cell.cell),
                                   cell.combinationText,
                                   cell.labelValue,
                                   std::to_string(step),
                                   CommonUtils::formatDouble(cell.disparityTrace[step])},
                                  delimiter);
        }
    }

    out.flush();
    if (!out.good()) throw Equilib::IOException("Failed while writing trace file: " + path);
}
