#include <gtest/gtest.h>

#include "Debiaser.h"
#include "EquilibExceptions.h"
#include "TestFixtures.h"

#include <algorithm>
#include <map>
#include <numeric>
#include <set>

namespace {

DebiasOptions options(std::optional<int> tolerance, int stop = -1, uint32_t seed = 1337) {
    DebiasOptions o;
    o.tolerance = tolerance;
    o.stop = stop;
    o.seed = seed;
    return o;
}

std::map<std::pair<double, double>, size_t> cellCounts(const TypedDataset& data) {
    const auto a = fixtures::numericColumn(data, "A");
    const auto y = fixtures::numericColumn(data, "Y");
    std::map<std::pair<double, double>, size_t> counts;
    for (size_t r = 0; r < a.size(); ++r) ++counts[{a[r], y[r]}];
    return counts;
}

} // namespace

TEST(Debiaser, BalancesToOneDecimal) {
    Debiaser debiaser(options(1));
    const TypedDataset out = debiaser.fitTransform(fixtures::skewedBinary(), {"A"}, "Y");

    EXPECT_EQ(out.rowCount(), 101u);
    EXPECT_EQ(debiaser.getIters(), 6u);

    const auto counts = cellCounts(out);
    EXPECT_EQ(counts.at({0.0, 0.0}), 35u);
    EXPECT_EQ(counts.at({0.0, 1.0}), 25u);
    EXPECT_EQ(counts.at({1.0, 0.0}), 25u);
    EXPECT_EQ(counts.at({1.0, 1.0}), 16u);

    ASSERT_EQ(debiaser.cells().size(), 4u);
    const std::vector<size_t> steps = {5, 5, 5, 6};
    for (size_t i = 0; i < 4; ++i) {
        const CellResult& cell = debiaser.cells()[i];
        EXPECT_EQ(cell.cell, i);
        EXPECT_EQ(cell.iterations, steps[i]);
        EXPECT_EQ(cell.disparityTrace.size(), cell.iterations + 1);
        EXPECT_DOUBLE_EQ(cell.disparityTrace.back(), 1.0);
    }
}

TEST(Debiaser, BalancesToTwoDecimals) {
    Debiaser debiaser(options(2));
    const TypedDataset out = debiaser.fitTransform(fixtures::skewedBinary(), {"A"}, "Y");

    EXPECT_EQ(out.rowCount(), 100u);
    EXPECT_EQ(debiaser.getIters(), 6u);
    const auto counts = cellCounts(out);
    EXPECT_EQ(counts.at({0.0, 0.0}), 36u);
    EXPECT_EQ(counts.at({0.0, 1.0}), 24u);
    EXPECT_EQ(counts.at({1.0, 0.0}), 24u);
    EXPECT_EQ(counts.at({1.0, 1.0}), 16u);
}

TEST(Debiaser, CellMetadataDescribesEachCell) {
    Debiaser debiaser(options(2));
    debiaser.fitTransform(fixtures::skewedBinary(), {"A"}, "Y");

    const CellResult& last = debiaser.cells().back();
    EXPECT_EQ(last.combinationText, "A=1");
    EXPECT_EQ(last.labelValue, "1");
    EXPECT_DOUBLE_EQ(last.expectedWeight, 0.4 * 0.4);
    EXPECT_DOUBLE_EQ(last.initialObservedWeight, 0.1);
    EXPECT_DOUBLE_EQ(last.finalObservedWeight, 0.16);
    EXPECT_EQ(last.originalSize, 10u);
    EXPECT_EQ(last.rows.size(), 16u);
}

TEST(Debiaser, ToleranceZeroRoundsToInteger) {
    Debiaser debiaser(options(0));
    debiaser.fitTransform(fixtures::skewedBinary(), {"A"}, "Y");

    EXPECT_EQ(debiaser.cells()[1].iterations, 0u);  // 0.8 rounds to 1
    EXPECT_EQ(debiaser.cells()[3].iterations, 1u);  // 1.6 -> 2, then 16/11 -> 1
}

TEST(Debiaser, ZeroStopReturnsPermutationOfInput) {
    Debiaser debiaser(options(1, 0));
    const TypedDataset out = debiaser.fitTransform(fixtures::skewedBinary(), {"A"}, "Y");

    EXPECT_EQ(out.rowCount(), 100u);
    EXPECT_EQ(debiaser.getIters(), 0u);
    auto ids = fixtures::numericColumn(out, "id");
    std::sort(ids.begin(), ids.end());
    std::vector<double> expected(100);
    std::iota(expected.begin(), expected.end(), 0.0);
    EXPECT_EQ(ids, expected);
}

TEST(Debiaser, StopCapsEveryCell) {
    Debiaser debiaser(options(1, 2));
    const TypedDataset out = debiaser.fitTransform(fixtures::skewedBinary(), {"A"}, "Y");

    EXPECT_EQ(debiaser.getIters(), 2u);
    for (const auto& cell : debiaser.cells()) EXPECT_EQ(cell.iterations, 2u);
    EXPECT_EQ(out.rowCount(), 32u + 28u + 28u + 12u);
}

TEST(Debiaser, OutputRowsComeFromTheirOwnCell) {
    const TypedDataset input = fixtures::skewedBinary();
    const TypedDataset out = debias(input, {"A"}, "Y", options(2)).dataset;

    const auto ids = fixtures::numericColumn(out, "id");
    const auto a = fixtures::numericColumn(out, "A");
    const auto y = fixtures::numericColumn(out, "Y");
    const auto inA = fixtures::numericColumn(input, "A");
    const auto inY = fixtures::numericColumn(input, "Y");
    for (size_t r = 0; r < ids.size(); ++r) {
        const size_t src = static_cast<size_t>(ids[r]);
        EXPECT_EQ(a[r], inA[src]);
        EXPECT_EQ(y[r], inY[src]);
    }
}

TEST(Debiaser, SameSeedSameOutput) {
    const TypedDataset input = fixtures::skewedBinary();
    const auto first = fixtures::numericColumn(debias(input, {"A"}, "Y", options(2, -1, 42)).dataset, "id");
    const auto second = fixtures::numericColumn(debias(input, {"A"}, "Y", options(2, -1, 42)).dataset, "id");
    EXPECT_EQ(first, second);
}

TEST(Debiaser, ThreadCountDoesNotChangeOutput) {
    const TypedDataset input = fixtures::skewedBinary();
    DebiasOptions single = options(2, -1, 7);
    single.threads = 1;
    DebiasOptions many = single;
    many.threads = 4;
    EXPECT_EQ(fixtures::numericColumn(debias(input, {"A"}, "Y", single).dataset, "id"),
              fixtures::numericColumn(debias(input, {"A"}, "Y", many).dataset, "id"));
}

TEST(Debiaser, OutputIsShuffled) {
    const auto ids = fixtures::numericColumn(debias(fixtures::skewedBinary(), {"A"}, "Y", options(1, 0)).dataset, "id");
    EXPECT_FALSE(std::is_sorted(ids.begin(), ids.end()));
}

TEST(Debiaser, NoProtectedAttributesLeavesRowsAlone) {
    Debiaser debiaser(options(std::nullopt));
    const TypedDataset out = debiaser.fitTransform(fixtures::skewedBinary(), {}, "Y");
    EXPECT_EQ(out.rowCount(), 100u);
    EXPECT_EQ(debiaser.getIters(), 0u);
    EXPECT_EQ(debiaser.cells().size(), 2u);
}

TEST(Debiaser, DisparitiesMatchCellTraces) {
    Debiaser debiaser(options(1));
    debiaser.fitTransform(fixtures::skewedBinary(), {"A"}, "Y");
    ASSERT_EQ(debiaser.disparities().size(), debiaser.cells().size());
    for (size_t i = 0; i < debiaser.cells().size(); ++i) {
        EXPECT_EQ(debiaser.disparities()[i], debiaser.cells()[i].disparityTrace);
    }
}

TEST(Debiaser, StateResetsBetweenRuns) {
    Debiaser debiaser(options(1));
    debiaser.fitTransform(fixtures::skewedBinary(), {"A"}, "Y");
    EXPECT_EQ(debiaser.getIters(), 6u);
    debiaser.fitTransform(fixtures::skewedBinary(), {}, "Y");
    EXPECT_EQ(debiaser.getIters(), 0u);
    EXPECT_EQ(debiaser.disparities().size(), 2u);
}

TEST(Debiaser, FailedRunKeepsPreviousState) {
    Debiaser debiaser(options(1));
    debiaser.fitTransform(fixtures::skewedBinary(), {"A"}, "Y");
    EXPECT_THROW(debiaser.fitTransform(fixtures::skewedBinary(), {"missing"}, "Y"), Equilib::SchemaError);
    EXPECT_EQ(debiaser.getIters(), 6u);
    EXPECT_EQ(debiaser.cells().size(), 4u);
}

TEST(Debiaser, AbsentCombinationIsDivisionByZero) {
    // b always equals a, so (0,1) and (1,0) never occur.
    const TypedDataset data = TypedDataset::fromColumns({
        makeNumericColumn("a", {0, 0, 1, 1, 0, 1, 0, 1}),
        makeNumericColumn("b", {0, 0, 1, 1, 0, 1, 0, 1}),
        makeNumericColumn("y", {0, 1, 0, 1, 0, 1, 1, 0}),
    });
    EXPECT_THROW(debias(data, {"a", "b"}, "y", options(2)), Equilib::DivisionByZeroError);
}

TEST(Debiaser, EmptyCellIsDivisionByZero) {
    // Every a=1 row has y=1.
    const TypedDataset data = TypedDataset::fromColumns({
        makeNumericColumn("a", {0, 0, 0, 1, 1, 1}),
        makeNumericColumn("y", {0, 1, 0, 1, 1, 1}),
    });
    EXPECT_THROW(debias(data, {"a"}, "y", options(2)), Equilib::DivisionByZeroError);
}

TEST(Debiaser, SchemaErrorsPropagate) {
    Debiaser debiaser(options(1));
    EXPECT_THROW(debiaser.fitTransform(fixtures::skewedBinary(), {"A"}, "nope"), Equilib::SchemaError);
    EXPECT_THROW(debiaser.fitTransform(fixtures::skewedBinary(), {"id"}, "Y"), Equilib::UnsupportedCardinalityError);
}

TEST(Debiaser, TwoAttributesAndThreeLabelsCoverEveryCell) {
    const TypedDataset input = fixtures::twoAttributesThreeLabels();
    const size_t n = input.rowCount();
    const int a = input.findColumnIndex("a");
    const int b = input.findColumnIndex("b");
    const int grade = input.findColumnIndex("grade");
    const auto keyOf = [&](const TypedDataset& data, size_t row) {
        return data.cellText(a, row) + "|" + data.cellText(b, row) + "|" + data.cellText(grade, row);
    };

    std::map<std::string, size_t> comboCounts;
    std::map<std::string, size_t> labelCounts;
    for (size_t r = 0; r < n; ++r) {
        ++comboCounts[input.cellText(a, r) + "|" + input.cellText(b, r)];
        ++labelCounts[input.cellText(grade, r)];
    }

    Debiaser debiaser(options(1, 15));
    const TypedDataset out = debiaser.fitTransform(input, {"a", "b"}, "grade");
    const auto& cells = debiaser.cells();
    ASSERT_EQ(cells.size(), 12u);

    const std::vector<std::vector<std::string>> combos = {{"0", "0"}, {"0", "1"}, {"1", "0"}, {"1", "1"}};
    const std::vector<std::string> labels = {"hi", "lo", "mid"};
    size_t expectedRows = 0;
    for (size_t id = 0; id < cells.size(); ++id) {
        const CellResult& cell = cells[id];
        const auto& combo = combos[id / 3];
        EXPECT_EQ(cell.cell, id);
        EXPECT_EQ(cell.combination, id / 3);
        EXPECT_EQ(cell.attributeValues, combo);
        EXPECT_EQ(cell.combinationText, "a=" + combo[0] + ", b=" + combo[1]);
        EXPECT_EQ(cell.labelValue, labels[id % 3]);
        EXPECT_LE(cell.iterations, 15u);
        EXPECT_EQ(cell.disparityTrace.size(), cell.iterations + 1);

        const double total = static_cast<double>(n);
        EXPECT_DOUBLE_EQ(cell.expectedWeight,
                         (static_cast<double>(comboCounts.at(combo[0] + "|" + combo[1])) / total) *
                             (static_cast<double>(labelCounts.at(cell.labelValue)) / total));

        const std::string key = combo[0] + "|" + combo[1] + "|" + cell.labelValue;
        for (size_t src : cell.rows) EXPECT_EQ(keyOf(input, src), key) << "cell " << id;
        expectedRows += cell.rows.size();
    }

    ASSERT_EQ(out.rowCount(), expectedRows);
    std::map<std::string, size_t> outCounts;
    const auto ids = fixtures::numericColumn(out, "id");
    for (size_t r = 0; r < out.rowCount(); ++r) {
        ++outCounts[keyOf(out, r)];
        EXPECT_EQ(keyOf(input, static_cast<size_t>(ids[r])), keyOf(out, r));
    }
    for (const auto& cell : cells) {
        EXPECT_EQ(outCounts[cell.attributeValues[0] + "|" + cell.attributeValues[1] + "|" + cell.labelValue],
                  cell.rows.size());
    }
}
