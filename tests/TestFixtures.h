#pragma once
#include "TypedDataset.h"
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fixtures {

// 100 rows, A has 60 zeros and 40 ones; Y=1 for 30 rows of A=0 and 10 rows of A=1.
// Cells (A,Y): (0,0)=30 (0,1)=30 (1,0)=30 (1,1)=10. "id" is the original row number.
inline TypedDataset skewedBinary() {
    std::vector<double> id(100), a(100), y(100);
    for (size_t r = 0; r < 100; ++r) {
        id[r] = static_cast<double>(r);
        a[r] = r < 60 ? 0.0 : 1.0;
        y[r] = (r < 30 || (r >= 60 && r < 70)) ? 1.0 : 0.0;
    }
    return TypedDataset::fromColumns({makeNumericColumn("id", id),
                                      makeNumericColumn("A", a),
                                      makeNumericColumn("Y", y)});
}

// 240 rows with two binary attributes and a three-level label. a splits at row 140,
// b is 1 on every fourth row, grade cycles lo/mid/hi; every one of the 12 cells is populated.
inline TypedDataset twoAttributesThreeLabels() {
    static const char* const grades[] = {"lo", "mid", "hi"};
    std::vector<double> id(240), a(240), b(240);
    std::vector<std::string> grade(240);
    for (size_t r = 0; r < 240; ++r) {
        id[r] = static_cast<double>(r);
        a[r] = r < 140 ? 0.0 : 1.0;
        b[r] = r % 4 == 0 ? 1.0 : 0.0;
        grade[r] = grades[r % 3];
    }
    return TypedDataset::fromColumns({makeNumericColumn("id", id),
                                      makeNumericColumn("a", a),
                                      makeNumericColumn("b", b),
                                      makeCategoricalColumn("grade", grade)});
}

inline std::vector<double> numericColumn(const TypedDataset& data, const std::string& name) {
    const int idx = data.findColumnIndex(name);
    if (idx < 0) return {};
    return std::get<std::vector<double>>(data.columns()[static_cast<size_t>(idx)].values);
}

inline std::string tempPath(const std::string& name) {
    return (std::filesystem::temp_directory_path() / ("equilib_test_" + name)).string();
}

inline std::string writeTempFile(const std::string& name, const std::string& content) {
    const std::string path = tempPath(name);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    return path;
}

inline std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace fixtures
