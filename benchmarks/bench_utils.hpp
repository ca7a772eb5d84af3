#pragma once

#include <cstdint>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace csvcols::bench {

inline std::string column_name(int64_t index) {
    return "c" + std::to_string(index);
}

/// Builds a CSV table with a key column followed by float columns
inline std::string make_table(int64_t rows, int64_t columns, uint64_t seed = 42) {
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> dist(-1000.0, 1000.0);

    std::ostringstream out;
    out << "key";
    for (int64_t c = 0; c < columns; ++c) {
        out << ',' << column_name(c);
    }
    out << '\n';

    out.precision(17);
    for (int64_t r = 0; r < rows; ++r) {
        out << "row" << r;
        for (int64_t c = 0; c < columns; ++c) {
            out << ',' << dist(rng);
        }
        out << '\n';
    }
    return out.str();
}

/// Every other column of a table built by make_table
inline std::vector<std::string> every_other_column(int64_t columns) {
    std::vector<std::string> names{"key"};
    for (int64_t c = 0; c < columns; c += 2) {
        names.push_back(column_name(c));
    }
    return names;
}

}  // namespace csvcols::bench
