#pragma once

/**
 * @file split.hpp
 * @brief Wide split - break a wide CSV file into narrower files
 */

#include <string>
#include <vector>

#include "csvcols/status.hpp"

namespace csvcols {

/**
 * @brief Configuration options for a wide split
 */
struct SplitOptions {
    /// CSV file to split
    std::string file;

    /// Data columns per output file, <= 0 keeps all of them in one file
    int ncols = 0;

    /// Field delimiter of the input and of every output file
    char delimiter = ',';

    /// Also render every output file to .tex with csv2latex
    bool tex = false;
};

/**
 * @brief Split a wide CSV file into column groups
 *
 * Comment rows are dropped. Every output file <base><index>.csv carries the
 * first (key) column and up to ncols following columns, header included.
 *
 * @param options Split configuration
 * @param outputs If not null, receives the paths of the CSV files written
 * @return IOError if the input cannot be read or an output cannot be
 *         written; NotSupported or Aborted if the typeset step fails
 */
[[nodiscard]] Status split_wide(const SplitOptions& options,
                                std::vector<std::string>* outputs = nullptr);

}  // namespace csvcols
