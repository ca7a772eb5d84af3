#pragma once

/**
 * @file select.hpp
 * @brief Column selection - project a CSV stream onto a set of columns
 */

#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "csvcols/status.hpp"

namespace csvcols {

/**
 * @brief Configuration options for a column selection
 */
struct SelectOptions {
    /// Columns to keep, in output order (or to drop when complement is set)
    std::vector<std::string> columns;

    /// Keep every header column except the listed ones, in header order
    bool complement = false;

    /// Field delimiter of the input
    char input_delimiter = ',';

    /// Field delimiter of the output, '\0' means same as input
    char output_delimiter = '\0';

    /// Load the whole table before writing anything (default: stream rows)
    bool in_memory = false;

    /// Decimal digits to round float cells to, negative disables rounding
    int round = -1;

    /// Drop rows whose first cell starts with '#'
    bool skip_comments = true;

    /// Output delimiter after applying the "same as input" default
    [[nodiscard]] char effective_output_delimiter() const noexcept {
        return output_delimiter == '\0' ? input_delimiter : output_delimiter;
    }
};

/**
 * @brief Project a CSV stream onto the configured columns
 *
 * Reads the header and rows from in, writes the projected table to out.
 * Row order is preserved.
 *
 * Example usage:
 * @code
 * csvcols::SelectOptions options;
 * options.columns = {"name", "score"};
 * options.round = 2;
 * auto status = csvcols::select_columns(std::cin, std::cout, options);
 * @endcode
 *
 * @return NotFound listing every requested column missing from the header
 */
[[nodiscard]] Status select_columns(std::istream& in, std::ostream& out,
                                    const SelectOptions& options);

}  // namespace csvcols
