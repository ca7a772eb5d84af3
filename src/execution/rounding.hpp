#pragma once

/**
 * @file rounding.hpp
 * @brief Rounding of numeric cell values
 */

#include <optional>
#include <string>
#include <string_view>

#include "common/types.hpp"

namespace csvcols {

/**
 * @brief True if text is an integer literal
 *
 * Surrounding whitespace and a leading sign are allowed, as are single '_'
 * separators between digits.
 */
[[nodiscard]] bool is_integer_literal(std::string_view text) noexcept;

/**
 * @brief Parse a floating-point literal
 *
 * Accepts decimal and exponent forms, inf, infinity and nan (any case), with
 * optional surrounding whitespace and sign. The whole text must be consumed.
 */
[[nodiscard]] std::optional<double> parse_float_literal(std::string_view text);

/**
 * @brief Round to a number of decimal digits
 *
 * Rounds half to even on the exact binary value.
 */
[[nodiscard]] double round_to_digits(double value, int digits);

/**
 * @brief Shortest text that reads back as the same double
 *
 * Uses fixed notation for decimal exponents in [-4, 16) and always keeps a
 * fractional part there ("2.0"); scientific notation otherwise ("1e+16").
 */
[[nodiscard]] std::string format_double(double value);

/**
 * @brief Round one cell
 *
 * Integer literals and non-numeric text are returned unchanged; float
 * literals are rounded to precision digits. A negative precision disables
 * rounding.
 */
[[nodiscard]] std::string round_cell(const std::string& cell, int precision);

/**
 * @brief Round every cell of a row in place
 */
void round_row(Row* row, int precision);

}  // namespace csvcols
