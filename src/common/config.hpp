#pragma once

/**
 * @file config.hpp
 * @brief Configuration constants and option parsing for csvcols
 */

#include <string>
#include <string_view>
#include <vector>

#include "csvcols/status.hpp"

namespace csvcols {
namespace config {

// ─────────────────────────────────────────────────────────────────────────────
// CSV Dialect
// ─────────────────────────────────────────────────────────────────────────────

/// Default field delimiter
constexpr char kDefaultDelimiter = ',';

/// Quote character for fields holding delimiters, quotes or newlines
constexpr char kQuoteChar = '"';

/// Rows whose first cell starts with this character are comments
constexpr char kCommentMarker = '#';

/// Separator between names in a column list option
constexpr char kColumnListSeparator = ',';

// ─────────────────────────────────────────────────────────────────────────────
// Projection
// ─────────────────────────────────────────────────────────────────────────────

/// Rounding precision meaning "do not round"
constexpr int kNoRounding = -1;

// ─────────────────────────────────────────────────────────────────────────────
// Splitting
// ─────────────────────────────────────────────────────────────────────────────

/// Chunk width meaning "all splittable columns in one file"
constexpr int kNoChunking = 0;

/// Index of the key column carried into every split
constexpr size_t kKeyColumn = 0;

// ─────────────────────────────────────────────────────────────────────────────
// Typeset Conversion
// ─────────────────────────────────────────────────────────────────────────────

/// External converter program, looked up on PATH
constexpr const char* kLatexConverterProgram = "csv2latex";

/// Header rows repeated on each typeset page
constexpr const char* kLatexRepeatRows = "2";

/// Column alignment passed to the converter (right)
constexpr const char* kLatexAlignment = "r";

/// Column width factor passed to the converter
constexpr const char* kLatexColumnWidth = "0.75";

// ─────────────────────────────────────────────────────────────────────────────
// File Extensions
// ─────────────────────────────────────────────────────────────────────────────

/// Extension of split output files
constexpr const char* kCsvFileExtension = ".csv";

/// Extension of typeset renderings
constexpr const char* kTexFileExtension = ".tex";

// ─────────────────────────────────────────────────────────────────────────────
// Runtime Option Parsing
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Parse a boolean option value
 *
 * Accepts yes/true/t/y/1 and no/false/f/n/0, case-insensitively.
 */
[[nodiscard]] Status parse_bool(std::string_view text, bool* value);

/**
 * @brief Parse a single-character delimiter
 *
 * Besides a literal character, "\t" and "tab" both mean a tab.
 */
[[nodiscard]] Status parse_delimiter(std::string_view text, char* delimiter);

/**
 * @brief Parse a whole-string base-10 integer
 */
[[nodiscard]] Status parse_int(std::string_view text, int* value);

/**
 * @brief Split a comma-separated column list
 *
 * Surrounding whitespace is stripped first. A blank list has no names.
 */
[[nodiscard]] std::vector<std::string> split_column_list(std::string_view text);

}  // namespace config
}  // namespace csvcols
