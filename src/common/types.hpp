#pragma once

/**
 * @file types.hpp
 * @brief Common type definitions for csvcols
 */

#include <cstddef>
#include <string>
#include <vector>

namespace csvcols {

// ─────────────────────────────────────────────────────────────────────────────
// Tabular Data
// ─────────────────────────────────────────────────────────────────────────────

/// One CSV record, cells in column order
using Row = std::vector<std::string>;

/// A whole table; row 0 is the header when present
using Table = std::vector<Row>;

/// Ordered list of requested column names
using ColumnSet = std::vector<std::string>;

/// Header positions, one per resolved column, in output order
using ColumnIndexMap = std::vector<size_t>;

}  // namespace csvcols
