#pragma once

/**
 * @file header.hpp
 * @brief Table header - column names and column resolution
 */

#include <string>
#include <vector>

#include "common/status.hpp"
#include "common/types.hpp"

namespace csvcols {

/**
 * @brief Header row of a table
 *
 * Resolves requested column names to header positions. Lookups are by
 * name; when a name occurs more than once the first occurrence wins.
 */
class Header {
public:
    Header() = default;
    explicit Header(Row names);

    [[nodiscard]] const Row& names() const noexcept { return names_; }

    [[nodiscard]] size_t column_count() const noexcept { return names_.size(); }

    [[nodiscard]] const std::string& name(size_t idx) const { return names_.at(idx); }

    /// Get column index by name, returns -1 if not found
    [[nodiscard]] int index_of(const std::string& name) const;

    /**
     * @brief Requested names that are not in the header, in requested order
     */
    [[nodiscard]] ColumnSet missing_columns(const ColumnSet& requested) const;

    /**
     * @brief Map requested names to header positions, in requested order
     * @param requested Column names to select
     * @param indices Output index map
     * @return NotFound listing every missing name
     */
    [[nodiscard]] Status resolve(const ColumnSet& requested,
                                 ColumnIndexMap* indices) const;

    /**
     * @brief Positions of every column not requested, in header order
     * @return NotFound listing every missing name
     */
    [[nodiscard]] Status complement(const ColumnSet& requested,
                                    ColumnIndexMap* indices) const;

private:
    [[nodiscard]] Status check_columns(const ColumnSet& requested) const;

    Row names_;
};

/**
 * @brief Format names as "[a, b, c]" for diagnostics
 */
[[nodiscard]] std::string format_column_list(const ColumnSet& names);

}  // namespace csvcols
