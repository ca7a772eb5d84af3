#pragma once

/**
 * @file csv_writer.hpp
 * @brief CSV record writer
 */

#include <ostream>
#include <string_view>

#include "common/config.hpp"
#include "csv/row_source.hpp"

namespace csvcols {

/**
 * @brief Writes delimited records to an output stream
 *
 * Quotes a field only when it holds the delimiter, a quote or a line break.
 * Every record ends with a single '\n'.
 */
class CsvWriter : public RowSink {
public:
    explicit CsvWriter(std::ostream& out, char delimiter = config::kDefaultDelimiter)
        : out_(out), delimiter_(delimiter) {}

    [[nodiscard]] Status write(const Row& row) override;
    [[nodiscard]] Status flush() override;

    [[nodiscard]] size_t rows_written() const noexcept { return rows_written_; }

private:
    [[nodiscard]] bool needs_quoting(std::string_view field) const noexcept;
    void write_field(std::string_view field);

    std::ostream& out_;
    char delimiter_;
    size_t rows_written_ = 0;
};

}  // namespace csvcols
