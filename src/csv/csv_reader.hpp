#pragma once

/**
 * @file csv_reader.hpp
 * @brief Streaming CSV record reader
 */

#include <istream>

#include "common/config.hpp"
#include "csv/row_source.hpp"

namespace csvcols {

/**
 * @brief Reads delimited records from an input stream
 *
 * Fields may be quoted with '"'; inside quotes the delimiter and line breaks
 * are literal and '""' stands for one quote. Both "\n" and "\r\n" end a
 * record. Blank lines carry no record and are skipped.
 */
class CsvReader : public RowSource {
public:
    /**
     * @brief Construct a reader
     * @param in Input stream, must outlive the reader
     * @param delimiter Field delimiter
     * @param skip_comments Drop rows whose first cell starts with '#'
     */
    explicit CsvReader(std::istream& in,
                       char delimiter = config::kDefaultDelimiter,
                       bool skip_comments = false)
        : RowSource(skip_comments), in_(in), delimiter_(delimiter) {}

    [[nodiscard]] Status status() const override;

    /// Number of physical lines consumed so far
    [[nodiscard]] size_t line_number() const noexcept { return line_number_; }

protected:
    bool read_row(Row* row) override;

private:
    enum class State {
        kStartRecord,
        kStartField,
        kUnquoted,
        kQuoted,
        kQuoteInQuoted,
    };

    /// Consume the '\n' of a "\r\n" pair
    void skip_line_feed();

    std::istream& in_;
    char delimiter_;
    size_t line_number_ = 0;
};

}  // namespace csvcols
