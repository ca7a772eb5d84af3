/**
 * @file csv_writer.cpp
 * @brief CSV writer implementation
 */

#include "csv/csv_writer.hpp"

namespace csvcols {

bool CsvWriter::needs_quoting(std::string_view field) const noexcept {
    for (char c : field) {
        if (c == delimiter_ || c == config::kQuoteChar || c == '\n' || c == '\r') {
            return true;
        }
    }
    return false;
}

void CsvWriter::write_field(std::string_view field) {
    if (!needs_quoting(field)) {
        out_ << field;
        return;
    }

    out_ << config::kQuoteChar;
    for (char c : field) {
        if (c == config::kQuoteChar) {
            out_ << config::kQuoteChar;
        }
        out_ << c;
    }
    out_ << config::kQuoteChar;
}

Status CsvWriter::write(const Row& row) {
    // A lone empty cell would otherwise read back as a blank line
    if (row.size() == 1 && row.front().empty()) {
        out_ << config::kQuoteChar << config::kQuoteChar;
    } else {
        for (size_t i = 0; i < row.size(); ++i) {
            if (i > 0) {
                out_ << delimiter_;
            }
            write_field(row[i]);
        }
    }
    out_ << '\n';

    if (!out_) {
        return Status::IOError("failed to write csv record " +
                               std::to_string(rows_written_ + 1));
    }
    ++rows_written_;
    return Status::Ok();
}

Status CsvWriter::flush() {
    out_.flush();
    if (!out_) {
        return Status::IOError("failed to flush csv output");
    }
    return Status::Ok();
}

}  // namespace csvcols
