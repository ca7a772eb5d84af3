/**
 * @file csv_reader.cpp
 * @brief CSV reader implementation
 */

#include "csv/csv_reader.hpp"

#include <string>

namespace csvcols {

Status CsvReader::status() const {
    if (in_.bad()) {
        return Status::IOError("failed to read csv input near line " +
                               std::to_string(line_number_));
    }
    return Status::Ok();
}

void CsvReader::skip_line_feed() {
    if (in_.peek() == '\n') {
        in_.get();
    }
}

bool CsvReader::read_row(Row* row) {
    row->clear();
    std::string field;
    State state = State::kStartRecord;

    const auto end_field = [&]() {
        row->push_back(std::move(field));
        field.clear();
    };

    char c;
    while (in_.get(c)) {
        const bool line_break = (c == '\n' || c == '\r');

        switch (state) {
            case State::kStartRecord:
                if (line_break) {
                    if (c == '\r') {
                        skip_line_feed();
                    }
                    ++line_number_;
                    continue;
                }
                [[fallthrough]];

            case State::kStartField:
                if (c == config::kQuoteChar) {
                    state = State::kQuoted;
                } else if (c == delimiter_) {
                    end_field();
                    state = State::kStartField;
                } else if (line_break) {
                    break;
                } else {
                    field += c;
                    state = State::kUnquoted;
                }
                continue;

            case State::kUnquoted:
                if (c == delimiter_) {
                    end_field();
                    state = State::kStartField;
                } else if (!line_break) {
                    field += c;
                }
                if (!line_break) {
                    continue;
                }
                break;

            case State::kQuoted:
                if (c == config::kQuoteChar) {
                    state = State::kQuoteInQuoted;
                } else {
                    if (c == '\n') {
                        ++line_number_;
                    }
                    field += c;
                }
                continue;

            case State::kQuoteInQuoted:
                if (c == config::kQuoteChar) {
                    field += c;
                    state = State::kQuoted;
                } else if (c == delimiter_) {
                    end_field();
                    state = State::kStartField;
                } else if (!line_break) {
                    // Text after a closing quote is kept verbatim
                    field += c;
                    state = State::kUnquoted;
                }
                if (!line_break) {
                    continue;
                }
                break;
        }

        // Only a line break outside quotes reaches this point
        if (c == '\r') {
            skip_line_feed();
        }
        ++line_number_;
        end_field();
        return true;
    }

    if (state == State::kStartRecord) {
        return false;
    }

    // Last record without a trailing newline (or an unterminated quote)
    ++line_number_;
    end_field();
    return true;
}

}  // namespace csvcols
