/**
 * @file row_source.cpp
 * @brief Row source and sink implementation
 */

#include "csv/row_source.hpp"

#include "common/config.hpp"
#include "common/logger.hpp"

namespace csvcols {

bool is_comment_row(const Row& row) noexcept {
    return !row.empty() && !row.front().empty() &&
           row.front().front() == config::kCommentMarker;
}

bool RowSource::next(Row* row) {
    while (read_row(row)) {
        if (skip_comments_ && is_comment_row(*row)) {
            ++comments_skipped_;
            LOG_TRACE("Skipping comment row: {}", row->front());
            continue;
        }
        return true;
    }
    return false;
}

bool TableSource::read_row(Row* row) {
    if (position_ >= table_.size()) {
        return false;
    }
    *row = table_[position_++];
    return true;
}

Status TableSink::write(const Row& row) {
    table_->push_back(row);
    return Status::Ok();
}

}  // namespace csvcols
