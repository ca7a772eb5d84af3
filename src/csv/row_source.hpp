#pragma once

/**
 * @file row_source.hpp
 * @brief Row source and sink interfaces
 *
 * Projectors and the wide splitter read rows from a RowSource and write
 * rows to a RowSink, so the same code runs over CSV streams and over
 * in-memory tables.
 */

#include <cstddef>

#include "common/status.hpp"
#include "common/types.hpp"

namespace csvcols {

/**
 * @brief Returns true if the row is a comment row (first cell starts with '#')
 */
[[nodiscard]] bool is_comment_row(const Row& row) noexcept;

/**
 * @brief Pull-based producer of rows
 */
class RowSource {
public:
    explicit RowSource(bool skip_comments = false) : skip_comments_(skip_comments) {}
    virtual ~RowSource() = default;

    /**
     * @brief Fetch the next row, skipping comment rows if enabled
     * @return false once the source is exhausted or has failed
     */
    bool next(Row* row);

    /**
     * @brief Error that stopped the source, Ok if it simply ran out
     */
    [[nodiscard]] virtual Status status() const { return Status::Ok(); }

    [[nodiscard]] size_t comments_skipped() const noexcept { return comments_skipped_; }

protected:
    virtual bool read_row(Row* row) = 0;

private:
    bool skip_comments_;
    size_t comments_skipped_ = 0;
};

/**
 * @brief Push-based consumer of rows
 */
class RowSink {
public:
    virtual ~RowSink() = default;

    [[nodiscard]] virtual Status write(const Row& row) = 0;
    [[nodiscard]] virtual Status flush() { return Status::Ok(); }
};

/**
 * @brief RowSource over an in-memory table
 */
class TableSource : public RowSource {
public:
    explicit TableSource(const Table& table, bool skip_comments = false)
        : RowSource(skip_comments), table_(table) {}

protected:
    bool read_row(Row* row) override;

private:
    const Table& table_;
    size_t position_ = 0;
};

/**
 * @brief RowSink appending to an in-memory table
 */
class TableSink : public RowSink {
public:
    explicit TableSink(Table* table) : table_(table) {}

    [[nodiscard]] Status write(const Row& row) override;

private:
    Table* table_;
};

}  // namespace csvcols
