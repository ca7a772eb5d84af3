#pragma once

/**
 * @file projector.hpp
 * @brief Projector interface
 */

#include <memory>

#include "common/status.hpp"
#include "common/types.hpp"
#include "csv/row_source.hpp"
#include "csvcols/select.hpp"

namespace csvcols {

/**
 * @brief Base class for column projectors
 *
 * A projector reads a header and data rows from a source and writes the
 * selected columns of every row, header included, to a sink. Float cells
 * of data rows are rounded when the options ask for it.
 */
class Projector {
public:
  explicit Projector(SelectOptions options) : options_(std::move(options)) {}
  virtual ~Projector() = default;

  [[nodiscard]] virtual Status project(RowSource &source, RowSink &sink) = 0;

  /// Strategy name for logging
  [[nodiscard]] virtual const char *name() const noexcept = 0;

  [[nodiscard]] const SelectOptions &options() const noexcept {
    return options_;
  }

protected:
  /**
   * @brief Validate the requested columns against the header and resolve
   * them (or their complement) to header positions
   */
  [[nodiscard]] Status resolve_columns(const Row &header,
                                       ColumnIndexMap *indices) const;

  /**
   * @brief Copy the cells at indices into out; cells past the end of a
   * short row come out empty
   */
  static void project_row(const Row &row, const ColumnIndexMap &indices,
                          Row *out);

  SelectOptions options_;
};

/**
 * @brief Create the projector the options ask for
 */
[[nodiscard]] std::unique_ptr<Projector>
make_projector(const SelectOptions &options);

/**
 * @brief Run a projector over an in-memory table
 */
[[nodiscard]] Status project_table(Projector &projector, const Table &input,
                                   Table *output);

} // namespace csvcols
