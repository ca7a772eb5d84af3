/**
 * @file bulk_projector.cpp
 * @brief Bulk projector implementation
 */

#include "execution/bulk_projector.hpp"

#include "common/logger.hpp"
#include "execution/rounding.hpp"

namespace csvcols {

Status BulkProjector::project(RowSource &source, RowSink &sink) {
  Table table;
  Row row;
  while (source.next(&row)) {
    table.push_back(std::move(row));
  }
  CSVCOLS_RETURN_IF_ERROR(source.status());

  if (table.empty()) {
    return Status::Ok();
  }
  LOG_DEBUG("Loaded {} rows into memory", table.size());

  ColumnIndexMap indices;
  CSVCOLS_RETURN_IF_ERROR(resolve_columns(table.front(), &indices));

  Table projected(table.size());
  for (size_t i = 0; i < table.size(); ++i) {
    project_row(table[i], indices, &projected[i]);
  }
  table.clear();

  // Header names are never rounded
  for (size_t i = 1; i < projected.size(); ++i) {
    round_row(&projected[i], options_.round);
  }

  for (const auto &out_row : projected) {
    CSVCOLS_RETURN_IF_ERROR(sink.write(out_row));
  }
  return sink.flush();
}

} // namespace csvcols
