/**
 * @file streaming_projector.cpp
 * @brief Streaming projector implementation
 */

#include "execution/streaming_projector.hpp"

#include "execution/rounding.hpp"

namespace csvcols {

Status StreamingProjector::project(RowSource &source, RowSink &sink) {
  Row row;
  if (!source.next(&row)) {
    return source.status();
  }

  ColumnIndexMap indices;
  CSVCOLS_RETURN_IF_ERROR(resolve_columns(row, &indices));

  Row projected;
  project_row(row, indices, &projected);
  CSVCOLS_RETURN_IF_ERROR(sink.write(projected));

  while (source.next(&row)) {
    project_row(row, indices, &projected);
    round_row(&projected, options_.round);
    CSVCOLS_RETURN_IF_ERROR(sink.write(projected));
  }
  CSVCOLS_RETURN_IF_ERROR(source.status());

  return sink.flush();
}

} // namespace csvcols
