/**
 * @file projector.cpp
 * @brief Projector shared logic and factory
 */

#include "execution/projector.hpp"

#include "common/logger.hpp"
#include "execution/bulk_projector.hpp"
#include "execution/streaming_projector.hpp"
#include "schema/header.hpp"

namespace csvcols {

Status Projector::resolve_columns(const Row &header_row,
                                  ColumnIndexMap *indices) const {
  const Header header(header_row);
  Status status;
  if (!options_.complement && options_.columns.empty()) {
    status = Status::InvalidArgument("no columns selected");
  } else {
    status = options_.complement ? header.complement(options_.columns, indices)
                                 : header.resolve(options_.columns, indices);
  }
  if (!status.ok()) {
    LOG_ERROR("Column resolution failed: {}", status.to_string());
    return status;
  }

  LOG_DEBUG("{} projector resolved {} of {} columns{}", name(),
            indices->size(), header.column_count(),
            options_.complement ? " (complement)" : "");
  return Status::Ok();
}

void Projector::project_row(const Row &row, const ColumnIndexMap &indices,
                            Row *out) {
  out->clear();
  out->reserve(indices.size());
  for (size_t idx : indices) {
    if (idx < row.size()) {
      out->push_back(row[idx]);
    } else {
      out->emplace_back();
    }
  }
}

std::unique_ptr<Projector> make_projector(const SelectOptions &options) {
  if (options.in_memory) {
    return std::make_unique<BulkProjector>(options);
  }
  return std::make_unique<StreamingProjector>(options);
}

Status project_table(Projector &projector, const Table &input, Table *output) {
  output->clear();
  TableSource source(input, projector.options().skip_comments);
  TableSink sink(output);
  return projector.project(source, sink);
}

} // namespace csvcols
