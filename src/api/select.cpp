/**
 * @file select.cpp
 * @brief Column selection entry point
 */

#include "csvcols/select.hpp"

#include "common/logger.hpp"
#include "csv/csv_reader.hpp"
#include "csv/csv_writer.hpp"
#include "execution/projector.hpp"

namespace csvcols {

Status select_columns(std::istream &in, std::ostream &out,
                      const SelectOptions &options) {
  auto projector = make_projector(options);
  LOG_DEBUG("Selecting {} column(s){} with the {} projector",
            options.columns.size(), options.complement ? " (complement)" : "",
            projector->name());

  CsvReader reader(in, options.input_delimiter, options.skip_comments);
  CsvWriter writer(out, options.effective_output_delimiter());
  return projector->project(reader, writer);
}

} // namespace csvcols
