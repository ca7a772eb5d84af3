#pragma once

/**
 * @file streaming_projector.hpp
 * @brief Row-by-row projector
 */

#include "execution/projector.hpp"

namespace csvcols {

/**
 * @brief Streaming projector - holds one row at a time
 *
 * Columns are resolved from the first row; every following row is
 * projected and written before the next one is read.
 */
class StreamingProjector : public Projector {
public:
  using Projector::Projector;

  [[nodiscard]] Status project(RowSource &source, RowSink &sink) override;

  [[nodiscard]] const char *name() const noexcept override {
    return "streaming";
  }
};

} // namespace csvcols
