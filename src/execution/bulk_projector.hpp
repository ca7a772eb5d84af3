#pragma once

/**
 * @file bulk_projector.hpp
 * @brief Whole-table projector
 */

#include "execution/projector.hpp"

namespace csvcols {

/**
 * @brief Bulk projector - loads the whole input before writing
 *
 * Memory grows with the input. Nothing is written until the whole input
 * has been read and resolved.
 */
class BulkProjector : public Projector {
public:
  using Projector::Projector;

  [[nodiscard]] Status project(RowSource &source, RowSink &sink) override;

  [[nodiscard]] const char *name() const noexcept override { return "bulk"; }
};

} // namespace csvcols
