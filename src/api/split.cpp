/**
 * @file split.cpp
 * @brief Wide split entry point
 */

#include "csvcols/split.hpp"

#include <memory>

#include "common/status.hpp"
#include "split/latex_converter.hpp"
#include "split/wide_splitter.hpp"

namespace csvcols {

Status split_wide(const SplitOptions &options,
                  std::vector<std::string> *outputs) {
  std::unique_ptr<LatexConverter> converter;
  if (options.tex) {
    CSVCOLS_RETURN_IF_ERROR(
        LatexConverter::create(options.delimiter, &converter));
  }

  std::vector<std::filesystem::path> written;
  WideSplitter splitter(options, converter.get());
  Status status = splitter.run(&written);

  if (outputs != nullptr) {
    for (const auto &path : written) {
      outputs->push_back(path.string());
    }
  }
  return status;
}

} // namespace csvcols
