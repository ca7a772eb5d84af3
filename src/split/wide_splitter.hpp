#pragma once

/**
 * @file wide_splitter.hpp
 * @brief Splits a wide CSV file into column groups
 */

#include <filesystem>
#include <vector>

#include "common/status.hpp"
#include "common/types.hpp"
#include "csvcols/split.hpp"
#include "split/converter.hpp"
#include "split/split_plan.hpp"

namespace csvcols {

/**
 * @brief Wide splitter
 *
 * Reads the whole input, drops comment rows, then writes one file per
 * split. When a converter is given, every split file is converted to a
 * sibling .tex file after all splits are written. Files already written
 * stay on disk when a later step fails.
 */
class WideSplitter {
public:
    /**
     * @param options Split configuration (options.tex is not consulted)
     * @param converter Optional converter, not owned
     */
    explicit WideSplitter(SplitOptions options, Converter* converter = nullptr)
        : options_(std::move(options)), converter_(converter) {}

    /**
     * @brief Run the split
     * @param written If not null, receives the CSV files written in order
     */
    [[nodiscard]] Status run(std::vector<std::filesystem::path>* written = nullptr);

    /**
     * @brief Read the input into a header and data rows, dropping comments
     */
    [[nodiscard]] Status read_table(Row* header, Table* rows) const;

    /**
     * @brief Write one split: key column plus the split's data columns
     *
     * The header's key cell is written as an empty placeholder.
     */
    [[nodiscard]] Status write_split(const Split& split, const Row& header,
                                     const Table& rows) const;

    /**
     * @brief Render one split file to its sibling .tex file
     */
    [[nodiscard]] Status convert_split(const Split& split) const;

private:
    SplitOptions options_;
    Converter* converter_;
};

}  // namespace csvcols
