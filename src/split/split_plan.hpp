#pragma once

/**
 * @file split_plan.hpp
 * @brief Partition of a header's data columns into output files
 */

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace csvcols {

/**
 * @brief One output file of a wide split
 *
 * Covers data columns [first, last) of the input; the key column is
 * carried in addition.
 */
struct Split {
    size_t index = 0;
    size_t first = 0;
    size_t last = 0;
    std::filesystem::path path;

    [[nodiscard]] size_t width() const noexcept { return last - first; }
};

/**
 * @brief Data columns per split after applying the "all columns" default
 */
[[nodiscard]] size_t effective_chunk_width(size_t splittable_columns, int chunk_width) noexcept;

/**
 * @brief Zero-padded split number, as wide as the largest index needs
 *
 * With 10 splits the suffixes are "0".."9", with 11 they are "00".."10".
 */
[[nodiscard]] std::string split_suffix(size_t index, size_t split_count);

/**
 * @brief Compute the splits for a header of the given width
 * @param header_width Number of header cells, key column included
 * @param chunk_width Data columns per split, <= 0 means all in one
 * @param input Path of the input file; outputs are its siblings
 */
[[nodiscard]] std::vector<Split> plan_splits(size_t header_width, int chunk_width,
                                             const std::filesystem::path& input);

/**
 * @brief Sibling path with the typeset extension (base0.csv -> base0.tex)
 */
[[nodiscard]] std::filesystem::path tex_path_for(const std::filesystem::path& csv_path);

}  // namespace csvcols
