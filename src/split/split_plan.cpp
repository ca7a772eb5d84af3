/**
 * @file split_plan.cpp
 * @brief Split planning implementation
 */

#include "split/split_plan.hpp"

#include <algorithm>

#include "common/config.hpp"

namespace csvcols {

size_t effective_chunk_width(size_t splittable_columns, int chunk_width) noexcept {
    if (chunk_width <= config::kNoChunking) {
        return splittable_columns;
    }
    return static_cast<size_t>(chunk_width);
}

std::string split_suffix(size_t index, size_t split_count) {
    const size_t digits = split_count <= 1 ? 1 : std::to_string(split_count - 1).size();
    std::string suffix = std::to_string(index);
    if (suffix.size() < digits) {
        suffix.insert(0, digits - suffix.size(), '0');
    }
    return suffix;
}

std::vector<Split> plan_splits(size_t header_width, int chunk_width,
                               const std::filesystem::path& input) {
    std::vector<Split> splits;
    // Only the key column, nothing to split
    if (header_width <= 1) {
        return splits;
    }

    const size_t splittable = header_width - 1;
    const size_t width = effective_chunk_width(splittable, chunk_width);
    const size_t count = (splittable + width - 1) / width;

    std::filesystem::path base = input;
    base.replace_extension();

    splits.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        Split split;
        split.index = i;
        split.first = i * width + 1;
        split.last = std::min(split.first + width, header_width);
        split.path = base;
        split.path += split_suffix(i, count) + config::kCsvFileExtension;
        splits.push_back(std::move(split));
    }
    return splits;
}

std::filesystem::path tex_path_for(const std::filesystem::path& csv_path) {
    std::filesystem::path tex = csv_path;
    tex.replace_extension(config::kTexFileExtension);
    return tex;
}

}  // namespace csvcols
