#pragma once

/**
 * @file converter.hpp
 * @brief Converter interface for typeset renderings of split files
 */

#include <filesystem>
#include <string>

#include "common/status.hpp"

namespace csvcols {

/**
 * @brief Renders a CSV file into another format
 */
class Converter {
public:
    virtual ~Converter() = default;

    /**
     * @brief Convert one file
     * @param input CSV file to convert
     * @param output Receives the rendered bytes
     */
    [[nodiscard]] virtual Status convert(const std::filesystem::path& input,
                                         std::string* output) = 0;
};

}  // namespace csvcols
