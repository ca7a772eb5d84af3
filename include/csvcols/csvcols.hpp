#pragma once

/**
 * @file csvcols.hpp
 * @brief Main include header for csvcols
 *
 * Include this single header to access the public API of csvcols.
 */

#include "csvcols/select.hpp"
#include "csvcols/split.hpp"
#include "csvcols/status.hpp"

namespace csvcols {

/**
 * @brief Get the version string of csvcols
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* version() noexcept {
    return "0.1.0";
}

}  // namespace csvcols
