#pragma once

/**
 * @file macros.hpp
 * @brief Utility macros for csvcols
 */

namespace csvcols {

/**
 * @brief Disable copy constructor and assignment
 */
#define CSVCOLS_DISALLOW_COPY(ClassName)           \
    ClassName(const ClassName&) = delete;          \
    ClassName& operator=(const ClassName&) = delete

/**
 * @brief Disable move constructor and assignment
 */
#define CSVCOLS_DISALLOW_MOVE(ClassName)           \
    ClassName(ClassName&&) = delete;               \
    ClassName& operator=(ClassName&&) = delete

/**
 * @brief Disable copy and move
 */
#define CSVCOLS_DISALLOW_COPY_AND_MOVE(ClassName)  \
    CSVCOLS_DISALLOW_COPY(ClassName);              \
    CSVCOLS_DISALLOW_MOVE(ClassName)

}  // namespace csvcols
