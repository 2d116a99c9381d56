#pragma once

/**
 * @file format.hpp
 * @brief Single entry point for the fmt library.
 */

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <string>

namespace base {

/**
 * @brief Formats a sequence of extents the way shapes are printed in messages, e.g. `(2, 3)`.
 */
template <typename R>
inline std::string format_extents(const R& extents)
{
    return fmt::format("({})", fmt::join(extents, ", "));
}

} // namespace base
