#pragma once

/**
 * @file format.hpp
 * @brief fmt formatters for `dtype` and `array`.
 */

#include "array.hpp"

#include <base/format.hpp>

#include <string_view>

template <>
struct fmt::formatter<ndx::dtype> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(ndx::dtype t, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(ndx::dtype_to_str(t), ctx);
    }
};

template <>
struct fmt::formatter<ndx::array> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(const ndx::array& a, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(ndx::to_string(a), ctx);
    }
};
