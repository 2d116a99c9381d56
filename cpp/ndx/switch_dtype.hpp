#pragma once

#include "dtype.hpp"
#include "exceptions.hpp"

#include <string>
#include <string_view>

namespace ndx {

template <typename F>
auto switch_dtype(dtype t, F f)
{
    switch (t) {
    case dtype::boolean:
        return f.template operator()<bool>();
    case dtype::int8:
        return f.template operator()<int8_t>();
    case dtype::int16:
        return f.template operator()<int16_t>();
    case dtype::int32:
        return f.template operator()<int32_t>();
    case dtype::int64:
        return f.template operator()<int64_t>();
    case dtype::uint8:
        return f.template operator()<uint8_t>();
    case dtype::uint16:
        return f.template operator()<uint16_t>();
    case dtype::uint32:
        return f.template operator()<uint32_t>();
    case dtype::uint64:
        return f.template operator()<uint64_t>();
    case dtype::float32:
        return f.template operator()<float>();
    case dtype::float64:
        return f.template operator()<double>();
    case dtype::complex64:
        return f.template operator()<complex64_t>();
    case dtype::complex128:
        return f.template operator()<complex128_t>();
    default:
        throw unsupported_dtype_error(std::to_string(static_cast<int>(t)));
    }
}

/**
 * @brief Same as `switch_dtype` restricted to the real (non-complex) dtypes.
 * @throws unsupported_dtype_error for complex dtypes, naming `operation`.
 */
template <typename F>
auto switch_real_dtype(dtype t, std::string_view operation, F f)
{
    switch (t) {
    case dtype::boolean:
        return f.template operator()<bool>();
    case dtype::int8:
        return f.template operator()<int8_t>();
    case dtype::int16:
        return f.template operator()<int16_t>();
    case dtype::int32:
        return f.template operator()<int32_t>();
    case dtype::int64:
        return f.template operator()<int64_t>();
    case dtype::uint8:
        return f.template operator()<uint8_t>();
    case dtype::uint16:
        return f.template operator()<uint16_t>();
    case dtype::uint32:
        return f.template operator()<uint32_t>();
    case dtype::uint64:
        return f.template operator()<uint64_t>();
    case dtype::float32:
        return f.template operator()<float>();
    case dtype::float64:
        return f.template operator()<double>();
    case dtype::complex64:
    case dtype::complex128:
        throw unsupported_dtype_error(dtype_to_str(t), operation);
    default:
        throw unsupported_dtype_error(std::to_string(static_cast<int>(t)));
    }
}

} // namespace ndx
