#pragma once

/**
 * @file dtype.hpp
 * @brief Definition of the `dtype` enum and related utilities.
 */

#include <complex>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace ndx {

enum class dtype : uint8_t
{
    boolean,
    int8,
    int16,
    int32,
    int64,
    uint8,
    uint16,
    uint32,
    uint64,
    float32,
    float64,
    complex64,
    complex128
};

using complex64_t = std::complex<float>;
using complex128_t = std::complex<double>;

std::string_view dtype_to_str(dtype d);

/**
 * @brief Parses a dtype name as returned by `dtype_to_str`.
 * @throws unsupported_dtype_error if the name is unknown.
 */
dtype dtype_from_str(std::string_view s);

//////////////
/// dtype_enum
//////////////
template <typename T>
struct dtype_enum;

template <>
struct dtype_enum<bool> {
    constexpr static auto value = dtype::boolean;
};

template <>
struct dtype_enum<int8_t> {
    constexpr static auto value = dtype::int8;
};

template <>
struct dtype_enum<int16_t> {
    constexpr static auto value = dtype::int16;
};

template <>
struct dtype_enum<int32_t> {
    constexpr static auto value = dtype::int32;
};

template <>
struct dtype_enum<int64_t> {
    constexpr static auto value = dtype::int64;
};

template <>
struct dtype_enum<uint8_t> {
    constexpr static auto value = dtype::uint8;
};

template <>
struct dtype_enum<uint16_t> {
    constexpr static auto value = dtype::uint16;
};

template <>
struct dtype_enum<uint32_t> {
    constexpr static auto value = dtype::uint32;
};

template <>
struct dtype_enum<uint64_t> {
    constexpr static auto value = dtype::uint64;
};

template <>
struct dtype_enum<float> {
    constexpr static auto value = dtype::float32;
};

template <>
struct dtype_enum<double> {
    constexpr static auto value = dtype::float64;
};

template <>
struct dtype_enum<complex64_t> {
    constexpr static auto value = dtype::complex64;
};

template <>
struct dtype_enum<complex128_t> {
    constexpr static auto value = dtype::complex128;
};

template <typename T>
constexpr auto dtype_enum_v = dtype_enum<std::remove_cvref_t<T>>::value;

//////////////
/// dtype_type
//////////////
template <dtype t>
struct dtype_type;

template <>
struct dtype_type<dtype::boolean> {
    using type = bool;
};

template <>
struct dtype_type<dtype::int8> {
    using type = int8_t;
};

template <>
struct dtype_type<dtype::int16> {
    using type = int16_t;
};

template <>
struct dtype_type<dtype::int32> {
    using type = int32_t;
};

template <>
struct dtype_type<dtype::int64> {
    using type = int64_t;
};

template <>
struct dtype_type<dtype::uint8> {
    using type = uint8_t;
};

template <>
struct dtype_type<dtype::uint16> {
    using type = uint16_t;
};

template <>
struct dtype_type<dtype::uint32> {
    using type = uint32_t;
};

template <>
struct dtype_type<dtype::uint64> {
    using type = uint64_t;
};

template <>
struct dtype_type<dtype::float32> {
    using type = float;
};

template <>
struct dtype_type<dtype::float64> {
    using type = double;
};

template <>
struct dtype_type<dtype::complex64> {
    using type = complex64_t;
};

template <>
struct dtype_type<dtype::complex128> {
    using type = complex128_t;
};

template <dtype t>
using dtype_type_t = typename dtype_type<t>::type;

/**
 * @brief Width in bytes of a single element of the given dtype.
 */
constexpr std::size_t dtype_bytes(dtype t) noexcept
{
    switch (t) {
    case dtype::boolean:
    case dtype::int8:
    case dtype::uint8:
        return 1;
    case dtype::int16:
    case dtype::uint16:
        return 2;
    case dtype::int32:
    case dtype::uint32:
    case dtype::float32:
        return 4;
    case dtype::int64:
    case dtype::uint64:
    case dtype::float64:
    case dtype::complex64:
        return 8;
    case dtype::complex128:
        return 16;
    }
    return 0;
}

constexpr bool dtype_is_integral(dtype t) noexcept
{
    return t >= dtype::int8 && t <= dtype::uint64;
}

constexpr bool dtype_is_float(dtype t) noexcept
{
    return t == dtype::float32 || t == dtype::float64;
}

constexpr bool dtype_is_complex(dtype t) noexcept
{
    return t == dtype::complex64 || t == dtype::complex128;
}

} // namespace ndx

#include "switch_dtype.hpp"
