#pragma once

#include <complex>
#include <concepts>
#include <type_traits>

namespace base {

// complex

template <typename T>
struct is_complex : std::false_type {};

template <typename T>
struct is_complex<std::complex<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_complex_v = is_complex<T>::value;

// concepts

template <typename T>
concept floating_point = std::is_floating_point_v<T>;

template <typename T>
concept integral = std::is_integral_v<T>;

template <typename T>
concept complex = is_complex_v<T>;

// concept only for arithmetic to avoid defining bulky __or_ template
template <typename T>
concept arithmetic = integral<T> || floating_point<T>;

template <typename T>
concept numeric = arithmetic<T> || complex<T>;

} // namespace base
