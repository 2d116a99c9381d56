#pragma once

/**
 * @file generators.hpp
 * @brief Functions creating new arrays.
 */

#include "array.hpp"

#include <base/type_traits.hpp>

#include <cstring>
#include <utility>
#include <vector>

namespace ndx {

/**
 * @brief Array of the given shape filled with zeros.
 */
array zeros(shape_t shape, dtype t = dtype::float64);

/**
 * @brief Array of the given shape filled with ones.
 */
array ones(shape_t shape, dtype t = dtype::float64);

/**
 * @brief Array of the given shape filled with `value`, converted to `t`.
 */
array full(shape_t shape, double value, dtype t = dtype::float64);

/**
 * @brief Array holding `data` in row-major order.
 * @throws shape_error if `data.size()` differs from the number of elements of `shape`.
 */
template <typename T>
requires(base::numeric<T> && !std::is_same_v<T, bool>)
array from_vector(const std::vector<T>& data, shape_t shape)
{
    auto expected = shape_size(shape);
    if (static_cast<int64_t>(data.size()) != expected) {
        throw shape_error(fmt::format("Data length {} does not match shape {} of size {}", data.size(),
                                      shape_to_string(shape), expected),
                          {{"shape", shape_to_string(shape)}, {"length", std::to_string(data.size())}});
    }
    std::vector<uint8_t> buffer(data.size() * sizeof(T));
    if (!data.empty()) {
        std::memcpy(buffer.data(), data.data(), buffer.size());
    }
    return array(std::move(buffer), std::move(shape), dtype_enum_v<T>);
}

inline array from_float64(const std::vector<double>& data, shape_t shape)
{
    return from_vector(data, std::move(shape));
}

inline array from_int64(const std::vector<int64_t>& data, shape_t shape)
{
    return from_vector(data, std::move(shape));
}

inline array from_float32(const std::vector<float>& data, shape_t shape)
{
    return from_vector(data, std::move(shape));
}

/**
 * @brief Single dimension float64 array of `ceil((stop - start) / step)` evenly spaced values starting at `start`.
 * @throws invalid_argument if `step` is zero or any argument is not finite.
 */
array arange(double start, double stop, double step = 1.0);

/**
 * @brief Single dimension int64 array of the integers in `[start, stop)`. Empty if `stop < start`.
 */
array range(int64_t start, int64_t stop);

/**
 * @brief `n x n` array with ones on the diagonal.
 */
array eye(int64_t n, dtype t = dtype::float64);

} // namespace ndx
