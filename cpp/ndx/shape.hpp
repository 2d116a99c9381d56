#pragma once

/**
 * @file shape.hpp
 * @brief Shape vector type and the index/stride arithmetic shared by every array operation.
 */

#include <boost/container/small_vector.hpp>

#include <cstdint>
#include <string>

namespace ndx {

/**
 * @brief Extents, byte strides and multi-indices. Most arrays have at most four axes, so those stay inline.
 */
using shape_t = boost::container::small_vector<int64_t, 4>;

/**
 * @brief Number of elements described by the shape. An empty shape describes no elements.
 */
int64_t shape_size(const shape_t& shape) noexcept;

/**
 * @brief Row-major byte strides: `stride[i] = itemsize * product(shape[i+1:])`.
 */
shape_t c_strides(const shape_t& shape, int64_t itemsize);

/**
 * @brief Resolves a possibly negative index against the axis extent.
 * @throws index_error if the result falls outside of `[0, size)`.
 */
int64_t normalize_index(int64_t index, int64_t size, int64_t axis = 0);

/**
 * @brief Resolves a possibly negative axis against the number of dimensions.
 * @throws index_error if the result falls outside of `[0, ndim)`.
 */
int64_t normalize_axis(int64_t axis, int64_t ndim);

/**
 * @brief Converts a row-major linear position into the multi-index it designates.
 */
shape_t unravel_index(int64_t flat, const shape_t& shape);

/**
 * @brief Converts a multi-index (already normalized) into its row-major linear position.
 */
int64_t ravel_index(const shape_t& index, const shape_t& shape) noexcept;

bool shapes_equal(const shape_t& s1, const shape_t& s2) noexcept;

/**
 * @brief Renders the shape as `(2, 3)`.
 */
std::string shape_to_string(const shape_t& shape);

} // namespace ndx
