#pragma once

/**
 * @file transform.hpp
 * @brief Shape transformations. Every function returns a C-contiguous copy.
 */

#include "array.hpp"

#include <optional>

namespace ndx {

/**
 * @brief Copy of `a` laid out with `new_shape`.
 *
 * A single extent of `-1` is inferred from the remaining ones.
 * @throws shape_error if the element count changes, more than one `-1` is given or an extent is negative.
 */
array reshape(const array& a, shape_t new_shape);

/**
 * @brief Permutes the axes of `a`. Without `axes` the order of the axes is reversed.
 * @throws shape_error if `axes` is not a permutation of the axes.
 * @throws index_error if an axis is out of range.
 */
array transpose(const array& a, std::optional<shape_t> axes = std::nullopt);

/**
 * @brief Transpose of a matrix.
 * @throws dimension_error if `a` is not 2D.
 */
array matrix_transpose(const array& a);

array flatten(const array& a);
array ravel(const array& a);

/**
 * @brief Drops all axes of extent 1. If all axes are dropped the result has shape `(1)`.
 */
array squeeze(const array& a);

/**
 * @brief Inserts an axis of extent 1 at position `axis`, which may be negative.
 */
array expand_dims(const array& a, int64_t axis);

array swap_axes(const array& a, int64_t axis1, int64_t axis2);

} // namespace ndx
