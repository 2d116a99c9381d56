#pragma once

/**
 * @file combine.hpp
 * @brief Selection, joining and set utilities.
 */

#include "array.hpp"

#include <vector>

namespace ndx {

/**
 * @brief Picks elements from `a` where `condition` is true and from `b` otherwise.
 *
 * The three operands are broadcast to their joint shape. The result is typed as `a`.
 * @throws unsupported_dtype_error if `condition` is not boolean.
 */
array where(const array& condition, const array& a, const array& b);

/**
 * @brief Copy of `a` with every element limited to `[lo, hi]`.
 */
array clip(const array& a, double lo, double hi);

/**
 * @brief Joins arrays along an existing axis. The result is typed as the first array.
 * @throws invalid_argument if `arrays` is empty.
 * @throws shape_error if the arrays differ in rank or in an extent other than `axis`.
 */
array concatenate(const std::vector<array>& arrays, int64_t axis = 0);

/**
 * @brief Joins arrays of identical shape along a new axis inserted at `axis`.
 * @throws shape_error if the shapes differ.
 */
array stack(const std::vector<array>& arrays, int64_t axis = 0);

/**
 * @brief Sorted distinct values of `a` as a single dimension float64 array.
 */
array unique(const array& a);

/**
 * @brief Flattened float64 array with every element of `a` repeated `repeats` times.
 */
array repeat(const array& a, int64_t repeats);

/**
 * @brief Repeats `a` `reps[i]` times along each axis.
 *
 * If `reps` is shorter than the rank of `a` it is padded with leading 1s, otherwise `a` is treated as having
 * leading axes of extent 1.
 * @throws invalid_argument if `reps` is empty or holds a negative count.
 */
array tile(const array& a, const shape_t& reps);

} // namespace ndx
