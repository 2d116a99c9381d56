#pragma once

/**
 * @file statistics.hpp
 * @brief Reductions over all elements of an array and along a single axis.
 *
 * Whole array reductions decode the elements as float64 and therefore reject complex arrays with
 * `unsupported_dtype_error`.
 */

#include "array.hpp"

#include <cstdint>

namespace ndx {

double sum(const array& a);

double prod(const array& a);

/**
 * @brief Arithmetic mean. NaN for an empty array.
 */
double mean(const array& a);

/**
 * @brief Smallest element, the first one on ties. NaN for an empty array.
 */
double min(const array& a);

/**
 * @brief Largest element, the first one on ties. NaN for an empty array.
 */
double max(const array& a);

/**
 * @brief Flat index of the first smallest element, -1 for an empty array.
 */
int64_t argmin(const array& a);

/**
 * @brief Flat index of the first largest element, -1 for an empty array.
 */
int64_t argmax(const array& a);

/**
 * @brief Population variance. NaN for an empty array.
 */
double var(const array& a);

double stdev(const array& a);

/**
 * @brief True if every element is non-zero. True for an empty array.
 */
bool all(const array& a);

/**
 * @brief True if some element is non-zero.
 */
bool any(const array& a);

/**
 * @brief Sums along `axis`, which may be negative. The axis is removed from the result, a single dimension
 * input gives a one element array. The result keeps the dtype of `a`.
 * @throws index_error if the axis is out of range.
 */
array sum_axis(const array& a, int64_t axis);

/**
 * @brief Same as `sum_axis` divided by the extent of the reduced axis.
 */
array mean_axis(const array& a, int64_t axis);

} // namespace ndx
