#pragma once

/**
 * @file comparison.hpp
 * @brief Definitions of comparison functions.
 */

#include "array.hpp"

namespace ndx {

/**
 * @brief Broadcasting elementwise `f > s` as a boolean array.
 */
array greater(const array& f, const array& s);

/**
 * @brief Broadcasting elementwise `f < s` as a boolean array.
 */
array less(const array& f, const array& s);

array greater_scalar(const array& a, double value);

array less_scalar(const array& a, double value);

/**
 * @brief True if both arrays have the same shape and identical element values.
 */
bool equal(const array& f, const array& s);

/**
 * @brief True if both arrays have the same shape and `|f - s| <= atol + rtol * |s|` holds for every element.
 */
bool allclose(const array& f, const array& s, double rtol, double atol);

/**
 * @brief `allclose` with the tolerances of the active configuration.
 */
bool allclose(const array& f, const array& s);

} // namespace ndx
