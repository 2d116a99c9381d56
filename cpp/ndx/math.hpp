#pragma once

/**
 * @file math.hpp
 * @brief Elementwise mathematical functions. Results keep the shape and dtype of the input.
 */

#include "array.hpp"

namespace ndx {

array exp(const array& a);

/**
 * @brief Natural logarithm. Non-positive real elements give `-inf` or NaN before conversion to the dtype.
 */
array log(const array& a);

array sin(const array& a);

array cos(const array& a);

array sqrt(const array& a);

array pow(const array& a, double exponent);

array abs(const array& a);

array negative(const array& a);

inline array operator-(const array& a)
{
    return negative(a);
}

} // namespace ndx
