#pragma once

/**
 * @file arithmetic.hpp
 * @brief Definitions of arithmetic operators.
 *
 * Binary operators broadcast their operands and produce an array typed as the left operand.
 */

#include "array.hpp"

namespace ndx {

array add(const array& f, const array& s);

array subtract(const array& f, const array& s);

array multiply(const array& f, const array& s);

/**
 * @brief Elementwise quotient. Division by zero follows IEEE rules before conversion to the result dtype,
 * so integer results saturate and `0 / 0` becomes 0.
 */
array divide(const array& f, const array& s);

array add_scalar(const array& a, double value);

array multiply_scalar(const array& a, double value);

inline array operator+(const array& f, const array& s)
{
    return add(f, s);
}

inline array operator-(const array& f, const array& s)
{
    return subtract(f, s);
}

inline array operator*(const array& f, const array& s)
{
    return multiply(f, s);
}

inline array operator/(const array& f, const array& s)
{
    return divide(f, s);
}

} // namespace ndx
