#pragma once

/**
 * @file json_adapt.hpp
 * @brief Conversion between arrays and nested JSON lists.
 *
 * Real elements map to JSON numbers or booleans, complex elements to `{"re": x, "im": y}` objects.
 */

#include "array.hpp"

#include <boost/json/value.hpp>

namespace ndx {

/**
 * @brief Nested JSON list with one level per axis.
 */
boost::json::value to_json(const array& a);

/**
 * @brief Parses a nested JSON list into an array of the given dtype.
 *
 * A scalar gives a one element array of shape `(1)`.
 * @throws shape_error if the nesting is ragged.
 * @throws invalid_argument if an element is not a number, a boolean or a complex object.
 */
array from_json(const boost::json::value& j, dtype t = dtype::float64);

} // namespace ndx
