#pragma once

/**
 * @file broadcast.hpp
 * @brief Broadcasting of shapes and arrays.
 */

#include "array.hpp"

namespace ndx {

/**
 * @brief Joint shape of two broadcast compatible shapes.
 *
 * Shapes are right aligned and the shorter one is padded with leading 1s. On every axis the extents must be
 * equal or one of them must be 1.
 * @throws broadcast_error otherwise.
 */
shape_t broadcast_shapes(const shape_t& s1, const shape_t& s2);

/**
 * @brief Materializes `a` at the `target` shape. Axes of extent 1 are repeated.
 * @throws broadcast_error if `a` can't be broadcast to `target`.
 */
array broadcast_to(const array& a, const shape_t& target);

} // namespace ndx
