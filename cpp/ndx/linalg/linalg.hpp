#pragma once

/**
 * @file linalg.hpp
 * @brief Dense linear algebra on float64 values.
 *
 * Inputs of any real dtype are decoded as float64. Array results are float64.
 */

#include "../array.hpp"

namespace ndx::linalg {

/**
 * @brief Matrix product of two 2D arrays.
 * @throws dimension_error if an input is not 2D or the inner extents differ.
 */
array matmul(const array& a, const array& b);

/**
 * @brief Dot product.
 *
 * 1D with 1D gives the inner product as a one element array, 2D with 2D the matrix product and 2D with 1D the
 * matrix-vector product.
 * @throws shape_error if two vectors differ in length.
 * @throws dimension_error if a matrix-vector pair doesn't match.
 * @throws unsupported_rank_error for any other combination of ranks.
 */
array dot(const array& a, const array& b);

/**
 * @brief `len(a) x len(b)` matrix of pairwise products of two 1D arrays.
 */
array outer(const array& a, const array& b);

/**
 * @brief Inner product of two 1D arrays of the same length.
 */
double inner(const array& a, const array& b);

/**
 * @brief Euclidean norm over all elements.
 */
double norm(const array& a);

/**
 * @brief Sum of the main diagonal of a 2D array.
 */
double trace(const array& a);

/**
 * @brief Determinant of a square matrix by cofactor expansion along the first row.
 *
 * The cost grows factorially with the order, a warning is logged above `config::det_warn_order`.
 * @throws dimension_error if `a` is not 2D.
 * @throws shape_error if `a` is not square.
 */
double det(const array& a);

/**
 * @brief Inverse of a square matrix by Gauss-Jordan elimination on `[A | I]`.
 *
 * Pivots are taken from the diagonal without row exchanges, so some invertible matrices with a zero on the
 * diagonal are reported as singular.
 * @throws singular_matrix_error if a pivot is smaller than `config::singular_tolerance`.
 */
array inv(const array& a);

array transpose(const array& a);

} // namespace ndx::linalg
