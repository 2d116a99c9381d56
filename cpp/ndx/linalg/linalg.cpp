#include "linalg.hpp"
#include "../config.hpp"
#include "../generators.hpp"
#include "../transform.hpp"

#include <base/logger.hpp>

#include <algorithm>
#include <cmath>
#include <vector>

namespace ndx::linalg {

namespace {

using matrix = std::vector<double>;

void check_rank(const array& a, int64_t rank, std::string_view operation)
{
    if (a.ndim() != rank) {
        throw dimension_error(fmt::format("{} requires a {}D array, got shape {}", operation, rank,
                                          shape_to_string(a.shape())),
                              {{"operation", std::string(operation)}, {"shape", shape_to_string(a.shape())}});
    }
}

void check_square(const array& a, std::string_view operation)
{
    check_rank(a, 2, operation);
    if (a.shape()[0] != a.shape()[1]) {
        throw shape_error(fmt::format("{} requires a square matrix, got shape {}", operation,
                                      shape_to_string(a.shape())),
                          {{"operation", std::string(operation)}, {"shape", shape_to_string(a.shape())}});
    }
}

/// Cofactor expansion along row 0 of the `n x n` row-major matrix `m`.
double det_recursive(const matrix& m, int64_t n)
{
    if (n == 0) {
        return 1.0;
    }
    if (n == 1) {
        return m[0];
    }
    if (n == 2) {
        return m[0] * m[3] - m[1] * m[2];
    }
    double result = 0.0;
    matrix minor(static_cast<std::size_t>((n - 1) * (n - 1)));
    for (int64_t col = 0; col < n; ++col) {
        std::size_t k = 0;
        for (int64_t i = 1; i < n; ++i) {
            for (int64_t j = 0; j < n; ++j) {
                if (j != col) {
                    minor[k++] = m[i * n + j];
                }
            }
        }
        double sign = col % 2 == 0 ? 1.0 : -1.0;
        result += sign * m[col] * det_recursive(minor, n - 1);
    }
    return result;
}

} // namespace

array matmul(const array& a, const array& b)
{
    if (a.ndim() != 2 || b.ndim() != 2) {
        throw dimension_error(fmt::format("matmul requires 2D arrays, got shapes {} and {}",
                                          shape_to_string(a.shape()), shape_to_string(b.shape())),
                              {{"first", shape_to_string(a.shape())}, {"second", shape_to_string(b.shape())}});
    }
    auto m = a.shape()[0];
    auto k = a.shape()[1];
    auto n = b.shape()[1];
    if (b.shape()[0] != k) {
        throw dimension_error(fmt::format("matmul inner dimensions differ: shapes {} and {}",
                                          shape_to_string(a.shape()), shape_to_string(b.shape())),
                              {{"first", shape_to_string(a.shape())}, {"second", shape_to_string(b.shape())}});
    }
    auto x = a.to_float64_vector();
    auto y = b.to_float64_vector();
    std::vector<double> out(static_cast<std::size_t>(m * n), 0.0);
    for (int64_t i = 0; i < m; ++i) {
        for (int64_t j = 0; j < n; ++j) {
            double total = 0.0;
            for (int64_t l = 0; l < k; ++l) {
                total += x[i * k + l] * y[l * n + j];
            }
            out[i * n + j] = total;
        }
    }
    return from_float64(out, {m, n});
}

array dot(const array& a, const array& b)
{
    if (a.ndim() == 1 && b.ndim() == 1) {
        return from_float64({inner(a, b)}, {1});
    }
    if (a.ndim() == 2 && b.ndim() == 2) {
        return matmul(a, b);
    }
    if (a.ndim() == 2 && b.ndim() == 1) {
        auto m = a.shape()[0];
        auto k = a.shape()[1];
        if (b.shape()[0] != k) {
            throw dimension_error(fmt::format("Matrix of shape {} and vector of shape {} are not aligned",
                                              shape_to_string(a.shape()), shape_to_string(b.shape())),
                                  {{"first", shape_to_string(a.shape())}, {"second", shape_to_string(b.shape())}});
        }
        auto x = a.to_float64_vector();
        auto y = b.to_float64_vector();
        std::vector<double> out(static_cast<std::size_t>(m), 0.0);
        for (int64_t i = 0; i < m; ++i) {
            for (int64_t l = 0; l < k; ++l) {
                out[i] += x[i * k + l] * y[l];
            }
        }
        return from_float64(out, {m});
    }
    throw unsupported_rank_error("dot", a.ndim(), b.ndim());
}

array outer(const array& a, const array& b)
{
    check_rank(a, 1, "outer");
    check_rank(b, 1, "outer");
    auto x = a.to_float64_vector();
    auto y = b.to_float64_vector();
    std::vector<double> out;
    out.reserve(x.size() * y.size());
    for (auto u : x) {
        for (auto v : y) {
            out.push_back(u * v);
        }
    }
    return from_float64(out, {a.size(), b.size()});
}

double inner(const array& a, const array& b)
{
    check_rank(a, 1, "inner");
    check_rank(b, 1, "inner");
    if (a.size() != b.size()) {
        throw shape_error(fmt::format("Vectors of shapes {} and {} differ in length", shape_to_string(a.shape()),
                                      shape_to_string(b.shape())),
                          {{"first", shape_to_string(a.shape())}, {"second", shape_to_string(b.shape())}});
    }
    auto x = a.to_float64_vector();
    auto y = b.to_float64_vector();
    double total = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        total += x[i] * y[i];
    }
    return total;
}

double norm(const array& a)
{
    double total = 0.0;
    for (auto v : a.to_float64_vector()) {
        total += v * v;
    }
    return std::sqrt(total);
}

double trace(const array& a)
{
    check_rank(a, 2, "trace");
    auto n = std::min(a.shape()[0], a.shape()[1]);
    double total = 0.0;
    for (int64_t i = 0; i < n; ++i) {
        total += a.get_float64(i, i);
    }
    return total;
}

double det(const array& a)
{
    check_square(a, "det");
    auto n = a.shape()[0];
    base::log_debug(base::log_channel::linalg, "Computing determinant of order {}", n);
    if (n > get_config().det_warn_order) {
        base::log_warning(base::log_channel::linalg,
                          "Determinant of order {} uses cofactor expansion with factorial cost", n);
    }
    return det_recursive(a.to_float64_vector(), n);
}

array inv(const array& a)
{
    check_square(a, "inv");
    auto n = a.shape()[0];
    auto width = 2 * n;
    auto tolerance = get_config().singular_tolerance;
    base::log_debug(base::log_channel::linalg, "Inverting matrix of order {} with tolerance {}", n, tolerance);

    auto values = a.to_float64_vector();
    matrix aug(static_cast<std::size_t>(n * width), 0.0);
    for (int64_t i = 0; i < n; ++i) {
        for (int64_t j = 0; j < n; ++j) {
            aug[i * width + j] = values[i * n + j];
        }
        aug[i * width + n + i] = 1.0;
    }

    for (int64_t i = 0; i < n; ++i) {
        auto pivot = aug[i * width + i];
        if (std::abs(pivot) < tolerance) {
            throw singular_matrix_error(i, pivot);
        }
        for (int64_t j = 0; j < width; ++j) {
            aug[i * width + j] /= pivot;
        }
        for (int64_t r = 0; r < n; ++r) {
            if (r == i) {
                continue;
            }
            auto factor = aug[r * width + i];
            for (int64_t j = 0; j < width; ++j) {
                aug[r * width + j] -= factor * aug[i * width + j];
            }
        }
    }

    std::vector<double> out(static_cast<std::size_t>(n * n));
    for (int64_t i = 0; i < n; ++i) {
        for (int64_t j = 0; j < n; ++j) {
            out[i * n + j] = aug[i * width + n + j];
        }
    }
    return from_float64(out, {n, n});
}

array transpose(const array& a)
{
    return ndx::transpose(a);
}

} // namespace ndx::linalg
