#include "combine.hpp"
#include "broadcast.hpp"
#include "generators.hpp"
#include "impl/kernels.hpp"
#include "ndenumerate.hpp"
#include "transform.hpp"

#include <base/type_traits.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace ndx {

array where(const array& condition, const array& a, const array& b)
{
    if (condition.dtype() != dtype::boolean) {
        throw unsupported_dtype_error(dtype_to_str(condition.dtype()), "where condition");
    }
    auto shape = broadcast_shapes(broadcast_shapes(condition.shape(), a.shape()), b.shape());
    auto c = broadcast_to(condition, shape);
    auto x = broadcast_to(a, shape);
    auto y = broadcast_to(b, shape);

    array result(shape, a.dtype());
    auto flags = c.data();
    for (int64_t i = 0; i < result.size(); ++i) {
        auto offset = i * result.itemsize();
        if (flags[i] != 0) {
            impl::copy_element(x, offset, result, offset);
        } else {
            impl::copy_element(y, i * y.itemsize(), result, offset);
        }
    }
    return result;
}

array clip(const array& a, double lo, double hi)
{
    if (dtype_is_complex(a.dtype())) {
        throw unsupported_dtype_error(dtype_to_str(a.dtype()), "clip");
    }
    return impl::map_unary(a, [lo, hi](auto x) {
        if constexpr (base::complex<decltype(x)>) {
            return x;
        } else {
            if (x < lo) {
                x = lo;
            }
            if (x > hi) {
                x = hi;
            }
            return x;
        }
    });
}

array concatenate(const std::vector<array>& arrays, int64_t axis)
{
    if (arrays.empty()) {
        throw invalid_argument("Need at least one array to concatenate");
    }
    const auto& first = arrays.front();
    auto ax = normalize_axis(axis, first.ndim());

    shape_t shape = first.shape();
    shape[ax] = 0;
    for (const auto& a : arrays) {
        bool compatible = a.ndim() == first.ndim();
        for (int64_t i = 0; compatible && i < a.ndim(); ++i) {
            compatible = i == ax || a.shape()[i] == first.shape()[i];
        }
        if (!compatible) {
            throw shape_error(fmt::format("Cannot concatenate arrays of shapes {} and {} along axis {}",
                                          shape_to_string(first.shape()), shape_to_string(a.shape()), ax),
                              {{"first", shape_to_string(first.shape())},
                               {"second", shape_to_string(a.shape())},
                               {"axis", std::to_string(ax)}});
        }
        shape[ax] += a.shape()[ax];
    }

    array result(shape, first.dtype());
    int64_t start = 0;
    shape_t target;
    for (const auto& a : arrays) {
        for (const auto& index : ndenumerate(a.shape())) {
            target = index;
            target[ax] += start;
            impl::copy_element(a, a.byte_offset(index), result, result.byte_offset(target));
        }
        start += a.shape()[ax];
    }
    return result;
}

array stack(const std::vector<array>& arrays, int64_t axis)
{
    if (arrays.empty()) {
        throw invalid_argument("Need at least one array to stack");
    }
    std::vector<array> expanded;
    expanded.reserve(arrays.size());
    for (const auto& a : arrays) {
        if (!shapes_equal(a.shape(), arrays.front().shape())) {
            throw shape_error(fmt::format("All arrays must have the same shape to stack, got {} and {}",
                                          shape_to_string(arrays.front().shape()), shape_to_string(a.shape())),
                              {{"first", shape_to_string(arrays.front().shape())},
                               {"second", shape_to_string(a.shape())}});
        }
        expanded.push_back(expand_dims(a, axis));
    }
    return concatenate(expanded, axis);
}

array unique(const array& a)
{
    auto values = a.to_float64_vector();
    auto nan_begin = std::partition(values.begin(), values.end(), [](double v) {
        return !std::isnan(v);
    });
    bool has_nan = nan_begin != values.end();
    values.erase(nan_begin, values.end());
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    if (has_nan) {
        values.push_back(std::numeric_limits<double>::quiet_NaN());
    }
    auto n = static_cast<int64_t>(values.size());
    return from_float64(values, {n});
}

array repeat(const array& a, int64_t repeats)
{
    if (repeats < 0) {
        throw invalid_argument(fmt::format("Repeat count must be non-negative, got {}", repeats));
    }
    std::vector<double> values;
    values.reserve(static_cast<std::size_t>(a.size() * repeats));
    for (auto v : a.to_float64_vector()) {
        values.insert(values.end(), static_cast<std::size_t>(repeats), v);
    }
    auto n = static_cast<int64_t>(values.size());
    return from_float64(values, {n});
}

array tile(const array& a, const shape_t& reps)
{
    if (reps.empty()) {
        throw invalid_argument("Tile repetitions cannot be empty");
    }
    if (std::any_of(reps.begin(), reps.end(), [](int64_t r) { return r < 0; })) {
        throw invalid_argument(fmt::format("Tile repetitions must be non-negative, got {}", shape_to_string(reps)));
    }

    auto ndim = std::max(reps.size(), a.shape().size());
    shape_t padded_reps(ndim - reps.size(), 1);
    padded_reps.insert(padded_reps.end(), reps.begin(), reps.end());
    shape_t padded_shape(ndim - a.shape().size(), 1);
    padded_shape.insert(padded_shape.end(), a.shape().begin(), a.shape().end());
    auto source = reshape(a, padded_shape);

    shape_t shape(ndim);
    for (std::size_t i = 0; i < ndim; ++i) {
        shape[i] = padded_shape[i] * padded_reps[i];
    }

    array result(shape, a.dtype());
    shape_t src_index(ndim);
    for (const auto& index : ndenumerate(shape)) {
        for (std::size_t i = 0; i < ndim; ++i) {
            src_index[i] = index[i] % padded_shape[i];
        }
        impl::copy_element(source, source.byte_offset(src_index), result, result.byte_offset(index));
    }
    return result;
}

} // namespace ndx
