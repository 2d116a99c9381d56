#include "statistics.hpp"
#include "ndenumerate.hpp"

#include <cmath>
#include <limits>
#include <vector>

namespace ndx {

namespace {

template <typename F>
void for_each_float64(const array& a, F f)
{
    const auto& codec = a.codec();
    auto bytes = a.data();
    auto width = a.itemsize();
    for (int64_t i = 0; i < a.size(); ++i) {
        f(i, codec.load_float64(bytes.data() + i * width));
    }
}

template <typename C>
int64_t arg_extreme(const array& a, C better)
{
    int64_t index = -1;
    double best = std::numeric_limits<double>::quiet_NaN();
    for_each_float64(a, [&](int64_t i, double v) {
        if (index == -1 || better(v, best)) {
            index = i;
            best = v;
        }
    });
    return index;
}

array reduce_axis(const array& a, int64_t axis, bool average)
{
    auto ax = normalize_axis(axis, a.ndim());
    const auto& shape = a.shape();
    shape_t out_shape;
    for (int64_t i = 0; i < a.ndim(); ++i) {
        if (i != ax) {
            out_shape.push_back(shape[i]);
        }
    }
    if (out_shape.empty()) {
        out_shape.push_back(1);
    }

    auto out_size = shape_size(out_shape);
    std::vector<complex128_t> acc(static_cast<std::size_t>(out_size));
    shape_t out_index;
    for (const auto& index : ndenumerate(shape)) {
        out_index.clear();
        for (int64_t i = 0; i < a.ndim(); ++i) {
            if (i != ax) {
                out_index.push_back(index[i]);
            }
        }
        auto slot = a.ndim() == 1 ? 0 : ravel_index(out_index, out_shape);
        acc[slot] += a.get_complex(index);
    }

    auto out_dtype = a.ndim() == 1 && !dtype_is_complex(a.dtype()) ? dtype::float64 : a.dtype();
    array result(out_shape, out_dtype);
    const auto& codec = result.codec();
    auto dst = result.mutable_data();
    auto width = result.itemsize();
    auto extent = static_cast<double>(shape[ax]);
    for (int64_t i = 0; i < out_size; ++i) {
        auto v = average ? acc[i] / extent : acc[i];
        if (dtype_is_complex(result.dtype())) {
            codec.store_complex(dst.data() + i * width, v);
        } else {
            codec.store_float64(dst.data() + i * width, v.real());
        }
    }
    return result;
}

} // namespace

double sum(const array& a)
{
    double total = 0.0;
    for_each_float64(a, [&total](int64_t, double v) {
        total += v;
    });
    return total;
}

double prod(const array& a)
{
    double total = 1.0;
    for_each_float64(a, [&total](int64_t, double v) {
        total *= v;
    });
    return total;
}

double mean(const array& a)
{
    if (a.size() == 0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return sum(a) / static_cast<double>(a.size());
}

double min(const array& a)
{
    auto i = argmin(a);
    return i < 0 ? std::numeric_limits<double>::quiet_NaN()
                 : a.codec().load_float64(a.data().data() + i * a.itemsize());
}

double max(const array& a)
{
    auto i = argmax(a);
    return i < 0 ? std::numeric_limits<double>::quiet_NaN()
                 : a.codec().load_float64(a.data().data() + i * a.itemsize());
}

int64_t argmin(const array& a)
{
    return arg_extreme(a, [](double v, double best) {
        return v < best;
    });
}

int64_t argmax(const array& a)
{
    return arg_extreme(a, [](double v, double best) {
        return v > best;
    });
}

double var(const array& a)
{
    if (a.size() == 0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    auto m = mean(a);
    double total = 0.0;
    for_each_float64(a, [&](int64_t, double v) {
        total += (v - m) * (v - m);
    });
    return total / static_cast<double>(a.size());
}

double stdev(const array& a)
{
    return std::sqrt(var(a));
}

bool all(const array& a)
{
    auto width = a.itemsize();
    for (int64_t i = 0; i < a.size(); ++i) {
        if (a.codec().load_complex(a.data().data() + i * width) == complex128_t()) {
            return false;
        }
    }
    return true;
}

bool any(const array& a)
{
    auto width = a.itemsize();
    for (int64_t i = 0; i < a.size(); ++i) {
        if (a.codec().load_complex(a.data().data() + i * width) != complex128_t()) {
            return true;
        }
    }
    return false;
}

array sum_axis(const array& a, int64_t axis)
{
    return reduce_axis(a, axis, false);
}

array mean_axis(const array& a, int64_t axis)
{
    return reduce_axis(a, axis, true);
}

} // namespace ndx
