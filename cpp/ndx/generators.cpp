#include "generators.hpp"

#include <algorithm>
#include <cmath>

namespace ndx {

namespace {

void fill(array& a, double value)
{
    auto& codec = a.codec();
    auto bytes = a.mutable_data();
    auto width = a.itemsize();
    for (int64_t i = 0; i < a.size(); ++i) {
        codec.store_complex(bytes.data() + i * width, complex128_t(value, 0.0));
    }
}

} // namespace

array zeros(shape_t shape, dtype t)
{
    return array(std::move(shape), t);
}

array ones(shape_t shape, dtype t)
{
    return full(std::move(shape), 1.0, t);
}

array full(shape_t shape, double value, dtype t)
{
    auto result = zeros(std::move(shape), t);
    fill(result, value);
    return result;
}

array arange(double start, double stop, double step)
{
    if (step == 0.0) {
        throw invalid_argument("arange step cannot be zero");
    }
    if (!std::isfinite(start) || !std::isfinite(stop) || !std::isfinite(step)) {
        throw invalid_argument(fmt::format("arange requires finite bounds and step, got [{}, {}) step {}", start,
                                           stop, step));
    }
    auto n = static_cast<int64_t>(std::ceil((stop - start) / step));
    n = std::max<int64_t>(n, 0);

    std::vector<double> data(static_cast<std::size_t>(n));
    for (int64_t i = 0; i < n; ++i) {
        data[i] = start + static_cast<double>(i) * step;
    }
    return from_float64(data, {n});
}

array range(int64_t start, int64_t stop)
{
    if (stop < start) {
        return from_int64({}, {0});
    }
    auto n = stop - start;
    std::vector<int64_t> data(static_cast<std::size_t>(n));
    for (int64_t i = 0; i < n; ++i) {
        data[i] = start + i;
    }
    return from_int64(data, {n});
}

array eye(int64_t n, dtype t)
{
    auto result = zeros({n, n}, t);
    for (int64_t i = 0; i < n; ++i) {
        result.set_complex(complex128_t(1.0, 0.0), i, i);
    }
    return result;
}

} // namespace ndx
