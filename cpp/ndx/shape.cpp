#include "shape.hpp"
#include "exceptions.hpp"

#include <base/format.hpp>

#include <algorithm>
#include <functional>
#include <numeric>

namespace ndx {

int64_t shape_size(const shape_t& shape) noexcept
{
    if (shape.empty()) {
        return 0;
    }
    return std::accumulate(shape.begin(), shape.end(), int64_t{1}, std::multiplies<int64_t>());
}

shape_t c_strides(const shape_t& shape, int64_t itemsize)
{
    shape_t strides(shape.size(), 0);
    auto stride = itemsize;
    for (auto i = static_cast<int64_t>(shape.size()) - 1; i >= 0; --i) {
        strides[i] = stride;
        stride *= shape[i];
    }
    return strides;
}

int64_t normalize_index(int64_t index, int64_t size, int64_t axis)
{
    auto normalized = index < 0 ? size + index : index;
    if (normalized < 0 || normalized >= size) {
        throw index_error(index, axis, size);
    }
    return normalized;
}

int64_t normalize_axis(int64_t axis, int64_t ndim)
{
    auto normalized = axis < 0 ? ndim + axis : axis;
    if (normalized < 0 || normalized >= ndim) {
        throw index_error(fmt::format("Axis {} is out of bounds for array of dimension {}", axis, ndim));
    }
    return normalized;
}

shape_t unravel_index(int64_t flat, const shape_t& shape)
{
    shape_t indices(shape.size(), 0);
    auto remaining = flat;
    for (auto i = static_cast<int64_t>(shape.size()) - 1; i >= 0; --i) {
        indices[i] = remaining % shape[i];
        remaining /= shape[i];
    }
    return indices;
}

int64_t ravel_index(const shape_t& index, const shape_t& shape) noexcept
{
    int64_t flat = 0;
    for (std::size_t i = 0; i < shape.size(); ++i) {
        flat = flat * shape[i] + index[i];
    }
    return flat;
}

bool shapes_equal(const shape_t& s1, const shape_t& s2) noexcept
{
    return std::equal(s1.begin(), s1.end(), s2.begin(), s2.end());
}

std::string shape_to_string(const shape_t& shape)
{
    return base::format_extents(shape);
}

} // namespace ndx
