#include "transform.hpp"
#include "ndenumerate.hpp"

#include <algorithm>
#include <cstring>
#include <iterator>
#include <numeric>

namespace ndx {

namespace {

array with_shape(const array& a, shape_t shape)
{
    auto bytes = a.data();
    return array(std::vector<uint8_t>(bytes.begin(), bytes.end()), std::move(shape), a.dtype());
}

} // namespace

array reshape(const array& a, shape_t new_shape)
{
    int64_t known = 1;
    std::optional<std::size_t> inferred;
    for (auto i = 0u; i < new_shape.size(); ++i) {
        if (new_shape[i] == -1) {
            if (inferred) {
                throw shape_error(fmt::format("Can only specify one unknown dimension, got {}",
                                              shape_to_string(new_shape)),
                                  {{"shape", shape_to_string(new_shape)}});
            }
            inferred = i;
        } else if (new_shape[i] < 0) {
            throw shape_error(fmt::format("Negative extent in shape {}", shape_to_string(new_shape)),
                              {{"shape", shape_to_string(new_shape)}});
        } else {
            known *= new_shape[i];
        }
    }
    if (inferred) {
        if (known == 0 || a.size() % known != 0) {
            throw shape_error(fmt::format("Cannot reshape array of size {} into shape {}", a.size(),
                                          shape_to_string(new_shape)),
                              {{"size", std::to_string(a.size())}, {"shape", shape_to_string(new_shape)}});
        }
        new_shape[*inferred] = a.size() / known;
    }
    if (shape_size(new_shape) != a.size()) {
        throw shape_error(fmt::format("Cannot reshape array of size {} into shape {}", a.size(),
                                      shape_to_string(new_shape)),
                          {{"size", std::to_string(a.size())}, {"shape", shape_to_string(new_shape)}});
    }
    return with_shape(a, std::move(new_shape));
}

array transpose(const array& a, std::optional<shape_t> axes)
{
    auto ndim = a.ndim();
    shape_t perm(static_cast<std::size_t>(ndim));
    if (axes) {
        if (static_cast<int64_t>(axes->size()) != ndim) {
            throw shape_error(fmt::format("Axes {} don't match array of dimension {}", shape_to_string(*axes), ndim),
                              {{"axes", shape_to_string(*axes)}});
        }
        std::vector<bool> seen(static_cast<std::size_t>(ndim), false);
        for (int64_t i = 0; i < ndim; ++i) {
            auto axis = normalize_axis((*axes)[i], ndim);
            if (seen[axis]) {
                throw shape_error(fmt::format("Repeated axis {} in transpose", axis),
                                  {{"axes", shape_to_string(*axes)}});
            }
            seen[axis] = true;
            perm[i] = axis;
        }
    } else {
        std::iota(perm.rbegin(), perm.rend(), int64_t{0});
    }

    const auto& src_shape = a.shape();
    shape_t dst_shape(perm.size());
    for (auto i = 0u; i < perm.size(); ++i) {
        dst_shape[i] = src_shape[perm[i]];
    }

    array result(dst_shape, a.dtype());
    auto src = a.data();
    auto dst = result.mutable_data();
    auto width = a.itemsize();
    shape_t src_index(perm.size());
    for (const auto& index : ndenumerate(dst_shape)) {
        for (auto i = 0u; i < perm.size(); ++i) {
            src_index[perm[i]] = index[i];
        }
        std::memcpy(dst.data() + result.byte_offset(index), src.data() + a.byte_offset(src_index), width);
    }
    return result;
}

array matrix_transpose(const array& a)
{
    if (a.ndim() != 2) {
        throw dimension_error(fmt::format("Matrix transpose requires a 2D array, got {}D", a.ndim()),
                              {{"shape", shape_to_string(a.shape())}});
    }
    return transpose(a);
}

array flatten(const array& a)
{
    return with_shape(a, {a.size()});
}

array ravel(const array& a)
{
    return flatten(a);
}

array squeeze(const array& a)
{
    if (a.ndim() == 0) {
        return a;
    }
    shape_t shape;
    std::copy_if(a.shape().begin(), a.shape().end(), std::back_inserter(shape), [](int64_t e) {
        return e != 1;
    });
    if (shape.empty()) {
        shape.push_back(1);
    }
    return with_shape(a, std::move(shape));
}

array expand_dims(const array& a, int64_t axis)
{
    auto position = normalize_axis(axis, a.ndim() + 1);
    auto shape = a.shape();
    shape.insert(shape.begin() + position, 1);
    return with_shape(a, std::move(shape));
}

array swap_axes(const array& a, int64_t axis1, int64_t axis2)
{
    auto ndim = a.ndim();
    auto first = normalize_axis(axis1, ndim);
    auto second = normalize_axis(axis2, ndim);
    shape_t axes(static_cast<std::size_t>(ndim));
    std::iota(axes.begin(), axes.end(), int64_t{0});
    std::swap(axes[first], axes[second]);
    return transpose(a, axes);
}

} // namespace ndx
