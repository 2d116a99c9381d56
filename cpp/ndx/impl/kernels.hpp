#pragma once

/**
 * @file kernels.hpp
 * @brief Elementwise kernels shared by the arithmetic, math and comparison functions.
 *
 * Real elements are evaluated in double precision, complex elements in `complex128_t`. The result is encoded
 * through the codec of the result dtype.
 */

#include "../array.hpp"
#include "../broadcast.hpp"

#include <cstring>
#include <string_view>
#include <utility>

namespace ndx::impl {

/**
 * @brief Copies one element between buffers, converting it when the dtypes differ.
 */
inline void copy_element(const array& src, int64_t src_offset, array& dst, int64_t dst_offset)
{
    auto from = src.data().data() + src_offset;
    auto to = dst.mutable_data().data() + dst_offset;
    if (src.dtype() == dst.dtype()) {
        std::memcpy(to, from, static_cast<std::size_t>(src.itemsize()));
    } else if (dtype_is_complex(src.dtype()) || dtype_is_complex(dst.dtype())) {
        dst.codec().store_complex(to, src.codec().load_complex(from));
    } else {
        dst.codec().store_float64(to, src.codec().load_float64(from));
    }
}

/**
 * @brief Applies `op` to every element of `a`. The result has the shape and dtype of `a`.
 *
 * `op` must be callable with `double` and, for complex arrays, with `complex128_t`.
 */
template <typename O>
array map_unary(const array& a, O op)
{
    array result(a.shape(), a.dtype());
    const auto& codec = a.codec();
    auto src = a.data();
    auto dst = result.mutable_data();
    auto width = a.itemsize();
    if (dtype_is_complex(a.dtype())) {
        for (int64_t i = 0; i < a.size(); ++i) {
            auto v = op(codec.load_complex(src.data() + i * width));
            codec.store_complex(dst.data() + i * width, complex128_t(v));
        }
    } else {
        for (int64_t i = 0; i < a.size(); ++i) {
            auto v = op(codec.load_float64(src.data() + i * width));
            codec.store_float64(dst.data() + i * width, static_cast<double>(v));
        }
    }
    return result;
}

/**
 * @brief Broadcasts `a` and `b` and applies `op` pairwise. The result is typed as `a`.
 */
template <typename O>
array map_binary(const array& a, const array& b, O op)
{
    auto shape = broadcast_shapes(a.shape(), b.shape());
    auto first = broadcast_to(a, shape);
    auto second = broadcast_to(b, shape);

    array result(shape, a.dtype());
    const auto& c1 = first.codec();
    const auto& c2 = second.codec();
    const auto& out = result.codec();
    auto w1 = first.itemsize();
    auto w2 = second.itemsize();
    auto wo = result.itemsize();
    auto s1 = first.data();
    auto s2 = second.data();
    auto dst = result.mutable_data();
    if (dtype_is_complex(a.dtype()) || dtype_is_complex(b.dtype())) {
        for (int64_t i = 0; i < result.size(); ++i) {
            auto v = op(c1.load_complex(s1.data() + i * w1), c2.load_complex(s2.data() + i * w2));
            out.store_complex(dst.data() + i * wo, complex128_t(v));
        }
    } else {
        for (int64_t i = 0; i < result.size(); ++i) {
            auto v = op(c1.load_float64(s1.data() + i * w1), c2.load_float64(s2.data() + i * w2));
            out.store_float64(dst.data() + i * wo, static_cast<double>(v));
        }
    }
    return result;
}

/**
 * @brief Broadcasts `a` and `b` and evaluates the predicate pairwise into a boolean array.
 * @throws unsupported_dtype_error if either operand is complex.
 */
template <typename P>
array compare_binary(const array& a, const array& b, std::string_view operation, P predicate)
{
    for (auto t : {a.dtype(), b.dtype()}) {
        if (dtype_is_complex(t)) {
            throw unsupported_dtype_error(dtype_to_str(t), operation);
        }
    }
    auto shape = broadcast_shapes(a.shape(), b.shape());
    auto first = broadcast_to(a, shape);
    auto second = broadcast_to(b, shape);

    array result(shape, dtype::boolean);
    auto dst = result.mutable_data();
    auto w1 = first.itemsize();
    auto w2 = second.itemsize();
    for (int64_t i = 0; i < result.size(); ++i) {
        auto x = first.codec().load_float64(first.data().data() + i * w1);
        auto y = second.codec().load_float64(second.data().data() + i * w2);
        dst[i] = predicate(x, y) ? 1 : 0;
    }
    return result;
}

/**
 * @brief Evaluates the predicate on every element of `a` into a boolean array of the same shape.
 * @throws unsupported_dtype_error if `a` is complex.
 */
template <typename P>
array compare_unary(const array& a, std::string_view operation, P predicate)
{
    if (dtype_is_complex(a.dtype())) {
        throw unsupported_dtype_error(dtype_to_str(a.dtype()), operation);
    }
    array result(a.shape(), dtype::boolean);
    auto dst = result.mutable_data();
    auto width = a.itemsize();
    for (int64_t i = 0; i < a.size(); ++i) {
        dst[i] = predicate(a.codec().load_float64(a.data().data() + i * width)) ? 1 : 0;
    }
    return result;
}

} // namespace ndx::impl
