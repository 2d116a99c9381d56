#include "broadcast.hpp"
#include "ndenumerate.hpp"

#include <base/logger.hpp>

#include <algorithm>
#include <cstring>

namespace ndx {

shape_t broadcast_shapes(const shape_t& s1, const shape_t& s2)
{
    auto ndim = std::max(s1.size(), s2.size());
    shape_t result(ndim, 1);
    for (std::size_t i = 0; i < ndim; ++i) {
        auto e1 = i < s1.size() ? s1[s1.size() - 1 - i] : 1;
        auto e2 = i < s2.size() ? s2[s2.size() - 1 - i] : 1;
        if (e1 == e2 || e2 == 1) {
            result[ndim - 1 - i] = e1;
        } else if (e1 == 1) {
            result[ndim - 1 - i] = e2;
        } else {
            throw broadcast_error(shape_to_string(s1), shape_to_string(s2));
        }
    }
    return result;
}

array broadcast_to(const array& a, const shape_t& target)
{
    const auto& shape = a.shape();
    if (shapes_equal(shape, target)) {
        return a;
    }
    if (shape.size() > target.size()) {
        throw broadcast_error(fmt::format("Cannot broadcast array of shape {} to fewer dimensions {}",
                                          shape_to_string(shape), shape_to_string(target)),
                              {{"shape", shape_to_string(shape)}, {"target", shape_to_string(target)}});
    }
    auto offset = target.size() - shape.size();
    for (std::size_t i = 0; i < shape.size(); ++i) {
        if (shape[i] != 1 && shape[i] != target[offset + i]) {
            throw broadcast_error(fmt::format("Cannot broadcast array of shape {} to shape {}",
                                              shape_to_string(shape), shape_to_string(target)),
                                  {{"shape", shape_to_string(shape)}, {"target", shape_to_string(target)}});
        }
    }

    if (a.size() == 0 && shape_size(target) != 0) {
        throw broadcast_error(fmt::format("Cannot broadcast empty array of shape {} to shape {}",
                                          shape_to_string(shape), shape_to_string(target)),
                              {{"shape", shape_to_string(shape)}, {"target", shape_to_string(target)}});
    }

    base::log_debug(base::log_channel::tensor, "Broadcasting {} to {}", shape_to_string(shape),
                    shape_to_string(target));
    array result(target, a.dtype());
    auto src = a.data();
    auto dst = result.mutable_data();
    auto width = a.itemsize();
    shape_t src_index(shape.size());
    for (const auto& index : ndenumerate(target)) {
        for (std::size_t i = 0; i < shape.size(); ++i) {
            src_index[i] = shape[i] == 1 ? 0 : index[offset + i];
        }
        std::memcpy(dst.data() + result.byte_offset(index), src.data() + a.byte_offset(src_index), width);
    }
    return result;
}

} // namespace ndx
