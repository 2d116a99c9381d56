#include "json_adapt.hpp"
#include "ndenumerate.hpp"

#include <boost/json.hpp>

#include <cstring>

namespace ndx {

namespace {

boost::json::value element_to_json(const array& a, const shape_t& index)
{
    auto p = a.data().data() + a.byte_offset(index);
    return switch_dtype(a.dtype(), [p]<typename T>() -> boost::json::value {
        if constexpr (std::is_same_v<T, bool>) {
            return boost::json::value(*p != 0);
        } else {
            T v;
            std::memcpy(&v, p, sizeof(T));
            if constexpr (base::complex<T>) {
                return boost::json::object{{"re", static_cast<double>(v.real())},
                                           {"im", static_cast<double>(v.imag())}};
            } else if constexpr (base::floating_point<T>) {
                return boost::json::value(static_cast<double>(v));
            } else if constexpr (std::is_signed_v<T>) {
                return boost::json::value(static_cast<std::int64_t>(v));
            } else {
                return boost::json::value(static_cast<std::uint64_t>(v));
            }
        }
    });
}

boost::json::value axis_to_json(const array& a, shape_t& index, std::size_t axis)
{
    if (axis == index.size()) {
        return element_to_json(a, index);
    }
    boost::json::array result;
    result.reserve(static_cast<std::size_t>(a.shape()[axis]));
    for (int64_t i = 0; i < a.shape()[axis]; ++i) {
        index[axis] = i;
        result.push_back(axis_to_json(a, index, axis + 1));
    }
    return result;
}

shape_t infer_shape(const boost::json::value& j)
{
    shape_t shape;
    const auto* level = &j;
    while (level->is_array()) {
        const auto& items = level->get_array();
        shape.push_back(static_cast<int64_t>(items.size()));
        if (items.empty()) {
            break;
        }
        level = &items.front();
    }
    return shape;
}

void store_element(const boost::json::value& j, array& result, int64_t flat)
{
    const auto& codec = result.codec();
    auto p = result.mutable_data().data() + flat * result.itemsize();
    if (dtype_is_complex(result.dtype()) && (j.is_bool() || j.is_number())) {
        codec.store_complex(p, complex128_t(j.is_bool() ? (j.get_bool() ? 1.0 : 0.0) : j.to_number<double>(), 0.0));
    } else if (j.is_bool()) {
        codec.store_int64(p, j.get_bool() ? 1 : 0);
    } else if (j.is_int64()) {
        codec.store_int64(p, j.get_int64());
    } else if (j.is_uint64() && result.dtype() == dtype::uint64) {
        codec.store_int64(p, static_cast<int64_t>(j.get_uint64()));
    } else if (j.is_uint64()) {
        codec.store_float64(p, static_cast<double>(j.get_uint64()));
    } else if (j.is_double()) {
        codec.store_complex(p, complex128_t(j.get_double(), 0.0));
    } else if (j.is_object() && j.get_object().contains("re") && j.get_object().contains("im")) {
        const auto& o = j.get_object();
        codec.store_complex(p, complex128_t(o.at("re").to_number<double>(), o.at("im").to_number<double>()));
    } else {
        throw invalid_argument(fmt::format("Unsupported JSON element {}", boost::json::serialize(j)));
    }
}

void flatten_json(const boost::json::value& j, const shape_t& shape, std::size_t axis, array& result,
                  int64_t& flat)
{
    if (axis == shape.size()) {
        if (j.is_array()) {
            throw shape_error(fmt::format("Ragged nested list, expected an element at depth {}", axis),
                              {{"shape", shape_to_string(shape)}});
        }
        store_element(j, result, flat++);
        return;
    }
    if (!j.is_array() || static_cast<int64_t>(j.get_array().size()) != shape[axis]) {
        throw shape_error(fmt::format("Ragged nested list, expected {} items at depth {}", shape[axis], axis),
                          {{"shape", shape_to_string(shape)}, {"axis", std::to_string(axis)}});
    }
    for (const auto& item : j.get_array()) {
        flatten_json(item, shape, axis + 1, result, flat);
    }
}

} // namespace

boost::json::value to_json(const array& a)
{
    if (a.ndim() == 0) {
        return boost::json::array();
    }
    shape_t index(a.shape().size(), 0);
    return axis_to_json(a, index, 0);
}

array from_json(const boost::json::value& j, dtype t)
{
    auto shape = infer_shape(j);
    if (shape.empty()) {
        array result({1}, t);
        store_element(j, result, 0);
        return result;
    }
    array result(shape, t);
    int64_t flat = 0;
    flatten_json(j, shape, 0, result, flat);
    return result;
}

} // namespace ndx
