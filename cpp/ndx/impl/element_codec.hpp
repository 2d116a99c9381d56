#pragma once

/**
 * @file element_codec.hpp
 * @brief Decoding and encoding of single elements stored in an untyped byte buffer.
 */

#include "../dtype.hpp"
#include "../exceptions.hpp"

#include <base/type_traits.hpp>

#include <cmath>
#include <complex>
#include <cstdint>
#include <cstring>
#include <limits>

namespace ndx::impl {

/**
 * @brief Converts a double into `T`, truncating toward zero and clamping to the range of `T`. NaN becomes 0.
 */
template <typename T>
requires base::integral<T>
inline T saturate_cast(double v) noexcept
{
    if (std::isnan(v)) {
        return T{};
    }
    if (v <= static_cast<double>(std::numeric_limits<T>::lowest())) {
        return std::numeric_limits<T>::lowest();
    }
    if (v >= static_cast<double>(std::numeric_limits<T>::max())) {
        return std::numeric_limits<T>::max();
    }
    return static_cast<T>(v);
}

class element_codec
{
public:
    virtual ~element_codec() = default;

    virtual enum dtype dtype() const noexcept = 0;

    virtual double load_float64(const uint8_t* p) const = 0;
    virtual int64_t load_int64(const uint8_t* p) const = 0;
    virtual complex128_t load_complex(const uint8_t* p) const = 0;

    virtual void store_float64(uint8_t* p, double value) const = 0;
    virtual void store_int64(uint8_t* p, int64_t value) const = 0;
    virtual void store_complex(uint8_t* p, complex128_t value) const = 0;
};

template <typename T>
class typed_codec final : public element_codec
{
public:
    enum dtype dtype() const noexcept override
    {
        return dtype_enum_v<T>;
    }

    double load_float64(const uint8_t* p) const override
    {
        if constexpr (base::complex<T>) {
            throw unsupported_dtype_error(dtype_to_str(dtype()), "float64 decoding");
        } else {
            return static_cast<double>(load(p));
        }
    }

    int64_t load_int64(const uint8_t* p) const override
    {
        if constexpr (base::complex<T>) {
            throw unsupported_dtype_error(dtype_to_str(dtype()), "int64 decoding");
        } else if constexpr (base::floating_point<T>) {
            return saturate_cast<int64_t>(static_cast<double>(load(p)));
        } else {
            return static_cast<int64_t>(load(p));
        }
    }

    complex128_t load_complex(const uint8_t* p) const override
    {
        if constexpr (base::complex<T>) {
            auto v = load(p);
            return {static_cast<double>(v.real()), static_cast<double>(v.imag())};
        } else {
            return {static_cast<double>(load(p)), 0.0};
        }
    }

    void store_float64(uint8_t* p, double value) const override
    {
        if constexpr (base::complex<T>) {
            throw unsupported_dtype_error(dtype_to_str(dtype()), "float64 encoding");
        } else if constexpr (std::is_same_v<T, bool>) {
            store(p, value != 0.0);
        } else if constexpr (base::integral<T>) {
            store(p, saturate_cast<T>(value));
        } else {
            store(p, static_cast<T>(value));
        }
    }

    void store_int64(uint8_t* p, int64_t value) const override
    {
        if constexpr (base::complex<T>) {
            throw unsupported_dtype_error(dtype_to_str(dtype()), "int64 encoding");
        } else if constexpr (std::is_same_v<T, bool>) {
            store(p, value != 0);
        } else {
            store(p, static_cast<T>(value));
        }
    }

    void store_complex(uint8_t* p, complex128_t value) const override
    {
        if constexpr (base::complex<T>) {
            using part_t = typename T::value_type;
            store(p, T(static_cast<part_t>(value.real()), static_cast<part_t>(value.imag())));
        } else {
            if (value.imag() != 0.0) {
                throw unsupported_dtype_error(dtype_to_str(dtype()), "complex encoding with non-zero imaginary part");
            }
            store_float64(p, value.real());
        }
    }

private:
    static T load(const uint8_t* p) noexcept
    {
        if constexpr (std::is_same_v<T, bool>) {
            return *p != 0;
        } else {
            T value;
            std::memcpy(&value, p, sizeof(T));
            return value;
        }
    }

    static void store(uint8_t* p, T value) noexcept
    {
        if constexpr (std::is_same_v<T, bool>) {
            *p = value ? 1 : 0;
        } else {
            std::memcpy(p, &value, sizeof(T));
        }
    }
};

/**
 * @brief Returns the codec of the given dtype. Codecs are stateless singletons.
 */
const element_codec& codec_for(enum dtype t);

} // namespace ndx::impl
