#pragma once

/**
 * @file array.hpp
 * @brief Definition of the `array` class, the owning strided buffer every operation consumes and produces.
 */

#include "dtype.hpp"
#include "exceptions.hpp"
#include "impl/element_codec.hpp"
#include "shape.hpp"

#include <concepts>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace ndx {

/**
 * @brief N-dimensional array over an exclusively owned byte buffer.
 *
 * The buffer holds `size() * itemsize()` bytes interpreted through `dtype()`. `strides()` gives the byte step of
 * every axis; arrays produced by the library are always C-contiguous. Copying an array copies its buffer, there
 * are no views sharing storage.
 *
 * Element accessors take one index per axis. Negative indices count from the end of the axis.
 */
class array
{
public:
    /**
     * @brief Empty float64 array with shape `()` and no elements.
     */
    array();

    /**
     * @brief Zero filled array of the given shape and dtype.
     */
    array(shape_t shape, enum dtype dtype);

    /**
     * @brief Adopts `buffer` as the row-major content of an array with the given shape and dtype.
     * @throws shape_error if the buffer length does not match the shape.
     */
    array(std::vector<uint8_t> buffer, shape_t shape, enum dtype dtype);

    array(const array&) = default;
    array(array&&) noexcept = default;
    array& operator=(const array&) = default;
    array& operator=(array&&) noexcept = default;
    ~array() = default;

public:
    const shape_t& shape() const noexcept
    {
        return shape_;
    }

    const shape_t& strides() const noexcept
    {
        return strides_;
    }

    enum dtype dtype() const noexcept
    {
        return dtype_;
    }

    int64_t size() const noexcept
    {
        return size_;
    }

    int64_t ndim() const noexcept
    {
        return static_cast<int64_t>(shape_.size());
    }

    int64_t itemsize() const noexcept
    {
        return static_cast<int64_t>(dtype_bytes(dtype_));
    }

    int64_t nbytes() const noexcept
    {
        return static_cast<int64_t>(buffer_.size());
    }

    /**
     * @brief Raw bytes of the array.
     */
    std::span<const uint8_t> data() const noexcept
    {
        return buffer_;
    }

    std::span<uint8_t> mutable_data() noexcept
    {
        return buffer_;
    }

    /**
     * @brief Typed view of the buffer. `T` must match the dtype of the array.
     * @throws unsupported_dtype_error on mismatch.
     */
    template <typename T>
    std::span<const T> data_as() const
    {
        if (dtype_enum_v<T> != dtype_) {
            throw unsupported_dtype_error(dtype_to_str(dtype_), dtype_to_str(dtype_enum_v<T>));
        }
        return std::span<const T>(reinterpret_cast<const T*>(buffer_.data()), static_cast<std::size_t>(size_));
    }

    const impl::element_codec& codec() const noexcept
    {
        return *codec_;
    }

public:
    /**
     * @brief Byte offset of the element at `indices`.
     * @throws shape_error if the number of indices differs from `ndim()`.
     * @throws index_error if an index is out of bounds.
     */
    int64_t byte_offset(const shape_t& indices) const;

    double get_float64(const shape_t& indices) const;
    int64_t get_int64(const shape_t& indices) const;
    complex128_t get_complex(const shape_t& indices) const;

    void set_float64(double value, const shape_t& indices);
    void set_int64(int64_t value, const shape_t& indices);
    void set_complex(complex128_t value, const shape_t& indices);

    template <std::integral... I>
    double get_float64(I... indices) const
    {
        return get_float64(shape_t{static_cast<int64_t>(indices)...});
    }

    template <std::integral... I>
    int64_t get_int64(I... indices) const
    {
        return get_int64(shape_t{static_cast<int64_t>(indices)...});
    }

    template <std::integral... I>
    complex128_t get_complex(I... indices) const
    {
        return get_complex(shape_t{static_cast<int64_t>(indices)...});
    }

    template <std::integral... I>
    void set_float64(double value, I... indices)
    {
        set_float64(value, shape_t{static_cast<int64_t>(indices)...});
    }

    template <std::integral... I>
    void set_int64(int64_t value, I... indices)
    {
        set_int64(value, shape_t{static_cast<int64_t>(indices)...});
    }

    template <std::integral... I>
    void set_complex(complex128_t value, I... indices)
    {
        set_complex(value, shape_t{static_cast<int64_t>(indices)...});
    }

    /**
     * @brief All elements in row-major order, decoded as float64.
     */
    std::vector<double> to_float64_vector() const;

    /**
     * @brief All elements in row-major order, decoded as int64.
     */
    std::vector<int64_t> to_int64_vector() const;

private:
    int64_t checked_offset(const shape_t& indices) const;

private:
    std::vector<uint8_t> buffer_;
    shape_t shape_;
    shape_t strides_;
    enum dtype dtype_ = dtype::float64;
    int64_t size_ = 0;
    const impl::element_codec* codec_ = nullptr;
};

/**
 * @brief Deep copy of the array.
 */
array copy(const array& a);

std::string to_string(const array& a);

} // namespace ndx
