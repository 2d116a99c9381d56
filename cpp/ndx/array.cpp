#include "array.hpp"
#include "ndenumerate.hpp"

#include <base/assert.hpp>
#include <base/format.hpp>

#include <utility>

namespace ndx {

array::array()
    : codec_(&impl::codec_for(dtype::float64))
{
}

array::array(shape_t shape, enum dtype dtype)
    : shape_(std::move(shape))
    , dtype_(dtype)
    , codec_(&impl::codec_for(dtype))
{
    for (auto i = 0u; i < shape_.size(); ++i) {
        if (shape_[i] < 0) {
            throw shape_error(fmt::format("Negative extent {} on axis {} of shape {}", shape_[i], i,
                                          shape_to_string(shape_)),
                              {{"shape", shape_to_string(shape_)}});
        }
    }
    size_ = shape_size(shape_);
    strides_ = c_strides(shape_, itemsize());
    buffer_.assign(static_cast<std::size_t>(size_ * itemsize()), 0);
}

array::array(std::vector<uint8_t> buffer, shape_t shape, enum dtype dtype)
    : array(std::move(shape), dtype)
{
    if (static_cast<int64_t>(buffer.size()) != nbytes()) {
        throw shape_error(fmt::format("Buffer of {} bytes does not match shape {} of {} elements of {}",
                                      buffer.size(), shape_to_string(shape_), size_, dtype_to_str(dtype)),
                          {{"shape", shape_to_string(shape_)}, {"bytes", std::to_string(buffer.size())}});
    }
    buffer_ = std::move(buffer);
}

int64_t array::byte_offset(const shape_t& indices) const
{
    if (indices.size() != shape_.size()) {
        throw shape_error(fmt::format("Expected {} indices for shape {}, got {}", shape_.size(),
                                      shape_to_string(shape_), indices.size()),
                          {{"shape", shape_to_string(shape_)}, {"indices", shape_to_string(indices)}});
    }
    int64_t offset = 0;
    for (auto i = 0u; i < indices.size(); ++i) {
        offset += normalize_index(indices[i], shape_[i], i) * strides_[i];
    }
    return offset;
}

int64_t array::checked_offset(const shape_t& indices) const
{
    auto offset = byte_offset(indices);
    ASSERT(offset >= 0 && offset + itemsize() <= nbytes());
    return offset;
}

double array::get_float64(const shape_t& indices) const
{
    return codec_->load_float64(buffer_.data() + checked_offset(indices));
}

int64_t array::get_int64(const shape_t& indices) const
{
    return codec_->load_int64(buffer_.data() + checked_offset(indices));
}

complex128_t array::get_complex(const shape_t& indices) const
{
    return codec_->load_complex(buffer_.data() + checked_offset(indices));
}

void array::set_float64(double value, const shape_t& indices)
{
    codec_->store_float64(buffer_.data() + checked_offset(indices), value);
}

void array::set_int64(int64_t value, const shape_t& indices)
{
    codec_->store_int64(buffer_.data() + checked_offset(indices), value);
}

void array::set_complex(complex128_t value, const shape_t& indices)
{
    codec_->store_complex(buffer_.data() + checked_offset(indices), value);
}

std::vector<double> array::to_float64_vector() const
{
    std::vector<double> result;
    result.reserve(static_cast<std::size_t>(size_));
    for (const auto& index : ndenumerate(shape_)) {
        result.push_back(get_float64(index));
    }
    return result;
}

std::vector<int64_t> array::to_int64_vector() const
{
    std::vector<int64_t> result;
    result.reserve(static_cast<std::size_t>(size_));
    for (const auto& index : ndenumerate(shape_)) {
        result.push_back(get_int64(index));
    }
    return result;
}

array copy(const array& a)
{
    return a;
}

std::string to_string(const array& a)
{
    return fmt::format("array(shape={}, dtype={})", shape_to_string(a.shape()), dtype_to_str(a.dtype()));
}

} // namespace ndx
