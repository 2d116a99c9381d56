#pragma once

/**
 * @file ndenumerate.hpp
 * @brief Row-major walk over the multi-indices of a `shape_t`.
 *
 * `ndenumerate(shape)` yields the same `shape_t` indices `unravel_index` gives for flat positions
 * `0 .. shape_size(shape) - 1`. The last axis varies fastest. A shape with a zero extent yields nothing and
 * a 0-dim shape yields the single empty index.
 */

#include "shape.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <utility>

namespace ndx {

class coord_iterator
{
public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = shape_t;
    using difference_type = std::ptrdiff_t;
    using pointer = const shape_t*;
    using reference = const shape_t&;

public:
    explicit coord_iterator(const shape_t& data)
        : data_(data)
        , state_(data.size(), 0)
        , end_(std::find(data_.begin(), data_.end(), 0) != data_.end())
    {
    }

    reference operator*() const
    {
        return state_;
    }

    pointer operator->() const
    {
        return &state_;
    }

    coord_iterator& operator++()
    {
        auto pos = static_cast<int64_t>(state_.size());
        while (--pos >= 0) {
            if (++state_[pos] != data_[pos]) {
                break;
            }
            state_[pos] = 0;
        }
        end_ = pos < 0;
        return *this;
    }

    bool operator==(const coord_iterator& other) const
    {
        return end_ == other.end_ && (end_ || state_ == other.state_);
    }

    bool operator!=(const coord_iterator& other) const
    {
        return !(*this == other);
    }

    void jump_to_end()
    {
        end_ = true;
    }

private:
    shape_t data_;
    shape_t state_;
    bool end_;
};

inline auto ndenumerate(const shape_t& iterable)
{
    struct coord_iterator_wrapper
    {
        shape_t iterable;

        [[nodiscard]] auto begin() const
        {
            return coord_iterator(iterable);
        }

        [[nodiscard]] auto end() const
        {
            coord_iterator it(iterable);
            it.jump_to_end();
            return it;
        }
    };

    return coord_iterator_wrapper{iterable};
}

} // namespace ndx
