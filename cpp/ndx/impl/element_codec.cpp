#include "element_codec.hpp"

namespace ndx::impl {

const element_codec& codec_for(enum dtype t)
{
    return *switch_dtype(t, []<typename T>() -> const element_codec* {
        static const typed_codec<T> codec{};
        return &codec;
    });
}

} // namespace ndx::impl
