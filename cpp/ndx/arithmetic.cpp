#include "arithmetic.hpp"
#include "impl/kernels.hpp"

namespace ndx {

array add(const array& f, const array& s)
{
    return impl::map_binary(f, s, [](auto x, auto y) {
        return x + y;
    });
}

array subtract(const array& f, const array& s)
{
    return impl::map_binary(f, s, [](auto x, auto y) {
        return x - y;
    });
}

array multiply(const array& f, const array& s)
{
    return impl::map_binary(f, s, [](auto x, auto y) {
        return x * y;
    });
}

array divide(const array& f, const array& s)
{
    return impl::map_binary(f, s, [](auto x, auto y) {
        return x / y;
    });
}

array add_scalar(const array& a, double value)
{
    return impl::map_unary(a, [value](auto x) {
        return x + value;
    });
}

array multiply_scalar(const array& a, double value)
{
    return impl::map_unary(a, [value](auto x) {
        return x * value;
    });
}

} // namespace ndx
