#include "math.hpp"
#include "impl/kernels.hpp"

#include <cmath>
#include <complex>

namespace ndx {

array exp(const array& a)
{
    return impl::map_unary(a, [](auto x) {
        return std::exp(x);
    });
}

array log(const array& a)
{
    return impl::map_unary(a, [](auto x) {
        return std::log(x);
    });
}

array sin(const array& a)
{
    return impl::map_unary(a, [](auto x) {
        return std::sin(x);
    });
}

array cos(const array& a)
{
    return impl::map_unary(a, [](auto x) {
        return std::cos(x);
    });
}

array sqrt(const array& a)
{
    return impl::map_unary(a, [](auto x) {
        return std::sqrt(x);
    });
}

array pow(const array& a, double exponent)
{
    return impl::map_unary(a, [exponent](auto x) {
        return std::pow(x, exponent);
    });
}

array abs(const array& a)
{
    return impl::map_unary(a, [](auto x) {
        return std::abs(x);
    });
}

array negative(const array& a)
{
    return impl::map_unary(a, [](auto x) {
        return -x;
    });
}

} // namespace ndx
