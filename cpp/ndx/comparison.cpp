#include "comparison.hpp"
#include "config.hpp"
#include "impl/kernels.hpp"

#include <cmath>

namespace ndx {

namespace {

template <typename P>
bool all_pairs(const array& f, const array& s, P predicate)
{
    if (!shapes_equal(f.shape(), s.shape())) {
        return false;
    }
    auto w1 = f.itemsize();
    auto w2 = s.itemsize();
    for (int64_t i = 0; i < f.size(); ++i) {
        auto x = f.codec().load_complex(f.data().data() + i * w1);
        auto y = s.codec().load_complex(s.data().data() + i * w2);
        if (!predicate(x, y)) {
            return false;
        }
    }
    return true;
}

} // namespace

array greater(const array& f, const array& s)
{
    return impl::compare_binary(f, s, "greater", [](double x, double y) {
        return x > y;
    });
}

array less(const array& f, const array& s)
{
    return impl::compare_binary(f, s, "less", [](double x, double y) {
        return x < y;
    });
}

array greater_scalar(const array& a, double value)
{
    return impl::compare_unary(a, "greater_scalar", [value](double x) {
        return x > value;
    });
}

array less_scalar(const array& a, double value)
{
    return impl::compare_unary(a, "less_scalar", [value](double x) {
        return x < value;
    });
}

bool equal(const array& f, const array& s)
{
    return all_pairs(f, s, [](complex128_t x, complex128_t y) {
        return x == y;
    });
}

bool allclose(const array& f, const array& s, double rtol, double atol)
{
    return all_pairs(f, s, [rtol, atol](complex128_t x, complex128_t y) {
        return std::abs(x - y) <= atol + rtol * std::abs(y);
    });
}

bool allclose(const array& f, const array& s)
{
    const auto& c = get_config();
    return allclose(f, s, c.allclose_rtol, c.allclose_atol);
}

} // namespace ndx
