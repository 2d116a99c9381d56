#include "generator.hpp"
#include "../generators.hpp"

#include <base/logger.hpp>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <numeric>
#include <vector>

namespace ndx::random {

namespace {

void check_shape(const shape_t& shape)
{
    if (std::any_of(shape.begin(), shape.end(), [](int64_t e) { return e < 0; })) {
        throw invalid_argument(fmt::format("Sample shape {} has a negative extent", shape_to_string(shape)));
    }
}

void check_positive(double value, std::string_view name)
{
    if (!(value > 0.0)) {
        throw invalid_argument(fmt::format("{} must be positive, got {}", name, value));
    }
}

} // namespace

generator::generator()
    : generator(std::random_device{}())
{
}

generator::generator(uint64_t seed)
    : engine_(seed)
{
    base::log_debug(base::log_channel::random, "Created generator with seed {}", seed);
}

void generator::seed(uint64_t seed)
{
    engine_.seed(seed);
    normal_.reset();
    rejections_ = 0;
    base::log_debug(base::log_channel::random, "Reseeded generator with {}", seed);
}

double generator::next_uniform()
{
    return static_cast<double>(engine_() >> 11) * 0x1.0p-53;
}

double generator::next_normal()
{
    return normal_(engine_);
}

int64_t generator::next_index(int64_t n)
{
    std::uniform_int_distribution<int64_t> dist(0, n - 1);
    return dist(engine_);
}

double generator::next_gamma(double shape)
{
    if (shape < 1.0) {
        auto u = next_uniform();
        return next_gamma(shape + 1.0) * std::pow(u, 1.0 / shape);
    }
    auto d = shape - 1.0 / 3.0;
    auto c = 1.0 / std::sqrt(9.0 * d);
    while (true) {
        double x = 0.0;
        double v = 0.0;
        do {
            x = next_normal();
            v = 1.0 + c * x;
            if (v <= 0.0) {
                ++rejections_;
            }
        } while (v <= 0.0);
        v = v * v * v;
        auto u = next_uniform();
        if (u < 1.0 - 0.0331 * (x * x) * (x * x)) {
            return d * v;
        }
        if (std::log(u) < 0.5 * x * x + d * (1.0 - v + std::log(v))) {
            return d * v;
        }
        ++rejections_;
    }
}

template <typename F>
array generator::sample(const shape_t& shape, F draw)
{
    check_shape(shape);
    std::vector<double> values(static_cast<std::size_t>(shape_size(shape)));
    for (auto& v : values) {
        v = draw();
    }
    return from_float64(values, shape);
}

array generator::uniform(double low, double high, const shape_t& shape)
{
    if (high < low) {
        throw invalid_argument(fmt::format("uniform requires low <= high, got [{}, {})", low, high));
    }
    return sample(shape, [&] {
        return low + (high - low) * next_uniform();
    });
}

array generator::rand(const shape_t& shape)
{
    return uniform(0.0, 1.0, shape);
}

array generator::normal(double mean, double std, const shape_t& shape)
{
    if (std < 0.0) {
        throw invalid_argument(fmt::format("Standard deviation must be non-negative, got {}", std));
    }
    return sample(shape, [&] {
        return mean + std * next_normal();
    });
}

array generator::standard_normal(const shape_t& shape)
{
    return normal(0.0, 1.0, shape);
}

array generator::binomial(int64_t n, double p, const shape_t& shape)
{
    if (n < 0) {
        throw invalid_argument(fmt::format("Number of trials must be non-negative, got {}", n));
    }
    if (!(p >= 0.0 && p <= 1.0)) {
        throw invalid_argument(fmt::format("Probability must be in [0, 1], got {}", p));
    }
    return sample(shape, [&] {
        int64_t successes = 0;
        for (int64_t i = 0; i < n; ++i) {
            if (next_uniform() < p) {
                ++successes;
            }
        }
        return static_cast<double>(successes);
    });
}

array generator::poisson(double lambda, const shape_t& shape)
{
    if (!(lambda >= 0.0)) {
        throw invalid_argument(fmt::format("Poisson rate must be non-negative, got {}", lambda));
    }
    auto limit = std::exp(-lambda);
    return sample(shape, [&] {
        int64_t k = 0;
        double p = 1.0;
        do {
            ++k;
            p *= next_uniform();
        } while (p > limit);
        return static_cast<double>(k - 1);
    });
}

array generator::exponential(double scale, const shape_t& shape)
{
    check_positive(scale, "Scale");
    return sample(shape, [&] {
        return -scale * std::log(1.0 - next_uniform());
    });
}

array generator::gamma(double shape, double scale, const shape_t& size)
{
    check_positive(shape, "Shape");
    check_positive(scale, "Scale");
    return sample(size, [&] {
        return scale * next_gamma(shape);
    });
}

array generator::beta(double alpha, double beta, const shape_t& shape)
{
    check_positive(alpha, "Alpha");
    check_positive(beta, "Beta");
    return sample(shape, [&] {
        auto x = next_gamma(alpha);
        auto y = next_gamma(beta);
        return x / (x + y);
    });
}

array generator::randint(int64_t low, int64_t high, const shape_t& shape)
{
    if (high <= low) {
        throw invalid_argument(fmt::format("randint requires low < high, got [{}, {})", low, high));
    }
    check_shape(shape);
    auto span = static_cast<uint64_t>(high) - static_cast<uint64_t>(low);
    std::uniform_int_distribution<uint64_t> dist(0, span - 1);
    std::vector<int64_t> values(static_cast<std::size_t>(shape_size(shape)));
    for (auto& v : values) {
        v = static_cast<int64_t>(static_cast<uint64_t>(low) + dist(engine_));
    }
    return from_int64(values, shape);
}

array generator::choice(const array& a, int64_t size)
{
    if (a.size() == 0) {
        throw invalid_argument("Cannot choose from an empty array");
    }
    if (size < 0) {
        throw invalid_argument(fmt::format("Sample size must be non-negative, got {}", size));
    }
    std::vector<double> values(static_cast<std::size_t>(size));
    for (auto& v : values) {
        v = a.get_float64(unravel_index(next_index(a.size()), a.shape()));
    }
    return from_float64(values, {size});
}

array generator::permutation(int64_t n)
{
    if (n < 0) {
        throw invalid_argument(fmt::format("Permutation length must be non-negative, got {}", n));
    }
    std::vector<int64_t> values(static_cast<std::size_t>(n));
    std::iota(values.begin(), values.end(), int64_t{0});
    for (auto i = n - 1; i > 0; --i) {
        std::swap(values[i], values[next_index(i + 1)]);
    }
    return from_int64(values, {n});
}

void generator::shuffle(array& a)
{
    auto width = static_cast<std::size_t>(a.itemsize());
    auto bytes = a.mutable_data();
    std::vector<uint8_t> scratch(width);
    for (auto i = a.size() - 1; i > 0; --i) {
        auto j = next_index(i + 1);
        auto first = bytes.data() + a.byte_offset(unravel_index(i, a.shape()));
        auto second = bytes.data() + a.byte_offset(unravel_index(j, a.shape()));
        std::memcpy(scratch.data(), first, width);
        std::memcpy(first, second, width);
        std::memcpy(second, scratch.data(), width);
    }
}

} // namespace ndx::random
