#pragma once

/**
 * @file generator.hpp
 * @brief Seeded random sampling into arrays.
 */

#include "../array.hpp"

#include <cstdint>
#include <random>

namespace ndx::random {

/**
 * @brief Deterministic stream of random samples.
 *
 * Two generators constructed with the same seed produce identical sequences. Every sampling function
 * draws independently for each element of the requested shape. A generator is not thread safe.
 */
class generator
{
public:
    /**
     * @brief Generator seeded from `std::random_device`.
     */
    generator();

    explicit generator(uint64_t seed);

    generator(const generator&) = delete;
    generator& operator=(const generator&) = delete;
    generator(generator&&) noexcept = default;
    generator& operator=(generator&&) noexcept = default;
    ~generator() = default;

public:
    /**
     * @brief Restarts the stream from `seed` and clears the rejection counter.
     */
    void seed(uint64_t seed);

    /**
     * @brief float64 samples from `[low, high)`.
     */
    array uniform(double low, double high, const shape_t& shape);

    array rand(const shape_t& shape);

    array normal(double mean, double std, const shape_t& shape);

    array standard_normal(const shape_t& shape);

    /**
     * @brief Number of successes in `n` trials with success probability `p`.
     */
    array binomial(int64_t n, double p, const shape_t& shape);

    array poisson(double lambda, const shape_t& shape);

    array exponential(double scale, const shape_t& shape);

    /**
     * @brief Gamma distributed samples, Marsaglia-Tsang method.
     */
    array gamma(double shape, double scale, const shape_t& size);

    array beta(double alpha, double beta, const shape_t& shape);

    /**
     * @brief int64 samples from `[low, high)`.
     */
    array randint(int64_t low, int64_t high, const shape_t& shape);

    /**
     * @brief `size` elements of `a` picked with replacement, as a single dimension float64 array.
     */
    array choice(const array& a, int64_t size);

    /**
     * @brief Random ordering of `0 .. n-1` as int64.
     */
    array permutation(int64_t n);

    /**
     * @brief Shuffles the elements of `a` in place over its flattened order.
     */
    void shuffle(array& a);

    /**
     * @brief Number of rejected Gamma proposals since the last seeding.
     */
    int64_t rejections() const noexcept
    {
        return rejections_;
    }

private:
    double next_uniform();
    double next_normal();
    double next_gamma(double shape);
    int64_t next_index(int64_t n);

    template <typename F>
    array sample(const shape_t& shape, F draw);

private:
    std::mt19937_64 engine_;
    std::normal_distribution<double> normal_;
    int64_t rejections_ = 0;
};

} // namespace ndx::random
