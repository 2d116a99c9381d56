#include <gtest/gtest.h>
#include "../../ndx/generators.hpp"

#include <limits>
#include <vector>

TEST(GeneratorsTest, ones_and_full) {
    EXPECT_EQ((std::vector<double>{1, 1, 1, 1}), ndx::ones({2, 2}).to_float64_vector());
    auto f = ndx::full({3}, 2.5, ndx::dtype::float32);
    EXPECT_EQ(ndx::dtype::float32, f.dtype());
    EXPECT_EQ((std::vector<double>{2.5, 2.5, 2.5}), f.to_float64_vector());

    auto i = ndx::full({2}, 7.9, ndx::dtype::uint8);
    EXPECT_EQ((std::vector<int64_t>{7, 7}), i.to_int64_vector());

    auto c = ndx::ones({2}, ndx::dtype::complex64);
    EXPECT_EQ(ndx::complex128_t(1.0, 0.0), c.get_complex(1));
}

TEST(GeneratorsTest, from_vector) {
    auto a = ndx::from_float32({1.5f, 2.5f}, {2});
    EXPECT_EQ(ndx::dtype::float32, a.dtype());
    EXPECT_EQ(2.5, a.get_float64(1));

    auto b = ndx::from_vector<int16_t>({-1, 2, 3, 4}, {2, 2});
    EXPECT_EQ(ndx::dtype::int16, b.dtype());
    EXPECT_EQ(-1, b.get_int64(0, 0));

    EXPECT_THROW(ndx::from_float64({1, 2, 3}, {2, 2}), ndx::shape_error);
}

TEST(GeneratorsTest, arange) {
    EXPECT_EQ((std::vector<double>{0, 1, 2, 3, 4}), ndx::arange(0, 5).to_float64_vector());
    EXPECT_EQ((std::vector<double>{1, 1.5, 2, 2.5}), ndx::arange(1, 3, 0.5).to_float64_vector());
    EXPECT_EQ((std::vector<double>{5, 3, 1}), ndx::arange(5, 0, -2).to_float64_vector());
    EXPECT_EQ(0, ndx::arange(3, 1).size());
    EXPECT_EQ(1, ndx::arange(3, 1).ndim());
    EXPECT_THROW(ndx::arange(0, 1, 0), ndx::invalid_argument);
}

TEST(GeneratorsTest, arange_non_finite) {
    auto inf = std::numeric_limits<double>::infinity();
    auto nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(ndx::arange(0, inf), ndx::invalid_argument);
    EXPECT_THROW(ndx::arange(-inf, 0), ndx::invalid_argument);
    EXPECT_THROW(ndx::arange(0, nan), ndx::invalid_argument);
    EXPECT_THROW(ndx::arange(0, 1, nan), ndx::invalid_argument);
    EXPECT_THROW(ndx::arange(0, 1, inf), ndx::invalid_argument);
}

TEST(GeneratorsTest, range) {
    auto r = ndx::range(-2, 3);
    EXPECT_EQ(ndx::dtype::int64, r.dtype());
    EXPECT_EQ((std::vector<int64_t>{-2, -1, 0, 1, 2}), r.to_int64_vector());
    auto empty = ndx::range(4, 1);
    EXPECT_EQ(0, empty.size());
    EXPECT_EQ(0, empty.shape()[0]);
}

TEST(GeneratorsTest, eye) {
    auto e = ndx::eye(3);
    EXPECT_EQ((std::vector<double>{1, 0, 0, 0, 1, 0, 0, 0, 1}), e.to_float64_vector());
    auto i = ndx::eye(2, ndx::dtype::int32);
    EXPECT_EQ(ndx::dtype::int32, i.dtype());
    EXPECT_EQ(1, i.get_int64(1, 1));
}
