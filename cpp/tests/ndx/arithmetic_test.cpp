#include <gtest/gtest.h>
#include "../../ndx/arithmetic.hpp"
#include "../../ndx/comparison.hpp"
#include "../../ndx/generators.hpp"
#include "../../ndx/math.hpp"

#include <cmath>
#include <vector>

TEST(ArithmeticTest, elementwise) {
    auto a = ndx::from_float64({1, 2, 3, 4}, {2, 2});
    auto b = ndx::from_float64({4, 3, 2, 1}, {2, 2});
    EXPECT_EQ((std::vector<double>{5, 5, 5, 5}), (a + b).to_float64_vector());
    EXPECT_EQ((std::vector<double>{-3, -1, 1, 3}), (a - b).to_float64_vector());
    EXPECT_EQ((std::vector<double>{4, 6, 6, 4}), (a * b).to_float64_vector());
    EXPECT_EQ((std::vector<double>{0.25, 2.0 / 3.0, 1.5, 4}), (a / b).to_float64_vector());
}

TEST(ArithmeticTest, broadcasting) {
    auto a = ndx::from_float64({1, 2, 3, 4, 5, 6}, {2, 3});
    auto row = ndx::from_float64({10, 20, 30}, {3});
    auto sum = ndx::add(a, row);
    EXPECT_EQ((std::vector<double>{11, 22, 33, 14, 25, 36}), sum.to_float64_vector());
    EXPECT_THROW(ndx::add(a, ndx::zeros({2})), ndx::broadcast_error);
}

TEST(ArithmeticTest, result_typed_as_left_operand) {
    auto a = ndx::from_int64({1, 2, 3}, {3});
    auto b = ndx::from_float64({0.5, 0.5, 0.5}, {3});
    auto r = a + b;
    EXPECT_EQ(ndx::dtype::int64, r.dtype());
    EXPECT_EQ((std::vector<int64_t>{1, 2, 3}), r.to_int64_vector());
    EXPECT_EQ(ndx::dtype::float64, (b + a).dtype());
    EXPECT_EQ((std::vector<double>{1.5, 2.5, 3.5}), (b + a).to_float64_vector());
}

TEST(ArithmeticTest, add_zeros_is_identity) {
    auto a = ndx::arange(-3, 3, 0.5);
    EXPECT_TRUE(ndx::equal(a, a + ndx::zeros(a.shape())));
}

TEST(ArithmeticTest, scalar_operations) {
    auto a = ndx::from_float64({1, 2, 3}, {3});
    EXPECT_EQ((std::vector<double>{3, 4, 5}), ndx::add_scalar(a, 2).to_float64_vector());
    EXPECT_EQ((std::vector<double>{-2, -4, -6}), ndx::multiply_scalar(a, -2).to_float64_vector());
    EXPECT_EQ((std::vector<double>{1, 2, 3}), a.to_float64_vector());
}

TEST(ArithmeticTest, complex_arithmetic) {
    auto a = ndx::zeros({1}, ndx::dtype::complex128);
    a.set_complex({1.0, 2.0}, 0);
    auto b = ndx::zeros({1}, ndx::dtype::complex128);
    b.set_complex({3.0, -1.0}, 0);
    EXPECT_EQ(ndx::complex128_t(4.0, 1.0), (a + b).get_complex(0));
    EXPECT_EQ(ndx::complex128_t(5.0, 5.0), (a * b).get_complex(0));
}

TEST(MathTest, unary_functions) {
    auto a = ndx::from_float64({0, 1, 4}, {3});
    EXPECT_TRUE(ndx::allclose(ndx::exp(a), ndx::from_float64({1, std::exp(1.0), std::exp(4.0)}, {3})));
    EXPECT_TRUE(ndx::allclose(ndx::sqrt(a), ndx::from_float64({0, 1, 2}, {3})));
    EXPECT_TRUE(ndx::allclose(ndx::pow(a, 2), ndx::from_float64({0, 1, 16}, {3})));
    EXPECT_TRUE(ndx::allclose(ndx::sin(a), ndx::from_float64({0, std::sin(1.0), std::sin(4.0)}, {3})));
    EXPECT_TRUE(ndx::allclose(ndx::cos(a), ndx::from_float64({1, std::cos(1.0), std::cos(4.0)}, {3})));

    auto b = ndx::from_float64({1, std::exp(2.0)}, {2});
    EXPECT_TRUE(ndx::allclose(ndx::log(b), ndx::from_float64({0, 2}, {2})));
}

TEST(MathTest, abs_and_negative) {
    auto a = ndx::from_int64({-2, 0, 5}, {3});
    EXPECT_EQ((std::vector<int64_t>{2, 0, 5}), ndx::abs(a).to_int64_vector());
    EXPECT_EQ((std::vector<int64_t>{2, 0, -5}), (-a).to_int64_vector());
    EXPECT_EQ(ndx::dtype::int64, ndx::abs(a).dtype());
}

TEST(MathTest, keeps_shape) {
    auto a = ndx::ones({2, 3, 4}, ndx::dtype::float32);
    auto r = ndx::exp(a);
    EXPECT_EQ(ndx::dtype::float32, r.dtype());
    EXPECT_EQ(24, r.size());
    EXPECT_FLOAT_EQ(static_cast<float>(std::exp(1.0)), static_cast<float>(r.get_float64(1, 2, 3)));
}

TEST(ComparisonTest, greater_less) {
    auto a = ndx::from_float64({1, 5, 3}, {3});
    auto b = ndx::from_float64({2, 2, 3}, {3});
    auto g = ndx::greater(a, b);
    EXPECT_EQ(ndx::dtype::boolean, g.dtype());
    EXPECT_EQ((std::vector<int64_t>{0, 1, 0}), g.to_int64_vector());
    EXPECT_EQ((std::vector<int64_t>{1, 0, 0}), ndx::less(a, b).to_int64_vector());
    EXPECT_EQ((std::vector<int64_t>{0, 1, 1}), ndx::greater_scalar(a, 2).to_int64_vector());
    EXPECT_EQ((std::vector<int64_t>{1, 0, 0}), ndx::less_scalar(a, 2).to_int64_vector());
}

TEST(ComparisonTest, greater_broadcasts) {
    auto a = ndx::from_float64({1, 2, 3, 4}, {2, 2});
    auto threshold = ndx::from_float64({2, 3}, {2});
    EXPECT_EQ((std::vector<int64_t>{0, 0, 1, 1}), ndx::greater(a, threshold).to_int64_vector());
}

TEST(ComparisonTest, equal_and_allclose) {
    auto a = ndx::from_float64({1, 2, 3}, {3});
    EXPECT_TRUE(ndx::equal(a, ndx::copy(a)));
    EXPECT_FALSE(ndx::equal(a, ndx::from_float64({1, 2, 3}, {3, 1})));
    EXPECT_FALSE(ndx::equal(a, ndx::from_float64({1, 2, 4}, {3})));

    auto b = ndx::from_float64({1, 2, 3 + 1e-9}, {3});
    EXPECT_FALSE(ndx::equal(a, b));
    EXPECT_TRUE(ndx::allclose(a, b));
    EXPECT_FALSE(ndx::allclose(a, ndx::from_float64({1, 2, 3.1}, {3})));
    EXPECT_TRUE(ndx::allclose(a, ndx::from_float64({1, 2, 3.1}, {3}), 0.0, 0.2));
}

TEST(ComparisonTest, complex_not_ordered) {
    auto a = ndx::zeros({2}, ndx::dtype::complex64);
    EXPECT_THROW(ndx::greater(a, a), ndx::unsupported_dtype_error);
    EXPECT_THROW(ndx::less_scalar(a, 0.0), ndx::unsupported_dtype_error);
}

TEST(ArithmeticTest, broadcast_row_matrix) {
    auto a = ndx::from_float64({1, 2, 3, 4, 5, 6}, {2, 3});
    auto row = ndx::from_float64({10, 20, 30}, {1, 3});
    auto sum = a + row;
    EXPECT_EQ(2, sum.shape()[0]);
    EXPECT_EQ(3, sum.shape()[1]);
    EXPECT_EQ((std::vector<double>{11, 22, 33, 14, 25, 36}), sum.to_float64_vector());
}
