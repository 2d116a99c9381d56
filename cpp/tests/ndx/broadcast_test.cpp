#include <gtest/gtest.h>
#include "../../ndx/broadcast.hpp"
#include "../../ndx/generators.hpp"
#include "../../ndx/transform.hpp"

#include <vector>

namespace {

std::vector<int64_t> to_vector(const ndx::shape_t& s)
{
    return std::vector<int64_t>(s.begin(), s.end());
}

} // namespace

TEST(BroadcastTest, shapes) {
    EXPECT_EQ((std::vector<int64_t>{2, 3}), to_vector(ndx::broadcast_shapes({2, 3}, {3})));
    EXPECT_EQ((std::vector<int64_t>{4, 2, 3}), to_vector(ndx::broadcast_shapes({4, 1, 3}, {2, 1})));
    EXPECT_EQ((std::vector<int64_t>{5, 4}), to_vector(ndx::broadcast_shapes({5, 4}, {5, 4})));
}

TEST(BroadcastTest, shapes_are_symmetric) {
    std::vector<std::pair<ndx::shape_t, ndx::shape_t>> cases = {
        {{2, 3}, {3}}, {{4, 1, 3}, {2, 1}}, {{1}, {7, 2}}, {{3, 1}, {1, 4}}};
    for (const auto& [a, b] : cases) {
        EXPECT_EQ(to_vector(ndx::broadcast_shapes(a, b)), to_vector(ndx::broadcast_shapes(b, a)));
    }
}

TEST(BroadcastTest, incompatible_shapes) {
    EXPECT_THROW(ndx::broadcast_shapes({2, 3}, {2}), ndx::broadcast_error);
    try {
        ndx::broadcast_shapes({2, 3}, {4});
        FAIL();
    } catch (const ndx::broadcast_error& e) {
        EXPECT_EQ("(2, 3)", e.param("first"));
        EXPECT_EQ("(4)", e.param("second"));
    }
}

TEST(BroadcastTest, broadcast_to) {
    auto a = ndx::from_float64({1, 2, 3}, {3});
    auto b = ndx::broadcast_to(a, {2, 3});
    EXPECT_EQ((std::vector<int64_t>{2, 3}), to_vector(b.shape()));
    EXPECT_EQ((std::vector<double>{1, 2, 3, 1, 2, 3}), b.to_float64_vector());

    auto column = ndx::from_int64({7, 8}, {2, 1});
    auto c = ndx::broadcast_to(column, {2, 3});
    EXPECT_EQ(ndx::dtype::int64, c.dtype());
    EXPECT_EQ((std::vector<int64_t>{7, 7, 7, 8, 8, 8}), c.to_int64_vector());
}

TEST(BroadcastTest, broadcast_to_errors) {
    auto a = ndx::zeros({2, 3});
    EXPECT_THROW(ndx::broadcast_to(a, {3}), ndx::broadcast_error);
    EXPECT_THROW(ndx::broadcast_to(a, {2, 4}), ndx::broadcast_error);
}
