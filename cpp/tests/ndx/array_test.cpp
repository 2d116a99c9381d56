#include <gtest/gtest.h>
#include "../../ndx/array.hpp"
#include "../../ndx/format.hpp"
#include "../../ndx/generators.hpp"

TEST(ArrayTest, zeros_layout) {
    auto a = ndx::zeros({2, 3}, ndx::dtype::float64);
    EXPECT_EQ(6, a.size());
    EXPECT_EQ(2, a.ndim());
    EXPECT_EQ(48, a.nbytes());
    EXPECT_EQ(24, a.strides()[0]);
    EXPECT_EQ(8, a.strides()[1]);
    for (auto v : a.to_float64_vector()) {
        EXPECT_EQ(0.0, v);
    }
}

TEST(ArrayTest, buffer_length_matches_shape) {
    for (auto t : {ndx::dtype::boolean, ndx::dtype::int16, ndx::dtype::uint32, ndx::dtype::float32,
                   ndx::dtype::complex128}) {
        auto a = ndx::zeros({3, 4, 2}, t);
        EXPECT_EQ(a.size() * a.itemsize(), a.nbytes());
        EXPECT_EQ(a.shape().size(), a.strides().size());
    }
}

TEST(ArrayTest, empty_shape_has_no_elements) {
    ndx::array a;
    EXPECT_EQ(0, a.size());
    EXPECT_EQ(0, a.ndim());
    EXPECT_EQ(ndx::dtype::float64, a.dtype());
    EXPECT_EQ(0, ndx::zeros({0, 3}).size());
}

TEST(ArrayTest, negative_extent) {
    EXPECT_THROW(ndx::zeros({2, -1}), ndx::shape_error);
}

TEST(ArrayTest, set_and_get) {
    auto a = ndx::zeros({2, 3});
    a.set_float64(5.5, 1, 2);
    EXPECT_EQ(5.5, a.get_float64(1, 2));
    EXPECT_EQ(5.5, a.get_float64(-1, -1));
    a.set_float64(1.25, -2, 0);
    EXPECT_EQ(1.25, a.get_float64(0, 0));
}

TEST(ArrayTest, out_of_bounds_index) {
    auto a = ndx::zeros({2, 3});
    EXPECT_THROW(a.get_float64(2, 0), ndx::index_error);
    EXPECT_THROW(a.get_float64(0, -4), ndx::index_error);
    try {
        a.get_float64(0, 3);
        FAIL();
    } catch (const ndx::index_error& e) {
        EXPECT_EQ("3", e.param("index"));
        EXPECT_EQ("1", e.param("axis"));
        EXPECT_EQ("3", e.param("size"));
    }
}

TEST(ArrayTest, wrong_index_count) {
    auto a = ndx::zeros({2, 3});
    EXPECT_THROW(a.get_float64(1), ndx::shape_error);
    EXPECT_THROW(a.get_float64(1, 1, 1), ndx::shape_error);
}

TEST(ArrayTest, integer_stores_saturate) {
    auto a = ndx::zeros({3}, ndx::dtype::int8);
    a.set_float64(300.0, 0);
    a.set_float64(-300.0, 1);
    a.set_float64(2.9, 2);
    EXPECT_EQ(127, a.get_int64(0));
    EXPECT_EQ(-128, a.get_int64(1));
    EXPECT_EQ(2, a.get_int64(2));
}

TEST(ArrayTest, boolean_stores_one_byte_flags) {
    auto a = ndx::zeros({2}, ndx::dtype::boolean);
    a.set_float64(7.0, 0);
    EXPECT_EQ(1, a.data()[0]);
    EXPECT_EQ(0, a.data()[1]);
    EXPECT_EQ(1.0, a.get_float64(0));
}

TEST(ArrayTest, complex_round_trip) {
    auto a = ndx::zeros({2}, ndx::dtype::complex128);
    a.set_complex({1.5, -2.0}, 1);
    EXPECT_EQ(ndx::complex128_t(1.5, -2.0), a.get_complex(1));
    EXPECT_THROW(a.get_float64(1), ndx::unsupported_dtype_error);
    EXPECT_THROW(a.set_float64(1.0, 0), ndx::unsupported_dtype_error);

    auto b = ndx::zeros({1}, ndx::dtype::complex64);
    b.set_complex({0.5, 0.25}, 0);
    EXPECT_EQ(ndx::complex128_t(0.5, 0.25), b.get_complex(0));
}

TEST(ArrayTest, real_rejects_imaginary_part) {
    auto a = ndx::zeros({1});
    EXPECT_THROW(a.set_complex({1.0, 1.0}, 0), ndx::unsupported_dtype_error);
    a.set_complex({3.0, 0.0}, 0);
    EXPECT_EQ(3.0, a.get_float64(0));
}

TEST(ArrayTest, copy_is_deep) {
    auto a = ndx::from_float64({1, 2, 3}, {3});
    auto b = ndx::copy(a);
    b.set_float64(10.0, 0);
    EXPECT_EQ(1.0, a.get_float64(0));
    EXPECT_EQ(10.0, b.get_float64(0));
}

TEST(ArrayTest, typed_view) {
    auto a = ndx::from_int64({4, 5, 6}, {3});
    auto view = a.data_as<int64_t>();
    EXPECT_EQ(3u, view.size());
    EXPECT_EQ(6, view[2]);
    EXPECT_THROW(a.data_as<double>(), ndx::unsupported_dtype_error);
}

TEST(ArrayTest, formatting) {
    auto a = ndx::zeros({2, 3});
    EXPECT_EQ("array(shape=(2, 3), dtype=float64)", ndx::to_string(a));
    EXPECT_EQ("array(shape=(2, 3), dtype=float64)", fmt::format("{}", a));
    EXPECT_EQ("int32", fmt::format("{}", ndx::dtype::int32));
}

TEST(ArrayTest, negative_indices_count_from_end) {
    auto a = ndx::from_float64({1, 2, 3, 4}, {2, 2});
    EXPECT_EQ(4.0, a.get_float64(-1, -1));
    EXPECT_EQ(1.0, a.get_float64(-2, -2));
}
