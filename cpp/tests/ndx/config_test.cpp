#include <gtest/gtest.h>
#include "../../ndx/ndx.hpp"

#include <base/logger.hpp>

#include <spdlog/sinks/ostream_sink.h>

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_ = ndx::get_config();
    }

    void TearDown() override {
        unsetenv("NDX_SINGULAR_TOLERANCE");
        unsetenv("NDX_DET_WARN_ORDER");
        unsetenv("NDX_LOG_LEVEL");
        ndx::initialize(saved_);
    }

    ndx::config saved_;
};

TEST_F(ConfigTest, defaults) {
    ndx::config c;
    EXPECT_EQ("warn", c.log_level);
    EXPECT_EQ(1e-10, c.singular_tolerance);
    EXPECT_EQ(1e-5, c.allclose_rtol);
    EXPECT_EQ(1e-8, c.allclose_atol);
    EXPECT_EQ(10, c.det_warn_order);
}

TEST_F(ConfigTest, from_env) {
    setenv("NDX_SINGULAR_TOLERANCE", "0.001", 1);
    setenv("NDX_DET_WARN_ORDER", "not a number", 1);
    setenv("NDX_LOG_LEVEL", "debug", 1);
    auto c = ndx::config::from_env();
    EXPECT_EQ(0.001, c.singular_tolerance);
    EXPECT_EQ(10, c.det_warn_order);
    EXPECT_EQ("debug", c.log_level);
}

TEST_F(ConfigTest, initialize_applies_log_level) {
    ndx::config c;
    c.log_level = "error";
    ndx::initialize(c);
    EXPECT_EQ(base::log_level::error, base::get_log_level());
    EXPECT_EQ("error", ndx::get_config().log_level);
}

TEST_F(ConfigTest, singular_tolerance_controls_inv) {
    auto a = ndx::from_float64({1e-4, 0, 0, 1}, {2, 2});
    EXPECT_NO_THROW(ndx::linalg::inv(a));

    ndx::config c;
    c.singular_tolerance = 1e-3;
    ndx::initialize(c);
    EXPECT_THROW(ndx::linalg::inv(a), ndx::singular_matrix_error);
}

TEST_F(ConfigTest, allclose_uses_configured_tolerances) {
    auto a = ndx::from_float64({1.0}, {1});
    auto b = ndx::from_float64({1.01}, {1});
    EXPECT_FALSE(ndx::allclose(a, b));

    ndx::config c;
    c.allclose_atol = 0.1;
    ndx::initialize(c);
    EXPECT_TRUE(ndx::allclose(a, b));
}

TEST(LoggerTest, level_names) {
    EXPECT_EQ(base::log_level::warning, base::str_to_log_level("warn").value());
    EXPECT_EQ(base::log_level::warning, base::str_to_log_level("WARNING").value());
    EXPECT_EQ(base::log_level::error, base::str_to_log_level("err").value());
    EXPECT_EQ(base::log_level::off, base::str_to_log_level("off").value());
    EXPECT_FALSE(base::str_to_log_level("verbose").has_value());
    EXPECT_EQ("critical", base::log_level_to_str(base::log_level::critical));
}

TEST(LoggerTest, broadcast_logs_on_tensor_channel) {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto logger = base::get_logger(base::log_channel::tensor);
    logger->sinks().push_back(sink);
    auto previous = base::get_log_level();
    base::set_log_level(base::log_level::debug);

    auto b = ndx::broadcast_to(ndx::ones({1, 3}), {2, 3});
    logger->flush();

    base::set_log_level(previous);
    logger->sinks().pop_back();
    EXPECT_EQ(6, b.size());
    EXPECT_NE(std::string::npos, out.str().find("Broadcasting (1, 3) to (2, 3)"));
}
