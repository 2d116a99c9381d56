#pragma once

/**
 * @file config.hpp
 * @brief Process wide settings of the library.
 */

#include <cstdint>
#include <string>

namespace ndx {

struct config
{
    /// Name of the spdlog level applied to every `ndx` log channel.
    std::string log_level = "warn";

    /// Pivots with a smaller magnitude make `linalg::inv` report a singular matrix.
    double singular_tolerance = 1e-10;

    double allclose_rtol = 1e-5;
    double allclose_atol = 1e-8;

    /// `linalg::det` logs a warning for matrices of a higher order.
    int64_t det_warn_order = 10;

    /**
     * @brief Reads `NDX_LOG_LEVEL`, `NDX_SINGULAR_TOLERANCE`, `NDX_ALLCLOSE_RTOL`, `NDX_ALLCLOSE_ATOL` and
     * `NDX_DET_WARN_ORDER`. Unset or malformed variables keep the defaults.
     */
    static config from_env();
};

/**
 * @brief Installs `c` as the active configuration and applies its log level.
 */
void initialize(const config& c);

/**
 * @brief Returns the active configuration. Loaded from the environment on first use unless `initialize` was
 * called before.
 */
const config& get_config();

} // namespace ndx
