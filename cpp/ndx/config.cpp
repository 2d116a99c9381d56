#include "config.hpp"

#include <base/getenv.hpp>
#include <base/logger.hpp>

#include <optional>

namespace ndx {

namespace {

std::optional<config>& active()
{
    static std::optional<config> c;
    return c;
}

} // namespace

config config::from_env()
{
    config c;
    c.log_level = base::getenv<std::string>("NDX_LOG_LEVEL", c.log_level);
    c.singular_tolerance = base::getenv<double>("NDX_SINGULAR_TOLERANCE", c.singular_tolerance);
    c.allclose_rtol = base::getenv<double>("NDX_ALLCLOSE_RTOL", c.allclose_rtol);
    c.allclose_atol = base::getenv<double>("NDX_ALLCLOSE_ATOL", c.allclose_atol);
    c.det_warn_order = base::getenv<int64_t>("NDX_DET_WARN_ORDER", c.det_warn_order);
    return c;
}

void initialize(const config& c)
{
    active() = c;
    base::set_log_level(c.log_level);
    base::log_debug(base::log_channel::config,
                    "Initialized with singular_tolerance={}, allclose_rtol={}, allclose_atol={}, det_warn_order={}",
                    c.singular_tolerance, c.allclose_rtol, c.allclose_atol, c.det_warn_order);
}

const config& get_config()
{
    if (!active()) {
        initialize(config::from_env());
    }
    return *active();
}

} // namespace ndx
