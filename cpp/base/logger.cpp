#include "logger.hpp"
#include "assert.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>

namespace base {

const log_channel log_channel::config("ndx.config");
const log_channel log_channel::linalg("ndx.linalg");
const log_channel log_channel::random("ndx.random");
const log_channel log_channel::tensor("ndx.tensor");

namespace {

std::mutex& loggers_mutex()
{
    static std::mutex m;
    return m;
}

log_level& current_level()
{
    static log_level level = log_level::warning;
    return level;
}

spdlog::level::level_enum to_spdlog(log_level level)
{
    switch (level) {
    case log_level::debug:
        return spdlog::level::debug;
    case log_level::info:
        return spdlog::level::info;
    case log_level::warning:
        return spdlog::level::warn;
    case log_level::error:
        return spdlog::level::err;
    case log_level::critical:
        return spdlog::level::critical;
    case log_level::off:
    default:
        return spdlog::level::off;
    }
}

} // namespace

std::string_view log_level_to_str(log_level level)
{
    switch (level) {
    case log_level::debug:
        return "debug";
    case log_level::info:
        return "info";
    case log_level::warning:
        return "warning";
    case log_level::error:
        return "error";
    case log_level::critical:
        return "critical";
    case log_level::off:
        return "off";
    }
    return "unknown";
}

std::optional<log_level> str_to_log_level(std::string_view level)
{
    std::string lc_level(level);
    std::transform(lc_level.begin(), lc_level.end(), lc_level.begin(), [](unsigned char c) {
        return std::tolower(c);
    });

    if (lc_level == "debug") {
        return log_level::debug;
    }
    if (lc_level == "info") {
        return log_level::info;
    }
    if (lc_level == "warn" || lc_level == "warning") {
        return log_level::warning;
    }
    if (lc_level == "err" || lc_level == "error") {
        return log_level::error;
    }
    if (lc_level == "critical") {
        return log_level::critical;
    }
    if (lc_level == "off") {
        return log_level::off;
    }
    return std::nullopt;
}

void set_log_level(log_level level)
{
    {
        std::lock_guard lock(loggers_mutex());
        current_level() = level;
    }
    spdlog::set_level(to_spdlog(level));
}

void set_log_level(const std::string& level)
{
    auto parsed = str_to_log_level(level);
    if (!parsed) {
        log_warning(log_channel::config, "Unknown log level '{}', keeping '{}'", level,
                    log_level_to_str(get_log_level()));
        return;
    }
    set_log_level(*parsed);
    log_debug(log_channel::config, "Set log level to {}", level);
}

log_level get_log_level()
{
    std::lock_guard lock(loggers_mutex());
    return current_level();
}

std::shared_ptr<spdlog::logger> get_logger(const log_channel& channel)
{
    auto name = channel.channel();
    std::lock_guard lock(loggers_mutex());
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    auto created = spdlog::stderr_color_mt(name);
    created->set_level(to_spdlog(current_level()));
    return created;
}

#ifdef NDX_ASSERTIONS

void abort(const std::string& message)
{
    spdlog::critical(message);
    std::abort();
}

#endif

} // namespace base
