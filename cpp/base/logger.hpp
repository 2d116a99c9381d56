#pragma once

/**
 * @file logger.hpp
 * @brief Channel based logging on top of spdlog.
 */

#include "format.hpp"
#include "log_channel.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace base {

enum class log_level : unsigned char
{
    debug,
    info,
    warning,
    error,
    critical,
    off
};

std::string_view log_level_to_str(log_level level);

/**
 * @brief Parses a level name, case insensitive.
 *
 * Accepts `debug`, `info`, `warn`/`warning`, `err`/`error`, `critical` and `off`.
 */
std::optional<log_level> str_to_log_level(std::string_view level);

void set_log_level(log_level level);

/**
 * @brief Sets the level of every channel. Unknown names keep the current level and log a warning.
 */
void set_log_level(const std::string& level);

log_level get_log_level();

/**
 * @brief Returns the spdlog logger backing the given channel, creating it on first use.
 */
std::shared_ptr<spdlog::logger> get_logger(const log_channel& channel);

/**
 * @param channel Log channel to use
 * @param message Message to log.
 * @param args Arguments to format message with.
 */
template <typename... Args>
inline void log_debug(const log_channel& channel, fmt::format_string<Args...> message, Args&&... args)
{
    get_logger(channel)->debug(message, std::forward<Args>(args)...);
}

/**
 * @param channel Log channel to use
 * @param message Message to log.
 * @param args Arguments to format message with.
 */
template <typename... Args>
inline void log_warning(const log_channel& channel, fmt::format_string<Args...> message, Args&&... args)
{
    get_logger(channel)->warn(message, std::forward<Args>(args)...);
}

} // namespace base
