#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace base {

/**
 * @brief Reads the environment variable `name` and converts it to `T`.
 *
 * Returns `default_value` when the variable is unset or cannot be parsed.
 */
template <typename T>
requires std::is_same_v<T, std::string> || std::is_same_v<T, bool> || std::is_integral_v<T> ||
         std::is_floating_point_v<T>
inline T getenv(const std::string& name, T default_value = T{})
{
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return default_value;
    }

    std::string str(value);
    if constexpr (std::is_same_v<T, std::string>) {
        return str;
    } else if constexpr (std::is_same_v<T, bool>) {
        std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
            return std::tolower(c);
        });
        return str == "1" || str == "true" || str == "yes";
    } else {
        try {
            if constexpr (std::is_floating_point_v<T>) {
                return static_cast<T>(std::stod(str));
            } else if constexpr (std::is_signed_v<T>) {
                return static_cast<T>(std::stoll(str));
            } else {
                return static_cast<T>(std::stoull(str));
            }
        } catch (const std::logic_error&) {
            return default_value;
        }
    }
}

} // namespace base
