#pragma once

#include <string>
#include <utility>

namespace base {

class log_channel
{
public:
    [[nodiscard]] std::string channel() const
    {
        return channel_;
    }

    static const log_channel config;
    static const log_channel linalg;
    static const log_channel random;
    static const log_channel tensor;

private:
    explicit log_channel(std::string channel)
        : channel_(std::move(channel))
    {
    }

    std::string channel_;
};

} // namespace base
