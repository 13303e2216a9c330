#pragma once
#include <string>

namespace hk
{
    enum class LogLevel
    {
        Error = 0,
        Warn = 1,
        Info = 2,
        Debug = 3
    };

    void set_log_level(LogLevel level);

    LogLevel log_level();

    // Unknown names fall back to Info.
    LogLevel parse_log_level(const std::string &level);

    bool is_log_level(const std::string &level);

    void log(LogLevel level, const std::string &message);
}
