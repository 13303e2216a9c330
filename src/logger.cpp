#include "logger.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace hk
{
    namespace
    {
        std::mutex log_mutex;
        std::atomic<LogLevel> current_level{LogLevel::Info};

        const char *to_string(LogLevel level)
        {
            switch (level)
            {
            case LogLevel::Error:
                return "ERROR";
            case LogLevel::Warn:
                return "WARN";
            case LogLevel::Info:
                return "INFO";
            case LogLevel::Debug:
                return "DEBUG";
            }
            return "UNKNOWN";
        }
    }

    void set_log_level(LogLevel level)
    {
        current_level.store(level);
    }

    LogLevel log_level()
    {
        return current_level.load();
    }

    bool is_log_level(const std::string &level)
    {
        return level == "error" || level == "warn" || level == "info" || level == "debug";
    }

    LogLevel parse_log_level(const std::string &level)
    {
        if (level == "error")
            return LogLevel::Error;
        if (level == "warn")
            return LogLevel::Warn;
        if (level == "debug")
            return LogLevel::Debug;
        return LogLevel::Info;
    }

    void log(LogLevel level, const std::string &message)
    {
        if (static_cast<int>(level) > static_cast<int>(current_level.load()))
        {
            return;
        }

        auto now = std::chrono::system_clock::now();
        std::time_t now_time = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf{};
        localtime_r(&now_time, &tm_buf);

        std::ostringstream line;
        line << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "] [" << to_string(level) << "] " << message
             << '\n';

        std::lock_guard<std::mutex> lock(log_mutex);
        std::cerr << line.str();
    }
}
