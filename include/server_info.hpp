#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>

namespace hk
{
    // Process-wide counters reported by INFO.
    struct ServerInfo
    {
        std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();
        std::atomic<int> connected_clients{0};
        std::atomic<std::uint64_t> total_connections{0};
        std::atomic<std::uint64_t> rejected_connections{0};
        std::atomic<std::uint64_t> total_commands{0};
        std::atomic<std::uint64_t> auth_lockouts{0};

        std::int64_t uptime_seconds() const
        {
            auto elapsed = std::chrono::steady_clock::now() - started;
            return std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
        }
    };
}
