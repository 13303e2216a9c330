#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace hk
{
    enum class FsyncPolicy
    {
        Always,
        EverySec,
        No
    };

    struct ServerConfig
    {
        std::string bind = "127.0.0.1";
        std::uint16_t port = 2112;
        int maxclients = 10000;
        int timeout = 0; // client read timeout in seconds, 0 = none
        std::string requirepass;
        bool appendonly = true;
        std::string appendfilename = "appendonly.aof";
        std::string dir = ".";
        FsyncPolicy appendfsync = FsyncPolicy::EverySec;
        int hz = 10;
        std::size_t sweep_batch = 64;
        std::string log_level = "info";
        std::unordered_map<std::string, std::string> raw;

        // Empty requirepass means connections start authenticated.
        std::optional<std::string> password() const;

        std::string aof_path() const;
    };

    class ConfigError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Applies one `directive value` pair. Unknown directives are kept in `raw`.
    void apply_directive(ServerConfig &cfg, const std::string &key, const std::string &value);

    // Reads a redis.conf-style file on top of `cfg`.
    void load_config_file(ServerConfig &cfg, const std::string &path);

    ServerConfig load_config(const std::string &path);

    // --config is read first, then every other flag overrides it.
    // Sets show_help for --help/-h.
    ServerConfig parse_command_line(int argc, const char *const argv[], bool &show_help);

    const char *usage();
}
