#include "config.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <vector>

namespace hk
{
    namespace
    {
        std::string trim(const std::string &s)
        {
            auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
            if (first == s.end())
                return "";
            auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
            return std::string(first, last);
        }

        std::string lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        long long to_number(const std::string &key, const std::string &value, long long min, long long max)
        {
            long long n = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
            if (value.empty() || ec != std::errc() || ptr != value.data() + value.size() || n < min || n > max)
            {
                throw ConfigError("invalid value '" + value + "' for '" + key + "'");
            }
            return n;
        }

        bool to_bool(const std::string &key, const std::string &value)
        {
            std::string v = lower(value);
            if (v == "yes" || v == "true" || v == "1")
                return true;
            if (v == "no" || v == "false" || v == "0")
                return false;
            throw ConfigError("invalid value '" + value + "' for '" + key + "', expected yes or no");
        }
    }

    std::optional<std::string> ServerConfig::password() const
    {
        if (requirepass.empty())
        {
            return std::nullopt;
        }
        return requirepass;
    }

    std::string ServerConfig::aof_path() const
    {
        return (std::filesystem::path(dir) / appendfilename).string();
    }

    void apply_directive(ServerConfig &cfg, const std::string &key, const std::string &value)
    {
        const std::string name = lower(key);
        cfg.raw[name] = value;

        if (name == "port")
        {
            cfg.port = static_cast<std::uint16_t>(to_number(name, value, 0, 65535));
        }
        else if (name == "bind")
        {
            cfg.bind = value;
        }
        else if (name == "maxclients")
        {
            cfg.maxclients = static_cast<int>(to_number(name, value, 1, std::numeric_limits<int>::max()));
        }
        else if (name == "timeout")
        {
            cfg.timeout = static_cast<int>(to_number(name, value, 0, std::numeric_limits<int>::max()));
        }
        else if (name == "requirepass")
        {
            cfg.requirepass = value;
        }
        else if (name == "appendonly")
        {
            cfg.appendonly = to_bool(name, value);
        }
        else if (name == "appendfilename")
        {
            cfg.appendfilename = value;
        }
        else if (name == "dir")
        {
            cfg.dir = value;
        }
        else if (name == "appendfsync")
        {
            std::string v = lower(value);
            if (v == "always")
                cfg.appendfsync = FsyncPolicy::Always;
            else if (v == "everysec")
                cfg.appendfsync = FsyncPolicy::EverySec;
            else if (v == "no")
                cfg.appendfsync = FsyncPolicy::No;
            else
                throw ConfigError("invalid value '" + value + "' for 'appendfsync'");
        }
        else if (name == "hz")
        {
            cfg.hz = static_cast<int>(to_number(name, value, 1, 500));
        }
        else if (name == "sweep-batch")
        {
            cfg.sweep_batch = static_cast<std::size_t>(to_number(name, value, 1, 1000000));
        }
        else if (name == "loglevel")
        {
            std::string v = lower(value);
            if (!is_log_level(v))
                throw ConfigError("invalid value '" + value + "' for 'loglevel'");
            cfg.log_level = v;
        }
    }

    void load_config_file(ServerConfig &cfg, const std::string &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw ConfigError("cannot open config file '" + path + "'");
        }

        std::string line;
        int line_no = 0;
        while (std::getline(in, line))
        {
            ++line_no;
            const std::string cleaned = trim(line.substr(0, line.find('#')));
            if (cleaned.empty())
                continue;

            std::istringstream iss(cleaned);
            std::string key;
            iss >> key;
            std::string value;
            std::getline(iss, value);
            value = trim(value);

            try
            {
                apply_directive(cfg, key, value);
            }
            catch (const ConfigError &e)
            {
                throw ConfigError(path + ":" + std::to_string(line_no) + ": " + e.what());
            }
        }
    }

    ServerConfig load_config(const std::string &path)
    {
        ServerConfig cfg;
        if (!path.empty())
        {
            load_config_file(cfg, path);
        }
        return cfg;
    }

    ServerConfig parse_command_line(int argc, const char *const argv[], bool &show_help)
    {
        show_help = false;
        std::string config_path;
        std::vector<std::pair<std::string, std::string>> overrides;

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                show_help = true;
                continue;
            }
            if (arg.rfind("--", 0) != 0)
            {
                throw ConfigError("unexpected argument '" + arg + "'");
            }
            if (i + 1 >= argc)
            {
                throw ConfigError("missing value for '" + arg + "'");
            }
            const std::string value = argv[++i];
            if (arg == "--config")
            {
                config_path = value;
            }
            else
            {
                overrides.emplace_back(arg.substr(2), value);
            }
        }

        ServerConfig cfg = load_config(config_path);
        for (const auto &[key, value] : overrides)
        {
            apply_directive(cfg, key, value);
        }
        return cfg;
    }

    const char *usage()
    {
        return "Usage: hexkv-server [--config <path>] [--port <port>] [--bind <ip>] [--requirepass <password>]\n"
               "                    [--appendonly yes|no] [--appendfilename <name>] [--dir <path>]\n"
               "                    [--appendfsync always|everysec|no] [--maxclients <n>] [--timeout <sec>]\n"
               "                    [--loglevel error|warn|info|debug]\n";
    }
}
