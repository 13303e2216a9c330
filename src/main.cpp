#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include "aof.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "errors.hpp"
#include "expiration.hpp"
#include "keyspace.hpp"
#include "logger.hpp"
#include "server.hpp"
#include "server_info.hpp"

namespace
{
    std::atomic<bool> running{true};

    extern "C" void on_signal(int)
    {
        running.store(false);
    }
}

int main(int argc, char *argv[])
{
    hk::ServerConfig config;
    try
    {
        bool show_help = false;
        config = hk::parse_command_line(argc, argv, show_help);
        if (show_help)
        {
            std::cout << hk::usage();
            return 0;
        }
    }
    catch (const hk::ConfigError &e)
    {
        hk::log(hk::LogLevel::Error, e.what());
        std::cerr << hk::usage();
        return 1;
    }
    hk::set_log_level(hk::parse_log_level(config.log_level));

    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    hk::Keyspace keyspace;
    hk::ServerInfo info;
    hk::Dispatcher dispatcher(keyspace, info);
    std::unique_ptr<hk::AofWriter> aof;

    if (config.appendonly)
    {
        const std::string path = config.aof_path();
        try
        {
            hk::AofReader reader = hk::AofReader::open(path);
            hk::ReplayStats stats = dispatcher.replay(reader);
            reader.truncate_tail();
            hk::log(hk::LogLevel::Info, "replayed " + std::to_string(stats.applied) + " records from " + path + " (" +
                                            std::to_string(stats.skipped) + " skipped, " +
                                            std::to_string(stats.expired) + " keys already expired)");

            aof = std::make_unique<hk::AofWriter>(path, config.appendfsync);
        }
        catch (const hk::CorruptLogError &e)
        {
            hk::log(hk::LogLevel::Error, e.what());
            return 1;
        }
        catch (const std::filesystem::filesystem_error &e)
        {
            hk::log(hk::LogLevel::Error, std::string("cannot truncate durability log: ") + e.what());
            return 1;
        }
        catch (const std::system_error &e)
        {
            hk::log(hk::LogLevel::Error, std::string("durability log unavailable: ") + e.what());
            return 1;
        }
        dispatcher.attach_log(aof.get());
    }

    hk::ActiveExpirer expirer(dispatcher, std::chrono::milliseconds(1000 / config.hz), config.sweep_batch);
    expirer.start();

    int rc = hk::run_server(config, dispatcher, info, running);

    expirer.stop();
    dispatcher.attach_log(nullptr);
    hk::log(hk::LogLevel::Info, "shutting down");
    return rc;
}
