#include <gtest/gtest.h>
#include "config.hpp"
#include "logger.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace
{
    class ConfigFileTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            const auto *test = ::testing::UnitTest::GetInstance()->current_test_info();
            path = (fs::temp_directory_path() / ("hexkv_" + std::to_string(::getpid()) + "_" + test->name() + ".conf"))
                       .string();
        }

        void TearDown() override
        {
            std::error_code ec;
            fs::remove(path, ec);
        }

        void write(const std::string &text)
        {
            std::ofstream out(path, std::ios::trunc);
            out << text;
        }

        std::string path;
    };
}

TEST(Config, Defaults)
{
    hk::ServerConfig cfg;
    EXPECT_EQ(cfg.bind, "127.0.0.1");
    EXPECT_EQ(cfg.port, 2112);
    EXPECT_EQ(cfg.maxclients, 10000);
    EXPECT_EQ(cfg.timeout, 0);
    EXPECT_TRUE(cfg.appendonly);
    EXPECT_EQ(cfg.appendfsync, hk::FsyncPolicy::EverySec);
    EXPECT_FALSE(cfg.password().has_value());
    EXPECT_EQ(fs::path(cfg.aof_path()), fs::path(".") / "appendonly.aof");
}

TEST(Config, ApplyDirectiveValidatesValues)
{
    hk::ServerConfig cfg;
    hk::apply_directive(cfg, "PORT", "7000");
    hk::apply_directive(cfg, "appendfsync", "Always");
    hk::apply_directive(cfg, "appendonly", "no");
    hk::apply_directive(cfg, "requirepass", "s3cret");
    hk::apply_directive(cfg, "loglevel", "DEBUG");
    EXPECT_EQ(cfg.port, 7000);
    EXPECT_EQ(cfg.appendfsync, hk::FsyncPolicy::Always);
    EXPECT_FALSE(cfg.appendonly);
    EXPECT_EQ(cfg.password().value(), "s3cret");
    EXPECT_EQ(cfg.log_level, "debug");

    EXPECT_THROW(hk::apply_directive(cfg, "port", "70000"), hk::ConfigError);
    EXPECT_THROW(hk::apply_directive(cfg, "port", "12ab"), hk::ConfigError);
    EXPECT_THROW(hk::apply_directive(cfg, "maxclients", "0"), hk::ConfigError);
    EXPECT_THROW(hk::apply_directive(cfg, "appendonly", "maybe"), hk::ConfigError);
    EXPECT_THROW(hk::apply_directive(cfg, "appendfsync", "sometimes"), hk::ConfigError);
    EXPECT_THROW(hk::apply_directive(cfg, "loglevel", "loud"), hk::ConfigError);
    EXPECT_EQ(cfg.port, 7000);
}

TEST(Config, UnknownDirectivesAreKeptRaw)
{
    hk::ServerConfig cfg;
    hk::apply_directive(cfg, "save", "900 1");
    EXPECT_EQ(cfg.raw.at("save"), "900 1");
}

TEST_F(ConfigFileTest, ReadsDirectivesAndComments)
{
    write("# hexkv test config\n"
          "\n"
          "port 6400\n"
          "bind 0.0.0.0   # all interfaces\n"
          "  maxclients 64\n"
          "dir /var/lib/hexkv\n"
          "appendfilename data.aof\n"
          "timeout 30\n");

    hk::ServerConfig cfg = hk::load_config(path);
    EXPECT_EQ(cfg.port, 6400);
    EXPECT_EQ(cfg.bind, "0.0.0.0");
    EXPECT_EQ(cfg.maxclients, 64);
    EXPECT_EQ(cfg.timeout, 30);
    EXPECT_EQ(fs::path(cfg.aof_path()), fs::path("/var/lib/hexkv/data.aof"));
}

TEST_F(ConfigFileTest, BadLineReportsLocation)
{
    write("port 6400\nhz fast\n");
    try
    {
        hk::load_config(path);
        FAIL() << "expected ConfigError";
    }
    catch (const hk::ConfigError &e)
    {
        const std::string message = e.what();
        EXPECT_NE(message.find(path + ":2:"), std::string::npos) << message;
        EXPECT_NE(message.find("'hz'"), std::string::npos) << message;
    }
}

TEST_F(ConfigFileTest, CommandLineOverridesFile)
{
    write("port 6400\nrequirepass fromfile\n");
    const char *argv[] = {"hexkv-server", "--port", "6500", "--config", path.c_str(), "--appendfsync", "no"};
    bool show_help = true;
    hk::ServerConfig cfg = hk::parse_command_line(7, argv, show_help);

    EXPECT_FALSE(show_help);
    EXPECT_EQ(cfg.port, 6500);
    EXPECT_EQ(cfg.password().value(), "fromfile");
    EXPECT_EQ(cfg.appendfsync, hk::FsyncPolicy::No);
}

TEST(ConfigCommandLine, MissingFileIsAnError)
{
    const char *argv[] = {"hexkv-server", "--config", "/nonexistent/hexkv.conf"};
    bool show_help = false;
    EXPECT_THROW(hk::parse_command_line(3, argv, show_help), hk::ConfigError);
}

TEST(ConfigCommandLine, RejectsMalformedArguments)
{
    bool show_help = false;
    const char *dangling[] = {"hexkv-server", "--port"};
    EXPECT_THROW(hk::parse_command_line(2, dangling, show_help), hk::ConfigError);

    const char *positional[] = {"hexkv-server", "6379"};
    EXPECT_THROW(hk::parse_command_line(2, positional, show_help), hk::ConfigError);
}

TEST(ConfigCommandLine, HelpFlag)
{
    const char *argv[] = {"hexkv-server", "-h"};
    bool show_help = false;
    hk::parse_command_line(2, argv, show_help);
    EXPECT_TRUE(show_help);
    EXPECT_NE(std::string(hk::usage()).find("--config"), std::string::npos);
}

TEST(Logger, LevelNames)
{
    EXPECT_TRUE(hk::is_log_level("warn"));
    EXPECT_FALSE(hk::is_log_level("verbose"));
    EXPECT_EQ(hk::parse_log_level("error"), hk::LogLevel::Error);
    EXPECT_EQ(hk::parse_log_level("debug"), hk::LogLevel::Debug);
    EXPECT_EQ(hk::parse_log_level("verbose"), hk::LogLevel::Info);

    const hk::LogLevel saved = hk::log_level();
    hk::set_log_level(hk::LogLevel::Warn);
    EXPECT_EQ(hk::log_level(), hk::LogLevel::Warn);
    hk::set_log_level(saved);
}
