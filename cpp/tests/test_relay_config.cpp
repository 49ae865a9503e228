/**
 * @file test_relay_config.cpp
 * @brief RelayConfig layering: defaults < config file < environment < command line.
 */
#include "utils/relay_config.hpp"
#include "rh_platform.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using relayhub::utils::RelayConfig;

namespace
{
constexpr const char *kEnvVars[] = {"RELAY_HOST", "RELAY_PORT", "RELAY_PATH",
                                    "RELAYHUB_CONFIG_FILE"};

void set_env(const char *name, const char *value)
{
#if defined(_WIN32)
    _putenv_s(name, value);
#else
    ::setenv(name, value, 1);
#endif
}

void unset_env(const char *name)
{
#if defined(_WIN32)
    _putenv_s(name, "");
#else
    ::unsetenv(name);
#endif
}
} // namespace

class RelayConfigTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        for (const char *v : kEnvVars)
            unset_env(v);
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_file = fs::temp_directory_path() /
                 ("relayhub-config-" + std::to_string(relayhub::platform::get_pid()) + "-" +
                  info->name() + ".json");
    }

    void TearDown() override
    {
        for (const char *v : kEnvVars)
            unset_env(v);
        std::error_code ec;
        fs::remove(m_file, ec);
    }

    void write_file(const std::string &text) { std::ofstream(m_file) << text; }

    fs::path m_file;
};

TEST_F(RelayConfigTest, Defaults)
{
    const auto cfg = RelayConfig::load(std::vector<std::string>{});
    EXPECT_EQ(cfg.host, "127.0.0.1");
    EXPECT_EQ(cfg.port, 8888);
    EXPECT_EQ(cfg.path, "/");
    EXPECT_EQ(cfg.peer_timeout, std::chrono::seconds(60));
    EXPECT_FALSE(cfg.use_curve);
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_TRUE(cfg.reuse_existing);
    EXPECT_FALSE(cfg.show_help);
    EXPECT_TRUE(cfg.config_file.empty());
}

TEST_F(RelayConfigTest, EnvironmentOverridesDefaults)
{
    set_env("RELAY_HOST", "0.0.0.0");
    set_env("RELAY_PORT", "9001");
    set_env("RELAY_PATH", "relay/");
    const auto cfg = RelayConfig::load(std::vector<std::string>{});
    EXPECT_EQ(cfg.host, "0.0.0.0");
    EXPECT_EQ(cfg.port, 9001);
    EXPECT_EQ(cfg.path, "/relay");
}

TEST_F(RelayConfigTest, CommandLineOverridesEnvironment)
{
    set_env("RELAY_PORT", "9001");
    const auto cfg = RelayConfig::load({"--port", "9002", "--host=10.0.0.1", "--path", "/x"});
    EXPECT_EQ(cfg.port, 9002);
    EXPECT_EQ(cfg.host, "10.0.0.1");
    EXPECT_EQ(cfg.path, "/x");
}

TEST_F(RelayConfigTest, ShortPortFlag)
{
    EXPECT_EQ(RelayConfig::load({"-p", "9003"}).port, 9003);
    EXPECT_EQ(RelayConfig::load({"--port", "9005", "-p", "9006"}).port, 9006);
    EXPECT_THROW(RelayConfig::load({"-p"}), std::runtime_error);
    EXPECT_THROW(RelayConfig::load({"-p", "0"}), std::runtime_error);
    EXPECT_NE(RelayConfig::usage("relayhub-broker").find("-p, --port"), std::string::npos);
}

TEST_F(RelayConfigTest, BareNumericArgumentIsThePort)
{
    EXPECT_EQ(RelayConfig::load({"7777"}).port, 7777);
}

TEST_F(RelayConfigTest, FlagsAndHelp)
{
    const auto cfg = RelayConfig::load({"--curve", "--no-reuse", "--log-level", "debug",
                                        "--lock-dir", "/tmp/locks", "-h"});
    EXPECT_TRUE(cfg.use_curve);
    EXPECT_FALSE(cfg.reuse_existing);
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.lock_dir, "/tmp/locks");
    EXPECT_TRUE(cfg.show_help);
}

TEST_F(RelayConfigTest, InvalidPortsAreRejected)
{
    EXPECT_THROW(RelayConfig::load({"--port", "0"}), std::runtime_error);
    EXPECT_THROW(RelayConfig::load({"--port", "65536"}), std::runtime_error);
    EXPECT_THROW(RelayConfig::load({"--port", "12ab"}), std::runtime_error);
    EXPECT_THROW(RelayConfig::load({"--port"}), std::runtime_error);

    set_env("RELAY_PORT", "-1");
    try
    {
        static_cast<void>(RelayConfig::load(std::vector<std::string>{}));
        FAIL() << "RELAY_PORT=-1 must be rejected";
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_NE(std::string(e.what()).find("RELAY_PORT"), std::string::npos) << e.what();
    }
}

TEST_F(RelayConfigTest, ParsePortTrimsWhitespace)
{
    EXPECT_EQ(RelayConfig::parse_port(" 8080 ", "test"), 8080);
    EXPECT_EQ(RelayConfig::parse_port("65535", "test"), 65535);
}

TEST_F(RelayConfigTest, UnknownArgumentAndLevelAreRejected)
{
    EXPECT_THROW(RelayConfig::load({"--bogus"}), std::runtime_error);
    EXPECT_THROW(RelayConfig::load({"--log-level", "loud"}), std::runtime_error);
}

TEST_F(RelayConfigTest, ConfigFileLayer)
{
    write_file(R"({"relay": {"port": 9100, "path": "hub", "peer_timeout_s": 5},
                   "logging": {"level": "warn"},
                   "lock": {"reuse_existing": false}})");
    const auto cfg = RelayConfig::load({"--config", m_file.string()});
    EXPECT_EQ(cfg.port, 9100);
    EXPECT_EQ(cfg.path, "/hub");
    EXPECT_EQ(cfg.peer_timeout, std::chrono::seconds(5));
    EXPECT_EQ(cfg.host, "127.0.0.1") << "keys absent from the file keep their defaults";
    EXPECT_EQ(cfg.log_level, "warn");
    EXPECT_FALSE(cfg.reuse_existing);
    EXPECT_EQ(cfg.config_file, m_file.string());
}

TEST_F(RelayConfigTest, ConfigFileFromEnvironmentIsBelowEnvAndArgs)
{
    write_file(R"({"relay": {"host": "192.168.1.2", "port": 9100}})");
    set_env("RELAYHUB_CONFIG_FILE", m_file.string().c_str());
    set_env("RELAY_PORT", "9200");
    const auto cfg = RelayConfig::load({"--host=127.0.0.2"});
    EXPECT_EQ(cfg.port, 9200);
    EXPECT_EQ(cfg.host, "127.0.0.2");
    EXPECT_EQ(cfg.config_file, m_file.string());
}

TEST_F(RelayConfigTest, BadConfigFilesAreRejected)
{
    EXPECT_THROW(RelayConfig::load({"--config", (m_file.string() + ".missing")}),
                 std::runtime_error);

    write_file("{ not json");
    EXPECT_THROW(RelayConfig::load({"--config", m_file.string()}), std::runtime_error);

    write_file(R"({"relay": {"port": "eighty"}})");
    EXPECT_THROW(RelayConfig::load({"--config", m_file.string()}), std::runtime_error);

    write_file(R"({"relay": {"use_curve": "yes"}})");
    EXPECT_THROW(RelayConfig::load({"--config", m_file.string()}), std::runtime_error);
}

TEST_F(RelayConfigTest, ToJsonRoundTripsThroughApplyJson)
{
    RelayConfig a;
    a.port = 4242;
    a.path = "/p";
    a.use_curve = true;
    RelayConfig b;
    b.apply_json(a.to_json());
    EXPECT_EQ(b.port, 4242);
    EXPECT_EQ(b.path, "/p");
    EXPECT_TRUE(b.use_curve);
}

TEST_F(RelayConfigTest, UsageMentionsProgramAndOptions)
{
    const auto text = RelayConfig::usage("relayhub-broker");
    EXPECT_NE(text.find("relayhub-broker"), std::string::npos);
    EXPECT_NE(text.find("--port"), std::string::npos);
    EXPECT_NE(text.find("RELAY_HOST"), std::string::npos);
}
