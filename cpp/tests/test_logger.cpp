/**
 * @file test_logger.cpp
 * @brief Logger: level parsing, file sink, filtering, concurrency and error callback.
 *
 * The Logger is a process-wide singleton; tests restore the console sink and the
 * default level when they finish and never call shutdown().
 */
#include "utils/logger.hpp"
#include "rh_platform.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using relayhub::utils::Logger;

namespace
{
std::string read_file(const fs::path &p)
{
    std::ifstream in(p);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

size_t count_occurrences(const std::string &haystack, const std::string &needle)
{
    size_t n = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size()))
        ++n;
    return n;
}
} // namespace

class LoggerTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_log = fs::temp_directory_path() /
                ("relayhub-logger-" + std::to_string(relayhub::platform::get_pid()) + "-" +
                 info->name() + ".log");
        fs::remove(m_log);
    }

    void TearDown() override
    {
        auto &logger = Logger::instance();
        logger.set_console();
        logger.set_level(Logger::Level::L_INFO);
        logger.flush();
        std::error_code ec;
        fs::remove(m_log, ec);
    }

    fs::path m_log;
};

TEST_F(LoggerTest, LevelFromString)
{
    EXPECT_EQ(Logger::level_from_string("trace"), Logger::Level::L_TRACE);
    EXPECT_EQ(Logger::level_from_string("debug"), Logger::Level::L_DEBUG);
    EXPECT_EQ(Logger::level_from_string("info"), Logger::Level::L_INFO);
    EXPECT_EQ(Logger::level_from_string("warn"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::level_from_string("warning"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::level_from_string("error"), Logger::Level::L_ERROR);
    EXPECT_EQ(Logger::level_from_string("system"), Logger::Level::L_SYSTEM);
    EXPECT_FALSE(Logger::level_from_string("INFO").has_value());
    EXPECT_FALSE(Logger::level_from_string("").has_value());
}

TEST_F(LoggerTest, WritesFormattedLinesToFile)
{
    auto &logger = Logger::instance();
    logger.set_level(Logger::Level::L_INFO);
    logger.set_logfile(m_log.string());

    LOGGER_INFO("relay listening on port {}", 8888);
    LOGGER_WARN("channel {} has {} callers", "AB12CD34", 3);
    LOGGER_DEBUG("filtered out {}", 1);
    logger.flush();

    const auto text = read_file(m_log);
    EXPECT_NE(text.find("relay listening on port 8888"), std::string::npos) << text;
    EXPECT_NE(text.find("channel AB12CD34 has 3 callers"), std::string::npos) << text;
    EXPECT_NE(text.find("[INFO"), std::string::npos) << text;
    EXPECT_NE(text.find("[WARN"), std::string::npos) << text;
    EXPECT_EQ(text.find("filtered out"), std::string::npos) << text;
}

TEST_F(LoggerTest, LevelChangeTakesEffect)
{
    auto &logger = Logger::instance();
    logger.set_logfile(m_log.string());
    logger.set_level(Logger::Level::L_ERROR);
    EXPECT_EQ(logger.level(), Logger::Level::L_ERROR);

    LOGGER_WARN("suppressed warning");
    LOGGER_ERROR("visible error");
    logger.set_level(Logger::Level::L_TRACE);
    LOGGER_TRACE("visible trace");
    logger.flush();

    const auto text = read_file(m_log);
    EXPECT_EQ(text.find("suppressed warning"), std::string::npos);
    EXPECT_NE(text.find("visible error"), std::string::npos);
    EXPECT_NE(text.find("visible trace"), std::string::npos);
}

TEST_F(LoggerTest, ConcurrentWritersLoseNothing)
{
    constexpr int kThreads = 4;
    constexpr int kPerThread = 250;

    auto &logger = Logger::instance();
    logger.set_level(Logger::Level::L_INFO);
    logger.set_logfile(m_log.string());

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back(
            [t]
            {
                for (int i = 0; i < kPerThread; ++i)
                    LOGGER_INFO("concurrent-msg t={} i={}", t, i);
            });
    }
    for (auto &th : threads)
        th.join();
    logger.flush();

    EXPECT_EQ(count_occurrences(read_file(m_log), "concurrent-msg"),
              static_cast<size_t>(kThreads * kPerThread));
}

TEST_F(LoggerTest, UnopenableFileReportsThroughCallback)
{
    auto &logger = Logger::instance();
    auto fired = std::make_shared<std::atomic<bool>>(false);
    auto message = std::make_shared<std::string>();
    auto mu = std::make_shared<std::mutex>();
    logger.set_write_error_callback(
        [fired, message, mu](const std::string &err)
        {
            {
                std::lock_guard<std::mutex> lk(*mu);
                *message = err;
            }
            fired->store(true);
        });

    logger.set_logfile((m_log.parent_path() / "relayhub-no-such-dir" / "x" / "y.log").string());
    logger.flush();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!fired->load() && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));

    ASSERT_TRUE(fired->load());
    {
        std::lock_guard<std::mutex> lk(*mu);
        EXPECT_NE(message->find("FileSink"), std::string::npos) << *message;
    }
    logger.set_write_error_callback(nullptr);
}
