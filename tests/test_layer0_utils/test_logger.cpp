/**
 * @file test_logger.cpp
 * @brief Logger: file sink, level filtering, flush ordering, sink errors.
 *
 * The logger is process-global. Each test routes output to its own temporary file
 * and restores the console sink and INFO level in TearDown.
 */
#include "test_patterns.h"
#include "utils/logger.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using simpub::utils::Logger;

namespace
{
std::string read_file(const fs::path &path)
{
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

size_t count_occurrences(const std::string &haystack, const std::string &needle)
{
    size_t count = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size()))
    {
        ++count;
    }
    return count;
}
} // namespace

class LoggerTest : public ::testing::Test
{
  protected:
    std::vector<fs::path> paths_to_clean_;

    void TearDown() override
    {
        auto &logger = Logger::instance();
        logger.set_console();
        logger.set_level(Logger::Level::L_INFO);
        logger.set_write_error_callback(nullptr);
        logger.flush();
        for (const auto &p : paths_to_clean_)
        {
            std::error_code ec;
            fs::remove(p, ec);
        }
    }

    fs::path GetUniqueLogPath(const std::string &test_name)
    {
        auto p = fs::temp_directory_path() / ("simpub_test_" + test_name + ".log");
        std::error_code ec;
        fs::remove(p, ec);
        paths_to_clean_.push_back(p);
        return p;
    }
};

TEST_F(LoggerTest, WritesFormattedLinesToFile)
{
    const auto path = GetUniqueLogPath("basic");
    auto &logger = Logger::instance();
    ASSERT_TRUE(logger.set_logfile(path.string()));

    LOGGER_INFO("client {} registered {} topics", "10.0.0.2", 3);
    logger.flush();

    const auto contents = read_file(path);
    EXPECT_NE(contents.find("[SIMPUB]"), std::string::npos);
    EXPECT_NE(contents.find("INFO"), std::string::npos);
    EXPECT_NE(contents.find("client 10.0.0.2 registered 3 topics"), std::string::npos);
}

TEST_F(LoggerTest, LevelFilteringDropsLowerLevels)
{
    const auto path = GetUniqueLogPath("filtering");
    auto &logger = Logger::instance();
    ASSERT_TRUE(logger.set_logfile(path.string()));
    logger.set_level(Logger::Level::L_WARNING);
    EXPECT_EQ(logger.level(), Logger::Level::L_WARNING);

    LOGGER_DEBUG("debug-should-not-appear");
    LOGGER_INFO("info-should-not-appear");
    LOGGER_WARN("warn-should-appear");
    LOGGER_ERROR("error-should-appear");
    logger.flush();

    const auto contents = read_file(path);
    EXPECT_EQ(contents.find("should-not-appear"), std::string::npos);
    EXPECT_NE(contents.find("warn-should-appear"), std::string::npos);
    EXPECT_NE(contents.find("error-should-appear"), std::string::npos);
}

TEST_F(LoggerTest, FlushWaitsForMessagesFromAllThreads)
{
    const auto path = GetUniqueLogPath("threads");
    auto &logger = Logger::instance();
    ASSERT_TRUE(logger.set_logfile(path.string()));

    constexpr int kThreads = 4;
    constexpr int kPerThread = 50;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back(
            [t]
            {
                for (int i = 0; i < kPerThread; ++i)
                {
                    LOGGER_INFO("stress-line thread={} i={}", t, i);
                }
            });
    }
    for (auto &th : threads)
    {
        th.join();
    }
    logger.flush();

    EXPECT_EQ(count_occurrences(read_file(path), "stress-line"),
              static_cast<size_t>(kThreads * kPerThread));
}

TEST_F(LoggerTest, UnopenableLogFileKeepsCurrentSinkAndReportsError)
{
    auto &logger = Logger::instance();
    std::atomic<bool> reported{false};
    logger.set_write_error_callback([&reported](const std::string &) { reported = true; });

    const fs::path blocker = GetUniqueLogPath("blocker");
    {
        std::ofstream(blocker) << "not a directory";
    }
    // A path below a regular file cannot be created.
    EXPECT_FALSE(logger.set_logfile((blocker / "nested.log").string()));
    EXPECT_TRUE(simpub::tests::wait_until([&reported] { return reported.load(); }));
}

TEST_F(LoggerTest, LevelFromStringIsCaseInsensitive)
{
    EXPECT_EQ(Logger::level_from_string("TRACE"), Logger::Level::L_TRACE);
    EXPECT_EQ(Logger::level_from_string("debug"), Logger::Level::L_DEBUG);
    EXPECT_EQ(Logger::level_from_string("Info"), Logger::Level::L_INFO);
    EXPECT_EQ(Logger::level_from_string("warn"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::level_from_string("warning"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::level_from_string("error"), Logger::Level::L_ERROR);
    EXPECT_EQ(Logger::level_from_string("system"), Logger::Level::L_SYSTEM);
    EXPECT_FALSE(Logger::level_from_string("verbose").has_value());
}
