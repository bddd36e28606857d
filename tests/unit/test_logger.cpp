#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "common/logging.h"
#include "test_support.h"

class LoggerTestBase : public MarkgateTestBase {
protected:
    size_t countLogLines(const std::string& filename) {
        const std::string content = readFile(filename);
        return static_cast<size_t>(std::count(content.begin(), content.end(), '\n'));
    }

    std::string createTempLogFile() {
        static std::atomic<int> counter{0};
        return test_dir_ + "/temp_" + std::to_string(counter.fetch_add(1)) + ".log";
    }
};

TEST_F(LoggerTestBase, InitializationAndShutdownContract) {
    // === GIVEN ===
    const std::string custom_log = createTempLogFile();
    Common::shutdownLogging();

    // === WHEN ===
    Common::initLogging(custom_log.c_str());
    LOG_INFO("Test initialization message");
    Common::shutdownLogging();

    // === THEN ===
    ASSERT_TRUE(std::filesystem::exists(custom_log)) << "Log file must be created during initialization";
    const std::string content = readFile(custom_log);
    ASSERT_NE(content.find("[LOGGER_CONFIG]"), std::string::npos) << "Config line written on startup";
    ASSERT_NE(content.find("Test initialization message"), std::string::npos)
        << "Shutdown must drain pending entries";

    // Reinitialize after shutdown
    Common::initLogging(custom_log.c_str());
    LOG_WARN("Test reinitialization message");
    Common::shutdownLogging();
    ASSERT_NE(readFile(custom_log).find("Test reinitialization message"), std::string::npos)
        << "Logger must work after reinitialization";
}

TEST_F(LoggerTestBase, LogLevelsAndMacroContract) {
    // === GIVEN ===
    const std::string unique_log = createTempLogFile();
    Common::shutdownLogging();
    Common::initLogging(unique_log.c_str());
    Common::setLogLevel(Common::Logger::DEBUG);

    // === WHEN ===
    LOG_DEBUG("Debug message with value %d", 42);
    LOG_INFO("Info message loading module %s", "01-update-title.lua");
    LOG_WARN("Warning: risk score approaching %d%%", 70);
    LOG_ERROR("Error: security validation failed");
    LOG_FATAL("Fatal: transform aborted");
    Common::shutdownLogging();

    // === THEN ===
    const std::string content = readFile(unique_log);
    ASSERT_NE(content.find("][DEBUG]["), std::string::npos);
    ASSERT_NE(content.find("][INFO ]["), std::string::npos);
    ASSERT_NE(content.find("][WARN ]["), std::string::npos);
    ASSERT_NE(content.find("][ERROR]["), std::string::npos);
    ASSERT_NE(content.find("][FATAL]["), std::string::npos);

    ASSERT_NE(content.find("Debug message with value 42"), std::string::npos);
    ASSERT_NE(content.find("Info message loading module 01-update-title.lua"), std::string::npos);
    ASSERT_NE(content.find("Warning: risk score approaching 70%"), std::string::npos);

    // Format: [seconds.nanos][LEVEL][Ttid] message
    std::istringstream stream(content);
    std::string line;
    int level_count = 0;
    while (std::getline(stream, line)) {
        if (line.rfind("[LOGGER_CONFIG]", 0) == 0) continue;
        ++level_count;
        ASSERT_EQ(line[0], '[') << "Log entry must start with timestamp bracket";
        const size_t first_close = line.find(']');
        ASSERT_NE(first_close, std::string::npos);
        const std::string timestamp = line.substr(1, first_close - 1);
        ASSERT_NE(timestamp.find('.'), std::string::npos) << "Timestamp should contain nanosecond precision";
        ASSERT_NE(line.find("][T"), std::string::npos) << "Thread id field expected";
    }
    ASSERT_EQ(level_count, 5) << "Should find exactly 5 log level entries";
}

TEST_F(LoggerTestBase, LevelFilteringContract) {
    const std::string filtered_log = createTempLogFile();
    Common::shutdownLogging();
    Common::initLogging(filtered_log.c_str());
    Common::setLogLevel(Common::Logger::WARN);

    const uint64_t filtered_before = Common::Logger::getStats().messages_filtered;
    LOG_DEBUG("hidden debug");
    LOG_INFO("hidden info");
    LOG_WARN("visible warning");
    const uint64_t filtered_after = Common::Logger::getStats().messages_filtered;
    Common::shutdownLogging();

    const std::string content = readFile(filtered_log);
    EXPECT_EQ(content.find("hidden debug"), std::string::npos);
    EXPECT_EQ(content.find("hidden info"), std::string::npos);
    EXPECT_NE(content.find("visible warning"), std::string::npos);
    EXPECT_EQ(filtered_after - filtered_before, 2u);
    EXPECT_FALSE(Common::Logger::isEnabled(Common::Logger::INFO));
    EXPECT_TRUE(Common::Logger::isEnabled(Common::Logger::ERROR));
}

TEST_F(LoggerTestBase, MessageTruncationContract) {
    const std::string format_log = createTempLogFile();
    Common::shutdownLogging();
    Common::initLogging(format_log.c_str());

    const std::string long_msg(230, 'X');
    const std::string overflow_msg(300, 'Y');
    LOG_INFO("Long message test: %s", long_msg.c_str());
    LOG_INFO("Overflow test: %s", overflow_msg.c_str());
    Common::shutdownLogging();

    const std::string content = readFile(format_log);
    std::istringstream stream(content);
    std::string line;
    bool saw_overflow = false;
    while (std::getline(stream, line)) {
        const size_t msg_start = line.find("] ");
        if (msg_start == std::string::npos) continue;
        const std::string message = line.substr(msg_start + 2);
        ASSERT_LT(message.size(), Common::Logger::MAX_MSG_SIZE) << "Messages are capped at the record size";
        if (message.rfind("Overflow test: ", 0) == 0) {
            saw_overflow = true;
            EXPECT_EQ(message.find_first_not_of('Y', std::strlen("Overflow test: ")), std::string::npos);
        }
    }
    EXPECT_TRUE(saw_overflow) << "Oversized messages are truncated, not dropped";
}

TEST_F(LoggerTestBase, ConcurrentProducersContract) {
    const std::string mt_log = createTempLogFile();
    Common::shutdownLogging();
    Common::initLogging(mt_log.c_str());

    constexpr int kThreads = 4;
    constexpr int kPerThread = 200;
    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < kPerThread; ++i) {
                LOG_INFO("thread=%d seq=%d", t, i);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    const Common::Logger::Stats stats = Common::Logger::getStats();
    Common::shutdownLogging();

    // Every message is either written or counted as dropped
    const size_t lines = countLogLines(mt_log) - 1;  // [LOGGER_CONFIG]
    EXPECT_EQ(lines + stats.messages_dropped, static_cast<size_t>(kThreads * kPerThread));
    EXPECT_EQ(stats.messages_dropped, 0u) << "Queue capacity covers this burst";
}

TEST_F(LoggerTestBase, DefaultLogPathUsesEnvironment) {
    setenv("MARKGATE_LOGS_DIR", test_dir_.c_str(), 1);
    char buf[512];
    ASSERT_TRUE(Common::defaultLogPath("markgate", buf, sizeof(buf)));
    const std::string path(buf);
    EXPECT_EQ(path.rfind(test_dir_ + "/markgate_", 0), 0u);
    EXPECT_EQ(path.substr(path.size() - 4), ".log");

    char tiny[8];
    EXPECT_FALSE(Common::defaultLogPath("markgate", tiny, sizeof(tiny)));
    unsetenv("MARKGATE_LOGS_DIR");
}
