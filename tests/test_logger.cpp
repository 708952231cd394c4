#include "core/kdc.hpp"
#include "utils/logger.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace fs = std::filesystem;
using namespace std::chrono_literals;

// 同步日志测试类，统一处理资源释放
class SyncLoggerTest : public testing::Test {
protected:
    std::string testLogDir;                            // 测试日志目录
    std::shared_ptr<Kdc::FileAppender> fileAppender;   // 同步文件输出器

    void SetUp() override {
        testLogDir = createTestDir();
        fs::remove_all(testLogDir);// 清理历史残留
    }

    void TearDown() override {
        Kdc::Logger::GetInstance().ResetAppenders();
        Kdc::Logger::GetInstance().SetLevel(Kdc::LogLevel::INFO);
        fileAppender.reset();
        std::error_code ec;
        fs::remove_all(testLogDir, ec);
    }

    // 生成唯一测试目录
    static std::string createTestDir() {
        std::string testName = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        return (fs::temp_directory_path() / ("kdc_test_logs_" + testName + "_" + std::to_string(getpid()))).string();
    }

    void attachFileAppender(const Kdc::LogConfig &config = Kdc::LogConfig()) {
        fileAppender = std::make_shared<Kdc::FileAppender>(testLogDir, config);
        Kdc::Logger::GetInstance().RemoveAllAppenders();
        Kdc::Logger::GetInstance().AddAppender(fileAppender);
    }

    static std::string readAll(const std::string &path) {
        std::ifstream file(path);
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }
};

// 收集消息的内存输出器
class CapturingAppender : public Kdc::LogAppender {
public:
    void Append(Kdc::LogLevel level, const std::string &message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries.emplace_back(level, message);
    }

    std::vector<std::pair<Kdc::LogLevel, std::string>> entries;

private:
    std::mutex mutex_;
};

TEST_F(SyncLoggerTest, FileCreationAndContent) {
    attachFileAppender();
    Kdc::Logger::GetInstance().SetLevel(Kdc::LogLevel::INFO);

    std::string testMsg = "Sync file creation test message";
    KDC_LOG_INFO("{}", testMsg);
    Kdc::Logger::GetInstance().Flush();

    std::string logFileName = fileAppender->GetCurrentLogFileName();
    EXPECT_TRUE(fs::exists(logFileName)) << "日志文件未创建: " << logFileName;
    EXPECT_NE(logFileName.find("kdc_client_"), std::string::npos);

    std::string logContent = readAll(logFileName);
    EXPECT_NE(logContent.find(testMsg), std::string::npos) << "日志内容不匹配";
    EXPECT_NE(logContent.find("[INFO ]"), std::string::npos) << "日志级别标识错误";
}

TEST_F(SyncLoggerTest, ConcurrentWrites) {
    attachFileAppender();
    Kdc::Logger::GetInstance().SetLevel(Kdc::LogLevel::TRACE);

    // 多线程并发写入（5个线程，每个写200条）
    const int threadCount = 5;
    const int logsPerThread = 200;
    std::vector<std::thread> threads;
    for (int t = 0; t < threadCount; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < logsPerThread; ++i) {
                KDC_LOG_TRACE("Sync thread {} log {}", t, i);
            }
        });
    }
    for (auto &th: threads) {
        th.join();
    }
    Kdc::Logger::GetInstance().Flush();

    std::ifstream file(fileAppender->GetCurrentLogFileName());
    std::string line;
    int totalLines = 0;
    while (std::getline(file, line)) {
        totalLines++;
    }
    EXPECT_EQ(totalLines, threadCount * logsPerThread)
            << "并发写入丢失，实际: " << totalLines;
}

TEST_F(SyncLoggerTest, LevelFiltering) {
    attachFileAppender();
    Kdc::Logger::GetInstance().SetLevel(Kdc::LogLevel::WARN);// 只输出WARN及以上

    KDC_LOG_TRACE("Sync TRACE should be filtered");
    KDC_LOG_DEBUG("Sync DEBUG should be filtered");
    KDC_LOG_INFO("Sync INFO should be filtered");
    KDC_LOG_WARN("Sync WARN should be kept");
    KDC_LOG_ERROR("Sync ERROR should be kept");
    KDC_LOG_FATAL("Sync FATAL should be kept");
    Kdc::Logger::GetInstance().Flush();

    std::string content = readAll(fileAppender->GetCurrentLogFileName());
    EXPECT_EQ(content.find("TRACE"), std::string::npos) << "TRACE日志未被过滤";
    EXPECT_EQ(content.find("DEBUG"), std::string::npos) << "DEBUG日志未被过滤";
    EXPECT_EQ(content.find("INFO"), std::string::npos) << "INFO日志未被过滤";
    EXPECT_NE(content.find("WARN"), std::string::npos) << "WARN日志丢失";
    EXPECT_NE(content.find("ERROR"), std::string::npos) << "ERROR日志丢失";
    EXPECT_NE(content.find("FATAL"), std::string::npos) << "FATAL日志丢失";
}

TEST_F(SyncLoggerTest, RollsFileWhenFull) {
    Kdc::LogConfig config;
    config.max_file_size = 256;
    config.max_backup_files = 2;
    attachFileAppender(config);
    Kdc::Logger::GetInstance().SetLevel(Kdc::LogLevel::INFO);

    for (int i = 0; i < 50; ++i) {
        KDC_LOG_INFO("rolling line {} with some padding to fill the file", i);
    }
    Kdc::Logger::GetInstance().Flush();

    EXPECT_TRUE(fs::exists(fileAppender->GetCurrentLogFileName()));
    EXPECT_TRUE(fs::exists(fileAppender->GetLogFileName(1)));
    EXPECT_TRUE(fs::exists(fileAppender->GetLogFileName(2)));
    EXPECT_FALSE(fs::exists(fileAppender->GetLogFileName(3))) << "备份数超过上限";

    // 最新的一条一定在当前文件里
    EXPECT_NE(readAll(fileAppender->GetCurrentLogFileName()).find("rolling line 49"), std::string::npos);
}

TEST_F(SyncLoggerTest, AppendersReceiveFormattedMessage) {
    auto capture = std::make_shared<CapturingAppender>();
    Kdc::Logger::GetInstance().RemoveAllAppenders();
    Kdc::Logger::GetInstance().AddAppender(capture);
    Kdc::Logger::GetInstance().SetLevel(Kdc::LogLevel::DEBUG);

    KDC_LOG_TRACE("hidden");
    KDC_LOG_DEBUG("handle {} opened", 7);
    KDC_LOG_ERROR("{} failed: code={}", "GetCommand", "ERROR");

    ASSERT_EQ(capture->entries.size(), 2u);
    EXPECT_EQ(capture->entries[0].first, Kdc::LogLevel::DEBUG);
    EXPECT_EQ(capture->entries[0].second, "handle 7 opened");
    EXPECT_EQ(capture->entries[1].first, Kdc::LogLevel::ERR);
    EXPECT_EQ(capture->entries[1].second, "GetCommand failed: code=ERROR");
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(Kdc::ParseLogLevel("trace"), Kdc::LogLevel::TRACE);
    EXPECT_EQ(Kdc::ParseLogLevel("debug"), Kdc::LogLevel::DEBUG);
    EXPECT_EQ(Kdc::ParseLogLevel("info"), Kdc::LogLevel::INFO);
    EXPECT_EQ(Kdc::ParseLogLevel("warn"), Kdc::LogLevel::WARN);
    EXPECT_EQ(Kdc::ParseLogLevel("error"), Kdc::LogLevel::ERR);
    EXPECT_EQ(Kdc::ParseLogLevel("fatal"), Kdc::LogLevel::FATAL);
    EXPECT_THROW(Kdc::ParseLogLevel("verbose"), std::invalid_argument);
}

TEST(LoggerTest, LevelToStringIsPadded) {
    EXPECT_EQ(Kdc::Logger::LevelToString(Kdc::LogLevel::INFO), "INFO ");
    EXPECT_EQ(Kdc::Logger::LevelToString(Kdc::LogLevel::WARN), "WARN ");
    EXPECT_EQ(Kdc::Logger::LevelToString(Kdc::LogLevel::ERR), "ERROR");
}
