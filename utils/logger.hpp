#pragma once

#include <core/noncopyable.hpp>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/format.h>

#ifndef _WIN32
#undef ERROR
#endif

namespace Kdc {
    // 日志级别枚举
    enum class LogLevel {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERR,
        FATAL
    };

    // 日志配置参数
    struct LogConfig {
        size_t max_file_size = 10 * 1024 * 1024;// 默认单个日志文件最大10MB
        size_t max_backup_files = 5;            // 默认保留5个备份文件
    };

    // 日志输出目标接口（策略模式）
    class LogAppender {
    public:
        virtual ~LogAppender() = default;
        virtual void Append(LogLevel level, const std::string &message) = 0;
        virtual void Flush() {}
    };

    // 控制台输出器（输出到 stderr，避免干扰命令行工具的正常输出）
    class ConsoleAppender : public LogAppender {
    public:
        void Append(LogLevel level, const std::string &message) override;
        void Flush() override;

    private:
        std::mutex mutex_;
    };

    // 同步文件输出器，按大小滚动
    class FileAppender : public LogAppender {
    public:
        explicit FileAppender(const std::string &base_dir, const LogConfig &config = LogConfig());
        ~FileAppender() override;

        void Append(LogLevel level, const std::string &message) override;
        void Flush() override;
        void SetConfig(const LogConfig &config);
        LogConfig GetConfig() const;
        std::string GetCurrentLogFileName() const;
        // index 为 0 时返回当前文件名，>0 时返回第 index 个备份文件名
        std::string GetLogFileName(int index) const;

    private:
        void rollLogFileIfNeeded();
        std::string generateLogFileName(int index = 0) const;
        void openCurrentFile();
        void closeCurrentFile();

        std::string base_dir_;
        LogConfig config_;
        mutable std::mutex mutex_;
        std::ofstream file_;
        std::string current_file_name_;
        size_t current_file_size_ = 0;
        std::string pid_str_;
        std::string start_time_str_;
    };

    // 日志核心类（单例模式）
    class Logger : private NonCopyable {
    public:
        static Logger &GetInstance();
        void SetLevel(LogLevel level);
        LogLevel GetLevel() const;
        bool IsEnabled(LogLevel level) const;
        void AddAppender(std::shared_ptr<LogAppender> appender);
        // 清空所有输出器（包括默认的控制台输出器）
        void RemoveAllAppenders();
        // 恢复为只有控制台输出器的初始状态
        void ResetAppenders();
        void Log(LogLevel level, const std::string &message);
        void Flush();
        static std::string LevelToString(LogLevel level);
        static std::string GetTimestamp();

        template<typename... Args>
        void Trace(const std::string &fmt, Args &&...args) {
            if (IsEnabled(LogLevel::TRACE)) {
                Log(LogLevel::TRACE, fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
            }
        }

        template<typename... Args>
        void Debug(const std::string &fmt, Args &&...args) {
            if (IsEnabled(LogLevel::DEBUG)) {
                Log(LogLevel::DEBUG, fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
            }
        }

        template<typename... Args>
        void Info(const std::string &fmt, Args &&...args) {
            if (IsEnabled(LogLevel::INFO)) {
                Log(LogLevel::INFO, fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
            }
        }

        template<typename... Args>
        void Warn(const std::string &fmt, Args &&...args) {
            if (IsEnabled(LogLevel::WARN)) {
                Log(LogLevel::WARN, fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
            }
        }

        template<typename... Args>
        void Error(const std::string &fmt, Args &&...args) {
            if (IsEnabled(LogLevel::ERR)) {
                Log(LogLevel::ERR, fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
            }
        }

        template<typename... Args>
        void Fatal(const std::string &fmt, Args &&...args) {
            Log(LogLevel::FATAL, fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
        }

    private:
        Logger();
        ~Logger();

        LogLevel level_;                                     // 当前日志级别
        std::vector<std::shared_ptr<LogAppender>> appenders_;// 日志输出器列表
        mutable std::mutex mutex_;
    };

    // "trace/debug/info/warn/error/fatal" -> LogLevel，无法识别时抛出 std::invalid_argument
    LogLevel ParseLogLevel(const std::string &level_str);

}// namespace Kdc

// 宏定义简化调用
#define KDC_LOG_TRACE(...) Kdc::Logger::GetInstance().Trace(__VA_ARGS__)
#define KDC_LOG_DEBUG(...) Kdc::Logger::GetInstance().Debug(__VA_ARGS__)
#define KDC_LOG_INFO(...) Kdc::Logger::GetInstance().Info(__VA_ARGS__)
#define KDC_LOG_WARN(...) Kdc::Logger::GetInstance().Warn(__VA_ARGS__)
#define KDC_LOG_ERROR(...) Kdc::Logger::GetInstance().Error(__VA_ARGS__)
#define KDC_LOG_FATAL(...) Kdc::Logger::GetInstance().Fatal(__VA_ARGS__)
#define KDC_SET_LEVEL(level) Kdc::Logger::GetInstance().SetLevel(level)
