#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#ifdef _WIN32
#include <process.h>
#else
#include <unistd.h>
#endif

namespace Kdc {
    namespace fs = std::filesystem;

    namespace {
        std::tm LocalTime(std::time_t t) {
            std::tm tm{};
#ifdef _WIN32
            localtime_s(&tm, &t);
#else
            localtime_r(&t, &tm);
#endif
            return tm;
        }

        std::string CurrentPidString() {
#ifdef _WIN32
            return std::to_string(_getpid());
#else
            return std::to_string(getpid());
#endif
        }

        fmt::text_style StyleOf(LogLevel level) {
            switch (level) {
                case LogLevel::TRACE:
                    return fmt::fg(fmt::color::gray);
                case LogLevel::DEBUG:
                    return fmt::fg(fmt::color::cyan);
                case LogLevel::INFO:
                    return fmt::fg(fmt::color::lime_green);
                case LogLevel::WARN:
                    return fmt::fg(fmt::color::orange);
                case LogLevel::ERR:
                    return fmt::fg(fmt::color::red) | fmt::emphasis::bold;
                case LogLevel::FATAL:
                    return fmt::fg(fmt::color::crimson) | fmt::emphasis::bold;
            }
            return fmt::fg(fmt::color::white);
        }
    }// namespace

    // 控制台输出器实现
    void ConsoleAppender::Append(LogLevel level, const std::string &message) {
        std::lock_guard<std::mutex> lock(mutex_);
        fmt::print(stderr, StyleOf(level), "[{}] [{}] {}\n",
                   Logger::GetTimestamp(),
                   Logger::LevelToString(level),
                   message);
    }

    void ConsoleAppender::Flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::fflush(stderr);
    }

    // 文件输出器实现
    FileAppender::FileAppender(const std::string &base_dir, const LogConfig &config)
        : base_dir_(base_dir), config_(config) {
        pid_str_ = CurrentPidString();

        std::tm tm = LocalTime(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
        std::stringstream ss;
        ss << std::put_time(&tm, "%Y%m%d_%H%M%S");
        start_time_str_ = ss.str();

        std::error_code ec;
        fs::create_directories(base_dir_, ec);
        if (ec) {
            fmt::print(stderr, "Failed to create log directory {}: {}\n", base_dir_, ec.message());
        }

        current_file_name_ = generateLogFileName();
        std::lock_guard<std::mutex> lock(mutex_);
        openCurrentFile();
    }

    FileAppender::~FileAppender() {
        std::lock_guard<std::mutex> lock(mutex_);
        closeCurrentFile();
    }

    std::string FileAppender::GetCurrentLogFileName() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_file_name_;
    }

    std::string FileAppender::GetLogFileName(int index) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return generateLogFileName(index);
    }

    // 调用方需持有 mutex_
    void FileAppender::openCurrentFile() {
        file_.open(current_file_name_, std::ios::app | std::ios::binary);
        if (!file_.is_open()) {
            fmt::print(stderr, "Failed to open log file: {}\n", current_file_name_);
            return;
        }
        file_.seekp(0, std::ios::end);
        current_file_size_ = static_cast<size_t>(file_.tellp());
    }

    void FileAppender::closeCurrentFile() {
        if (file_.is_open()) {
            file_.flush();
            file_.close();
        }
    }

    void FileAppender::Append(LogLevel level, const std::string &message) {
        std::string log_line = fmt::format("[{}] [{}] {}\n",
                                           Logger::GetTimestamp(),
                                           Logger::LevelToString(level),
                                           message);

        std::lock_guard<std::mutex> lock(mutex_);
        rollLogFileIfNeeded();
        if (!file_.is_open()) {
            openCurrentFile();
            if (!file_.is_open()) {
                return;
            }
        }

        file_ << log_line;
        file_.flush();
        current_file_size_ += log_line.size();
    }

    void FileAppender::Flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (file_.is_open()) {
            file_.flush();
        }
    }

    void FileAppender::SetConfig(const LogConfig &config) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = config;
    }

    LogConfig FileAppender::GetConfig() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_;
    }

    // 当前文件写满后：.N-1 -> .N 依次后移，当前文件改名为 .1，再重新打开当前文件
    void FileAppender::rollLogFileIfNeeded() {
        if (config_.max_file_size == 0 || current_file_size_ < config_.max_file_size) {
            return;
        }
        closeCurrentFile();

        std::error_code ec;
        if (config_.max_backup_files == 0) {
            fs::remove(current_file_name_, ec);
        } else {
            fs::remove(generateLogFileName(static_cast<int>(config_.max_backup_files)), ec);
            for (int i = static_cast<int>(config_.max_backup_files); i > 1; --i) {
                std::string src = generateLogFileName(i - 1);
                if (fs::exists(src, ec)) {
                    fs::rename(src, generateLogFileName(i), ec);
                }
            }
            fs::rename(current_file_name_, generateLogFileName(1), ec);
            if (ec) {
                fmt::print(stderr, "Failed to rotate log file {}: {}\n", current_file_name_, ec.message());
            }
        }

        current_file_size_ = 0;
        openCurrentFile();
    }

    std::string FileAppender::generateLogFileName(int index) const {
        std::stringstream ss;
        ss << base_dir_ << "/kdc_client_" << start_time_str_ << "_" << pid_str_;
        if (index > 0) {
            ss << "." << index;
        }
        ss << ".log";
        return ss.str();
    }

    // 日志核心类实现
    Logger::Logger() : level_(LogLevel::INFO) {
        appenders_.push_back(std::make_shared<ConsoleAppender>());
    }

    Logger::~Logger() {
        Flush();
    }

    Logger &Logger::GetInstance() {
        static Logger instance;
        return instance;
    }

    void Logger::SetLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    LogLevel Logger::GetLevel() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    bool Logger::IsEnabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level >= level_;
    }

    void Logger::AddAppender(std::shared_ptr<LogAppender> appender) {
        std::lock_guard<std::mutex> lock(mutex_);
        appenders_.push_back(std::move(appender));
    }

    void Logger::RemoveAllAppenders() {
        std::lock_guard<std::mutex> lock(mutex_);
        appenders_.clear();
    }

    void Logger::ResetAppenders() {
        std::lock_guard<std::mutex> lock(mutex_);
        appenders_.clear();
        appenders_.push_back(std::make_shared<ConsoleAppender>());
    }

    void Logger::Log(LogLevel level, const std::string &message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < level_) {
            return;
        }
        for (const auto &appender: appenders_) {
            appender->Append(level, message);
        }
    }

    void Logger::Flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &appender: appenders_) {
            appender->Flush();
        }
    }

    std::string Logger::LevelToString(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE:
                return "TRACE";
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO ";
            case LogLevel::WARN:
                return "WARN ";
            case LogLevel::ERR:
                return "ERROR";
            case LogLevel::FATAL:
                return "FATAL";
        }
        return "UNKNOWN";
    }

    std::string Logger::GetTimestamp() {
        auto now = std::chrono::system_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
        std::tm tm = LocalTime(std::chrono::system_clock::to_time_t(now));
        std::stringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    LogLevel ParseLogLevel(const std::string &level_str) {
        static const std::unordered_map<std::string, LogLevel> levels = {
                {"trace", LogLevel::TRACE},
                {"debug", LogLevel::DEBUG},
                {"info", LogLevel::INFO},
                {"warn", LogLevel::WARN},
                {"error", LogLevel::ERR},
                {"fatal", LogLevel::FATAL}};

        auto it = levels.find(level_str);
        if (it != levels.end()) {
            return it->second;
        }
        throw std::invalid_argument("Invalid log level: " + level_str);
    }

}// namespace Kdc
