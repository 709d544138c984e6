#pragma once

#include <atomic>
#include <string>
#include <mutex>
#include <ostream>
#include <sstream>

namespace s3meter {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_.load(std::memory_order_relaxed); }
    // Accepts "debug", "INFO", ... ; unknown strings map to INFO.
    static LogLevel ParseLevel(const std::string& levelStr);

    // Redirects output (nullptr restores std::clog). The stream must outlive the logger use.
    void SetOutput(std::ostream* out);
    void SetColor(bool on);

    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::ostream* out_;
    bool color_;
    std::mutex mutex_;
};

// Stream wrapper to allow usage like: LOG_INFO << "Message " << 123;
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line)
        : level_(level), file_(file), line_(line) {}

    ~LogStream() {
        Logger::Instance().Log(level_, file_, line_, ss_.str());
    }

    template <typename T>
    LogStream& operator<<(const T& val) {
        ss_ << val;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    std::stringstream ss_;
};

} // namespace common
} // namespace s3meter

// Macros for easy usage
#define LOG_DEBUG \
    if (s3meter::common::LogLevel::DEBUG >= s3meter::common::Logger::Instance().GetLevel()) \
    s3meter::common::LogStream(s3meter::common::LogLevel::DEBUG, __FILE__, __LINE__)

#define LOG_INFO \
    if (s3meter::common::LogLevel::INFO >= s3meter::common::Logger::Instance().GetLevel()) \
    s3meter::common::LogStream(s3meter::common::LogLevel::INFO, __FILE__, __LINE__)

#define LOG_WARN \
    if (s3meter::common::LogLevel::WARN >= s3meter::common::Logger::Instance().GetLevel()) \
    s3meter::common::LogStream(s3meter::common::LogLevel::WARN, __FILE__, __LINE__)

#define LOG_ERROR \
    if (s3meter::common::LogLevel::ERROR >= s3meter::common::Logger::Instance().GetLevel()) \
    s3meter::common::LogStream(s3meter::common::LogLevel::ERROR, __FILE__, __LINE__)

#define LOG_FATAL \
    if (s3meter::common::LogLevel::FATAL >= s3meter::common::Logger::Instance().GetLevel()) \
    s3meter::common::LogStream(s3meter::common::LogLevel::FATAL, __FILE__, __LINE__)
