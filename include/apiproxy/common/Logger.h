#pragma once

#include <string>
#include <mutex>
#include <sstream>
#include <atomic>

namespace apiproxy {
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

    // Accepts DEBUG/INFO/WARN/ERROR/FATAL in any case. Returns false for anything else.
    static bool ParseLevel(const std::string& levelStr, LogLevel* out);

    // Colour is on by default only when stdout is a terminal.
    void SetColor(bool on) { color_ = on; }

    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_{LogLevel::INFO};
    bool color_{false};
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
    std::ostringstream ss_;
};

} // namespace common
} // namespace apiproxy

#define APIPROXY_LOG(level) \
    if (level >= apiproxy::common::Logger::Instance().GetLevel()) \
    apiproxy::common::LogStream(level, __FILE__, __LINE__)

#define LOG_DEBUG APIPROXY_LOG(apiproxy::common::LogLevel::DEBUG)
#define LOG_INFO APIPROXY_LOG(apiproxy::common::LogLevel::INFO)
#define LOG_WARN APIPROXY_LOG(apiproxy::common::LogLevel::WARN)
#define LOG_ERROR APIPROXY_LOG(apiproxy::common::LogLevel::ERROR)
#define LOG_FATAL APIPROXY_LOG(apiproxy::common::LogLevel::FATAL)
