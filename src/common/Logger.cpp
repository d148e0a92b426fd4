#include "apiproxy/common/Logger.h"

#include <iostream>
#include <chrono>
#include <iomanip>
#include <ctime>
#include <cctype>
#include <cstring>
#include <unistd.h>

namespace apiproxy {
namespace common {

namespace {

std::string CurrentTime() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tmBuf;
    localtime_r(&in_time_t, &tmBuf);
    std::ostringstream ss;
    ss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

const char* LevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

const char* LevelToColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35m";
        default: return "\033[0m";
    }
}

// __FILE__ carries the full build path; keep the part under src/ or tests/.
const char* ShortFile(const char* file) {
    const char* p = std::strstr(file, "src/");
    if (!p) p = std::strstr(file, "tests/");
    return p ? p : file;
}

} // namespace

Logger::Logger() : color_(::isatty(STDOUT_FILENO) == 1) {}

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::SetLevel(LogLevel level) {
    level_.store(level, std::memory_order_relaxed);
}

bool Logger::ParseLevel(const std::string& levelStr, LogLevel* out) {
    std::string s;
    s.reserve(levelStr.size());
    for (unsigned char c : levelStr) s.push_back(static_cast<char>(std::toupper(c)));
    LogLevel level;
    if (s == "DEBUG") level = LogLevel::DEBUG;
    else if (s == "INFO") level = LogLevel::INFO;
    else if (s == "WARN" || s == "WARNING") level = LogLevel::WARN;
    else if (s == "ERROR") level = LogLevel::ERROR;
    else if (s == "FATAL") level = LogLevel::FATAL;
    else return false;
    if (out) *out = level;
    return true;
}

void Logger::Log(LogLevel level, const char* file, int line, const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Format: [Time] [Level] [File:Line] Message
    if (color_) std::cout << LevelToColor(level);
    std::cout << "[" << CurrentTime() << "] "
              << "[" << LevelToString(level) << "] "
              << "[" << ShortFile(file) << ":" << line << "] "
              << msg;
    if (color_) std::cout << "\033[0m";
    std::cout << std::endl;
}

} // namespace common
} // namespace apiproxy
