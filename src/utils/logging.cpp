#include "utils/logging.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace medscribe {
namespace utils {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
std::mutex g_output_mutex;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << millis.count();
    return ss.str();
}

} // namespace

bool Logger::initialized_ = false;

void Logger::initialize(LogLevel level) {
    setLevel(level);
    if (!initialized_) {
        initialized_ = true;
        debug("Logger initialized");
    }
}

void Logger::info(const std::string& message) {
    write(LogLevel::INFO, "INFO", message);
}

void Logger::warn(const std::string& message) {
    write(LogLevel::WARN, "WARN", message);
}

void Logger::error(const std::string& message) {
    write(LogLevel::ERROR, "ERROR", message);
}

void Logger::debug(const std::string& message) {
    write(LogLevel::DEBUG, "DEBUG", message);
}

void Logger::setLevel(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel Logger::getLevel() {
    return static_cast<LogLevel>(g_level.load());
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

void Logger::write(LogLevel level, const char* tag, const std::string& message) {
    if (static_cast<int>(level) < g_level.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::ostream& out = (level == LogLevel::ERROR) ? std::cerr : std::cout;
    out << timestamp() << " [" << tag << "] " << message << std::endl;
}

} // namespace utils
} // namespace medscribe
