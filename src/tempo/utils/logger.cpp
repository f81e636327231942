#include <tempo/utils/logger.hpp>
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace tempo::utils {

std::mutex Logger::console_mutex_;
LogLevel Logger::current_level_ = LogLevel::INFO;
std::ostream* Logger::output_ = &std::cout;

LogLevel parse_level(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "error") return LogLevel::LOG_ERROR;
    return LogLevel::INFO;
}

Logger::Logger(LogLevel level) : level_(level) {}

Logger& Logger::for_level(LogLevel level) {
    // One buffer per level and thread, so interleaved builders never mix
    static thread_local Logger debug_instance(LogLevel::DEBUG);
    static thread_local Logger info_instance(LogLevel::INFO);
    static thread_local Logger warn_instance(LogLevel::WARN);
    static thread_local Logger error_instance(LogLevel::LOG_ERROR);

    Logger* instance = &info_instance;
    switch (level) {
        case LogLevel::DEBUG:
            instance = &debug_instance;
            break;
        case LogLevel::INFO:
            instance = &info_instance;
            break;
        case LogLevel::WARN:
            instance = &warn_instance;
            break;
        case LogLevel::LOG_ERROR:
            instance = &error_instance;
            break;
    }
    instance->stream_.str("");
    instance->stream_.clear();
    return *instance;
}

Logger& Logger::debug() {
    return for_level(LogLevel::DEBUG);
}

Logger& Logger::info() {
    return for_level(LogLevel::INFO);
}

Logger& Logger::warn() {
    return for_level(LogLevel::WARN);
}

Logger& Logger::error() {
    return for_level(LogLevel::LOG_ERROR);
}

Logger& Logger::operator<<(const EndlType&) {
    if (level_ < current_level_) {
        return *this;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ).count() % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &time);
#else
    localtime_r(&time, &local);
#endif

    std::stringstream time_str;
    time_str << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    time_str << '.' << std::setfill('0') << std::setw(3) << ms;

    const char* tag = "[INFO] ";
    switch (level_) {
        case LogLevel::DEBUG:
            tag = "[DEBUG] ";
            break;
        case LogLevel::INFO:
            tag = "[INFO] ";
            break;
        case LogLevel::WARN:
            tag = "[WARN] ";
            break;
        case LogLevel::LOG_ERROR:
            tag = "[ERROR] ";
            break;
    }

    std::lock_guard<std::mutex> lock(console_mutex_);
    *output_ << "[" << time_str.str() << "] " << tag << stream_.str() << std::endl;

    return *this;
}

void Logger::set_level(LogLevel level) {
    current_level_ = level;
}

LogLevel Logger::level() {
    return current_level_;
}

void Logger::set_output(std::ostream& out) {
    std::lock_guard<std::mutex> lock(console_mutex_);
    output_ = &out;
}

void Logger::reset_output() {
    std::lock_guard<std::mutex> lock(console_mutex_);
    output_ = &std::cout;
}

} // namespace tempo::utils
