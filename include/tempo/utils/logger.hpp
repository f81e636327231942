#pragma once
#include <string>
#include <sstream>
#include <ostream>
#include <mutex>

namespace tempo::utils {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    LOG_ERROR  // ERROR collides with a Windows macro
};

// Maps "debug", "info", "warn" and "error" to a level, INFO for anything else
LogLevel parse_level(const std::string& name);

class Logger {
public:
    struct EndlType {};
    inline static constexpr EndlType endl{};

    static Logger& debug();
    static Logger& info();
    static Logger& warn();
    static Logger& error();

    template<typename T>
    Logger& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

    Logger& operator<<(const EndlType&);

    static void set_level(LogLevel level);
    static LogLevel level();

    // Redirects every subsequent line; the stream must outlive its use
    static void set_output(std::ostream& out);
    static void reset_output();

private:
    explicit Logger(LogLevel level);
    static Logger& for_level(LogLevel level);

    LogLevel level_;
    std::stringstream stream_;

    static std::mutex console_mutex_;
    static LogLevel current_level_;
    static std::ostream* output_;
};

} // namespace tempo::utils
