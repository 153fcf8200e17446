#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <sstream>
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <unistd.h>

namespace mazegen {
namespace log {

enum class Level {
    FATAL = 0,
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DEBUG = 4,
    VERBOSE = 5
};

inline const char* level_to_string(Level level) {
    switch (level) {
        case Level::FATAL:   return "FATAL";
        case Level::ERROR:   return "ERROR";
        case Level::WARNING: return "WARNING";
        case Level::INFO:    return "INFO";
        case Level::DEBUG:   return "DEBUG";
        case Level::VERBOSE: return "VERBOSE";
        default:             return "UNKNOWN";
    }
}

// Case-insensitive; unknown names give fallback.
inline Level level_from_string(const std::string& name, Level fallback = Level::INFO) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return char(std::toupper(c)); });
    if (upper == "FATAL")   return Level::FATAL;
    if (upper == "ERROR")   return Level::ERROR;
    if (upper == "WARNING" || upper == "WARN") return Level::WARNING;
    if (upper == "INFO")    return Level::INFO;
    if (upper == "DEBUG")   return Level::DEBUG;
    if (upper == "VERBOSE") return Level::VERBOSE;
    return fallback;
}

// Writes to stderr; stdout is reserved for maze output.
class Logger {
public:
    Logger(const std::string& component, Level max_level = Level::INFO, std::ostream& sink = std::cerr)
        : component_(component)
        , max_level_(max_level)
        , pid_(getpid())
        , sink_(&sink) {}

    void set_level(Level level) {
        max_level_ = level;
    }

    Level get_level() const {
        return max_level_;
    }

    bool enabled(Level level) const {
        return level <= max_level_;
    }

    void log(Level level, const std::string& message) {
        if (!enabled(level)) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::ostringstream oss;
        oss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << " [" << component_ << "]"
            << " [" << pid_ << "]"
            << " [" << level_to_string(level) << "]"
            << " " << message;

        *sink_ << oss.str() << std::endl;
    }

    void fatal(const std::string& message)   { log(Level::FATAL, message); }
    void error(const std::string& message)   { log(Level::ERROR, message); }
    void warning(const std::string& message) { log(Level::WARNING, message); }
    void info(const std::string& message)    { log(Level::INFO, message); }
    void debug(const std::string& message)   { log(Level::DEBUG, message); }
    void verbose(const std::string& message) { log(Level::VERBOSE, message); }

private:
    std::string component_;
    Level max_level_;
    pid_t pid_;
    std::ostream* sink_;
};

} // namespace log
} // namespace mazegen
