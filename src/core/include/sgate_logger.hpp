#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <sstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <ctime>

namespace sgate {

/**
 * @brief Logging levels for sgate
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    NONE  = 6
};

/**
 * @brief Thread-safe process logger
 *
 * Console output goes to stderr so that command output on stdout stays
 * machine-parseable. File output is appended and flushed per line.
 * Messages carry the emitting component: "[INFO ] bans: 10.0.0.5 banned".
 */
class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mtx_);
        level_ = level;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return level_;
    }

    void setConsoleOutput(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx_);
        console_enabled_ = enabled;
    }

    bool setFileOutput(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (file_.is_open()) file_.close();
        file_.open(path, std::ios::app);
        file_enabled_ = file_.is_open();
        return file_enabled_;
    }

    void log(LogLevel level, const std::string& component, const std::string& msg) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (level < level_) return;

        std::string formatted = formatMessage(level, component, msg);

        if (console_enabled_) {
            std::cerr << formatted << std::endl;
        }

        if (file_enabled_ && file_.is_open()) {
            file_ << formatted << std::endl;
            file_.flush();
        }
    }

    static LogLevel levelFromString(const std::string& s) {
        if (s == "trace") return LogLevel::TRACE;
        if (s == "debug") return LogLevel::DEBUG;
        if (s == "info")  return LogLevel::INFO;
        if (s == "warn" || s == "warning") return LogLevel::WARN;
        if (s == "error") return LogLevel::ERROR;
        if (s == "fatal") return LogLevel::FATAL;
        if (s == "none")  return LogLevel::NONE;
        return LogLevel::INFO;
    }

private:
    Logger()
        : level_(LogLevel::INFO)
        , console_enabled_(true)
        , file_enabled_(false)
    {}

    ~Logger() {
        if (file_.is_open()) file_.close();
    }

    std::string formatMessage(LogLevel level, const std::string& component,
                              const std::string& msg) {
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        struct tm tm_buf{};
        localtime_r(&t, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << " [" << levelToString(level) << "] ";
        if (!component.empty()) oss << component << ": ";
        oss << msg;
        return oss.str();
    }

    static const char* levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default:              return "?????";
        }
    }

    LogLevel level_;
    bool console_enabled_;
    bool file_enabled_;
    std::ofstream file_;
    mutable std::mutex mtx_;
};

// Convenience macros: SGATE_LOG_INFO("bans", "10.0.0.5 banned")
#define SGATE_LOG_TRACE(comp, msg) sgate::Logger::instance().log(sgate::LogLevel::TRACE, comp, msg)
#define SGATE_LOG_DEBUG(comp, msg) sgate::Logger::instance().log(sgate::LogLevel::DEBUG, comp, msg)
#define SGATE_LOG_INFO(comp, msg)  sgate::Logger::instance().log(sgate::LogLevel::INFO,  comp, msg)
#define SGATE_LOG_WARN(comp, msg)  sgate::Logger::instance().log(sgate::LogLevel::WARN,  comp, msg)
#define SGATE_LOG_ERROR(comp, msg) sgate::Logger::instance().log(sgate::LogLevel::ERROR, comp, msg)
#define SGATE_LOG_FATAL(comp, msg) sgate::Logger::instance().log(sgate::LogLevel::FATAL, comp, msg)

} // namespace sgate
