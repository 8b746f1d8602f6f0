#ifndef SGATE_EVENT_LOG_HPP
#define SGATE_EVENT_LOG_HPP

#include <chrono>
#include <cstddef>
#include <fstream>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace sgate {

/**
 * @brief Structured operator log for errors and security events
 *
 * One line per event:
 *   2025-01-08T14:22:05Z [BAN] src=bans msg=10.0.0.5 level=1 duration=300
 *
 * Separate from the diagnostic Logger: this file is what operators and
 * alerting read, so every user-visible error is recorded here as well.
 */
class EventLog {
public:
    enum class EventType {
        ERROR,
        WARNING,
        INFO,
        CONFIG_CHANGE,
        ROLLBACK,
        RULESET,
        SESSION,
        BAN,
        UNBAN,
        WHITELIST_HIT
    };

    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        EventType type;
        std::string source;
        std::string message;
        std::map<std::string, std::string> metadata;
    };

    EventLog();
    explicit EventLog(const std::string& log_path);
    ~EventLog();

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    void log(EventType type, const std::string& source, const std::string& message,
             const std::map<std::string, std::string>& metadata = {});

    void log_error(const std::string& source, const std::string& message,
                   const std::string& code);
    void log_warning(const std::string& source, const std::string& message);
    void log_info(const std::string& source, const std::string& message);

    void set_log_path(const std::string& path);
    void flush();

    /// Most recent entries kept in memory (bounded).
    std::vector<LogEntry> get_recent_entries(size_t count) const;

    static const char* event_type_to_string(EventType type);

private:
    void write_entry(const LogEntry& entry);

    static constexpr size_t MAX_ENTRIES = 1000;

    std::string log_path_;
    std::ofstream log_file_;
    std::vector<LogEntry> entries_;
    mutable std::mutex mutex_;
};

} // namespace sgate

#endif // SGATE_EVENT_LOG_HPP
