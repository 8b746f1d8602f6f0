#include "../include/sgate_event_log.hpp"

#include <ctime>
#include <iomanip>

namespace sgate {

EventLog::EventLog() = default;

EventLog::EventLog(const std::string& log_path)
    : log_path_(log_path)
{
    if (!log_path_.empty()) {
        log_file_.open(log_path_, std::ios::app);
    }
}

EventLog::~EventLog() {
    if (log_file_.is_open()) {
        log_file_.flush();
        log_file_.close();
    }
}

const char* EventLog::event_type_to_string(EventType type) {
    switch (type) {
        case EventType::ERROR:         return "ERROR";
        case EventType::WARNING:       return "WARNING";
        case EventType::INFO:          return "INFO";
        case EventType::CONFIG_CHANGE: return "CONFIG_CHANGE";
        case EventType::ROLLBACK:      return "ROLLBACK";
        case EventType::RULESET:       return "RULESET";
        case EventType::SESSION:       return "SESSION";
        case EventType::BAN:           return "BAN";
        case EventType::UNBAN:         return "UNBAN";
        case EventType::WHITELIST_HIT: return "WHITELIST_HIT";
    }
    return "UNKNOWN";
}

void EventLog::write_entry(const LogEntry& entry) {
    if (!log_file_.is_open()) return;

    auto time_t_val = std::chrono::system_clock::to_time_t(entry.timestamp);
    struct tm tm_buf{};
    gmtime_r(&time_t_val, &tm_buf);

    log_file_ << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ")
              << " [" << event_type_to_string(entry.type) << "]"
              << " src=" << entry.source
              << " msg=" << entry.message;

    for (const auto& kv : entry.metadata) {
        log_file_ << " " << kv.first << "=" << kv.second;
    }
    log_file_ << "\n";
    log_file_.flush();
}

void EventLog::log(EventType type, const std::string& source,
                   const std::string& message,
                   const std::map<std::string, std::string>& metadata)
{
    std::lock_guard<std::mutex> lock(mutex_);

    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.type = type;
    entry.source = source;
    entry.message = message;
    entry.metadata = metadata;

    entries_.push_back(entry);
    if (entries_.size() > MAX_ENTRIES) {
        entries_.erase(entries_.begin());
    }

    write_entry(entry);
}

void EventLog::log_error(const std::string& source, const std::string& message,
                         const std::string& code) {
    log(EventType::ERROR, source, message, {{"code", code}});
}

void EventLog::log_warning(const std::string& source, const std::string& message) {
    log(EventType::WARNING, source, message);
}

void EventLog::log_info(const std::string& source, const std::string& message) {
    log(EventType::INFO, source, message);
}

void EventLog::set_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.flush();
        log_file_.close();
    }
    log_path_ = path;
    if (!path.empty()) {
        log_file_.open(path, std::ios::app);
    }
}

void EventLog::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.flush();
    }
}

std::vector<EventLog::LogEntry> EventLog::get_recent_entries(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (count >= entries_.size()) {
        return entries_;
    }
    auto start_it = entries_.end() - static_cast<std::ptrdiff_t>(count);
    return std::vector<LogEntry>(start_it, entries_.end());
}

} // namespace sgate
