#pragma once

/**
 * @file sgate_session.hpp
 * @brief Session identifiers and the per-date session log tree
 *
 * A SID names both the session and its audit log:
 *
 *   192-168-1-50_main_08-JAN'25_14.22       first session in that minute
 *   192-168-1-50_main_08-JAN'25_14.22-1     next one while the first exists
 *
 * Logs live under `<dir>/YYYY/MM/DD/<SID>.log`; the date directory is the
 * one encoded in the SID, so a SID alone locates its log. Each log is
 *
 *   # sgate session log
 *   SID: ...
 *   Principal: ...
 *   Source-IP: ...
 *   Start: 2025-01-08T14:22:05Z
 *   ---
 *   <timestamp> [kind] activity lines ...
 *   ---
 *   End: ...
 *   Duration: 00:12:31
 *   Exit-Status: 0
 *
 * The footer exists only once the session is closed. `<dir>/active/` holds
 * one symlink per open (principal, ip) pointing at its log.
 */

#include "sgate_util.hpp"

#include <chrono>
#include <cstddef>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace sgate {

class EventLog;

enum class SessionState { OPEN, CLOSED };

const char* session_state_to_string(SessionState s) noexcept;

struct Session {
    std::string sid;
    std::string principal;
    std::string source_ip;
    TimePoint start{};
    std::optional<TimePoint> end;
    std::optional<int> exit_status;
    SessionState state = SessionState::OPEN;
    std::string log_path;

    /// end - start for closed sessions, zero otherwise.
    std::chrono::seconds duration() const;
};

struct SessionFilter {
    std::optional<std::string> principal;
    std::optional<std::string> source_ip;
    std::optional<std::string> date;        // YYYY-MM-DD, as in the SID
    std::optional<SessionState> state;

    bool matches(const Session& s) const;
};

struct SessionRegistryConfig {
    std::string dir;
    bool utc = true;                         // SID and date tree in UTC or local time
    int max_suffix = 99;
    std::chrono::milliseconds retry_backoff{50};
};

class SessionRegistry;
struct SessionCursor;

/**
 * @brief Lazy sequence of sessions matching a filter
 *
 * Walks the date tree one day directory at a time and reads only the
 * header and footer of each log. Every begin() restarts the walk.
 */
class SessionRange {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Session;
        using difference_type = std::ptrdiff_t;
        using pointer = const Session*;
        using reference = const Session&;

        iterator() = default;

        reference operator*() const;
        pointer operator->() const { return &**this; }
        iterator& operator++();

        bool operator==(const iterator& o) const;
        bool operator!=(const iterator& o) const { return !(*this == o); }

    private:
        friend class SessionRange;
        explicit iterator(std::shared_ptr<SessionCursor> cursor);

        std::shared_ptr<SessionCursor> cursor_;
    };

    SessionRange(const SessionRegistry* registry, SessionFilter filter);

    iterator begin() const;
    iterator end() const { return iterator(); }

private:
    const SessionRegistry* registry_;
    SessionFilter filter_;
};

class SessionRegistry {
public:
    explicit SessionRegistry(const SessionRegistryConfig& config,
                             std::shared_ptr<EventLog> events = nullptr);

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @brief Mint a SID not yet used by any log.
     * @throws ValidationError for a malformed IP or principal
     * @throws ConflictError when every suffix up to max_suffix is taken
     */
    std::string generate_sid(const std::string& ip, const std::string& principal,
                             TimePoint now) const;

    /**
     * @brief Publish the log header for `sid`. Never overwrites.
     * @throws ConflictError if a log for `sid` already exists
     */
    Session open_session(const std::string& sid, const std::string& ip,
                         const std::string& principal, TimePoint start);

    /// generate_sid() + open_session(), retried once on ConflictError.
    Session begin(const std::string& ip, const std::string& principal,
                  TimePoint now = Clock::now());

    /// Timestamped body line. The session must be open.
    void append_activity(const std::string& sid, const std::string& kind,
                         const std::string& message, TimePoint now = Clock::now());

    /// @throws ValidationError if the session is unknown or already closed
    Session close_session(const std::string& sid, TimePoint end, int exit_status);

    std::optional<Session> find(const std::string& sid) const;

    /// Open session the active marker of (principal, ip) points to.
    std::optional<Session> current(const std::string& principal, const std::string& ip) const;

    /// @throws ValidationError if `filter.date` is not YYYY-MM-DD
    SessionRange lookup(const SessionFilter& filter = {}) const { return SessionRange(this, filter); }

    /// Log path for a SID, derived from the date it encodes.
    /// @throws ValidationError if `sid` is malformed
    std::string log_path_for(const std::string& sid) const;

    std::string marker_path(const std::string& principal, const std::string& ip) const;

    /// Header and footer of one log file; nullopt if it is not a session log.
    static std::optional<Session> read_log(const std::string& path);

    const SessionRegistryConfig& config() const { return config_; }

private:
    std::string base_sid(const std::string& ip, const std::string& principal,
                         TimePoint now) const;
    void set_marker(const Session& s);
    void clear_marker(const Session& s);

    SessionRegistryConfig config_;
    std::shared_ptr<EventLog> events_;
    std::mutex mutex_;
};

} // namespace sgate
