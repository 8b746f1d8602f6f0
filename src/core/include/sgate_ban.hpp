#pragma once

/**
 * @file sgate_ban.hpp
 * @brief Progressive ban escalation for source IPs with failed logins
 *
 * Per-IP state machine:
 *
 *   Clean -> Watched -> Banned(level) -> Expired -> Clean
 *
 * Failures are pushed in as FailedAuthEvent by an external log watcher;
 * nothing here reads authentication logs. Entering and leaving Banned
 * updates the kernel address set through IpSetControl and appends one
 * line to the ban audit log:
 *
 *   2025-01-08T14:22:05Z 10.0.0.5 1 300 add
 *
 * on_failure() sits on the authentication path and never throws: store and
 * control plane faults are retried, logged and swallowed there.
 */

#include "sgate_ban_store.hpp"
#include "sgate_util.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sgate {

class EventLog;
class IpSetControl;
class Whitelist;

struct FailedAuthEvent {
    std::string ip;
    TimePoint timestamp{};
};

struct BanPolicy {
    /// thresholds[k-1]: cumulative hits needed to reach level k
    std::vector<uint32_t> thresholds;
    /// durations[k-1]: ban duration at level k
    std::vector<std::chrono::seconds> durations;
    std::chrono::seconds max_duration{86400};
    /// Quiet time after which a Watched or Expired IP is forgotten
    std::chrono::seconds decay_window{86400};

    std::string set_v4 = "ssh_ban";
    std::string set_v6 = "ssh_ban6";
    std::vector<uint16_t> protected_ports{22};

    int ipset_retries = 2;
    std::chrono::milliseconds ipset_backoff{200};

    /// 30s, 3m, 15m, 30m, 1h, 3h, 6h, 12h, 24h at 3, 6, 9, ... hits
    static BanPolicy defaults();

    /// @throws ValidationError
    void validate() const;

    uint32_t max_level() const { return static_cast<uint32_t>(durations.size()); }
    uint32_t threshold(uint32_t level) const { return thresholds.at(level - 1); }

    /// Duration of `level`, capped at max_duration.
    std::chrono::seconds duration(uint32_t level) const;

    const std::string& set_for(IpFamily family) const {
        return family == IpFamily::V4 ? set_v4 : set_v6;
    }
};

struct BanEngineStats {
    uint64_t failures = 0;
    uint64_t bans = 0;
    uint64_t unbans = 0;
    uint64_t whitelist_hits = 0;
    uint64_t control_errors = 0;
    uint64_t store_errors = 0;
};

class BanEngine {
public:
    /// Called with the updated record whenever an IP enters (true) or leaves
    /// (false) Banned. Runs under the IP's lock: must not call back into
    /// the engine for the same IP.
    using ChangeCallback = std::function<void(const BanRecord&, bool banned)>;

    /// @throws ValidationError if `policy` is invalid
    BanEngine(const BanPolicy& policy,
              std::shared_ptr<BanStore> store,
              std::shared_ptr<IpSetControl> ipset,
              std::shared_ptr<Whitelist> whitelist = nullptr,
              std::string audit_log_path = "",
              std::shared_ptr<EventLog> events = nullptr);

    BanEngine(const BanEngine&) = delete;
    BanEngine& operator=(const BanEngine&) = delete;

    /// Record one failure. Returns the state afterwards; CLEAN if the
    /// event was dropped (malformed IP or store fault).
    BanState on_failure(const FailedAuthEvent& ev);

    /// Expire due bans and forget quiet records. Returns transitions made.
    size_t tick(TimePoint now = Clock::now());

    /// Current record, with expiry and decay applied to the returned copy
    /// only. Unknown IPs come back Clean.
    BanRecord status(const std::string& ip, TimePoint now = Clock::now());

    std::vector<BanRecord> records();

    /// Operator unban: lifts an active ban and forgets the record.
    /// @return false if the IP had no record
    bool clear(const std::string& ip, TimePoint now = Clock::now());

    /// Ban rule fragment for one family.
    std::string render_fragment(IpFamily family, TimePoint now = Clock::now());

    void set_change_callback(ChangeCallback cb);

    BanEngineStats get_stats() const;
    const BanPolicy& policy() const { return policy_; }

private:
    static constexpr size_t LOCK_STRIPES = 64;

    std::mutex& stripe_for(const std::string& ip);

    /// Ban entry or exit to announce once the record is persisted.
    struct Transition {
        bool banned;
        BanRecord rec;
        TimePoint at;
    };

    /// Lazy expiry and decay. Returns true if `rec` changed. Expiries are
    /// queued on `pending` when given.
    bool apply_time(BanRecord& rec, TimePoint now, std::vector<Transition>* pending);
    bool decayed(const BanRecord& rec, TimePoint now) const;

    void enter_ban(BanRecord& rec, uint32_t level, TimePoint now,
                   std::vector<Transition>& pending);
    void leave_ban(BanRecord& rec, TimePoint now, BanState next,
                   std::vector<Transition>& pending);
    /// ipset call, audit line, logs and callback for one transition.
    void publish(const Transition& t);

    void control(const std::string& op, const std::function<void()>& fn);
    void audit(TimePoint now, const BanRecord& rec, std::chrono::seconds duration,
               const char* action);
    void notify(const BanRecord& rec, bool banned);

    BanPolicy policy_;
    std::shared_ptr<BanStore> store_;
    std::shared_ptr<IpSetControl> ipset_;
    std::shared_ptr<Whitelist> whitelist_;
    std::string audit_log_path_;
    std::shared_ptr<EventLog> events_;

    std::array<std::mutex, LOCK_STRIPES> stripes_;

    mutable std::mutex meta_mutex_;
    ChangeCallback change_cb_;
    BanEngineStats stats_;
};

} // namespace sgate
