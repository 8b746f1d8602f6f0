#include "../include/sgate_ban.hpp"
#include "../include/sgate_errors.hpp"
#include "../include/sgate_event_log.hpp"
#include "../include/sgate_fsutil.hpp"
#include "../include/sgate_ipset.hpp"
#include "../include/sgate_logger.hpp"
#include "../include/sgate_whitelist.hpp"

#include <algorithm>
#include <thread>

namespace sgate {

static const char* const COMPONENT = "bans";

// ==================== BanPolicy ====================

BanPolicy BanPolicy::defaults() {
    BanPolicy p;
    for (long secs : {30L, 180L, 900L, 1800L, 3600L, 10800L, 21600L, 43200L, 86400L}) {
        p.durations.push_back(std::chrono::seconds(secs));
    }
    for (uint32_t k = 1; k <= p.durations.size(); ++k) {
        p.thresholds.push_back(3 * k);
    }
    return p;
}

void BanPolicy::validate() const {
    if (durations.empty()) {
        throw ValidationError("ban policy needs at least one level");
    }
    if (thresholds.size() != durations.size()) {
        throw ValidationError("ban policy has " + std::to_string(thresholds.size()) +
                              " thresholds for " + std::to_string(durations.size()) +
                              " durations");
    }
    for (size_t i = 0; i < durations.size(); ++i) {
        if (thresholds[i] == 0 || durations[i].count() <= 0) {
            throw ValidationError("ban level " + std::to_string(i + 1) +
                                  " needs a positive threshold and duration");
        }
        if (i > 0 && (thresholds[i] <= thresholds[i - 1] || durations[i] <= durations[i - 1])) {
            throw ValidationError("ban thresholds and durations must be strictly increasing");
        }
    }
    if (max_duration.count() <= 0 || decay_window.count() <= 0) {
        throw ValidationError("ban max duration and decay window must be positive");
    }
    if (set_v4.empty() || set_v6.empty()) {
        throw ValidationError("ban ipset names must not be empty");
    }
    if (protected_ports.empty() ||
        std::find(protected_ports.begin(), protected_ports.end(), 0) != protected_ports.end()) {
        throw ValidationError("ban protected ports must be 1..65535");
    }
    if (ipset_retries < 0) {
        throw ValidationError("ban ipset retries must not be negative");
    }
}

std::chrono::seconds BanPolicy::duration(uint32_t level) const {
    return std::min(durations.at(level - 1), max_duration);
}

// ==================== BanEngine ====================

BanEngine::BanEngine(const BanPolicy& policy,
                     std::shared_ptr<BanStore> store,
                     std::shared_ptr<IpSetControl> ipset,
                     std::shared_ptr<Whitelist> whitelist,
                     std::string audit_log_path,
                     std::shared_ptr<EventLog> events)
    : policy_(policy)
    , store_(std::move(store))
    , ipset_(std::move(ipset))
    , whitelist_(std::move(whitelist))
    , audit_log_path_(std::move(audit_log_path))
    , events_(std::move(events))
{
    policy_.validate();
    if (!store_) {
        throw ValidationError("ban engine needs a state store");
    }
}

std::mutex& BanEngine::stripe_for(const std::string& ip) {
    return stripes_[std::hash<std::string>{}(ip) % LOCK_STRIPES];
}

void BanEngine::set_change_callback(ChangeCallback cb) {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    change_cb_ = std::move(cb);
}

BanEngineStats BanEngine::get_stats() const {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    return stats_;
}

bool BanEngine::decayed(const BanRecord& rec, TimePoint now) const {
    // Quiet time counts from the later of last failure and ban expiry
    TimePoint quiet_since{};
    if (rec.last_failure) quiet_since = *rec.last_failure;
    if (rec.expiry && *rec.expiry > quiet_since) quiet_since = *rec.expiry;
    return now - quiet_since >= policy_.decay_window;
}

bool BanEngine::apply_time(BanRecord& rec, TimePoint now, std::vector<Transition>* pending) {
    bool changed = false;
    if (rec.state == BanState::BANNED && rec.expiry && *rec.expiry <= now) {
        if (pending) {
            leave_ban(rec, now, BanState::EXPIRED, *pending);
        } else {
            rec.state = BanState::EXPIRED;
        }
        changed = true;
    }
    if ((rec.state == BanState::WATCHED || rec.state == BanState::EXPIRED) && decayed(rec, now)) {
        rec.state = BanState::CLEAN;
        rec.level = 0;
        rec.hits = 0;
        rec.expiry.reset();
        rec.first_failure.reset();
        changed = true;
    }
    return changed;
}

void BanEngine::control(const std::string& op, const std::function<void()>& fn) {
    if (!ipset_) return;
    std::string last_error;
    for (int attempt = 0; attempt <= policy_.ipset_retries; ++attempt) {
        try {
            fn();
            return;
        } catch (const std::exception& e) {
            last_error = e.what();
            SGATE_LOG_WARN(COMPONENT, op + " attempt " + std::to_string(attempt + 1) +
                           " failed: " + last_error);
        }
        if (attempt < policy_.ipset_retries) {
            std::this_thread::sleep_for(policy_.ipset_backoff * (attempt + 1));
        }
    }

    {
        std::lock_guard<std::mutex> lock(meta_mutex_);
        stats_.control_errors++;
    }
    SGATE_LOG_ERROR(COMPONENT, op + " gave up: " + last_error);
    if (events_) events_->log_error(COMPONENT, op + ": " + last_error, "IO");
}

void BanEngine::audit(TimePoint now, const BanRecord& rec, std::chrono::seconds duration,
                      const char* action) {
    if (audit_log_path_.empty()) return;
    try {
        fs::append_line(audit_log_path_,
                        format_iso_utc(now) + " " + rec.ip + " " + std::to_string(rec.level) +
                        " " + std::to_string(duration.count()) + " " + action);
    } catch (const IOError& e) {
        SGATE_LOG_ERROR(COMPONENT, std::string("audit log: ") + e.what());
    }
}

void BanEngine::notify(const BanRecord& rec, bool banned) {
    ChangeCallback cb;
    {
        std::lock_guard<std::mutex> lock(meta_mutex_);
        if (banned) {
            stats_.bans++;
        } else {
            stats_.unbans++;
        }
        cb = change_cb_;
    }
    if (cb) cb(rec, banned);
}

void BanEngine::enter_ban(BanRecord& rec, uint32_t level, TimePoint now,
                          std::vector<Transition>& pending) {
    rec.level = level;
    rec.state = BanState::BANNED;
    rec.expiry = now + policy_.duration(level);
    pending.push_back({true, rec, now});
}

void BanEngine::leave_ban(BanRecord& rec, TimePoint now, BanState next,
                          std::vector<Transition>& pending) {
    rec.state = next;
    pending.push_back({false, rec, now});
}

void BanEngine::publish(const Transition& t) {
    const BanRecord& rec = t.rec;
    const std::string& set = policy_.set_for(parse_ip_family(rec.ip).value_or(IpFamily::V4));
    auto duration = rec.level > 0 ? policy_.duration(rec.level) : std::chrono::seconds(0);

    if (t.banned) {
        control("ipset add " + set + " " + rec.ip,
                [&] { ipset_->add(set, rec.ip, duration); });
        audit(t.at, rec, duration, "add");

        SGATE_LOG_WARN(COMPONENT, rec.ip + " banned at level " + std::to_string(rec.level) +
                       " for " + std::to_string(duration.count()) + "s after " +
                       std::to_string(rec.hits) + " failures");
        if (events_) {
            events_->log(EventLog::EventType::BAN, COMPONENT, rec.ip,
                         {{"level", std::to_string(rec.level)},
                          {"duration", std::to_string(duration.count())},
                          {"hits", std::to_string(rec.hits)}});
        }
    } else {
        control("ipset del " + set + " " + rec.ip,
                [&] { ipset_->remove(set, rec.ip); });
        audit(t.at, rec, duration, "remove");

        SGATE_LOG_INFO(COMPONENT, rec.ip + " unbanned (" + ban_state_to_string(rec.state) + ")");
        if (events_) {
            events_->log(EventLog::EventType::UNBAN, COMPONENT, rec.ip,
                         {{"level", std::to_string(rec.level)},
                          {"state", ban_state_to_string(rec.state)}});
        }
    }
    notify(rec, t.banned);
}

BanState BanEngine::on_failure(const FailedAuthEvent& ev) {
    if (!parse_ip_family(ev.ip)) {
        SGATE_LOG_WARN(COMPONENT, "ignoring failure for malformed address '" + ev.ip + "'");
        return BanState::CLEAN;
    }

    std::lock_guard<std::mutex> lock(stripe_for(ev.ip));
    {
        std::lock_guard<std::mutex> meta(meta_mutex_);
        stats_.failures++;
    }

    try {
        BanRecord rec = store_->load(ev.ip).value_or(BanRecord{});
        rec.ip = ev.ip;

        // Kernel set and audit log follow the store: nothing is announced
        // unless the new state was saved
        std::vector<Transition> pending;
        apply_time(rec, ev.timestamp, &pending);

        rec.hits++;
        if (!rec.first_failure) rec.first_failure = ev.timestamp;
        if (!rec.last_failure || *rec.last_failure < ev.timestamp) {
            rec.last_failure = ev.timestamp;
        }

        rec.whitelisted = whitelist_ && whitelist_->contains(ev.ip);
        if (rec.whitelisted) {
            if (rec.state == BanState::BANNED) {
                leave_ban(rec, ev.timestamp, BanState::WATCHED, pending);
            }
            rec.state = BanState::WATCHED;
            {
                std::lock_guard<std::mutex> meta(meta_mutex_);
                stats_.whitelist_hits++;
            }
            SGATE_LOG_DEBUG(COMPONENT, ev.ip + " is whitelisted, hit " + std::to_string(rec.hits));
            if (events_) {
                events_->log(EventLog::EventType::WHITELIST_HIT, COMPONENT, ev.ip,
                             {{"hits", std::to_string(rec.hits)}});
            }
        } else {
            switch (rec.state) {
                case BanState::CLEAN:
                case BanState::WATCHED: {
                    rec.state = BanState::WATCHED;
                    uint32_t next = rec.level + 1;
                    if (next <= policy_.max_level() && rec.hits >= policy_.threshold(next)) {
                        enter_ban(rec, next, ev.timestamp, pending);
                    }
                    break;
                }
                case BanState::BANNED:
                    // Counter only; the running ban window is left alone
                    break;
                case BanState::EXPIRED: {
                    uint32_t level = std::max<uint32_t>(rec.level, 1);
                    if (level < policy_.max_level() && rec.hits >= policy_.threshold(level + 1)) {
                        ++level;
                    }
                    enter_ban(rec, level, ev.timestamp, pending);
                    break;
                }
            }
        }

        store_->save(rec);
        for (const auto& t : pending) publish(t);
        return rec.state;
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> meta(meta_mutex_);
            stats_.store_errors++;
        }
        SGATE_LOG_ERROR(COMPONENT, "failure for " + ev.ip + " not recorded: " + e.what());
        if (events_) events_->log_error(COMPONENT, ev.ip + ": " + e.what(), "IO");
        return BanState::CLEAN;
    }
}

size_t BanEngine::tick(TimePoint now) {
    size_t transitions = 0;
    for (const auto& snapshot : store_->all()) {
        std::lock_guard<std::mutex> lock(stripe_for(snapshot.ip));
        auto rec = store_->load(snapshot.ip);
        if (!rec) continue;
        std::vector<Transition> pending;
        if (!apply_time(*rec, now, &pending)) continue;

        ++transitions;
        if (rec->state == BanState::CLEAN) {
            store_->erase(rec->ip);
            SGATE_LOG_DEBUG(COMPONENT, rec->ip + " forgotten after quiet window");
        } else {
            store_->save(*rec);
        }
        for (const auto& t : pending) publish(t);
    }
    return transitions;
}

BanRecord BanEngine::status(const std::string& ip, TimePoint now) {
    if (!parse_ip_family(ip)) {
        throw ValidationError("invalid IP address '" + ip + "'");
    }
    std::lock_guard<std::mutex> lock(stripe_for(ip));
    BanRecord rec = store_->load(ip).value_or(BanRecord{});
    rec.ip = ip;
    apply_time(rec, now, nullptr);
    return rec;
}

std::vector<BanRecord> BanEngine::records() {
    return store_->all();
}

bool BanEngine::clear(const std::string& ip, TimePoint now) {
    if (!parse_ip_family(ip)) {
        throw ValidationError("invalid IP address '" + ip + "'");
    }
    std::lock_guard<std::mutex> lock(stripe_for(ip));
    auto rec = store_->load(ip);
    if (!rec) return false;

    std::vector<Transition> pending;
    if (rec->state == BanState::BANNED) {
        leave_ban(*rec, now, BanState::CLEAN, pending);
    }
    store_->erase(ip);
    for (const auto& t : pending) publish(t);
    SGATE_LOG_INFO(COMPONENT, ip + " cleared by operator");
    return true;
}

std::string BanEngine::render_fragment(IpFamily family, TimePoint now) {
    std::string fam = family_to_string(family);
    std::string out = "# sgate ban fragment family=" + fam + "\n";
    for (uint16_t port : policy_.protected_ports) {
        out += fam + " INPUT tcp " + std::to_string(port) + " DROP:" +
               policy_.set_for(family) + "\n";
    }
    for (const auto& rec : store_->all()) {
        if (rec.state != BanState::BANNED || !rec.expiry || *rec.expiry <= now) continue;
        if (parse_ip_family(rec.ip) != family) continue;
        out += "# banned " + rec.ip + " level=" + std::to_string(rec.level) +
               " until=" + format_iso_utc(*rec.expiry) + "\n";
    }
    return out;
}

} // namespace sgate
