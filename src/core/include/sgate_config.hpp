#pragma once

#include <string>
#include <cstdint>
#include <map>
#include <vector>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace sgate {

/**
 * @brief Runtime configuration for the gateway engine
 *
 * Flat `key = value` store: directory layout, ban policy, session and
 * logging settings. Components never read it directly; Gateway turns it
 * into typed settings structs. Thread-safe singleton.
 */
class Config {
public:
    static Config& instance() {
        static Config cfg;
        return cfg;
    }

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // ==================== Getters ====================
    std::string get(const std::string& key, const std::string& default_val = "") const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = values_.find(key);
        return (it != values_.end()) ? it->second : default_val;
    }

    long long getInt(const std::string& key, long long default_val = 0) const {
        std::string v = get(key);
        if (v.empty()) return default_val;
        try { return std::stoll(v); }
        catch (const std::exception&) { return default_val; }
    }

    bool getBool(const std::string& key, bool default_val = false) const {
        std::string v = get(key);
        if (v.empty()) return default_val;
        std::transform(v.begin(), v.end(), v.begin(), ::tolower);
        return (v == "true" || v == "1" || v == "yes" || v == "on");
    }

    /// Comma or space separated integer list, e.g. "30, 180, 900".
    /// Throws std::invalid_argument on a non-numeric element.
    std::vector<long long> getIntList(const std::string& key) const {
        std::string v = get(key);
        std::replace(v.begin(), v.end(), ',', ' ');
        std::istringstream iss(v);
        std::vector<long long> out;
        std::string tok;
        while (iss >> tok) {
            size_t pos = 0;
            long long n = std::stoll(tok, &pos);
            if (pos != tok.size()) {
                throw std::invalid_argument("bad integer '" + tok + "' in " + key);
            }
            out.push_back(n);
        }
        return out;
    }

    // ==================== Setters ====================
    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mtx_);
        values_[key] = value;
    }

    void setInt(const std::string& key, long long value) {
        set(key, std::to_string(value));
    }

    void setBool(const std::string& key, bool value) {
        set(key, value ? "true" : "false");
    }

    // ==================== File I/O ====================
    bool loadFromFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx_);
        std::ifstream file(path);
        if (!file.is_open()) return false;

        std::string line;
        while (std::getline(file, line)) {
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;
            auto pos = line.find('=');
            if (pos == std::string::npos) continue;

            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            key.erase(0, key.find_first_not_of(" \t"));
            key.erase(key.find_last_not_of(" \t") + 1);
            val.erase(0, val.find_first_not_of(" \t"));
            val.erase(val.find_last_not_of(" \t\r") + 1);

            values_[key] = val;
        }
        return true;
    }

    // ==================== Defaults ====================
    void loadDefaults() {
        std::lock_guard<std::mutex> lock(mtx_);
        values_["log.level"] = "info";
        values_["log.console"] = "true";
        values_["log.file"] = "";
        values_["log.events_file"] = "/var/log/sgate/events.log";

        values_["snippets.dir"] = "/srv/sys/ssh/sshd_config.d";
        values_["snippets.validate_cmd"] = "";
        values_["snippets.wrapper"] = "/usr/local/bin/gate_login_wrapper";

        values_["rules.dir"] = "/srv/sys/iptables";
        values_["rules.whitelist_source"] = "whitelist";
        values_["rules.ban_source"] = "ban";
        values_["rules.apply"] = "false";
        values_["rules.consolidate_interval_sec"] = "300";

        values_["sessions.dir"] = "/srv/sys/log/ssh_session";
        values_["sessions.utc"] = "true";

        values_["ban.db"] = "/srv/sys/ssh/ssh_fail2ban/bans.db";
        values_["ban.audit_log"] = "/srv/sys/ssh/ssh_fail2ban/bans.log";
        values_["ban.thresholds"] = "3, 6, 9, 12, 15, 18, 21, 24, 27";
        values_["ban.durations"] = "30, 180, 900, 1800, 3600, 10800, 21600, 43200, 86400";
        values_["ban.max_duration"] = "86400";
        values_["ban.decay_window_sec"] = "86400";
        values_["ban.set_v4"] = "ssh_ban";
        values_["ban.set_v6"] = "ssh_ban6";
        values_["ban.white_set_v4"] = "ssh_white";
        values_["ban.white_set_v6"] = "ssh_white6";
        values_["ban.protected_ports"] = "22";
        values_["ban.ipset_retries"] = "2";
        values_["ban.ipset_backoff_ms"] = "200";
        values_["ban.tick_interval_sec"] = "5";
        values_["ban.whitelist_file"] = "/srv/sys/ssh/ssh_fail2ban/whitelist";
        values_["ban.workers"] = "4";
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        values_.clear();
    }

private:
    Config() { loadDefaults(); }

    mutable std::mutex mtx_;
    std::map<std::string, std::string> values_;
};

} // namespace sgate
