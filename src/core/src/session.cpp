#include "../include/sgate_session.hpp"
#include "../include/sgate_errors.hpp"
#include "../include/sgate_event_log.hpp"
#include "../include/sgate_fsutil.hpp"
#include "../include/sgate_logger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>
#include <vector>

#include <limits.h>
#include <unistd.h>

namespace sgate {

static const char* const COMPONENT = "sessions";
static const char* const HEADER_MAGIC = "# sgate session log";
static const char* const SEPARATOR = "---";
static const char* const LOG_SUFFIX = ".log";

static const char* const MONTHS[12] = {
    "JAN", "FEB", "MAR", "APR", "MAY", "JUN",
    "JUL", "AUG", "SEP", "OCT", "NOV", "DEC"
};

const char* session_state_to_string(SessionState s) noexcept {
    switch (s) {
        case SessionState::OPEN:   return "open";
        case SessionState::CLOSED: return "closed";
        default: return "unknown";
    }
}

std::chrono::seconds Session::duration() const {
    if (!end || *end < start) return std::chrono::seconds(0);
    return std::chrono::duration_cast<std::chrono::seconds>(*end - start);
}

namespace {

struct SidParts {
    std::string ip_part;
    std::string principal;
    int year = 0;     // full year
    int month = 0;    // 1..12
    int day = 0;
};

// Splits from the right: the IP part never contains '_', the principal may.
std::optional<SidParts> parse_sid(const std::string& sid) {
    auto last = sid.rfind('_');
    if (last == std::string::npos || last == 0) return std::nullopt;
    auto mid = sid.rfind('_', last - 1);
    if (mid == std::string::npos) return std::nullopt;
    auto first = sid.find('_');
    if (first >= mid) return std::nullopt;

    SidParts p;
    p.ip_part = sid.substr(0, first);
    p.principal = sid.substr(first + 1, mid - first - 1);
    std::string date = sid.substr(mid + 1, last - mid - 1);
    std::string time = sid.substr(last + 1);

    // DD-MON'YY
    if (date.size() != 9 || date[2] != '-' || date[6] != '\'') return std::nullopt;
    if (!std::isdigit(static_cast<unsigned char>(date[0])) ||
        !std::isdigit(static_cast<unsigned char>(date[1])) ||
        !std::isdigit(static_cast<unsigned char>(date[7])) ||
        !std::isdigit(static_cast<unsigned char>(date[8]))) {
        return std::nullopt;
    }
    p.day = std::stoi(date.substr(0, 2));
    std::string mon = date.substr(3, 3);
    for (int i = 0; i < 12; ++i) {
        if (mon == MONTHS[i]) p.month = i + 1;
    }
    p.year = 2000 + std::stoi(date.substr(7, 2));

    // HH.MM[-N]
    if (time.size() < 5 || time[2] != '.') return std::nullopt;
    if (p.month == 0 || p.day < 1 || p.day > 31) return std::nullopt;
    if (p.ip_part.empty() || !is_valid_principal(p.principal)) return std::nullopt;
    if (sid.find('/') != std::string::npos) return std::nullopt;
    return p;
}

std::string date_of(const SidParts& p) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", p.year, p.month, p.day);
    return buf;
}

std::string hms(std::chrono::seconds d) {
    long long s = d.count();
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld", s / 3600, (s / 60) % 60, s % 60);
    return buf;
}

std::string one_line(std::string s) {
    std::replace(s.begin(), s.end(), '\n', ' ');
    std::replace(s.begin(), s.end(), '\r', ' ');
    return s;
}

bool all_digits(const std::string& s, size_t n) {
    return s.size() == n &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

// Sorted child directory names with an exact digit count.
std::vector<std::string> numeric_children(const std::string& dir, size_t digits) {
    std::vector<std::string> out;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        std::string name = entry.path().filename().string();
        if (all_digits(name, digits) && entry.is_directory(ec)) out.push_back(name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

// YYYY-MM-DD with a plausible month and day
bool is_filter_date(const std::string& d) {
    if (d.size() != 10 || d[4] != '-' || d[7] != '-') return false;
    if (!all_digits(d.substr(0, 4), 4) || !all_digits(d.substr(5, 2), 2) ||
        !all_digits(d.substr(8, 2), 2)) {
        return false;
    }
    int month = std::stoi(d.substr(5, 2));
    int day = std::stoi(d.substr(8, 2));
    return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

std::vector<std::string> day_dirs(const std::string& root, const std::optional<std::string>& date) {
    std::vector<std::string> days;
    if (date) {
        days.push_back(root + "/" + date->substr(0, 4) + "/" + date->substr(5, 2) +
                       "/" + date->substr(8, 2));
        return days;
    }
    for (const auto& y : numeric_children(root, 4)) {
        for (const auto& m : numeric_children(root + "/" + y, 2)) {
            for (const auto& d : numeric_children(root + "/" + y + "/" + m, 2)) {
                days.push_back(root + "/" + y + "/" + m + "/" + d);
            }
        }
    }
    return days;
}

std::vector<std::string> logs_in(const std::string& day) {
    std::vector<std::string> out;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(day, ec)) {
        std::string name = entry.path().filename().string();
        if (name.empty() || name[0] == '.' || !ends_with(name, LOG_SUFFIX)) continue;
        out.push_back(entry.path().string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // anonymous namespace

bool SessionFilter::matches(const Session& s) const {
    if (principal && s.principal != *principal) return false;
    if (source_ip && s.source_ip != *source_ip) return false;
    if (state && s.state != *state) return false;
    if (date) {
        auto parts = parse_sid(s.sid);
        if (!parts || date_of(*parts) != *date) return false;
    }
    return true;
}

// ==================== Lazy walk ====================

struct SessionCursor {
    SessionFilter filter;
    std::vector<std::string> days;
    size_t day_idx = 0;
    std::vector<std::string> files;
    size_t file_idx = 0;
    bool files_loaded = false;
    std::optional<Session> current;

    void advance() {
        current.reset();
        while (true) {
            if (!files_loaded) {
                if (day_idx >= days.size()) return;
                files = logs_in(days[day_idx]);
                file_idx = 0;
                files_loaded = true;
            }
            if (file_idx >= files.size()) {
                ++day_idx;
                files_loaded = false;
                continue;
            }
            auto s = SessionRegistry::read_log(files[file_idx++]);
            if (s && filter.matches(*s)) {
                current = std::move(s);
                return;
            }
        }
    }
};

SessionRange::iterator::iterator(std::shared_ptr<SessionCursor> cursor)
    : cursor_(std::move(cursor)) {}

SessionRange::iterator::reference SessionRange::iterator::operator*() const {
    return *cursor_->current;
}

SessionRange::iterator& SessionRange::iterator::operator++() {
    cursor_->advance();
    return *this;
}

bool SessionRange::iterator::operator==(const iterator& o) const {
    bool at_end = !cursor_ || !cursor_->current;
    bool o_at_end = !o.cursor_ || !o.cursor_->current;
    if (at_end || o_at_end) return at_end == o_at_end;
    return cursor_ == o.cursor_;
}

SessionRange::SessionRange(const SessionRegistry* registry, SessionFilter filter)
    : registry_(registry), filter_(std::move(filter)) {
    if (filter_.date && !is_filter_date(*filter_.date)) {
        throw ValidationError("invalid date '" + *filter_.date + "', expected YYYY-MM-DD");
    }
}

SessionRange::iterator SessionRange::begin() const {
    auto cursor = std::make_shared<SessionCursor>();
    cursor->filter = filter_;
    cursor->days = day_dirs(registry_->config().dir, filter_.date);
    cursor->advance();
    return iterator(cursor);
}

// ==================== SessionRegistry ====================

SessionRegistry::SessionRegistry(const SessionRegistryConfig& config,
                                 std::shared_ptr<EventLog> events)
    : config_(config), events_(std::move(events)) {}

std::string SessionRegistry::base_sid(const std::string& ip, const std::string& principal,
                                      TimePoint now) const {
    if (!parse_ip_family(ip)) {
        throw ValidationError("invalid source IP '" + ip + "'");
    }
    if (!is_valid_principal(principal)) {
        throw ValidationError("invalid principal name '" + principal + "'");
    }

    std::string ip_part = ip;
    std::replace(ip_part.begin(), ip_part.end(), '.', '-');
    std::replace(ip_part.begin(), ip_part.end(), ':', '-');

    auto t = Clock::to_time_t(now);
    struct tm tm_buf{};
    if (config_.utc) {
        gmtime_r(&t, &tm_buf);
    } else {
        localtime_r(&t, &tm_buf);
    }

    char stamp[32];
    std::snprintf(stamp, sizeof(stamp), "%02d-%s'%02d_%02d.%02d",
                  tm_buf.tm_mday, MONTHS[tm_buf.tm_mon], tm_buf.tm_year % 100,
                  tm_buf.tm_hour, tm_buf.tm_min);
    return ip_part + "_" + principal + "_" + stamp;
}

std::string SessionRegistry::generate_sid(const std::string& ip, const std::string& principal,
                                          TimePoint now) const {
    std::string base = base_sid(ip, principal, now);
    if (!fs::exists(log_path_for(base))) return base;

    for (int n = 1; n <= config_.max_suffix; ++n) {
        std::string candidate = base + "-" + std::to_string(n);
        if (!fs::exists(log_path_for(candidate))) return candidate;
    }
    throw ConflictError("no free session id for " + base);
}

std::string SessionRegistry::log_path_for(const std::string& sid) const {
    auto parts = parse_sid(sid);
    if (!parts) {
        throw ValidationError("malformed session id '" + sid + "'");
    }
    char dir[16];
    std::snprintf(dir, sizeof(dir), "%04d/%02d/%02d", parts->year, parts->month, parts->day);
    return config_.dir + "/" + dir + "/" + sid + LOG_SUFFIX;
}

std::string SessionRegistry::marker_path(const std::string& principal,
                                         const std::string& ip) const {
    return config_.dir + "/active/" + principal + "@" + ip;
}

Session SessionRegistry::open_session(const std::string& sid, const std::string& ip,
                                      const std::string& principal, TimePoint start) {
    if (!parse_ip_family(ip)) {
        throw ValidationError("invalid source IP '" + ip + "'");
    }
    if (!is_valid_principal(principal)) {
        throw ValidationError("invalid principal name '" + principal + "'");
    }

    Session s;
    s.sid = sid;
    s.principal = principal;
    s.source_ip = ip;
    s.start = start;
    s.state = SessionState::OPEN;
    s.log_path = log_path_for(sid);

    std::ostringstream header;
    header << HEADER_MAGIC << "\n"
           << "SID: " << sid << "\n"
           << "Principal: " << principal << "\n"
           << "Source-IP: " << ip << "\n"
           << "Start: " << format_iso_utc(start) << "\n"
           << SEPARATOR << "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    fs::ensure_dir(std::filesystem::path(s.log_path).parent_path().string(), 0750);
    if (!fs::publish_no_clobber(s.log_path, header.str())) {
        throw ConflictError("session log already exists: " + s.log_path);
    }
    set_marker(s);

    SGATE_LOG_INFO(COMPONENT, "opened " + sid);
    if (events_) {
        events_->log(EventLog::EventType::SESSION, COMPONENT, "open",
                     {{"sid", sid}, {"principal", principal}, {"ip", ip}});
    }
    return s;
}

Session SessionRegistry::begin(const std::string& ip, const std::string& principal,
                               TimePoint now) {
    for (int attempt = 0; ; ++attempt) {
        std::string sid = generate_sid(ip, principal, now);
        try {
            return open_session(sid, ip, principal, now);
        } catch (const ConflictError& e) {
            if (attempt >= 1) throw;
            SGATE_LOG_WARN(COMPONENT, std::string(e.what()) + ", retrying");
            std::this_thread::sleep_for(config_.retry_backoff);
        }
    }
}

void SessionRegistry::append_activity(const std::string& sid, const std::string& kind,
                                      const std::string& message, TimePoint now) {
    std::string path = log_path_for(sid);
    if (!fs::exists(path)) {
        throw ValidationError("unknown session '" + sid + "'");
    }
    fs::FileLock lock(path);
    auto s = read_log(path);
    if (!s) {
        throw ValidationError("unknown session '" + sid + "'");
    }
    if (s->state == SessionState::CLOSED) {
        throw ValidationError("session '" + sid + "' is closed");
    }
    fs::append_line(path, format_iso_utc(now) + " [" + one_line(kind) + "] " + one_line(message));
}

Session SessionRegistry::close_session(const std::string& sid, TimePoint end, int exit_status) {
    std::string path = log_path_for(sid);
    if (!fs::exists(path)) {
        throw ValidationError("unknown session '" + sid + "'");
    }

    std::lock_guard<std::mutex> guard(mutex_);
    fs::FileLock lock(path);
    auto s = read_log(path);
    if (!s) {
        throw ValidationError("'" + path + "' is not a session log");
    }
    if (s->state == SessionState::CLOSED) {
        throw ValidationError("session '" + sid + "' is already closed");
    }

    s->end = end;
    s->exit_status = exit_status;
    s->state = SessionState::CLOSED;

    std::ostringstream footer;
    footer << SEPARATOR << "\n"
           << "End: " << format_iso_utc(end) << "\n"
           << "Duration: " << hms(s->duration()) << "\n"
           << "Exit-Status: " << exit_status << "\n";
    fs::append_line(path, footer.str());

    clear_marker(*s);

    SGATE_LOG_INFO(COMPONENT, "closed " + sid + " after " + hms(s->duration()));
    if (events_) {
        events_->log(EventLog::EventType::SESSION, COMPONENT, "close",
                     {{"sid", sid},
                      {"duration", std::to_string(s->duration().count())},
                      {"exit", std::to_string(exit_status)}});
    }
    return *s;
}

std::optional<Session> SessionRegistry::find(const std::string& sid) const {
    if (!parse_sid(sid)) return std::nullopt;
    return read_log(log_path_for(sid));
}

std::optional<Session> SessionRegistry::current(const std::string& principal,
                                                const std::string& ip) const {
    char buf[PATH_MAX];
    std::string link = marker_path(principal, ip);
    ssize_t n = ::readlink(link.c_str(), buf, sizeof(buf) - 1);
    if (n < 0) return std::nullopt;
    buf[n] = '\0';

    auto s = read_log(buf);
    if (!s || s->state != SessionState::OPEN) return std::nullopt;
    return s;
}

void SessionRegistry::set_marker(const Session& s) {
    std::string link = marker_path(s.principal, s.source_ip);
    fs::ensure_dir(config_.dir + "/active", 0750);

    // symlink() refuses to replace; build aside and rename over
    std::string tmp = config_.dir + "/active/.tmp." + std::to_string(::getpid()) + "." + s.sid;
    fs::remove_file(tmp);
    if (::symlink(s.log_path.c_str(), tmp.c_str()) != 0) {
        throw IOError("symlink " + tmp, errno);
    }
    fs::rename_file(tmp, link);
}

void SessionRegistry::clear_marker(const Session& s) {
    char buf[PATH_MAX];
    std::string link = marker_path(s.principal, s.source_ip);
    ssize_t n = ::readlink(link.c_str(), buf, sizeof(buf) - 1);
    if (n < 0) return;
    buf[n] = '\0';
    // A newer session of the same pair may own the marker by now
    if (s.log_path == buf) fs::remove_file(link);
}

std::optional<Session> SessionRegistry::read_log(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;

    std::string line;
    if (!std::getline(in, line) || line != HEADER_MAGIC) return std::nullopt;

    Session s;
    s.log_path = path;
    bool have_start = false;
    for (int i = 0; i < 16 && std::getline(in, line); ++i) {
        if (line == SEPARATOR) break;
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = line.substr(0, colon);
        std::string val = trim(line.substr(colon + 1));
        if (key == "SID") {
            s.sid = val;
        } else if (key == "Principal") {
            s.principal = val;
        } else if (key == "Source-IP") {
            s.source_ip = val;
        } else if (key == "Start") {
            if (auto tp = parse_iso_utc(val)) {
                s.start = *tp;
                have_start = true;
            }
        }
    }
    if (s.sid.empty() || !have_start) return std::nullopt;

    // The footer is short; only the tail of a long body is read
    std::streamoff header_end = in.tellg();
    in.seekg(0, std::ios::end);
    std::streamoff size = in.tellg();
    if (header_end < 0 || size <= header_end) return s;
    std::streamoff from = std::max(header_end, size - static_cast<std::streamoff>(512));
    in.clear();
    in.seekg(from);
    std::string tail((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto lines = split_lines(tail);
    size_t sep = lines.size();
    for (size_t i = lines.size(); i-- > 0;) {
        if (lines[i] == SEPARATOR) {
            sep = i;
            break;
        }
    }
    for (size_t i = sep + 1; i < lines.size(); ++i) {
        const std::string& l = lines[i];
        if (starts_with(l, "End:")) {
            s.end = parse_iso_utc(trim(l.substr(4)));
        } else if (starts_with(l, "Exit-Status:")) {
            try {
                s.exit_status = std::stoi(trim(l.substr(12)));
            } catch (const std::exception&) {
                s.exit_status = std::nullopt;
            }
        }
    }
    if (s.end) s.state = SessionState::CLOSED;
    return s;
}

} // namespace sgate
