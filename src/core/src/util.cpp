#include "../include/sgate_util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace sgate {

const char* family_to_string(IpFamily f) noexcept {
    return f == IpFamily::V4 ? "v4" : "v6";
}

std::optional<IpFamily> family_from_string(const std::string& s) {
    if (s == "v4" || s == "4" || s == "ipv4") return IpFamily::V4;
    if (s == "v6" || s == "6" || s == "ipv6") return IpFamily::V6;
    return std::nullopt;
}

// ==================== Strings ====================

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::vector<std::string> split_ws(const std::string& s) {
    std::istringstream iss(s);
    std::vector<std::string> out;
    std::string tok;
    while (iss >> tok) out.push_back(tok);
    return out;
}

std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> out;
    std::string::size_type start = 0;
    while (start < s.size()) {
        auto nl = s.find('\n', start);
        if (nl == std::string::npos) {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, nl - start));
        start = nl + 1;
    }
    return out;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// ==================== Time ====================

std::string format_iso_utc(TimePoint tp) {
    auto t = Clock::to_time_t(tp);
    struct tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::optional<TimePoint> parse_iso_utc(const std::string& s) {
    struct tm tm_buf{};
    int y, mo, d, h, mi, sec;
    char z = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%c",
                    &y, &mo, &d, &h, &mi, &sec, &z) != 7 || z != 'Z') {
        return std::nullopt;
    }
    tm_buf.tm_year = y - 1900;
    tm_buf.tm_mon = mo - 1;
    tm_buf.tm_mday = d;
    tm_buf.tm_hour = h;
    tm_buf.tm_min = mi;
    tm_buf.tm_sec = sec;
    return Clock::from_time_t(timegm(&tm_buf));
}

int64_t to_unix(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TimePoint from_unix(int64_t secs) {
    return TimePoint(std::chrono::seconds(secs));
}

// ==================== Identity ====================

std::optional<IpFamily> parse_ip_family(const std::string& ip) {
    in_addr a4{};
    if (inet_pton(AF_INET, ip.c_str(), &a4) == 1) return IpFamily::V4;
    in6_addr a6{};
    if (inet_pton(AF_INET6, ip.c_str(), &a6) == 1) return IpFamily::V6;
    return std::nullopt;
}

bool is_valid_principal(const std::string& name) {
    if (name.empty() || name.size() > 32) return false;
    unsigned char first = static_cast<unsigned char>(name[0]);
    if (!(std::islower(first) || first == '_')) return false;
    for (unsigned char c : name) {
        if (!(std::islower(c) || std::isdigit(c) || c == '_' || c == '.' || c == '-')) {
            return false;
        }
    }
    return true;
}

} // namespace sgate
