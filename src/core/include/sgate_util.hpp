#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sgate {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class IpFamily { V4, V6 };

const char* family_to_string(IpFamily f) noexcept;
std::optional<IpFamily> family_from_string(const std::string& s);

// ===== Strings =====

std::string trim(const std::string& s);
std::vector<std::string> split_ws(const std::string& s);
std::vector<std::string> split_lines(const std::string& s);
std::string to_lower(std::string s);
std::string to_upper(std::string s);
bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// ===== Time =====

/// "2025-01-08T14:22:05Z"
std::string format_iso_utc(TimePoint tp);

/// Parses the format produced by format_iso_utc().
std::optional<TimePoint> parse_iso_utc(const std::string& s);

int64_t to_unix(TimePoint tp);
TimePoint from_unix(int64_t secs);

// ===== Identity =====

/// IPv4 dotted quad or IPv6 text form.
std::optional<IpFamily> parse_ip_family(const std::string& ip);

/// POSIX-ish login name: [a-z_][a-z0-9_.-]{0,31}
bool is_valid_principal(const std::string& name);

} // namespace sgate
