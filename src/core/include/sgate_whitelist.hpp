#pragma once

#include "sgate_util.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace sgate {

/**
 * @brief Read-only view of addresses exempt from automatic bans
 */
class Whitelist {
public:
    virtual ~Whitelist() = default;
    virtual bool contains(const std::string& ip) const = 0;
};

/**
 * @brief Fixed list of addresses and CIDR blocks
 *
 * File format: one `10.0.0.0/8`, `192.168.1.7` or `2001:db8::/32` per
 * line, `#` starts a comment.
 */
class StaticWhitelist : public Whitelist {
public:
    StaticWhitelist() = default;

    /// @throws ValidationError for a malformed address or prefix
    void add(const std::string& entry);

    /// @throws IOError if unreadable, ParseError naming the bad line
    void load_file(const std::string& path);

    bool contains(const std::string& ip) const override;

    size_t size() const { return nets_.size(); }

    /// Entries of one family, as written ("10.0.0.0/8").
    std::vector<std::string> entries(IpFamily family) const;

    /// Whitelist rule fragment: one ACCEPT matching `set_name`, plus the
    /// entries as comments.
    std::string render_fragment(IpFamily family, const std::string& set_name) const;

private:
    struct Net {
        IpFamily family;
        std::array<uint8_t, 16> addr;
        unsigned prefix;
        std::string text;
    };

    std::vector<Net> nets_;
};

} // namespace sgate
