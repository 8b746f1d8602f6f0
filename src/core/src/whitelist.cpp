#include "../include/sgate_whitelist.hpp"
#include "../include/sgate_errors.hpp"
#include "../include/sgate_fsutil.hpp"

#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace sgate {

namespace {

bool parse_addr(const std::string& text, IpFamily& family, std::array<uint8_t, 16>& out) {
    out.fill(0);
    in_addr a4{};
    if (inet_pton(AF_INET, text.c_str(), &a4) == 1) {
        family = IpFamily::V4;
        std::memcpy(out.data(), &a4, 4);
        return true;
    }
    in6_addr a6{};
    if (inet_pton(AF_INET6, text.c_str(), &a6) == 1) {
        family = IpFamily::V6;
        std::memcpy(out.data(), &a6, 16);
        return true;
    }
    return false;
}

bool prefix_match(const std::array<uint8_t, 16>& a, const std::array<uint8_t, 16>& b,
                  unsigned prefix) {
    unsigned full = prefix / 8;
    if (std::memcmp(a.data(), b.data(), full) != 0) return false;
    unsigned rest = prefix % 8;
    if (rest == 0) return true;
    uint8_t mask = static_cast<uint8_t>(0xFF << (8 - rest));
    return (a[full] & mask) == (b[full] & mask);
}

} // anonymous namespace

void StaticWhitelist::add(const std::string& entry) {
    std::string text = trim(entry);
    std::string addr = text;
    std::string prefix_text;
    auto slash = text.find('/');
    if (slash != std::string::npos) {
        addr = text.substr(0, slash);
        prefix_text = text.substr(slash + 1);
    }

    Net net{};
    if (!parse_addr(addr, net.family, net.addr)) {
        throw ValidationError("invalid whitelist address '" + text + "'");
    }
    unsigned max_prefix = net.family == IpFamily::V4 ? 32 : 128;
    net.prefix = max_prefix;
    if (slash != std::string::npos) {
        if (prefix_text.empty() || prefix_text.size() > 3 ||
            prefix_text.find_first_not_of("0123456789") != std::string::npos) {
            throw ValidationError("invalid prefix length in '" + text + "'");
        }
        net.prefix = static_cast<unsigned>(std::stoul(prefix_text));
        if (net.prefix > max_prefix) {
            throw ValidationError("prefix length out of range in '" + text + "'");
        }
    }
    net.text = text;
    nets_.push_back(net);
}

void StaticWhitelist::load_file(const std::string& path) {
    std::string content = fs::read_file(path);
    size_t lineno = 0;
    for (const auto& raw : split_lines(content)) {
        ++lineno;
        std::string line = raw;
        auto hash = line.find('#');
        if (hash != std::string::npos) line = line.substr(0, hash);
        line = trim(line);
        if (line.empty()) continue;
        try {
            add(line);
        } catch (const ValidationError& e) {
            throw ParseError(path, lineno, e.what());
        }
    }
}

bool StaticWhitelist::contains(const std::string& ip) const {
    IpFamily family;
    std::array<uint8_t, 16> addr;
    if (!parse_addr(ip, family, addr)) return false;
    for (const auto& net : nets_) {
        if (net.family == family && prefix_match(net.addr, addr, net.prefix)) return true;
    }
    return false;
}

std::vector<std::string> StaticWhitelist::entries(IpFamily family) const {
    std::vector<std::string> out;
    for (const auto& net : nets_) {
        if (net.family == family) out.push_back(net.text);
    }
    return out;
}

std::string StaticWhitelist::render_fragment(IpFamily family, const std::string& set_name) const {
    std::string fam = family_to_string(family);
    std::string out = "# sgate whitelist fragment family=" + fam + "\n";
    auto list = entries(family);
    if (list.empty()) return out;
    out += fam + " INPUT all any ACCEPT:" + set_name + "\n";
    for (const auto& e : list) {
        out += "# member " + e + "\n";
    }
    return out;
}

} // namespace sgate
