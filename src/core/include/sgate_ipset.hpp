#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace sgate {

/**
 * @brief Control plane of the kernel address sets the rule set matches on
 *
 * Implementations throw on failure; the ban engine retries and logs.
 */
class IpSetControl {
public:
    virtual ~IpSetControl() = default;

    /// ttl of zero adds without a timeout.
    virtual void add(const std::string& set, const std::string& ip,
                     std::chrono::seconds ttl) = 0;
    virtual void remove(const std::string& set, const std::string& ip) = 0;
    virtual std::vector<std::string> list(const std::string& set) = 0;
};

/**
 * @brief Drives the `ipset` binary with an explicit argv (no shell)
 */
class IpsetCommand : public IpSetControl {
public:
    explicit IpsetCommand(std::string binary = "ipset");

    void add(const std::string& set, const std::string& ip,
             std::chrono::seconds ttl) override;
    void remove(const std::string& set, const std::string& ip) override;
    std::vector<std::string> list(const std::string& set) override;

private:
    std::string binary_;
};

} // namespace sgate
