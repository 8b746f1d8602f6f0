#pragma once

/**
 * @file sgate_services.hpp
 * @brief Named network services that can be opened or closed as rule fragments
 *
 * Enabling a service writes `<name>.rules` into both family directories
 * (`v4 INPUT tcp 22 ACCEPT # ssh`); disabling renames the fragments to
 * `.rules.inactive`. The next consolidation picks the change up.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sgate {

class RuleConsolidator;

struct ServiceDef {
    std::string name;
    uint16_t port;
    std::string protocol;   // tcp|udp
};

struct ServiceStatus {
    ServiceDef service;
    bool enabled = false;
};

class ServiceCatalog {
public:
    explicit ServiceCatalog(std::shared_ptr<RuleConsolidator> rules);

    /// Built-in catalog, sorted by name.
    static const std::vector<ServiceDef>& known_services();

    /// @throws ValidationError for an unknown service name
    static const ServiceDef& lookup(const std::string& name);

    void enable_protocol(const std::string& name);
    void disable_protocol(const std::string& name);

    /// Every known service with its current state (enabled only if both
    /// family fragments are active).
    std::vector<ServiceStatus> protocols() const;

    static std::string render_fragment(const ServiceDef& svc, bool v6);

private:
    std::shared_ptr<RuleConsolidator> rules_;
};

} // namespace sgate
