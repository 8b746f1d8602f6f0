#include "../include/sgate_services.hpp"
#include "../include/sgate_errors.hpp"
#include "../include/sgate_logger.hpp"
#include "../include/sgate_rules.hpp"

#include <algorithm>

namespace sgate {

ServiceCatalog::ServiceCatalog(std::shared_ptr<RuleConsolidator> rules)
    : rules_(std::move(rules)) {}

const std::vector<ServiceDef>& ServiceCatalog::known_services() {
    static const std::vector<ServiceDef> services = [] {
        std::vector<ServiceDef> v = {
            {"ssh",        22,    "tcp"},
            {"smtp",       25,    "tcp"},
            {"dns",        53,    "udp"},
            {"http",       80,    "tcp"},
            {"pop3",       110,   "tcp"},
            {"imap",       143,   "tcp"},
            {"https",      443,   "tcp"},
            {"smtps",      465,   "tcp"},
            {"imaps",      993,   "tcp"},
            {"pop3s",      995,   "tcp"},
            {"mysql",      3306,  "tcp"},
            {"postgresql", 5432,  "tcp"},
            {"mongodb",    27017, "tcp"},
            {"redis",      6379,  "tcp"},
            {"ftp",        21,    "tcp"},
            {"ftps",       990,   "tcp"},
            {"ssh-alt",    2222,  "tcp"},
            {"openvpn",    1194,  "udp"},
            {"wireguard",  51820, "udp"},
        };
        std::sort(v.begin(), v.end(),
                  [](const ServiceDef& a, const ServiceDef& b) { return a.name < b.name; });
        return v;
    }();
    return services;
}

const ServiceDef& ServiceCatalog::lookup(const std::string& name) {
    for (const auto& s : known_services()) {
        if (s.name == name) return s;
    }
    throw ValidationError("unknown service '" + name + "'");
}

std::string ServiceCatalog::render_fragment(const ServiceDef& svc, bool v6) {
    return std::string(v6 ? "v6" : "v4") + " INPUT " + svc.protocol + " " +
           std::to_string(svc.port) + " ACCEPT # " + svc.name + "\n";
}

void ServiceCatalog::enable_protocol(const std::string& name) {
    const ServiceDef& svc = lookup(name);
    for (IpFamily fam : {IpFamily::V4, IpFamily::V6}) {
        // Re-activate first so a hand-tuned fragment is kept as is
        auto state = rules_->fragment_state(fam, svc.name);
        if (state && !*state) {
            rules_->set_fragment_active(fam, svc.name, true);
        } else if (!state) {
            rules_->write_fragment(fam, svc.name, render_fragment(svc, fam == IpFamily::V6));
        }
    }
    SGATE_LOG_INFO("services", "enabled " + svc.name + " (" +
                   std::to_string(svc.port) + "/" + svc.protocol + ")");
}

void ServiceCatalog::disable_protocol(const std::string& name) {
    const ServiceDef& svc = lookup(name);
    for (IpFamily fam : {IpFamily::V4, IpFamily::V6}) {
        rules_->set_fragment_active(fam, svc.name, false);
    }
    SGATE_LOG_INFO("services", "disabled " + svc.name);
}

std::vector<ServiceStatus> ServiceCatalog::protocols() const {
    std::vector<ServiceStatus> out;
    for (const auto& svc : known_services()) {
        ServiceStatus st;
        st.service = svc;
        auto v4 = rules_->fragment_state(IpFamily::V4, svc.name);
        auto v6 = rules_->fragment_state(IpFamily::V6, svc.name);
        st.enabled = v4.value_or(false) && v6.value_or(false);
        out.push_back(st);
    }
    return out;
}

} // namespace sgate
