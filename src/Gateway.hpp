#ifndef SGATE_GATEWAY_HPP
#define SGATE_GATEWAY_HPP

#include <atomic>
#include <chrono>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/include/sgate_ban.hpp"
#include "core/include/sgate_config.hpp"
#include "core/include/sgate_event_log.hpp"
#include "core/include/sgate_logger.hpp"
#include "core/include/sgate_rules.hpp"
#include "core/include/sgate_scheduler.hpp"
#include "core/include/sgate_services.hpp"
#include "core/include/sgate_session.hpp"
#include "core/include/sgate_snippets.hpp"
#include "core/include/sgate_thread_pool.hpp"
#include "core/include/sgate_whitelist.hpp"

namespace sgate {

class IpSetControl;

/**
 * @brief Typed view of the `key = value` configuration
 */
struct GatewaySettings {
    SnippetStoreConfig snippets;
    std::vector<std::string> validate_cmd;      // empty: directive check only

    ConsolidatorConfig rules;
    bool apply_rules = false;                   // load canonical sets into the kernel
    std::chrono::seconds consolidate_interval{300};

    SessionRegistryConfig sessions;

    BanPolicy ban_policy = BanPolicy::defaults();
    std::string ban_db;                         // empty: in-memory state
    std::string ban_audit_log;
    std::string whitelist_file;
    std::string white_set_v4 = "ssh_white";
    std::string white_set_v6 = "ssh_white6";
    std::chrono::seconds tick_interval{5};
    size_t workers = 4;

    std::string events_file;

    /// @throws ValidationError for malformed numeric settings
    static GatewaySettings fromConfig(const Config& cfg);
};

/**
 * @brief Engine handle owning every component
 *
 * Components are built on first use, so a one-shot CLI call only opens
 * what it needs (`sgate list` never touches the ban database).
 * Construction of the daemon parts happens before any thread starts.
 */
class Gateway {
public:
    explicit Gateway(const GatewaySettings& settings);
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    static void initializeLogging(const Config& cfg);

    SnippetStore& snippets();
    RuleConsolidator& rules();
    ServiceCatalog& services();
    SessionRegistry& sessions();
    BanEngine& bans();
    StaticWhitelist& whitelist();
    EventLog& events() { return *events_; }

    /// Replace the ipset control plane (before bans() is first used).
    void setIpSetControl(std::shared_ptr<IpSetControl> ipset) { ipset_ = std::move(ipset); }
    /// Replace the packet filter hook (before rules() is first used).
    void setFilterReloader(std::shared_ptr<FilterReloader> reloader) { reloader_ = std::move(reloader); }

    /// Regenerate whitelist and ban fragments, then consolidate.
    std::vector<ConsolidateResult> consolidate(std::optional<IpFamily> family = std::nullopt);

    /// Route a failure to the worker owning its IP.
    void submitFailure(const FailedAuthEvent& ev);

    void startBackground();
    void stopBackground();

    /**
     * @brief Daemon loop: reads `<ip> <unix-seconds>` lines until EOF or
     *        until `stop` is set. Malformed lines are logged and skipped.
     * @return number of events accepted
     */
    size_t runDaemon(std::istream& in, const std::atomic<bool>& stop);

    /**
     * @brief Same loop over a file descriptor (stdin, a FIFO). Waits at most
     *        `poll_interval` between checks of `stop`, so an idle input does
     *        not hold up shutdown.
     * @throws IOError if the descriptor cannot be read
     */
    size_t runDaemon(int fd, const std::atomic<bool>& stop,
                     std::chrono::milliseconds poll_interval = std::chrono::milliseconds(200));

    const GatewaySettings& settings() const { return settings_; }

private:
    void writeDerivedFragments(IpFamily family);
    bool acceptDaemonLine(const std::string& raw, size_t lineno);

    GatewaySettings settings_;
    std::shared_ptr<EventLog> events_;
    std::shared_ptr<IpSetControl> ipset_;
    std::shared_ptr<FilterReloader> reloader_;

    std::shared_ptr<SnippetStore> snippets_;
    std::shared_ptr<RuleConsolidator> rules_;
    std::shared_ptr<ServiceCatalog> services_;
    std::shared_ptr<SessionRegistry> sessions_;
    std::shared_ptr<StaticWhitelist> whitelist_;
    std::shared_ptr<BanEngine> bans_;

    std::unique_ptr<StripedExecutor> executor_;
    std::unique_ptr<Scheduler> scheduler_;
};

} // namespace sgate

#endif // SGATE_GATEWAY_HPP
