#include "Gateway.hpp"
#include "core/include/sgate_errors.hpp"
#include "core/include/sgate_fsutil.hpp"
#include "core/include/sgate_ipset.hpp"

#include <cerrno>
#include <filesystem>
#include <stdexcept>

#include <poll.h>
#include <unistd.h>

namespace sgate {

namespace {

std::string parent_dir(const std::string& path) {
    return std::filesystem::path(path).parent_path().string();
}

std::vector<long long> int_list(const Config& cfg, const std::string& key) {
    try {
        return cfg.getIntList(key);
    } catch (const std::invalid_argument& e) {
        throw ValidationError(std::string("config ") + e.what());
    } catch (const std::out_of_range&) {
        throw ValidationError("config " + key + ": value out of range");
    }
}

long long positive(const Config& cfg, const std::string& key, long long def) {
    long long v = cfg.getInt(key, def);
    if (v <= 0) {
        throw ValidationError("config " + key + " must be positive");
    }
    return v;
}

} // anonymous namespace

// ==================== Settings ====================

GatewaySettings GatewaySettings::fromConfig(const Config& cfg) {
    GatewaySettings s;

    s.snippets.dir = cfg.get("snippets.dir");
    s.snippets.wrapper_path = cfg.get("snippets.wrapper", s.snippets.wrapper_path);
    s.validate_cmd = split_ws(cfg.get("snippets.validate_cmd"));

    s.rules.dir = cfg.get("rules.dir");
    s.rules.whitelist_source = cfg.get("rules.whitelist_source", "whitelist");
    s.rules.ban_source = cfg.get("rules.ban_source", "ban");
    s.apply_rules = cfg.getBool("rules.apply", false);
    s.consolidate_interval = std::chrono::seconds(positive(cfg, "rules.consolidate_interval_sec", 300));

    s.sessions.dir = cfg.get("sessions.dir");
    s.sessions.utc = cfg.getBool("sessions.utc", true);

    BanPolicy& p = s.ban_policy;
    p.thresholds.clear();
    for (long long t : int_list(cfg, "ban.thresholds")) {
        p.thresholds.push_back(static_cast<uint32_t>(t < 0 ? 0 : t));
    }
    p.durations.clear();
    for (long long d : int_list(cfg, "ban.durations")) {
        p.durations.push_back(std::chrono::seconds(d));
    }
    p.max_duration = std::chrono::seconds(positive(cfg, "ban.max_duration", 86400));
    p.decay_window = std::chrono::seconds(positive(cfg, "ban.decay_window_sec", 86400));
    p.set_v4 = cfg.get("ban.set_v4", "ssh_ban");
    p.set_v6 = cfg.get("ban.set_v6", "ssh_ban6");
    p.protected_ports.clear();
    for (long long port : int_list(cfg, "ban.protected_ports")) {
        if (port < 1 || port > 65535) {
            throw ValidationError("config ban.protected_ports: " + std::to_string(port) +
                                  " is not a port");
        }
        p.protected_ports.push_back(static_cast<uint16_t>(port));
    }
    p.ipset_retries = static_cast<int>(cfg.getInt("ban.ipset_retries", 2));
    p.ipset_backoff = std::chrono::milliseconds(cfg.getInt("ban.ipset_backoff_ms", 200));
    p.validate();

    s.ban_db = cfg.get("ban.db");
    s.ban_audit_log = cfg.get("ban.audit_log");
    s.whitelist_file = cfg.get("ban.whitelist_file");
    s.white_set_v4 = cfg.get("ban.white_set_v4", "ssh_white");
    s.white_set_v6 = cfg.get("ban.white_set_v6", "ssh_white6");
    s.tick_interval = std::chrono::seconds(positive(cfg, "ban.tick_interval_sec", 5));
    s.workers = static_cast<size_t>(positive(cfg, "ban.workers", 4));

    s.events_file = cfg.get("log.events_file");
    return s;
}

// ==================== Gateway ====================

Gateway::Gateway(const GatewaySettings& settings)
    : settings_(settings)
    , events_(std::make_shared<EventLog>())
    , ipset_(std::make_shared<IpsetCommand>())
{
    if (!settings_.events_file.empty()) {
        try {
            fs::ensure_dir(parent_dir(settings_.events_file));
        } catch (const IOError& e) {
            SGATE_LOG_WARN("gateway", std::string("event log directory: ") + e.what());
        }
        events_->set_log_path(settings_.events_file);
    }
    if (settings_.apply_rules) {
        reloader_ = std::make_shared<IptablesRestoreReloader>();
    }
}

Gateway::~Gateway() {
    stopBackground();
    events_->flush();
}

void Gateway::initializeLogging(const Config& cfg) {
    auto& log = Logger::instance();

    std::string level_str = cfg.get("log.level", "info");
    log.setLevel(Logger::levelFromString(level_str));
    log.setConsoleOutput(cfg.getBool("log.console", true));

    std::string log_file = cfg.get("log.file");
    if (!log_file.empty() && !log.setFileOutput(log_file)) {
        SGATE_LOG_WARN("gateway", "cannot open log file " + log_file);
    }
}

SnippetStore& Gateway::snippets() {
    if (!snippets_) {
        auto chain = std::make_shared<ChainValidator>();
        chain->add(std::make_shared<DirectiveValidator>());
        if (!settings_.validate_cmd.empty()) {
            chain->add(std::make_shared<CommandValidator>(settings_.validate_cmd));
        }
        snippets_ = std::make_shared<SnippetStore>(settings_.snippets, chain, events_);
    }
    return *snippets_;
}

RuleConsolidator& Gateway::rules() {
    if (!rules_) {
        rules_ = std::make_shared<RuleConsolidator>(settings_.rules, reloader_, events_);
    }
    return *rules_;
}

ServiceCatalog& Gateway::services() {
    if (!services_) {
        rules();
        services_ = std::make_shared<ServiceCatalog>(rules_);
    }
    return *services_;
}

SessionRegistry& Gateway::sessions() {
    if (!sessions_) {
        sessions_ = std::make_shared<SessionRegistry>(settings_.sessions, events_);
    }
    return *sessions_;
}

StaticWhitelist& Gateway::whitelist() {
    if (!whitelist_) {
        auto wl = std::make_shared<StaticWhitelist>();
        if (!settings_.whitelist_file.empty() && fs::exists(settings_.whitelist_file)) {
            wl->load_file(settings_.whitelist_file);
            SGATE_LOG_DEBUG("gateway", "whitelist: " + std::to_string(wl->size()) + " entries");
        }
        whitelist_ = wl;
    }
    return *whitelist_;
}

BanEngine& Gateway::bans() {
    if (!bans_) {
        whitelist();

        std::shared_ptr<BanStore> store;
        if (settings_.ban_db.empty()) {
            store = std::make_shared<MemoryBanStore>();
        } else {
            fs::ensure_dir(parent_dir(settings_.ban_db), 0750);
            store = std::make_shared<SqliteBanStore>(settings_.ban_db);
        }
        if (!settings_.ban_audit_log.empty()) {
            fs::ensure_dir(parent_dir(settings_.ban_audit_log), 0750);
        }
        bans_ = std::make_shared<BanEngine>(settings_.ban_policy, store, ipset_, whitelist_,
                                            settings_.ban_audit_log, events_);
    }
    return *bans_;
}

void Gateway::writeDerivedFragments(IpFamily family) {
    const std::string& white_set =
        family == IpFamily::V4 ? settings_.white_set_v4 : settings_.white_set_v6;
    rules().write_fragment(family, settings_.rules.whitelist_source,
                           whitelist().render_fragment(family, white_set));
    rules().write_fragment(family, settings_.rules.ban_source, bans().render_fragment(family));
}

std::vector<ConsolidateResult> Gateway::consolidate(std::optional<IpFamily> family) {
    std::vector<ConsolidateResult> results;
    for (IpFamily fam : {IpFamily::V4, IpFamily::V6}) {
        if (family && *family != fam) continue;
        writeDerivedFragments(fam);
        results.push_back(rules().consolidate(fam));
    }
    return results;
}

void Gateway::submitFailure(const FailedAuthEvent& ev) {
    if (!executor_) {
        bans().on_failure(ev);
        return;
    }
    BanEngine* engine = &bans();
    executor_->submit(ev.ip, [engine, ev] { engine->on_failure(ev); });
}

void Gateway::startBackground() {
    if (scheduler_) return;

    BanEngine* engine = &bans();

    // Whitelisted addresses live in the white sets permanently
    for (IpFamily fam : {IpFamily::V4, IpFamily::V6}) {
        const std::string& set = fam == IpFamily::V4 ? settings_.white_set_v4 : settings_.white_set_v6;
        for (const auto& entry : whitelist().entries(fam)) {
            try {
                ipset_->add(set, entry, std::chrono::seconds(0));
            } catch (const std::exception& e) {
                SGATE_LOG_ERROR("gateway", "whitelist sync: " + std::string(e.what()));
            }
        }
    }

    executor_ = std::make_unique<StripedExecutor>(settings_.workers);
    scheduler_ = std::make_unique<Scheduler>();
    scheduler_->add_job("ban-expiry",
                        std::chrono::duration_cast<std::chrono::milliseconds>(settings_.tick_interval),
                        [engine] { engine->tick(); });
    scheduler_->add_job("consolidate",
                        std::chrono::duration_cast<std::chrono::milliseconds>(settings_.consolidate_interval),
                        [this] { consolidate(); });
    scheduler_->start();
    SGATE_LOG_INFO("gateway", "background workers started (" +
                   std::to_string(settings_.workers) + " ban workers)");
}

void Gateway::stopBackground() {
    if (executor_) {
        executor_->shutdown();
    }
    if (scheduler_) {
        scheduler_->stop();
        scheduler_.reset();
        SGATE_LOG_INFO("gateway", "background workers stopped");
    }
    executor_.reset();
}

bool Gateway::acceptDaemonLine(const std::string& raw, size_t lineno) {
    std::string line = trim(raw);
    if (line.empty() || line[0] == '#') return false;

    auto tokens = split_ws(line);
    if (tokens.size() > 2 || !parse_ip_family(tokens[0])) {
        SGATE_LOG_WARN("daemon", "line " + std::to_string(lineno) + ": expected '<ip> <unix-seconds>'");
        return false;
    }

    FailedAuthEvent ev;
    ev.ip = tokens[0];
    ev.timestamp = Clock::now();
    if (tokens.size() == 2) {
        try {
            size_t pos = 0;
            long long secs = std::stoll(tokens[1], &pos);
            if (pos != tokens[1].size()) throw std::invalid_argument(tokens[1]);
            ev.timestamp = from_unix(secs);
        } catch (const std::exception&) {
            SGATE_LOG_WARN("daemon", "line " + std::to_string(lineno) + ": bad timestamp '" +
                           tokens[1] + "'");
            return false;
        }
    }
    submitFailure(ev);
    return true;
}

size_t Gateway::runDaemon(std::istream& in, const std::atomic<bool>& stop) {
    size_t accepted = 0;
    size_t lineno = 0;
    std::string line;
    while (!stop.load() && std::getline(in, line)) {
        if (acceptDaemonLine(line, ++lineno)) ++accepted;
    }
    return accepted;
}

size_t Gateway::runDaemon(int fd, const std::atomic<bool>& stop,
                          std::chrono::milliseconds poll_interval) {
    size_t accepted = 0;
    size_t lineno = 0;
    std::string pending;
    char buf[4096];

    while (!stop.load()) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, static_cast<int>(poll_interval.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw IOError("poll daemon input", errno);
        }
        if (ready == 0) continue;

        ssize_t n = read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw IOError("read daemon input", errno);
        }
        if (n == 0) break;

        pending.append(buf, static_cast<size_t>(n));
        size_t start = 0;
        size_t nl;
        while ((nl = pending.find('\n', start)) != std::string::npos) {
            if (acceptDaemonLine(pending.substr(start, nl - start), ++lineno)) ++accepted;
            start = nl + 1;
        }
        pending.erase(0, start);
    }

    // Unterminated last line at end of input
    if (!stop.load() && !pending.empty() && acceptDaemonLine(pending, ++lineno)) ++accepted;
    return accepted;
}

} // namespace sgate
