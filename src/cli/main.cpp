#include "Gateway.hpp"
#include "sgate_errors.hpp"
#include "sgate_fsutil.hpp"
#include "sgate_process.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

using namespace sgate;

// ============================================================================
// Global instances (RAII via unique_ptr)
// ============================================================================

static GatewaySettings g_settings;
static std::unique_ptr<Gateway> g_gateway;

std::atomic<bool> g_stop(false);

// ============================================================================
// Signal handler
// ============================================================================

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_stop = true;  // Only set flag, cleanup happens in main()
    }
}

static Gateway& gateway() {
    if (!g_gateway) {
        g_gateway = std::make_unique<Gateway>(g_settings);
    }
    return *g_gateway;
}

// ============================================================================
// ArgumentParser
// ============================================================================

class ArgumentParser {
public:
    using Handler = std::function<int(const std::vector<std::string>&)>;

    struct Command {
        std::string name;
        std::string description;
        Handler handler;
        std::vector<std::string> args_help;
    };

    ArgumentParser(const std::string& prog_name, const std::string& version)
        : prog_name_(prog_name), version_(version) {}

    void add_command(
        const std::string& name,
        const std::string& description,
        Handler handler,
        const std::vector<std::string>& args_help = {}
    ) {
        commands_[name] = {name, description, handler, args_help};
    }

    /// `args` starts at the command name.
    int parse_and_execute(const std::vector<std::string>& args) {
        if (args.empty()) {
            print_usage(std::cerr);
            return 1;
        }

        const std::string& cmd = args[0];
        if (cmd == "help" || cmd == "--help" || cmd == "-h") {
            print_usage(std::cout);
            return 0;
        }
        if (cmd == "version" || cmd == "--version" || cmd == "-v") {
            std::cout << prog_name_ << " " << version_ << std::endl;
            return 0;
        }

        auto it = commands_.find(cmd);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << cmd << "\n";
            print_usage(std::cerr);
            return 1;
        }

        return it->second.handler(std::vector<std::string>(args.begin() + 1, args.end()));
    }

private:
    void print_usage(std::ostream& out) const {
        out << prog_name_ << " " << version_ << " - SSH gateway access control\n";
        out << "\nUsage: " << prog_name_ << " [--config <file>] <command> [options]\n\n";
        out << "Commands:\n";
        for (const auto& [name, cmd] : commands_) {
            out << "  " << cmd.name;
            for (const auto& arg : cmd.args_help)
                out << " " << arg;
            out << "\n    " << cmd.description << "\n\n";
        }
        out << "  help\n    Show this help message\n\n";
        out << "  version\n    Show version information\n";
    }

    std::string prog_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

// ============================================================================
// Utility functions
// ============================================================================

static std::string get_arg(const std::vector<std::string>& args, size_t index, const std::string& default_val = "") {
    return index < args.size() ? args[index] : default_val;
}

static bool has_flag(const std::vector<std::string>& args, const std::string& flag) {
    return std::find(args.begin(), args.end(), flag) != args.end();
}

static std::string get_option(const std::vector<std::string>& args, const std::string& option, const std::string& default_val = "") {
    auto it = std::find(args.begin(), args.end(), option);
    if (it != args.end() && ++it != args.end()) return *it;
    return default_val;
}

static int get_option_int(const std::vector<std::string>& args, const std::string& option, int default_val = 0) {
    std::string val = get_option(args, option);
    if (val.empty()) return default_val;
    try {
        size_t pos = 0;
        int n = std::stoi(val, &pos);
        if (pos == val.size()) return n;
    } catch (const std::exception&) {
        // reported below
    }
    throw ValidationError("option " + option + " expects an integer, got '" + val + "'");
}

static std::string require_arg(const std::vector<std::string>& args, size_t index, const std::string& usage) {
    if (index >= args.size() || args[index].empty() || args[index][0] == '-') {
        throw ValidationError("usage: sgate " + usage);
    }
    return args[index];
}

static IpFamily parse_family_option(const std::string& value) {
    auto fam = family_from_string(value);
    if (!fam) throw ValidationError("unknown family '" + value + "', expected v4 or v6");
    return *fam;
}

static std::string format_expiry(const BanRecord& r) {
    return r.expiry ? format_iso_utc(*r.expiry) : "-";
}

// ============================================================================
// Forward declarations
// ============================================================================

int handle_provision(const std::vector<std::string>& args);
int handle_enable(const std::vector<std::string>& args);
int handle_disable(const std::vector<std::string>& args);
int handle_lock(const std::vector<std::string>& args);
int handle_unlock(const std::vector<std::string>& args);
int handle_remove(const std::vector<std::string>& args);
int handle_list(const std::vector<std::string>& args);
int handle_consolidate(const std::vector<std::string>& args);
int handle_protocol(const std::vector<std::string>& args);
int handle_session(const std::vector<std::string>& args);
int handle_ban(const std::vector<std::string>& args);
int handle_daemon(const std::vector<std::string>& args);

// ============================================================================
// main()
// ============================================================================

/// Appends a CLI failure to the event log, opening the engine if needed.
static void record_error(const std::string& msg, const char* code, bool settings_loaded) {
    if (!settings_loaded) return;
    try {
        gateway().events().log_error("cli", msg, code);
    } catch (const std::exception& e) {
        std::cerr << "sgate: event log unavailable: " << e.what() << "\n";
    }
}

static std::string locate_config(std::vector<std::string>& args) {
    auto it = std::find(args.begin(), args.end(), "--config");
    if (it != args.end()) {
        if (it + 1 == args.end()) throw ValidationError("usage: sgate --config <file> <command>");
        std::string path = *(it + 1);
        args.erase(it, it + 2);
        if (!fs::exists(path)) throw ValidationError("config file not found: " + path);
        return path;
    }
    if (const char* env = std::getenv("SGATE_CONFIG")) {
        if (*env) return env;
    }
    return "/etc/sgate/sgate.conf";
}

int main(int argc, char* argv[]) {
    // No SA_RESTART: a blocking open() of the events FIFO must see EINTR
    struct sigaction sa{};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    ignore_sigpipe();

    ArgumentParser parser("sgate", "v1.0.0");

    parser.add_command("provision", "Create or rewrite a principal's sshd fragment", handle_provision,
                       {"<principal>", "[--shell gate|rbash|full]", "[--sudo]", "[--inactive]"});
    parser.add_command("enable", "Make a principal reachable", handle_enable, {"<principal>"});
    parser.add_command("disable", "Make a principal unreachable, keeping its fragment", handle_disable, {"<principal>"});
    parser.add_command("lock", "Disable a principal until unlocked", handle_lock, {"<principal>"});
    parser.add_command("unlock", "Release a locked principal (inactive)", handle_unlock, {"<principal>"});
    parser.add_command("remove", "Delete a principal's fragment", handle_remove, {"<principal>"});
    parser.add_command("list", "List principals and their state", handle_list);
    parser.add_command("consolidate", "Regenerate the canonical rule sets", handle_consolidate,
                       {"[--family v4|v6]", "[--apply]"});
    parser.add_command("protocol", "Open or close a named service", handle_protocol,
                       {"list|enable|disable", "[<name>]"});
    parser.add_command("session", "Session audit logs", handle_session,
                       {"open|close|list|show", "[args]"});
    parser.add_command("ban", "Ban state of source addresses", handle_ban,
                       {"status|clear|list|fail", "[<ip>]"});
    parser.add_command("daemon", "Consume failed-login events and run periodic jobs", handle_daemon,
                       {"[--events <path>]"});

    std::vector<std::string> args(argv + 1, argv + argc);
    int rc = 0;
    bool settings_loaded = false;
    try {
        std::string config_path = locate_config(args);
        auto& cfg = Config::instance();
        bool loaded = cfg.loadFromFile(config_path);
        Gateway::initializeLogging(cfg);
        if (!loaded) {
            SGATE_LOG_DEBUG("cli", "config file " + config_path + " not found, using defaults");
        }
        g_settings = GatewaySettings::fromConfig(cfg);
        settings_loaded = true;

        rc = parser.parse_and_execute(args);
    } catch (const GateError& e) {
        std::cerr << "sgate: " << e.what() << " [" << error_code_to_string(e.code()) << "]\n";
        record_error(e.what(), error_code_to_string(e.code()), settings_loaded);
        rc = exit_code_for(e.code());
    } catch (const std::exception& e) {
        std::cerr << "sgate: " << e.what() << " [INTERNAL]\n";
        record_error(e.what(), "INTERNAL", settings_loaded);
        rc = 2;
    }

    g_gateway.reset();
    return rc;
}

// ============================================================================
// Handler implementations
// ============================================================================

int handle_provision(const std::vector<std::string>& args) {
    std::string principal = require_arg(args, 0,
        "provision <principal> [--shell gate|rbash|full] [--sudo] [--inactive]");
    std::string shell_name = get_option(args, "--shell", "gate");
    auto shell = shell_mode_from_string(shell_name);
    if (!shell) throw ValidationError("unknown shell mode '" + shell_name + "'");

    gateway().snippets().provision(principal, *shell, has_flag(args, "--sudo"),
                                   !has_flag(args, "--inactive"));
    auto p = gateway().snippets().get(principal);
    std::cout << principal << " " << (p ? principal_state_to_string(p->state) : "unknown") << "\n";
    return 0;
}

int handle_enable(const std::vector<std::string>& args) {
    gateway().snippets().enable(require_arg(args, 0, "enable <principal>"));
    return 0;
}

int handle_disable(const std::vector<std::string>& args) {
    gateway().snippets().disable(require_arg(args, 0, "disable <principal>"));
    return 0;
}

int handle_lock(const std::vector<std::string>& args) {
    gateway().snippets().lock(require_arg(args, 0, "lock <principal>"));
    return 0;
}

int handle_unlock(const std::vector<std::string>& args) {
    gateway().snippets().unlock(require_arg(args, 0, "unlock <principal>"));
    return 0;
}

int handle_remove(const std::vector<std::string>& args) {
    std::string principal = require_arg(args, 0, "remove <principal>");
    if (!gateway().snippets().remove(principal)) {
        std::cout << principal << " had no fragment\n";
    }
    return 0;
}

int handle_list(const std::vector<std::string>& args) {
    (void)args;
    for (const auto& [name, state] : gateway().snippets().list()) {
        std::cout << name << " " << principal_state_to_string(state) << "\n";
    }
    return 0;
}

int handle_consolidate(const std::vector<std::string>& args) {
    std::optional<IpFamily> family;
    std::string fam = get_option(args, "--family");
    if (!fam.empty()) family = parse_family_option(fam);
    if (has_flag(args, "--apply")) {
        if (g_gateway) throw ValidationError("--apply must be given before the engine starts");
        g_settings.apply_rules = true;
    }

    for (const auto& r : gateway().consolidate(family)) {
        std::cout << family_to_string(r.family) << " "
                  << (r.changed ? "changed" : "unchanged")
                  << " hash=" << r.hash.substr(0, 16)
                  << " rules=" << r.rule_count
                  << " duplicates=" << r.duplicates_dropped << "\n";
    }
    return 0;
}

int handle_protocol(const std::vector<std::string>& args) {
    std::string action = get_arg(args, 0, "list");

    if (action == "list") {
        for (const auto& st : gateway().services().protocols()) {
            std::cout << st.service.name << " " << st.service.port << "/" << st.service.protocol
                      << " " << (st.enabled ? "enabled" : "disabled") << "\n";
        }
        return 0;
    }
    if (action != "enable" && action != "disable") {
        throw ValidationError("usage: sgate protocol list|enable|disable [<name>]");
    }

    std::string name = require_arg(args, 1, "protocol " + action + " <name>");
    if (action == "enable") {
        gateway().services().enable_protocol(name);
    } else {
        gateway().services().disable_protocol(name);
    }
    gateway().consolidate();
    return 0;
}

static void print_session(const Session& s) {
    std::cout << s.sid << " " << session_state_to_string(s.state) << " " << s.principal
              << " " << s.source_ip << " " << format_iso_utc(s.start);
    if (s.end) std::cout << " " << s.duration().count() << "s";
    std::cout << "\n";
}

int handle_session(const std::vector<std::string>& args) {
    std::string action = get_arg(args, 0);

    if (action == "open") {
        std::string principal = require_arg(args, 1, "session open <principal> <ip>");
        std::string ip = require_arg(args, 2, "session open <principal> <ip>");
        // Fails closed: any error propagates and the wrapper refuses the login
        Session s = gateway().sessions().begin(ip, principal);
        std::cout << s.sid << "\n";
        return 0;
    }

    if (action == "close") {
        std::string sid = require_arg(args, 1, "session close <sid> [--exit <n>]");
        int exit_status = get_option_int(args, "--exit", 0);
        // Fails open: teardown continues whatever happens here
        try {
            gateway().sessions().close_session(sid, Clock::now(), exit_status);
        } catch (const GateError& e) {
            SGATE_LOG_WARN("cli", std::string("session close: ") + e.what());
            gateway().events().log_warning("cli", std::string("session close: ") + e.what());
        }
        return 0;
    }

    if (action == "list") {
        SessionFilter filter;
        std::string v;
        if (!(v = get_option(args, "--principal")).empty()) filter.principal = v;
        if (!(v = get_option(args, "--ip")).empty()) filter.source_ip = v;
        if (!(v = get_option(args, "--date")).empty()) filter.date = v;
        if (has_flag(args, "--open")) filter.state = SessionState::OPEN;
        for (const auto& s : gateway().sessions().lookup(filter)) {
            print_session(s);
        }
        return 0;
    }

    if (action == "show") {
        std::string sid = require_arg(args, 1, "session show <sid>");
        auto s = gateway().sessions().find(sid);
        if (!s) throw ValidationError("unknown session '" + sid + "'");
        std::cout << fs::read_file(s->log_path);
        return 0;
    }

    throw ValidationError("usage: sgate session open|close|list|show [args]");
}

static void print_ban(const BanRecord& r) {
    std::cout << r.ip << " " << ban_state_to_string(r.state)
              << " level=" << r.level
              << " hits=" << r.hits
              << " expiry=" << format_expiry(r)
              << (r.whitelisted ? " whitelisted" : "") << "\n";
}

int handle_ban(const std::vector<std::string>& args) {
    std::string action = get_arg(args, 0);

    if (action == "status") {
        print_ban(gateway().bans().status(require_arg(args, 1, "ban status <ip>")));
        return 0;
    }
    if (action == "clear") {
        std::string ip = require_arg(args, 1, "ban clear <ip>");
        if (!gateway().bans().clear(ip)) {
            std::cout << ip << " has no ban record\n";
        }
        return 0;
    }
    if (action == "list") {
        for (const auto& r : gateway().bans().records()) {
            print_ban(r);
        }
        return 0;
    }
    if (action == "fail") {
        std::string ip = require_arg(args, 1, "ban fail <ip>");
        if (!parse_ip_family(ip)) throw ValidationError("invalid IP address '" + ip + "'");
        FailedAuthEvent ev{ip, Clock::now()};
        gateway().bans().on_failure(ev);
        print_ban(gateway().bans().status(ip));
        return 0;
    }

    throw ValidationError("usage: sgate ban status|clear|list|fail <ip>");
}

int handle_daemon(const std::vector<std::string>& args) {
    std::string events_path = get_option(args, "--events");

    Gateway& gw = gateway();
    try {
        gw.consolidate();
    } catch (const GateError& e) {
        SGATE_LOG_ERROR("daemon", std::string("initial consolidation: ") + e.what());
        gw.events().log_error("daemon", e.what(), error_code_to_string(e.code()));
    }
    gw.startBackground();

    size_t accepted = 0;
    if (events_path.empty()) {
        SGATE_LOG_INFO("daemon", "reading failed-login events from stdin");
        accepted = gw.runDaemon(STDIN_FILENO, g_stop);
    } else {
        // Opening a FIFO blocks until a writer appears
        int fd = open(events_path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0 && !(errno == EINTR && g_stop.load())) {
            int err = errno;
            gw.stopBackground();
            throw IOError("open " + events_path, err);
        }
        if (fd >= 0) {
            SGATE_LOG_INFO("daemon", "reading failed-login events from " + events_path);
            try {
                accepted = gw.runDaemon(fd, g_stop);
            } catch (const std::exception&) {
                close(fd);
                gw.stopBackground();
                throw;
            }
            close(fd);
        }
    }

    gw.stopBackground();
    SGATE_LOG_INFO("daemon", "stopped after " + std::to_string(accepted) + " events");
    return 0;
}
