#include "../include/sgate_snippets.hpp"
#include "../include/sgate_errors.hpp"
#include "../include/sgate_event_log.hpp"
#include "../include/sgate_fsutil.hpp"
#include "../include/sgate_logger.hpp"
#include "../include/sgate_process.hpp"
#include "../include/sgate_util.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace sgate {

static const char* const COMPONENT = "snippets";

// When stale copies coexist, the earlier state wins: Disabled, then Active
static const PrincipalState STATE_PRECEDENCE[] = {
    PrincipalState::DISABLED, PrincipalState::ACTIVE, PrincipalState::INACTIVE
};

static int precedence_of(PrincipalState s) {
    for (int i = 0; i < 3; ++i) {
        if (STATE_PRECEDENCE[i] == s) return i;
    }
    return 3;
}

// ===== String conversions =====

const char* principal_state_to_string(PrincipalState s) noexcept {
    switch (s) {
        case PrincipalState::ACTIVE:   return "active";
        case PrincipalState::INACTIVE: return "inactive";
        case PrincipalState::DISABLED: return "disabled";
        default: return "unknown";
    }
}

const char* shell_mode_to_string(ShellMode m) noexcept {
    switch (m) {
        case ShellMode::GATE:  return "gate";
        case ShellMode::RBASH: return "rbash";
        case ShellMode::FULL:  return "full";
        default: return "unknown";
    }
}

std::optional<ShellMode> shell_mode_from_string(const std::string& s) {
    if (s == "gate")  return ShellMode::GATE;
    if (s == "rbash") return ShellMode::RBASH;
    if (s == "full")  return ShellMode::FULL;
    return std::nullopt;
}

static const char* suffix_for(PrincipalState s) {
    switch (s) {
        case PrincipalState::ACTIVE:   return ".conf";
        case PrincipalState::INACTIVE: return ".conf.inactive";
        case PrincipalState::DISABLED: return ".conf.disabled";
    }
    return ".conf";
}

// ==================== Validators ====================

ValidationResult DirectiveValidator::validate(const std::string& snippet_dir) {
    ValidationResult result;
    std::error_code ec;
    std::vector<std::string> files;
    for (const auto& entry : std::filesystem::directory_iterator(snippet_dir, ec)) {
        std::string name = entry.path().filename().string();
        if (name.empty() || name[0] == '.' || !ends_with(name, ".conf")) continue;
        files.push_back(entry.path().string());
    }
    if (ec) {
        result.ok = false;
        result.detail = "cannot list " + snippet_dir + ": " + ec.message();
        return result;
    }
    std::sort(files.begin(), files.end());

    for (const auto& path : files) {
        std::string content = fs::read_file(path);
        size_t lineno = 0;
        for (const auto& raw : split_lines(content)) {
            ++lineno;
            std::string line = trim(raw);
            if (line.empty() || line[0] == '#') continue;

            auto tokens = split_ws(line);
            const std::string& keyword = tokens[0];
            bool keyword_ok = std::isalpha(static_cast<unsigned char>(keyword[0])) &&
                std::all_of(keyword.begin(), keyword.end(),
                            [](unsigned char c) { return std::isalnum(c); });
            if (!keyword_ok || tokens.size() < 2) {
                result.ok = false;
                result.detail = path + ":" + std::to_string(lineno) +
                                ": expected 'Directive value', got '" + line + "'";
                return result;
            }
            if (to_lower(keyword) == "match" && tokens.size() < 3) {
                result.ok = false;
                result.detail = path + ":" + std::to_string(lineno) +
                                ": Match needs a criterion and a pattern";
                return result;
            }
        }
    }
    return result;
}

CommandValidator::CommandValidator(std::vector<std::string> argv)
    : argv_(std::move(argv)) {}

ValidationResult CommandValidator::validate(const std::string& snippet_dir) {
    ValidationResult result;
    if (argv_.empty()) return result;

    std::vector<std::string> argv = argv_;
    for (auto& arg : argv) {
        if (arg == "%d") arg = snippet_dir;
    }

    ExecResult exec = run_command(argv);
    if (exec.exit_code == 127) {
        result.ok = false;
        result.detail = "validator '" + argv[0] + "' could not be executed";
    } else if (!exec.ok()) {
        result.ok = false;
        result.detail = "'" + argv[0] + "' rejected the configuration (exit " +
                        std::to_string(exec.exit_code) + ")";
    }
    return result;
}

ValidationResult ChainValidator::validate(const std::string& snippet_dir) {
    for (const auto& v : chain_) {
        ValidationResult r = v->validate(snippet_dir);
        if (!r.ok) return r;
    }
    return {};
}

// ==================== SnippetStore ====================

SnippetStore::SnippetStore(const SnippetStoreConfig& config,
                           std::shared_ptr<ConfigValidator> validator,
                           std::shared_ptr<EventLog> events)
    : config_(config)
    , validator_(std::move(validator))
    , events_(std::move(events)) {}

SnippetStore::~SnippetStore() = default;

void SnippetStore::check_name(const std::string& principal) const {
    if (!is_valid_principal(principal)) {
        throw ValidationError("invalid principal name '" + principal + "'");
    }
}

std::string SnippetStore::path_for(const std::string& principal, PrincipalState state) const {
    return config_.dir + "/" + config_.file_prefix + principal + suffix_for(state);
}

std::optional<SnippetStore::Located> SnippetStore::locate(const std::string& principal) const {
    for (auto state : STATE_PRECEDENCE) {
        std::string path = path_for(principal, state);
        if (fs::exists(path)) return Located{state, path};
    }
    return std::nullopt;
}

std::string SnippetStore::render_fragment(const std::string& principal, ShellMode shell,
                                          bool sudo) const {
    std::string wrapper = config_.wrapper_path;
    auto pos = wrapper.find("%u");
    if (pos != std::string::npos) wrapper.replace(pos, 2, principal);

    std::ostringstream oss;
    oss << "# sgate principal=" << principal
        << " shell=" << shell_mode_to_string(shell)
        << " sudo=" << (sudo ? "yes" : "no") << "\n";
    oss << "Match User " << principal << "\n";
    switch (shell) {
        case ShellMode::GATE:
            oss << "  ForceCommand " << wrapper << "\n";
            oss << "  PermitTTY yes\n";
            break;
        case ShellMode::RBASH:
            oss << "  ForceCommand /bin/rbash -l\n";
            oss << "  PermitTTY yes\n";
            break;
        case ShellMode::FULL:
            oss << "  PermitTTY yes\n";
            break;
    }
    oss << "  X11Forwarding no\n";
    oss << "  AllowAgentForwarding no\n";
    oss << "  AllowTcpForwarding no\n";
    return oss.str();
}

void SnippetStore::commit_or_rollback(const std::string& op, const std::string& principal,
                                      const std::function<void()>& rollback) {
    ValidationResult vr;
    if (validator_) {
        try {
            vr = validator_->validate(config_.dir);
        } catch (const IOError& e) {
            vr.ok = false;
            vr.detail = e.what();
        }
    }
    if (vr.ok) {
        SGATE_LOG_INFO(COMPONENT, op + " " + principal);
        if (events_) {
            events_->log(EventLog::EventType::CONFIG_CHANGE, COMPONENT, op,
                         {{"principal", principal}});
        }
        return;
    }

    std::string msg = op + " " + principal + " rejected by validation: " + vr.detail;
    try {
        rollback();
    } catch (const IOError& e) {
        msg += " (rollback failed: " + std::string(e.what()) + ")";
        SGATE_LOG_FATAL(COMPONENT, msg);
        if (events_) events_->log_error(COMPONENT, msg, "FATAL_CONFIG");
        throw FatalConfigError(msg);
    }
    SGATE_LOG_ERROR(COMPONENT, msg);
    if (events_) {
        events_->log(EventLog::EventType::ROLLBACK, COMPONENT, op,
                     {{"principal", principal}, {"detail", vr.detail}});
    }
    throw FatalConfigError(msg);
}

void SnippetStore::transition(const std::string& op, const std::string& principal,
                              const Located& from, PrincipalState target) {
    std::string to = path_for(principal, target);
    fs::rename_file(from.path, to);
    commit_or_rollback(op, principal, [&] { fs::rename_file(to, from.path); });
}

void SnippetStore::provision(const std::string& principal, ShellMode shell, bool sudo,
                             bool active) {
    check_name(principal);
    std::lock_guard<std::mutex> lock(mutex_);
    fs::ensure_dir(config_.dir);
    fs::FileLock flock(config_.dir + "/.snippets.lock");

    std::string content = render_fragment(principal, shell, sudo);
    auto existing = locate(principal);

    if (existing) {
        std::string previous = fs::read_file(existing->path);
        if (previous == content) return;
        fs::atomic_write(existing->path, content);
        commit_or_rollback("provision", principal,
                           [&] { fs::atomic_write(existing->path, previous); });
        return;
    }

    std::string path = path_for(principal, active ? PrincipalState::ACTIVE
                                                   : PrincipalState::INACTIVE);
    fs::atomic_write(path, content);
    commit_or_rollback("provision", principal, [&] { fs::remove_file(path); });
}

void SnippetStore::enable(const std::string& principal) {
    check_name(principal);
    std::lock_guard<std::mutex> lock(mutex_);
    if (!fs::exists(config_.dir)) {
        throw ValidationError("no fragment for principal '" + principal + "'");
    }
    fs::FileLock flock(config_.dir + "/.snippets.lock");

    auto loc = locate(principal);
    if (!loc) {
        throw ValidationError("no fragment for principal '" + principal + "'");
    }
    if (loc->state == PrincipalState::DISABLED) {
        throw ValidationError("principal '" + principal + "' is disabled; unlock it first");
    }
    if (loc->state == PrincipalState::ACTIVE) return;
    transition("enable", principal, *loc, PrincipalState::ACTIVE);
}

void SnippetStore::disable(const std::string& principal) {
    check_name(principal);
    std::lock_guard<std::mutex> lock(mutex_);
    if (!fs::exists(config_.dir)) {
        throw ValidationError("no fragment for principal '" + principal + "'");
    }
    fs::FileLock flock(config_.dir + "/.snippets.lock");

    auto loc = locate(principal);
    if (!loc) {
        throw ValidationError("no fragment for principal '" + principal + "'");
    }
    if (loc->state != PrincipalState::ACTIVE) return;
    transition("disable", principal, *loc, PrincipalState::INACTIVE);
}

void SnippetStore::lock(const std::string& principal) {
    check_name(principal);
    std::lock_guard<std::mutex> lock(mutex_);
    if (!fs::exists(config_.dir)) {
        throw ValidationError("no fragment for principal '" + principal + "'");
    }
    fs::FileLock flock(config_.dir + "/.snippets.lock");

    auto loc = locate(principal);
    if (!loc) {
        throw ValidationError("no fragment for principal '" + principal + "'");
    }
    if (loc->state == PrincipalState::DISABLED) return;
    transition("lock", principal, *loc, PrincipalState::DISABLED);
}

void SnippetStore::unlock(const std::string& principal) {
    check_name(principal);
    std::lock_guard<std::mutex> lock(mutex_);
    if (!fs::exists(config_.dir)) {
        throw ValidationError("no fragment for principal '" + principal + "'");
    }
    fs::FileLock flock(config_.dir + "/.snippets.lock");

    auto loc = locate(principal);
    if (!loc) {
        throw ValidationError("no fragment for principal '" + principal + "'");
    }
    if (loc->state != PrincipalState::DISABLED) return;
    transition("unlock", principal, *loc, PrincipalState::INACTIVE);
}

bool SnippetStore::remove(const std::string& principal) {
    check_name(principal);
    std::lock_guard<std::mutex> lock(mutex_);
    if (!fs::exists(config_.dir)) return false;
    fs::FileLock flock(config_.dir + "/.snippets.lock");

    // Every state variant goes, stale duplicates included
    std::vector<std::pair<std::string, std::string>> removed;
    for (auto state : {PrincipalState::ACTIVE, PrincipalState::INACTIVE, PrincipalState::DISABLED}) {
        std::string path = path_for(principal, state);
        auto content = fs::read_file_if_exists(path);
        if (!content) continue;
        fs::remove_file(path);
        removed.emplace_back(path, *content);
    }
    if (removed.empty()) return false;

    commit_or_rollback("remove", principal, [&] {
        for (const auto& [path, content] : removed) fs::atomic_write(path, content);
    });
    return true;
}

std::map<std::string, PrincipalState> SnippetStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, PrincipalState> out;

    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(config_.dir, ec)) {
        std::string name = entry.path().filename().string();
        if (name.empty() || name[0] == '.' || !starts_with(name, config_.file_prefix)) continue;

        for (auto state : {PrincipalState::ACTIVE, PrincipalState::INACTIVE, PrincipalState::DISABLED}) {
            std::string suffix = suffix_for(state);
            if (!ends_with(name, suffix)) continue;
            std::string principal = name.substr(
                config_.file_prefix.size(),
                name.size() - config_.file_prefix.size() - suffix.size());
            if (!is_valid_principal(principal)) break;

            auto it = out.find(principal);
            if (it == out.end() || precedence_of(state) < precedence_of(it->second)) {
                out[principal] = state;
            }
            break;
        }
    }
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw IOError("list " + config_.dir + ": " + ec.message());
    }
    return out;
}

std::optional<Principal> SnippetStore::get(const std::string& principal) const {
    check_name(principal);
    std::lock_guard<std::mutex> lock(mutex_);

    auto loc = locate(principal);
    if (!loc) return std::nullopt;

    Principal p;
    p.name = principal;
    p.state = loc->state;
    p.content = fs::read_file(loc->path);

    // Flags come from the provisioning header; hand-written fragments keep defaults
    auto lines = split_lines(p.content);
    if (!lines.empty() && starts_with(lines[0], "# sgate ")) {
        for (const auto& tok : split_ws(lines[0].substr(8))) {
            auto eq = tok.find('=');
            if (eq == std::string::npos) continue;
            std::string key = tok.substr(0, eq);
            std::string val = tok.substr(eq + 1);
            if (key == "shell") {
                if (auto mode = shell_mode_from_string(val)) p.shell = *mode;
            } else if (key == "sudo") {
                p.sudo = (val == "yes");
            }
        }
    }
    return p;
}

} // namespace sgate
