#pragma once

/**
 * @file sgate_snippets.hpp
 * @brief Per-principal sshd_config fragments and their reachability lifecycle
 *
 * Each principal owns exactly one fragment in the snippet directory; its
 * state is encoded in the file name suffix only:
 *
 *   10-user_alice.conf            Active   (picked up by `Include *.conf`)
 *   10-user_alice.conf.inactive   Inactive (toggled off, content preserved)
 *   10-user_alice.conf.disabled   Disabled (locked by an operator)
 *
 * State changes are renames, so content survives a disable/enable cycle
 * byte for byte. Every mutation is followed by a validation pass over the
 * resulting configuration; a failed pass rolls the mutation back and
 * raises FatalConfigError.
 */

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sgate {

class EventLog;

enum class PrincipalState { ACTIVE, INACTIVE, DISABLED };
enum class ShellMode { GATE, RBASH, FULL };

const char* principal_state_to_string(PrincipalState s) noexcept;
const char* shell_mode_to_string(ShellMode m) noexcept;
std::optional<ShellMode> shell_mode_from_string(const std::string& s);

struct Principal {
    std::string name;
    PrincipalState state = PrincipalState::INACTIVE;
    ShellMode shell = ShellMode::GATE;
    bool sudo = false;
    std::string content;   // raw fragment bytes
};

// ===== Validation hook =====

struct ValidationResult {
    bool ok = true;
    std::string detail;
};

/**
 * @brief Post-mutation check of the aggregate sshd configuration
 */
class ConfigValidator {
public:
    virtual ~ConfigValidator() = default;
    virtual ValidationResult validate(const std::string& snippet_dir) = 0;
};

/// Every active fragment must be a sequence of `Directive value` lines.
class DirectiveValidator : public ConfigValidator {
public:
    ValidationResult validate(const std::string& snippet_dir) override;
};

/// Runs an external checker, e.g. {"sshd", "-t"}; exit status 0 means valid.
class CommandValidator : public ConfigValidator {
public:
    explicit CommandValidator(std::vector<std::string> argv);
    ValidationResult validate(const std::string& snippet_dir) override;

private:
    std::vector<std::string> argv_;
};

/// Runs several validators in order, stopping at the first failure.
class ChainValidator : public ConfigValidator {
public:
    void add(std::shared_ptr<ConfigValidator> v) { chain_.push_back(std::move(v)); }
    ValidationResult validate(const std::string& snippet_dir) override;

private:
    std::vector<std::shared_ptr<ConfigValidator>> chain_;
};

// ===== Store =====

struct SnippetStoreConfig {
    std::string dir;
    std::string file_prefix = "10-user_";
    std::string wrapper_path = "/usr/local/bin/gate_login_wrapper";  // %u = principal
};

class SnippetStore {
public:
    SnippetStore(const SnippetStoreConfig& config,
                 std::shared_ptr<ConfigValidator> validator,
                 std::shared_ptr<EventLog> events = nullptr);
    ~SnippetStore();

    SnippetStore(const SnippetStore&) = delete;
    SnippetStore& operator=(const SnippetStore&) = delete;

    /// Create or rewrite a principal's fragment. A new principal starts
    /// Active unless `active` is false; an existing one keeps its state.
    void provision(const std::string& principal, ShellMode shell, bool sudo,
                   bool active = true);

    void enable(const std::string& principal);
    void disable(const std::string& principal);
    void lock(const std::string& principal);
    void unlock(const std::string& principal);

    /// Idempotent. Returns true if a fragment was deleted.
    bool remove(const std::string& principal);

    std::map<std::string, PrincipalState> list() const;
    std::optional<Principal> get(const std::string& principal) const;

    std::string render_fragment(const std::string& principal, ShellMode shell,
                                bool sudo) const;

    const SnippetStoreConfig& config() const { return config_; }

private:
    struct Located {
        PrincipalState state;
        std::string path;
    };

    void check_name(const std::string& principal) const;
    std::string path_for(const std::string& principal, PrincipalState state) const;
    std::optional<Located> locate(const std::string& principal) const;

    /// Moves the fragment to `target`, validates, rolls back on failure.
    void transition(const std::string& op, const std::string& principal,
                    const Located& from, PrincipalState target);

    void commit_or_rollback(const std::string& op, const std::string& principal,
                            const std::function<void()>& rollback);

    SnippetStoreConfig config_;
    std::shared_ptr<ConfigValidator> validator_;
    std::shared_ptr<EventLog> events_;
    mutable std::mutex mutex_;
};

} // namespace sgate
