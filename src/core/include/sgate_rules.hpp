#pragma once

/**
 * @file sgate_rules.hpp
 * @brief Firewall rule fragments and their consolidation into one canonical
 *        rule set per IP family
 *
 * Layout under the rules directory:
 *
 *   v4/<source>.rules            active fragment
 *   v4/<source>.rules.inactive   disabled fragment (skipped)
 *   v4/canonical.v4              generated, never edited by hand
 *   v6/...                       same for IPv6
 *
 * Fragment line: `<family> <chain> <proto> <port-or-range> <action> [# comment]`
 * Action may carry an ipset source match: `DROP:ssh_ban`.
 *
 * Canonical order is whitelist fragment, ban fragment, then every other
 * fragment by source id. Duplicates (same chain/proto/port/action) keep
 * their first occurrence, since the packet filter is first-match-wins.
 */

#include "sgate_util.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sgate {

class EventLog;

enum class FragmentKind { WHITELIST, BAN, GENERIC };

const char* fragment_kind_to_string(FragmentKind k) noexcept;

struct RuleLine {
    IpFamily family = IpFamily::V4;
    std::string chain;     // upper case
    std::string protocol;  // tcp|udp|icmp|icmpv6|all
    std::string port;      // "22", "1000-2000" or "any"
    std::string action;    // ACCEPT|DROP|REJECT|RETURN|LOG, optionally ":set"
    std::string comment;   // not part of identity

    /// Normalized identity tuple (chain, protocol, port, action).
    std::string key() const;

    /// Canonical text form, without comment.
    std::string to_string() const;

    bool operator==(const RuleLine& o) const { return family == o.family && key() == o.key(); }
};

/**
 * @brief Parse one fragment line.
 * @return nullopt for blank and comment-only lines
 * @throws ParseError naming `file` and `lineno`
 */
std::optional<RuleLine> parse_rule_line(const std::string& text,
                                        const std::string& file,
                                        size_t lineno,
                                        std::optional<IpFamily> expected_family = std::nullopt);

struct RuleFragment {
    std::string source;
    IpFamily family = IpFamily::V4;
    FragmentKind kind = FragmentKind::GENERIC;
    std::vector<RuleLine> lines;
};

RuleFragment parse_fragment(const std::string& source, IpFamily family, FragmentKind kind,
                            const std::string& content, const std::string& file);

struct CanonicalRuleSet {
    IpFamily family = IpFamily::V4;
    std::vector<RuleLine> rules;
    std::string hash;
    TimePoint generated{};
    size_t generic_rules = 0;  // rules contributed by operator fragments
};

struct MergeStats {
    size_t input_lines = 0;
    size_t duplicates_dropped = 0;
};

/// Priority-ordered, deduplicated merge. Pure; does not touch the disk.
CanonicalRuleSet merge_fragments(IpFamily family,
                                 const std::vector<RuleFragment>& fragments,
                                 MergeStats* stats = nullptr);

/// Text the content hash is computed over.
std::string canonical_body(IpFamily family, const std::vector<RuleLine>& rules);

/// Canonical file content: header comment followed by rule lines.
std::string render_canonical(const CanonicalRuleSet& set);

/// iptables-restore / ip6tables-restore input for the rule set.
std::string render_restore(const CanonicalRuleSet& set);

// ===== Packet filter reload hook =====

class FilterReloader {
public:
    virtual ~FilterReloader() = default;
    /// Load `set` into the packet filter. Throws on failure.
    virtual void reload(const CanonicalRuleSet& set) = 0;
};

/// Pipes render_restore() into iptables-restore or ip6tables-restore.
class IptablesRestoreReloader : public FilterReloader {
public:
    void reload(const CanonicalRuleSet& set) override;
};

// ===== Consolidator =====

struct ConsolidatorConfig {
    std::string dir;
    std::string whitelist_source = "whitelist";
    std::string ban_source = "ban";
};

struct ConsolidateResult {
    IpFamily family = IpFamily::V4;
    bool changed = false;
    std::string hash;
    size_t rule_count = 0;
    size_t duplicates_dropped = 0;
};

class RuleConsolidator {
public:
    explicit RuleConsolidator(const ConsolidatorConfig& config,
                              std::shared_ptr<FilterReloader> reloader = nullptr,
                              std::shared_ptr<EventLog> events = nullptr);
    ~RuleConsolidator();

    RuleConsolidator(const RuleConsolidator&) = delete;
    RuleConsolidator& operator=(const RuleConsolidator&) = delete;

    /**
     * @brief Regenerate the canonical set for one family.
     *
     * Rewrites the canonical file (and reloads the filter) only if the
     * content hash changed. Safe to call concurrently, from threads or
     * processes.
     *
     * @throws ParseError on a malformed fragment line, nothing written
     * @throws FatalConfigError if the result has no rules from operator
     *         fragments but the persisted set had some. Whitelist and ban
     *         rules alone never replace a populated set.
     */
    ConsolidateResult consolidate(IpFamily family, TimePoint now = Clock::now());

    std::vector<ConsolidateResult> consolidate_all(TimePoint now = Clock::now());

    /// Persisted canonical set, or nullopt if none was generated yet.
    std::optional<CanonicalRuleSet> load_canonical(IpFamily family) const;

    /// All active fragments of one family, parsed.
    std::vector<RuleFragment> load_fragments(IpFamily family) const;

    /// Atomically (re)write an active fragment. Content is validated first.
    void write_fragment(IpFamily family, const std::string& source,
                        const std::string& content);

    /// Rename `<source>.rules` <-> `<source>.rules.inactive`.
    /// @return false if the fragment does not exist in either state
    bool set_fragment_active(IpFamily family, const std::string& source, bool active);

    /// nullopt if absent, otherwise whether it is active.
    std::optional<bool> fragment_state(IpFamily family, const std::string& source) const;

    std::string family_dir(IpFamily family) const;
    std::string canonical_path(IpFamily family) const;
    std::string fragment_path(IpFamily family, const std::string& source, bool active) const;

    const ConsolidatorConfig& config() const { return config_; }

private:
    FragmentKind kind_of(const std::string& source) const;

    ConsolidatorConfig config_;
    std::shared_ptr<FilterReloader> reloader_;
    std::shared_ptr<EventLog> events_;
};

} // namespace sgate
