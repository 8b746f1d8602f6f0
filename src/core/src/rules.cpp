#include "../include/sgate_rules.hpp"
#include "../include/sgate_digest.hpp"
#include "../include/sgate_errors.hpp"
#include "../include/sgate_event_log.hpp"
#include "../include/sgate_fsutil.hpp"
#include "../include/sgate_logger.hpp"
#include "../include/sgate_process.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>
#include <sstream>
#include <system_error>
#include <unordered_set>

namespace sgate {

static const char* const COMPONENT = "rules";
static const char* const FRAGMENT_SUFFIX = ".rules";
static const char* const INACTIVE_SUFFIX = ".rules.inactive";

const char* fragment_kind_to_string(FragmentKind k) noexcept {
    switch (k) {
        case FragmentKind::WHITELIST: return "whitelist";
        case FragmentKind::BAN:       return "ban";
        case FragmentKind::GENERIC:   return "generic";
        default: return "unknown";
    }
}

// ==================== RuleLine ====================

std::string RuleLine::key() const {
    return chain + " " + protocol + " " + port + " " + action;
}

std::string RuleLine::to_string() const {
    return std::string(family_to_string(family)) + " " + key();
}

namespace {

bool is_identifier(const std::string& s, size_t max_len) {
    if (s.empty() || s.size() > max_len) return false;
    if (!std::isalpha(static_cast<unsigned char>(s[0]))) return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
}

bool is_set_name(const std::string& s) {
    if (s.empty() || s.size() > 31) return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

bool is_source_id(const std::string& s) {
    if (s.empty() || s[0] == '.') return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

// Parses "N" into 1..65535; -1 on failure.
long parse_port_number(const std::string& s) {
    if (s.empty() || s.size() > 5) return -1;
    if (!std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return -1;
    }
    long v = std::stol(s);
    return (v >= 1 && v <= 65535) ? v : -1;
}

// Normalizes a port token; empty string means invalid.
std::string normalize_port(const std::string& tok) {
    if (tok == "any" || tok == "*" || tok == "-") return "any";

    auto sep = tok.find_first_of("-:");
    if (sep == std::string::npos) {
        long p = parse_port_number(tok);
        return p < 0 ? "" : std::to_string(p);
    }
    long lo = parse_port_number(tok.substr(0, sep));
    long hi = parse_port_number(tok.substr(sep + 1));
    if (lo < 0 || hi < 0 || lo > hi) return "";
    if (lo == hi) return std::to_string(lo);
    return std::to_string(lo) + "-" + std::to_string(hi);
}

const std::set<std::string>& known_protocols() {
    static const std::set<std::string> protos = {"tcp", "udp", "icmp", "icmpv6", "all"};
    return protos;
}

const std::set<std::string>& known_actions() {
    static const std::set<std::string> actions = {"ACCEPT", "DROP", "REJECT", "RETURN", "LOG"};
    return actions;
}

bool is_builtin_chain(const std::string& chain) {
    return chain == "INPUT" || chain == "FORWARD" || chain == "OUTPUT";
}

} // anonymous namespace

std::optional<RuleLine> parse_rule_line(const std::string& text,
                                        const std::string& file,
                                        size_t lineno,
                                        std::optional<IpFamily> expected_family) {
    std::string code = text;
    std::string comment;
    auto hash = text.find('#');
    if (hash != std::string::npos) {
        code = text.substr(0, hash);
        comment = trim(text.substr(hash + 1));
    }

    auto tokens = split_ws(code);
    if (tokens.empty()) return std::nullopt;
    if (tokens.size() != 5) {
        throw ParseError(file, lineno,
                         "expected '<family> <chain> <proto> <port-or-range> <action>', got " +
                         std::to_string(tokens.size()) + " fields");
    }

    RuleLine line;
    line.comment = comment;

    auto family = family_from_string(to_lower(tokens[0]));
    if (!family) {
        throw ParseError(file, lineno, "unknown family '" + tokens[0] + "'");
    }
    if (expected_family && *family != *expected_family) {
        throw ParseError(file, lineno,
                         std::string(family_to_string(*family)) + " rule in " +
                         family_to_string(*expected_family) + " fragment");
    }
    line.family = *family;

    line.chain = to_upper(tokens[1]);
    if (!is_identifier(line.chain, 28)) {
        throw ParseError(file, lineno, "invalid chain '" + tokens[1] + "'");
    }

    line.protocol = to_lower(tokens[2]);
    if (known_protocols().count(line.protocol) == 0) {
        throw ParseError(file, lineno, "unknown protocol '" + tokens[2] + "'");
    }

    line.port = normalize_port(tokens[3]);
    if (line.port.empty()) {
        throw ParseError(file, lineno, "invalid port or range '" + tokens[3] + "'");
    }
    if (line.port != "any" && line.protocol != "tcp" && line.protocol != "udp") {
        throw ParseError(file, lineno, "ports require tcp or udp, got '" + line.protocol + "'");
    }

    std::string action = tokens[4];
    std::string set_name;
    auto colon = action.find(':');
    if (colon != std::string::npos) {
        set_name = action.substr(colon + 1);
        action = action.substr(0, colon);
        if (!is_set_name(set_name)) {
            throw ParseError(file, lineno, "invalid ipset name '" + set_name + "'");
        }
    }
    action = to_upper(action);
    if (known_actions().count(action) == 0) {
        throw ParseError(file, lineno, "unknown action '" + tokens[4] + "'");
    }
    line.action = set_name.empty() ? action : action + ":" + set_name;

    return line;
}

RuleFragment parse_fragment(const std::string& source, IpFamily family, FragmentKind kind,
                            const std::string& content, const std::string& file) {
    RuleFragment frag;
    frag.source = source;
    frag.family = family;
    frag.kind = kind;

    size_t lineno = 0;
    for (const auto& raw : split_lines(content)) {
        ++lineno;
        auto line = parse_rule_line(raw, file, lineno, family);
        if (line) frag.lines.push_back(std::move(*line));
    }
    return frag;
}

// ==================== Merge ====================

CanonicalRuleSet merge_fragments(IpFamily family,
                                 const std::vector<RuleFragment>& fragments,
                                 MergeStats* stats) {
    // Stable priority sort: kind first, then source id
    std::vector<const RuleFragment*> ordered;
    ordered.reserve(fragments.size());
    for (const auto& f : fragments) {
        if (f.family == family) ordered.push_back(&f);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const RuleFragment* a, const RuleFragment* b) {
                         if (a->kind != b->kind) {
                             return static_cast<int>(a->kind) < static_cast<int>(b->kind);
                         }
                         return a->source < b->source;
                     });

    CanonicalRuleSet set;
    set.family = family;

    MergeStats local;
    std::unordered_set<std::string> seen;
    for (const auto* frag : ordered) {
        for (const auto& line : frag->lines) {
            ++local.input_lines;
            if (!seen.insert(line.key()).second) {
                ++local.duplicates_dropped;
                continue;
            }
            RuleLine kept = line;
            kept.comment.clear();
            set.rules.push_back(std::move(kept));
            if (frag->kind == FragmentKind::GENERIC) ++set.generic_rules;
        }
    }

    set.hash = content_hash(canonical_body(family, set.rules));
    if (stats) *stats = local;
    return set;
}

std::string canonical_body(IpFamily family, const std::vector<RuleLine>& rules) {
    std::string body = std::string("family=") + family_to_string(family) + "\n";
    for (const auto& r : rules) {
        body += r.to_string();
        body += "\n";
    }
    return body;
}

std::string render_canonical(const CanonicalRuleSet& set) {
    std::ostringstream oss;
    oss << "# sgate canonical family=" << family_to_string(set.family)
        << " hash=" << set.hash
        << " generated=" << format_iso_utc(set.generated)
        << " rules=" << set.rules.size()
        << " generic=" << set.generic_rules << "\n";
    oss << "# generated file, edit the fragments instead\n";
    for (const auto& r : set.rules) {
        oss << r.to_string() << "\n";
    }
    return oss.str();
}

std::string render_restore(const CanonicalRuleSet& set) {
    std::ostringstream oss;
    oss << "*filter\n";
    oss << ":INPUT DROP [0:0]\n";
    oss << ":FORWARD DROP [0:0]\n";
    oss << ":OUTPUT ACCEPT [0:0]\n";

    std::set<std::string> custom;
    for (const auto& r : set.rules) {
        if (!is_builtin_chain(r.chain)) custom.insert(r.chain);
    }
    for (const auto& chain : custom) {
        oss << ":" << chain << " - [0:0]\n";
    }

    oss << "-A INPUT -i lo -j ACCEPT\n";
    oss << "-A INPUT -m conntrack --ctstate ESTABLISHED,RELATED -j ACCEPT\n";

    for (const auto& r : set.rules) {
        oss << "-A " << r.chain;
        if (r.protocol == "icmpv6") {
            oss << " -p ipv6-icmp";
        } else if (r.protocol != "all") {
            oss << " -p " << r.protocol;
        }
        if (r.port != "any") {
            std::string port = r.port;
            std::replace(port.begin(), port.end(), '-', ':');
            oss << " --dport " << port;
        }
        std::string target = r.action;
        auto colon = target.find(':');
        if (colon != std::string::npos) {
            oss << " -m set --match-set " << target.substr(colon + 1) << " src";
            target = target.substr(0, colon);
        }
        oss << " -j " << target << "\n";
    }
    oss << "COMMIT\n";
    return oss.str();
}

void IptablesRestoreReloader::reload(const CanonicalRuleSet& set) {
    const char* tool = set.family == IpFamily::V4 ? "iptables-restore" : "ip6tables-restore";
    ExecResult res = run_command({tool}, render_restore(set));
    if (!res.ok()) {
        throw IOError(std::string(tool) + " exited with status " + std::to_string(res.exit_code));
    }
    SGATE_LOG_INFO(COMPONENT, std::string(tool) + " loaded " +
                   std::to_string(set.rules.size()) + " rules");
}

// ==================== RuleConsolidator ====================

RuleConsolidator::RuleConsolidator(const ConsolidatorConfig& config,
                                   std::shared_ptr<FilterReloader> reloader,
                                   std::shared_ptr<EventLog> events)
    : config_(config)
    , reloader_(std::move(reloader))
    , events_(std::move(events)) {}

RuleConsolidator::~RuleConsolidator() = default;

std::string RuleConsolidator::family_dir(IpFamily family) const {
    return config_.dir + "/" + family_to_string(family);
}

std::string RuleConsolidator::canonical_path(IpFamily family) const {
    return family_dir(family) + "/canonical." + family_to_string(family);
}

std::string RuleConsolidator::fragment_path(IpFamily family, const std::string& source,
                                            bool active) const {
    return family_dir(family) + "/" + source + (active ? FRAGMENT_SUFFIX : INACTIVE_SUFFIX);
}

FragmentKind RuleConsolidator::kind_of(const std::string& source) const {
    if (source == config_.whitelist_source) return FragmentKind::WHITELIST;
    if (source == config_.ban_source) return FragmentKind::BAN;
    return FragmentKind::GENERIC;
}

std::vector<RuleFragment> RuleConsolidator::load_fragments(IpFamily family) const {
    std::vector<std::string> sources;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(family_dir(family), ec)) {
        std::string name = entry.path().filename().string();
        if (name.empty() || name[0] == '.' || !ends_with(name, FRAGMENT_SUFFIX)) continue;
        sources.push_back(name.substr(0, name.size() - std::string(FRAGMENT_SUFFIX).size()));
    }
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw IOError("list " + family_dir(family) + ": " + ec.message());
    }
    std::sort(sources.begin(), sources.end());

    std::vector<RuleFragment> fragments;
    for (const auto& source : sources) {
        std::string path = fragment_path(family, source, true);
        auto content = fs::read_file_if_exists(path);
        if (!content) continue;  // removed between listing and reading
        fragments.push_back(parse_fragment(source, family, kind_of(source), *content, path));
    }
    return fragments;
}

std::optional<CanonicalRuleSet> RuleConsolidator::load_canonical(IpFamily family) const {
    std::string path = canonical_path(family);
    auto content = fs::read_file_if_exists(path);
    if (!content) return std::nullopt;

    CanonicalRuleSet set;
    set.family = family;
    std::optional<size_t> generic;
    size_t lineno = 0;
    for (const auto& raw : split_lines(*content)) {
        ++lineno;
        if (lineno == 1 && starts_with(raw, "# sgate canonical ")) {
            for (const auto& tok : split_ws(raw.substr(18))) {
                if (starts_with(tok, "hash=")) {
                    set.hash = tok.substr(5);
                } else if (starts_with(tok, "generated=")) {
                    if (auto tp = parse_iso_utc(tok.substr(10))) set.generated = *tp;
                } else if (starts_with(tok, "generic=")) {
                    try {
                        generic = static_cast<size_t>(std::stoul(tok.substr(8)));
                    } catch (const std::exception&) {
                        throw ParseError(path, lineno, "bad generic count '" + tok + "'");
                    }
                }
            }
            continue;
        }
        auto line = parse_rule_line(raw, path, lineno, family);
        if (line) set.rules.push_back(std::move(*line));
    }
    // Header without a count: treat every rule as an operator rule
    set.generic_rules = generic ? *generic : set.rules.size();
    return set;
}

ConsolidateResult RuleConsolidator::consolidate(IpFamily family, TimePoint now) {
    // Dry validate: every fragment parses before anything is touched
    auto fragments = load_fragments(family);

    MergeStats stats;
    CanonicalRuleSet merged = merge_fragments(family, fragments, &stats);
    merged.generated = now;

    ConsolidateResult result;
    result.family = family;
    result.hash = merged.hash;
    result.rule_count = merged.rules.size();
    result.duplicates_dropped = stats.duplicates_dropped;

    fs::ensure_dir(family_dir(family));
    fs::FileLock lock(family_dir(family) + "/.canonical." + family_to_string(family) + ".lock");

    auto previous = load_canonical(family);

    // Derived whitelist/ban rules are always present, so emptiness is judged
    // on the operator rules alone
    bool emptied = previous &&
        ((merged.rules.empty() && !previous->rules.empty()) ||
         (merged.generic_rules == 0 && previous->generic_rules > 0));
    if (emptied) {
        std::string msg = std::string("refusing to replace ") +
                          std::to_string(previous->generic_rules) + " " +
                          family_to_string(family) + " rules with an empty rule set";
        SGATE_LOG_ERROR(COMPONENT, msg);
        if (events_) events_->log_error(COMPONENT, msg, "FATAL_CONFIG");
        throw FatalConfigError(msg);
    }

    if (previous && previous->hash == merged.hash) {
        SGATE_LOG_DEBUG(COMPONENT, std::string(family_to_string(family)) + " unchanged");
        return result;
    }

    // Load first: a failed reload leaves the old file so the next pass retries
    if (reloader_) reloader_->reload(merged);

    fs::atomic_write(canonical_path(family), render_canonical(merged));
    result.changed = true;

    SGATE_LOG_INFO(COMPONENT, std::string(family_to_string(family)) + " canonical set: " +
                   std::to_string(merged.rules.size()) + " rules, " +
                   std::to_string(stats.duplicates_dropped) + " duplicates dropped");
    if (events_) {
        events_->log(EventLog::EventType::RULESET, COMPONENT, "regenerated",
                     {{"family", family_to_string(family)},
                      {"hash", merged.hash.substr(0, 16)},
                      {"rules", std::to_string(merged.rules.size())}});
    }
    return result;
}

std::vector<ConsolidateResult> RuleConsolidator::consolidate_all(TimePoint now) {
    std::vector<ConsolidateResult> results;
    results.push_back(consolidate(IpFamily::V4, now));
    results.push_back(consolidate(IpFamily::V6, now));
    return results;
}

void RuleConsolidator::write_fragment(IpFamily family, const std::string& source,
                                      const std::string& content) {
    if (!is_source_id(source)) {
        throw ValidationError("invalid fragment source id '" + source + "'");
    }
    std::string path = fragment_path(family, source, true);
    parse_fragment(source, family, kind_of(source), content, path);

    fs::ensure_dir(family_dir(family));
    auto current = fs::read_file_if_exists(path);
    if (current && *current == content) return;
    fs::atomic_write(path, content);
}

bool RuleConsolidator::set_fragment_active(IpFamily family, const std::string& source,
                                           bool active) {
    if (!is_source_id(source)) {
        throw ValidationError("invalid fragment source id '" + source + "'");
    }
    auto state = fragment_state(family, source);
    if (!state) return false;
    if (*state == active) return true;
    fs::rename_file(fragment_path(family, source, !active), fragment_path(family, source, active));
    return true;
}

std::optional<bool> RuleConsolidator::fragment_state(IpFamily family,
                                                     const std::string& source) const {
    if (fs::exists(fragment_path(family, source, true))) return true;
    if (fs::exists(fragment_path(family, source, false))) return false;
    return std::nullopt;
}

} // namespace sgate
