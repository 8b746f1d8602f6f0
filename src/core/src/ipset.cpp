#include "../include/sgate_ipset.hpp"
#include "../include/sgate_errors.hpp"
#include "../include/sgate_process.hpp"
#include "../include/sgate_util.hpp"

namespace sgate {

IpsetCommand::IpsetCommand(std::string binary) : binary_(std::move(binary)) {}

void IpsetCommand::add(const std::string& set, const std::string& ip,
                       std::chrono::seconds ttl) {
    std::vector<std::string> argv = {binary_, "add", set, ip};
    if (ttl.count() > 0) {
        argv.push_back("timeout");
        argv.push_back(std::to_string(ttl.count()));
    }
    argv.push_back("-exist");

    ExecResult res = run_command(argv);
    if (!res.ok()) {
        throw IOError("ipset add " + set + " " + ip + " failed with status " +
                      std::to_string(res.exit_code));
    }
}

void IpsetCommand::remove(const std::string& set, const std::string& ip) {
    ExecResult res = run_command({binary_, "del", set, ip, "-exist"});
    if (!res.ok()) {
        throw IOError("ipset del " + set + " " + ip + " failed with status " +
                      std::to_string(res.exit_code));
    }
}

std::vector<std::string> IpsetCommand::list(const std::string& set) {
    ExecResult res = run_command({binary_, "list", set});
    if (!res.ok()) {
        throw IOError("ipset list " + set + " failed with status " +
                      std::to_string(res.exit_code));
    }

    // Members follow the "Members:" line, one per line, options after the address
    std::vector<std::string> members;
    bool in_members = false;
    for (const auto& line : split_lines(res.output)) {
        if (!in_members) {
            in_members = starts_with(line, "Members:");
            continue;
        }
        auto tokens = split_ws(line);
        if (!tokens.empty()) members.push_back(tokens[0]);
    }
    return members;
}

} // namespace sgate
