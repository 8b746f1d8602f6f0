#pragma once

#include <string>
#include <vector>

namespace sgate {

struct ExecResult {
    int exit_code = -1;   // -1: fork/wait failure or killed by signal, 127: exec failed
    std::string output;   // captured stdout

    bool ok() const { return exit_code == 0; }
};

/**
 * @brief Execute a command with explicit argv, bypassing the shell entirely.
 *
 * argv[0] is resolved through PATH (execvp). `stdin_data` is written to the
 * child's stdin, which is then closed. stderr goes to /dev/null.
 */
ExecResult run_command(const std::vector<std::string>& argv,
                       const std::string& stdin_data = "");

/// Set SIGPIPE to SIG_IGN for the whole process, once. run_command() calls
/// it too; children get the default disposition back before exec.
void ignore_sigpipe();

} // namespace sgate
