#include "../include/sgate_process.hpp"

#include <cerrno>
#include <csignal>
#include <mutex>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sgate {

void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] {
        struct sigaction ign{};
        ign.sa_handler = SIG_IGN;
        sigemptyset(&ign.sa_mask);
        sigaction(SIGPIPE, &ign, nullptr);
    });
}

ExecResult run_command(const std::vector<std::string>& argv, const std::string& stdin_data) {
    ExecResult result;
    if (argv.empty()) return result;

    // A reader that exits early must not kill us with SIGPIPE
    ignore_sigpipe();

    int in_pipe[2];
    int out_pipe[2];
    if (pipe2(in_pipe, O_CLOEXEC) != 0) return result;
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        close(in_pipe[0]); close(in_pipe[1]);
        return result;
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        close(in_pipe[0]); close(in_pipe[1]);
        close(out_pipe[0]); close(out_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child: wire pipes, silence stderr, exec directly (no shell)
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        struct sigaction dfl{};
        dfl.sa_handler = SIG_DFL;
        sigaction(SIGPIPE, &dfl, nullptr);
        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    close(in_pipe[0]);
    close(out_pipe[1]);

    size_t written = 0;
    int in_fd = in_pipe[1];
    if (stdin_data.empty()) {
        close(in_fd);
        in_fd = -1;
    }
    int out_fd = out_pipe[0];
    char buf[4096];

    while (out_fd >= 0) {
        struct pollfd fds[2];
        nfds_t n = 0;
        fds[n++] = {out_fd, POLLIN, 0};
        if (in_fd >= 0) fds[n++] = {in_fd, POLLOUT, 0};

        if (poll(fds, n, -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }

        if (in_fd >= 0 && (fds[1].revents & (POLLOUT | POLLERR | POLLHUP))) {
            ssize_t w = write(in_fd, stdin_data.data() + written, stdin_data.size() - written);
            if (w > 0) written += static_cast<size_t>(w);
            if (w < 0 && errno != EINTR && errno != EAGAIN) written = stdin_data.size();
            if (written >= stdin_data.size()) {
                close(in_fd);
                in_fd = -1;
            }
        }

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            ssize_t r = read(out_fd, buf, sizeof(buf));
            if (r > 0) {
                result.output.append(buf, static_cast<size_t>(r));
            } else if (r == 0 || errno != EINTR) {
                close(out_fd);
                out_fd = -1;
            }
        }
    }
    if (in_fd >= 0) close(in_fd);
    if (out_fd >= 0) close(out_fd);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return result;
    }
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

} // namespace sgate
