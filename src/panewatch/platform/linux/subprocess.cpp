#include "platform/linux/subprocess.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <limits>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace platform {

namespace {

std::string errno_message(const char* call) {
    return std::string(call) + " failed: " + std::strerror(errno);
}

void close_pipe(int fds[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
    fds[0] = fds[1] = -1;
}

} // namespace

std::expected<ProcessResult, std::string> run_process(const std::vector<std::string>& argv,
                                                      std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        return std::unexpected("empty command");
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(errno_message("pipe2()"));
    }
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        auto msg = errno_message("pipe2()");
        close_pipe(out_pipe);
        return std::unexpected(msg);
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        auto msg = errno_message("fork()");
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        return std::unexpected(msg);
    }

    if (pid == 0) {
        // Child: stdout/stderr into the pipes, signal mask back to default, exec
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    ProcessResult result;
    pollfd fds[2] = {
        {.fd = out_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = err_pipe[0], .events = POLLIN, .revents = 0},
    };
    std::string* sinks[2] = {&result.out, &result.err};
    int open_fds = 2;
    std::string failure;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (open_fds > 0) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            failure = argv[0] + " timed out after " + std::to_string(timeout.count()) + " ms";
            break;
        }

        int wait_ms = static_cast<int>(std::min<int64_t>(left.count(), std::numeric_limits<int>::max()));
        int ret = ::poll(fds, 2, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            failure = errno_message("poll()");
            break;
        }
        if (ret == 0) continue;

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;

            char buf[4096];
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                open_fds--;
                continue;
            }
            sinks[i]->append(buf, static_cast<size_t>(n));
        }
    }

    // Still running on a failed read loop; it must not outlive the call
    if (!failure.empty()) ::kill(pid, SIGKILL);

    for (auto& p : fds) {
        if (p.fd >= 0) ::close(p.fd);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(errno_message("waitpid()"));
    }
    if (!failure.empty()) return std::unexpected(failure);

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        return std::unexpected(argv[0] + " killed by signal " + std::to_string(WTERMSIG(status)));
    }

    return result;
}

} // namespace platform
