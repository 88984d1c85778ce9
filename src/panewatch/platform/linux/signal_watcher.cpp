#include "platform/linux/signal_watcher.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <print>
#include <signal.h>
#include <sys/signalfd.h>
#include <unistd.h>

SignalWatcher::SignalWatcher(std::stop_source source)
    : source_(std::move(source)) {}

SignalWatcher::~SignalWatcher() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
    if (signal_fd_ >= 0) ::close(signal_fd_);
}

bool SignalWatcher::start() {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signals: signalfd failed: {}", std::strerror(errno));
        return false;
    }

    thread_ = std::jthread([this](std::stop_token stop) { watch(stop); });
    return true;
}

void SignalWatcher::watch(std::stop_token stop) {
    pollfd pfd{.fd = signal_fd_, .events = POLLIN, .revents = 0};

    // Short poll timeout so the destructor's stop request is noticed promptly.
    while (!stop.stop_requested()) {
        int ret = ::poll(&pfd, 1, 100);
        if (ret < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "signals: poll failed: {}", std::strerror(errno));
            return;
        }
        if (ret == 0) continue;

        signalfd_siginfo info;
        if (::read(signal_fd_, &info, sizeof(info)) == static_cast<ssize_t>(sizeof(info))) {
            source_.request_stop();
            return;
        }
    }
}
