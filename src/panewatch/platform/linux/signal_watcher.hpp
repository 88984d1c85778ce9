#pragma once

#include <stop_token>
#include <thread>

// Turns SIGINT/SIGTERM into a stop request on `source`. The signals are
// blocked for the calling thread and read from a signalfd on a watcher
// thread, so start() must run before any other thread is spawned.
class SignalWatcher {
public:
    explicit SignalWatcher(std::stop_source source);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    bool start();

private:
    void watch(std::stop_token stop);

    std::stop_source source_;
    int signal_fd_ = -1;
    std::jthread thread_;
};
