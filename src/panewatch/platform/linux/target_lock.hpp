#pragma once

#include <expected>
#include <string>

// Exclusive, non-blocking flock on a per-pane file. Held until release() or
// destruction; the kernel drops it if the process dies.
class TargetLock {
public:
    TargetLock();
    ~TargetLock();

    TargetLock(const TargetLock&) = delete;
    TargetLock& operator=(const TargetLock&) = delete;

    // Fails if another monitor already holds the lock for this path.
    std::expected<void, std::string> acquire(const std::string& path);
    void release();

    bool held() const { return fd_ >= 0; }

    // Lock file for a pane on a given tmux server, under platform::runtime_dir().
    static std::string path_for(const std::string& socket, const std::string& pane_id);

private:
    int fd_ = -1;
};
