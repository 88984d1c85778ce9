#include "platform/linux/target_lock.hpp"

#include "platform/platform_paths.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/file.h>
#include <unistd.h>

namespace fs = std::filesystem;

TargetLock::TargetLock() = default;

TargetLock::~TargetLock() {
    release();
}

std::expected<void, std::string> TargetLock::acquire(const std::string& path) {
    if (held()) return std::unexpected("lock already held");

    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);

    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        return std::unexpected("open " + path + ": " + std::strerror(errno));
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) < 0) {
        int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) {
            return std::unexpected("pane is already being monitored (" + path + ")");
        }
        return std::unexpected("flock " + path + ": " + std::strerror(err));
    }

    fd_ = fd;
    return {};
}

void TargetLock::release() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
}

std::string TargetLock::path_for(const std::string& socket, const std::string& pane_id) {
    std::string name = (socket.empty() ? "default" : socket) + "-" + pane_id;
    for (auto& c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') c = '_';
    }
    return platform::runtime_dir() + "/" + name + ".lock";
}
