#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <unistd.h>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/panewatch";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/panewatch";
}

std::string data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg) return std::string(xdg) + "/panewatch";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.local/share/panewatch";
}

std::string runtime_dir() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg) return std::string(xdg) + "/panewatch";
    return "/tmp/panewatch-" + std::to_string(::getuid());
}

} // namespace platform
