#pragma once

#include <string>

namespace platform {

// Directory holding config.json. Empty if neither XDG_CONFIG_HOME nor HOME is set.
std::string config_dir();

// Directory holding history.db. Empty if neither XDG_DATA_HOME nor HOME is set.
std::string data_dir();

// Per-user directory for lock files. Always non-empty.
std::string runtime_dir();

} // namespace platform
