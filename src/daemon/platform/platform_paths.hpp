#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/echo-dictate or ~/.config/echo-dictate; empty if neither is set.
std::string config_dir();

// $XDG_DATA_HOME/echo-dictate or ~/.local/share/echo-dictate.
std::string data_dir();

// Socket path the daemon listens on and the client connects to.
std::string ipc_endpoint();

} // namespace platform
