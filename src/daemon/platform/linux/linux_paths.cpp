#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <format>
#include <unistd.h>

namespace platform {

namespace {

constexpr const char* kAppName = "echo-dictate";

// $<xdg_var>/echo-dictate, else $HOME/<home_relative>/echo-dictate.
std::string xdg_dir(const char* xdg_var, const char* home_relative) {
    const char* xdg = std::getenv(xdg_var);
    if (xdg && *xdg) return std::format("{}/{}", xdg, kAppName);
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::format("{}/{}/{}", home, home_relative, kAppName);
}

} // namespace

std::string config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", ".config");
}

std::string data_dir() {
    return xdg_dir("XDG_DATA_HOME", ".local/share");
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) return std::format("{}/{}.sock", xdg, kAppName);
    // /tmp is shared between users
    return std::format("/tmp/{}-{}.sock", kAppName, ::getuid());
}

} // namespace platform
