#pragma once

#include <expected>
#include <string>

namespace platform {

// Detaches from the controlling terminal (double fork, setsid) and points
// stdio at /dev/null. Only the grandchild returns, unless the first fork
// fails, in which case the caller is still attached to its terminal.
std::expected<void, std::string> daemonize();

} // namespace platform
