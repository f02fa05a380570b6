#include "engine/config_file.hpp"

#include "logging.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace config_file {

std::optional<json> read(const fs::path& path) {
    std::ifstream f(path);
    if (!f.is_open()) return std::nullopt;

    try {
        auto j = json::parse(f);
        if (!j.is_object()) {
            logging::warn("config: {} is not a JSON object, using defaults", path.string());
            return std::nullopt;
        }
        return j;
    } catch (const json::exception& e) {
        logging::warn("config: parse error in {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

std::expected<void, std::string> write(const fs::path& path, const json& j) {
    std::error_code ec;
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);

    // Holds the API key, so owner-only even when the file already existed.
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        return std::unexpected(std::format("could not open {} for writing: {}", path.string(),
                                           std::strerror(errno)));
    }
    if (::fchmod(fd, 0600) < 0) {
        int err = errno;
        ::close(fd);
        return std::unexpected(std::format("could not restrict {}: {}", path.string(), std::strerror(err)));
    }

    std::string text = j.dump(2) + "\n";
    size_t total_written = 0;
    while (total_written < text.size()) {
        ssize_t n = ::write(fd, text.data() + total_written, text.size() - total_written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            return std::unexpected(std::format("could not write {}: {}", path.string(), std::strerror(err)));
        }
        total_written += static_cast<size_t>(n);
    }

    if (::close(fd) < 0) {
        return std::unexpected(std::format("could not write {}: {}", path.string(), std::strerror(errno)));
    }
    return {};
}

std::string string_field(const json& j, const char* key, const std::string& fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

} // namespace config_file
