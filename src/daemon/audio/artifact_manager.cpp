#include "audio/artifact_manager.hpp"

#include "logging.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <random>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr int kCreateAttempts = 8;

uint32_t random_suffix() {
    thread_local std::mt19937 rng{std::random_device{}()};
    return std::uniform_int_distribution<uint32_t>{}(rng);
}

} // namespace

AudioArtifactManager::AudioArtifactManager(fs::path directory, std::string extension,
                                           std::string prefix)
    : directory_(std::move(directory)), extension_(std::move(extension)),
      prefix_(std::move(prefix)) {}

std::string AudioArtifactManager::next_name() const {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return std::format("{}{}-{:08x}.{}", prefix_, ms, random_suffix(), extension_);
}

std::expected<Artifact, EngineError> AudioArtifactManager::create(std::span<const uint8_t> bytes) {
    std::error_code ec;
    fs::create_directories(directory_, ec);

    fs::path path;
    int fd = -1;
    for (int attempt = 0; attempt < kCreateAttempts && fd < 0; attempt++) {
        path = directory_ / next_name();
        fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
        if (fd < 0 && errno != EEXIST) {
            return std::unexpected(EngineError{
                ErrorKind::Internal,
                std::format("could not create audio file in {}: {}", directory_.string(),
                            std::strerror(errno))});
        }
    }
    if (fd < 0) {
        return std::unexpected(EngineError{ErrorKind::Internal,
                                           "could not find a free audio file name"});
    }

    size_t total_written = 0;
    while (total_written < bytes.size()) {
        ssize_t n = ::write(fd, bytes.data() + total_written, bytes.size() - total_written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            Artifact partial{path};
            remove(partial);
            return std::unexpected(EngineError{
                ErrorKind::Internal,
                std::format("could not write audio file: {}", std::strerror(err))});
        }
        total_written += static_cast<size_t>(n);
    }

    if (::close(fd) < 0) {
        int err = errno;
        Artifact partial{path};
        remove(partial);
        return std::unexpected(EngineError{
            ErrorKind::Internal, std::format("could not write audio file: {}", std::strerror(err))});
    }

    logging::debug("artifact: created {} ({} bytes)", path.string(), bytes.size());
    return Artifact{std::move(path)};
}

bool AudioArtifactManager::remove(Artifact& artifact) {
    if (artifact.path.empty()) return true;

    auto path = std::move(artifact.path);
    artifact.path.clear();

    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        logging::error("artifact: failed to delete {}: {}", path.string(), ec.message());
        return false;
    }
    logging::debug("artifact: deleted {}", path.string());
    return true;
}

bool AudioArtifactManager::matches(const fs::path& file) const {
    auto name = file.filename().string();
    auto suffix = "." + extension_;
    return name.size() > prefix_.size() + suffix.size() &&
           name.starts_with(prefix_) && name.ends_with(suffix);
}

size_t AudioArtifactManager::sweep_orphans() {
    size_t removed = 0;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        if (!entry.is_regular_file(ec) || !matches(entry.path())) continue;

        std::error_code rm_ec;
        if (fs::remove(entry.path(), rm_ec)) {
            removed++;
        } else if (rm_ec) {
            logging::warn("artifact: could not remove orphan {}: {}",
                          entry.path().string(), rm_ec.message());
        }
    }

    if (removed > 0) {
        logging::info("artifact: swept {} orphaned audio file(s) from {}", removed,
                      directory_.string());
    }
    return removed;
}

size_t AudioArtifactManager::count_artifacts() const {
    size_t count = 0;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        if (entry.is_regular_file(ec) && matches(entry.path())) count++;
    }
    return count;
}

ScopedArtifact::ScopedArtifact(AudioArtifactManager& manager, Artifact artifact)
    : manager_(manager), artifact_(std::move(artifact)) {}

ScopedArtifact::~ScopedArtifact() {
    remove();
}

bool ScopedArtifact::remove() {
    return manager_.remove(artifact_);
}
