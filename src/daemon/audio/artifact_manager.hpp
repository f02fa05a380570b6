#pragma once

#include "engine/engine_types.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>

struct Artifact {
    std::filesystem::path path;
};

// Owns the "audio bytes -> temp file -> deleted" lifecycle. Files are named
// <prefix><epoch ms>-<8 hex random>.<extension> so concurrent instances never
// collide and a startup sweep can find what a crashed session left behind.
class AudioArtifactManager {
public:
    static constexpr const char* kDefaultPrefix = "echo-dictate-audio-";

    explicit AudioArtifactManager(std::filesystem::path directory = std::filesystem::temp_directory_path(),
                                  std::string extension = "webm",
                                  std::string prefix = kDefaultPrefix);

    // Writes the bytes to a new, exclusively created file. On failure the
    // partial file is already removed.
    std::expected<Artifact, EngineError> create(std::span<const uint8_t> bytes);

    // Deletes the file and clears artifact.path so a second call is a no-op.
    // Returns false if the file could not be removed.
    bool remove(Artifact& artifact);

    // Deletes every file in the directory that matches the naming pattern.
    // Returns the number removed.
    size_t sweep_orphans();

    size_t count_artifacts() const;

    bool matches(const std::filesystem::path& file) const;

    const std::filesystem::path& directory() const { return directory_; }

private:
    std::string next_name() const;

    std::filesystem::path directory_;
    std::string extension_;
    std::string prefix_;
};

// Deletes its artifact when it goes out of scope unless remove() already ran.
class ScopedArtifact {
public:
    ScopedArtifact(AudioArtifactManager& manager, Artifact artifact);
    ~ScopedArtifact();

    ScopedArtifact(const ScopedArtifact&) = delete;
    ScopedArtifact& operator=(const ScopedArtifact&) = delete;

    const std::filesystem::path& path() const { return artifact_.path; }
    bool remove();

private:
    AudioArtifactManager& manager_;
    Artifact artifact_;
};
