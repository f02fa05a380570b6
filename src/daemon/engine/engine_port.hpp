#pragma once

#include "engine/engine_types.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

// Contract every transcription backend implements. EngineManager only talks
// to adapters through this interface.
//
// Failure reporting:
//  - transcribe/switch_model/configure return an EngineError on failure;
//    transport-level errors never escape as exceptions.
//  - is_available/get_health/list_models never fail; they fold the error into
//    the returned value (available=false, state=error/unavailable, empty list).
class EnginePort {
public:
    virtual ~EnginePort() = default;

    // Stable adapter name, e.g. "remote" or "local-sidecar".
    virtual std::string name() const = 0;

    virtual std::expected<TranscriptionResult, EngineError>
        transcribe(const std::filesystem::path& audio_path, const TranscribeOptions& options) = 0;

    // Cheap reachability probe used for selection. Bounded by the adapter's
    // own timeout.
    virtual Availability is_available() = 0;

    // Slower, richer status for diagnostics.
    virtual EngineHealth get_health() = 0;

    virtual std::vector<ModelInfo> list_models() = 0;

    // On success the adapter's selected model is updated and persisted before
    // returning.
    virtual std::expected<void, EngineError> switch_model(const std::string& model_id) = 0;

    // No I/O.
    virtual AdapterConfig get_config() const = 0;

    // Applies the patch and writes the adapter's config file synchronously.
    virtual std::expected<void, EngineError> configure(const ConfigPatch& patch) = 0;
};
