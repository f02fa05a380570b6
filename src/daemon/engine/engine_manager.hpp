#pragma once

#include "audio/artifact_manager.hpp"
#include "engine/engine_port.hpp"
#include "engine/watchdog.hpp"
#include "text/post_processor.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

enum class ManagerState { Uninitialized, Ready, Recording, Processing };

std::string_view to_string(ManagerState state);

struct ErrorResult {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
};

using ProcessResult = std::expected<TranscriptionResult, ErrorResult>;

struct SwitchOutcome {
    bool success = false;
    std::optional<ErrorResult> error;
    std::vector<ModelInfo> models;   // re-queried after the attempt
};

struct EngineStatus {
    ManagerState state = ManagerState::Uninitialized;
    std::optional<std::string> adapter;
    Availability availability;
    std::optional<AdapterConfig> config;
    uint64_t forced_resets = 0;
};

struct EngineManagerOptions {
    std::vector<std::string> preference = {"remote", "local-sidecar"};
    std::chrono::milliseconds watchdog_timeout = std::chrono::seconds(30);
    Watchdog::NowFn now;
    // Applied to every successful transcription before it is returned.
    std::function<std::string(std::string_view)> clean = postproc::clean;
};

void to_json(nlohmann::json& j, const ErrorResult& e);
void to_json(nlohmann::json& j, const EngineStatus& s);

// Chooses one adapter and routes every transcription through it. The active
// adapter only changes on initialize(), select_adapter() or a successful
// test_connection() while nothing is active; a failing call never falls over
// to another adapter.
//
// Thread-safe. The internal mutex is never held across an adapter call, so
// slow network or subprocess work does not block status queries.
class EngineManager {
public:
    using StateListener = std::function<void(ManagerState)>;

    explicit EngineManager(AudioArtifactManager& artifacts, EngineManagerOptions options = {});

    EngineManager(const EngineManager&) = delete;
    EngineManager& operator=(const EngineManager&) = delete;

    // Registration order is the fallback order after the preference list.
    void add_adapter(std::unique_ptr<EnginePort> adapter);

    // Probes every adapter in parallel and activates the first available one.
    // Returns the active adapter name, or nullopt if nothing is usable.
    std::optional<std::string> initialize();

    ProcessResult process_audio(std::span<const uint8_t> audio, const TranscribeOptions& options = {});

    std::vector<ModelInfo> list_models();
    SwitchOutcome switch_model(const std::string& model_id);
    EngineHealth get_health();
    EngineStatus get_status();

    std::expected<Availability, ErrorResult> select_adapter(const std::string& name);
    std::expected<Availability, ErrorResult> test_connection(const std::string& name = "remote");

    std::expected<void, ErrorResult> configure_adapter(const std::string& name, const ConfigPatch& patch);
    std::optional<AdapterConfig> adapter_config(const std::string& name) const;

    // Arms the watchdog in Recording. Capture itself happens in the UI.
    void start_recording(const std::string& source);
    void stop_recording(const std::string& source);

    // Called periodically; forces Ready if the deadline passed. Returns the
    // state that was stuck.
    std::optional<ProcessingState> check_watchdog();

    ManagerState state() const;
    std::optional<std::string> active_adapter_name() const;
    std::optional<TranscriptionResult> last_transcription() const;
    uint64_t generation() const;

    void set_state_listener(StateListener listener);

private:
    EnginePort* find_adapter(const std::string& name) const;
    ManagerState state_locked() const;
    void notify(ManagerState state);

    AudioArtifactManager& artifacts_;
    EngineManagerOptions options_;

    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<EnginePort>> adapters_;
    EnginePort* active_ = nullptr;
    bool initialized_ = false;
    Watchdog watchdog_;
    std::optional<TranscriptionResult> last_;
    std::string switching_model_;
    StateListener listener_;
};
