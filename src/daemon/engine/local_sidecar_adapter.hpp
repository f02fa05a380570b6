#pragma once

#include "engine/engine_port.hpp"
#include "engine/model_locator.hpp"

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

struct SidecarOptions {
    int num_threads = 4;
    std::chrono::seconds timeout{120};
};

struct SidecarOutput {
    std::string text;
    std::string language;
};

// Runs sherpa-onnx-offline once per transcription:
//   <binary> --model=<dir>/model.int8.onnx --tokens=<dir>/tokens.txt --num-threads=4 <audio>
// The process is killed if it outlives the timeout. Model selection is purely
// a config change; nothing is spawned outside transcribe().
class LocalSidecarAdapter : public EnginePort {
public:
    LocalSidecarAdapter(std::filesystem::path config_path, ModelLocator locator,
                        SidecarOptions options = {});

    std::string name() const override { return "local-sidecar"; }

    std::expected<TranscriptionResult, EngineError>
        transcribe(const std::filesystem::path& audio_path, const TranscribeOptions& options) override;
    Availability is_available() override;
    EngineHealth get_health() override;
    std::vector<ModelInfo> list_models() override;
    std::expected<void, EngineError> switch_model(const std::string& model_id) override;
    AdapterConfig get_config() const override;
    std::expected<void, EngineError> configure(const ConfigPatch& patch) override;

    // Scans stdout lines, then stderr lines, for the first one that starts
    // with '{' and parses as an object with a string "text".
    static std::optional<SidecarOutput> parse_output(std::string_view out, std::string_view err);

private:
    // The configured model, or the first downloaded one when none is set.
    std::string effective_model_id() const;

    void load_config();
    std::expected<void, EngineError> save_config(const std::string& active_model_id) const;

    std::filesystem::path config_path_;
    ModelLocator locator_;
    SidecarOptions options_;

    mutable std::mutex mutex_;
    std::string active_model_id_;
};
