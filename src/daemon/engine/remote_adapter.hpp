#pragma once

#include "engine/engine_port.hpp"
#include "engine/http_client.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Talks to an OpenAI-compatible transcription server:
//   GET  /health
//   GET  /v1/models
//   POST /v1/models/switch        {"model_id": ...}
//   POST /v1/audio/transcriptions multipart: file, model, response_format, language
//
// 502/503/504 and connection resets are retried with exponential backoff
// (1s, 2s). Config is persisted to a JSON file on every change.
class RemoteAdapter : public EnginePort {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    static constexpr std::chrono::seconds kTranscribeTimeout{120};
    static constexpr std::chrono::seconds kSwitchTimeout{60};
    static constexpr std::chrono::seconds kProbeTimeout{10};

    RemoteAdapter(std::filesystem::path config_path, std::unique_ptr<HttpClient> http,
                  Sleeper sleeper = {});

    std::string name() const override { return "remote"; }

    std::expected<TranscriptionResult, EngineError>
        transcribe(const std::filesystem::path& audio_path, const TranscribeOptions& options) override;
    Availability is_available() override;
    EngineHealth get_health() override;
    std::vector<ModelInfo> list_models() override;
    std::expected<void, EngineError> switch_model(const std::string& model_id) override;
    AdapterConfig get_config() const override;
    std::expected<void, EngineError> configure(const ConfigPatch& patch) override;

    int max_retries() const { return max_retries_; }

private:
    std::expected<HttpResponse, TransportError> perform_with_retry(const HttpRequest& request);

    RemoteConfig snapshot() const;
    static std::string base_url(const RemoteConfig& config);
    static std::vector<std::string> request_headers(const RemoteConfig& config,
                                                    std::vector<std::string> extra = {});

    void load_config();
    std::expected<void, EngineError> save_config(const RemoteConfig& config) const;

    std::filesystem::path config_path_;
    std::unique_ptr<HttpClient> http_;
    Sleeper sleep_;
    int max_retries_ = 2;

    mutable std::mutex mutex_;
    RemoteConfig config_;
};
