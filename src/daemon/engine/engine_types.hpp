#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

enum class ErrorKind {
    NotConfigured,
    Unreachable,
    AuthFailed,
    Timeout,
    ModelUnavailable,
    MalformedResponse,
    SubprocessFailed,
    ServerError,
    Internal,
};

std::string_view to_string(ErrorKind kind);

struct EngineError {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
};

struct TranscriptionResult {
    std::string text;
    std::string language;      // ISO 639-1
    double duration_s = 0.0;   // as reported by the backend, 0 if unknown
    int64_t processing_ms = 0;
    std::string engine_label;
    std::string model_id;
};

// Empty fields mean "use the adapter's configured default".
struct TranscribeOptions {
    std::string model;
    std::string language;
};

enum class ModelGroup { Gpu, Local };
enum class ModelState { Loaded, Available, Download, Switching };

struct ModelInfo {
    std::string id;
    std::string label;
    ModelGroup group = ModelGroup::Gpu;
    ModelState state = ModelState::Available;
};

enum class HealthState { Loaded, Degraded, Unavailable, Error };

struct EngineHealth {
    std::string adapter;
    HealthState state = HealthState::Unavailable;
    std::optional<std::string> model;
    nlohmann::json extra = nlohmann::json::object();
    std::string error;
};

struct Availability {
    bool available = false;
    std::string error;
};

struct RemoteConfig {
    std::string endpoint_url;
    std::string api_key;
    std::string selected_model = "gpu-english";
    std::string language;

    // Derived: an endpoint is the only thing needed to attempt a call.
    bool is_configured() const { return !endpoint_url.empty(); }
};

struct LocalConfig {
    std::string active_model_id;

    bool is_configured() const { return !active_model_id.empty(); }
};

using AdapterConfig = std::variant<RemoteConfig, LocalConfig>;

bool is_configured(const AdapterConfig& config);

// Partial update for configure(). Adapters apply the fields they own and
// ignore the rest.
struct ConfigPatch {
    std::optional<std::string> endpoint_url;
    std::optional<std::string> api_key;
    std::optional<std::string> selected_model;
    std::optional<std::string> language;
    std::optional<std::string> active_model_id;
};

std::string_view to_string(ModelGroup group);
std::string_view to_string(ModelState state);
std::string_view to_string(HealthState state);

void to_json(nlohmann::json& j, const TranscriptionResult& r);
void to_json(nlohmann::json& j, const ModelInfo& m);
void to_json(nlohmann::json& j, const EngineHealth& h);
void to_json(nlohmann::json& j, const RemoteConfig& c);
void to_json(nlohmann::json& j, const LocalConfig& c);

nlohmann::json config_to_json(const AdapterConfig& config);

// Accepts the UI's camelCase keys; "model" is an alias for selectedModel.
// Null or empty-string values clear the field.
ConfigPatch patch_from_json(const nlohmann::json& j);
