#include "engine/engine_types.hpp"

using json = nlohmann::json;

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotConfigured: return "not_configured";
        case ErrorKind::Unreachable: return "unreachable";
        case ErrorKind::AuthFailed: return "auth_failed";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::ModelUnavailable: return "model_unavailable";
        case ErrorKind::MalformedResponse: return "malformed_response";
        case ErrorKind::SubprocessFailed: return "subprocess_failed";
        case ErrorKind::ServerError: return "server_error";
        case ErrorKind::Internal: return "internal";
    }
    return "internal";
}

std::string_view to_string(ModelGroup group) {
    return group == ModelGroup::Gpu ? "gpu" : "local";
}

std::string_view to_string(ModelState state) {
    switch (state) {
        case ModelState::Loaded: return "loaded";
        case ModelState::Available: return "available";
        case ModelState::Download: return "download";
        case ModelState::Switching: return "switching";
    }
    return "available";
}

std::string_view to_string(HealthState state) {
    switch (state) {
        case HealthState::Loaded: return "loaded";
        case HealthState::Degraded: return "degraded";
        case HealthState::Unavailable: return "unavailable";
        case HealthState::Error: return "error";
    }
    return "error";
}

bool is_configured(const AdapterConfig& config) {
    return std::visit([](const auto& c) { return c.is_configured(); }, config);
}

void to_json(json& j, const TranscriptionResult& r) {
    j = {
        {"text", r.text},
        {"language", r.language},
        {"durationSeconds", r.duration_s},
        {"processingTimeMs", r.processing_ms},
        {"engineLabel", r.engine_label},
        {"modelId", r.model_id},
    };
}

void to_json(json& j, const ModelInfo& m) {
    j = {
        {"id", m.id},
        {"label", m.label},
        {"group", to_string(m.group)},
        {"state", to_string(m.state)},
    };
}

void to_json(json& j, const EngineHealth& h) {
    j = {
        {"adapter", h.adapter},
        {"state", to_string(h.state)},
        {"model", h.model ? json(*h.model) : json(nullptr)},
        {"extra", h.extra},
    };
    if (!h.error.empty()) j["error"] = h.error;
}

void to_json(json& j, const RemoteConfig& c) {
    auto or_null = [](const std::string& s) { return s.empty() ? json(nullptr) : json(s); };
    j = {
        {"endpointUrl", or_null(c.endpoint_url)},
        {"apiKey", or_null(c.api_key)},
        {"selectedModel", c.selected_model},
        {"language", or_null(c.language)},
        {"isConfigured", c.is_configured()},
    };
}

void to_json(json& j, const LocalConfig& c) {
    j = {
        {"activeModelId", c.active_model_id.empty() ? json(nullptr) : json(c.active_model_id)},
        {"isConfigured", c.is_configured()},
    };
}

json config_to_json(const AdapterConfig& config) {
    return std::visit([](const auto& c) { return json(c); }, config);
}

ConfigPatch patch_from_json(const json& j) {
    ConfigPatch patch;
    if (!j.is_object()) return patch;

    auto field = [&j](const char* key) -> std::optional<std::string> {
        auto it = j.find(key);
        if (it == j.end()) return std::nullopt;
        if (it->is_string()) return it->get<std::string>();
        return std::string{};
    };

    patch.endpoint_url = field("endpointUrl");
    patch.api_key = field("apiKey");
    patch.selected_model = field("selectedModel");
    if (auto model = field("model"); model && !model->empty()) patch.selected_model = model;
    patch.language = field("language");
    patch.active_model_id = field("activeModelId");
    return patch;
}
