#include "engine/remote_adapter.hpp"

#include "engine/config_file.hpp"
#include "engine/language_codes.hpp"
#include "logging.hpp"
#include "text/post_processor.hpp"

#include <format>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <thread>

#ifndef ECHO_DICTATE_VERSION
#define ECHO_DICTATE_VERSION "0.0.0"
#endif

using json = nlohmann::json;

namespace {

constexpr std::string_view kTranscriptionPath = "/v1/audio/transcriptions";

EngineError transport_error(const TransportError& e) {
    switch (e.kind) {
        case TransportFailure::ConnectionRefused:
            return {ErrorKind::Unreachable, "Connection refused - server may be offline"};
        case TransportFailure::HostNotFound:
            return {ErrorKind::Unreachable, "Server not found - check the URL"};
        case TransportFailure::Timeout:
            return {ErrorKind::Timeout, "Connection timeout"};
        case TransportFailure::ConnectionReset:
            return {ErrorKind::Unreachable, "Connection reset: " + e.message};
        case TransportFailure::Other:
            break;
    }
    return {ErrorKind::Unreachable, e.message};
}

bool is_auth_failure(long status) {
    return status == 401 || status == 403;
}

bool is_transient(long status) {
    return status >= 502 && status <= 504;
}

// Pulls a human readable message out of an error body: {"error": "..."},
// {"error": {"message": "..."}}, {"detail": "..."} or the raw text.
std::string error_detail(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.is_object()) {
            if (auto it = j.find("error"); it != j.end()) {
                if (it->is_string()) return it->get<std::string>();
                if (it->is_object() && it->contains("message") && (*it)["message"].is_string()) {
                    return (*it)["message"].get<std::string>();
                }
            }
            if (auto it = j.find("detail"); it != j.end() && it->is_string()) {
                return it->get<std::string>();
            }
        }
    } catch (const json::exception&) {
    }

    constexpr size_t kMaxDetail = 200;
    return body.size() > kMaxDetail ? body.substr(0, kMaxDetail) + "..." : body;
}

EngineError status_error(const HttpResponse& resp) {
    if (is_auth_failure(resp.status)) {
        return {ErrorKind::AuthFailed, "Invalid API key"};
    }
    auto detail = error_detail(resp.body);
    auto message = detail.empty() ? std::format("HTTP {}", resp.status)
                                  : std::format("HTTP {}: {}", resp.status, detail);
    auto kind = resp.status == 404 ? ErrorKind::ModelUnavailable : ErrorKind::ServerError;
    return {kind, std::move(message)};
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

std::string first_string(const json& j, std::initializer_list<const char*> keys,
                         const std::string& fallback) {
    for (const char* key : keys) {
        auto value = config_file::string_field(j, key);
        if (!value.empty()) return value;
    }
    return fallback;
}

} // namespace

RemoteAdapter::RemoteAdapter(std::filesystem::path config_path, std::unique_ptr<HttpClient> http,
                             Sleeper sleeper)
    : config_path_(std::move(config_path)), http_(std::move(http)),
      sleep_(sleeper ? std::move(sleeper)
                     : Sleeper([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); })) {
    load_config();
}

std::expected<TranscriptionResult, EngineError>
RemoteAdapter::transcribe(const std::filesystem::path& audio_path, const TranscribeOptions& options) {
    auto config = snapshot();
    if (!config.is_configured()) {
        return std::unexpected(EngineError{
            ErrorKind::NotConfigured, "Remote endpoint not configured. Please configure in Settings."});
    }

    std::ifstream f(audio_path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected(EngineError{ErrorKind::Internal,
                                           "could not read audio file " + audio_path.string()});
    }
    std::string audio((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    std::string model = options.model.empty() ? config.selected_model : options.model;
    std::string language = !options.language.empty() ? options.language
                         : !config.language.empty()  ? config.language
                                                     : "en";

    HttpRequest request{
        .method = "POST",
        .url = base_url(config) + std::string(kTranscriptionPath),
        .headers = request_headers(config),
        .form = {
            {.name = "file", .data = std::move(audio),
             .filename = "recording" + audio_path.extension().string(),
             .content_type = "audio/" + (audio_path.has_extension()
                                             ? audio_path.extension().string().substr(1)
                                             : std::string("webm"))},
            {.name = "model", .data = model},
            {.name = "response_format", .data = "verbose_json"},
            {.name = "language", .data = language},
        },
        .timeout = kTranscribeTimeout,
    };

    auto start = std::chrono::steady_clock::now();
    auto resp = perform_with_retry(request);
    auto processing_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    if (!resp) {
        auto err = transport_error(resp.error());
        logging::error("remote: transcription failed: {}", err.message);
        return std::unexpected(std::move(err));
    }
    if (!resp->ok()) {
        auto err = status_error(*resp);
        logging::error("remote: transcription failed: {}", err.message);
        return std::unexpected(std::move(err));
    }

    json j;
    try {
        j = json::parse(resp->body);
    } catch (const json::exception& e) {
        return std::unexpected(EngineError{ErrorKind::MalformedResponse,
                                           std::string("invalid JSON from server: ") + e.what()});
    }
    if (!j.is_object()) {
        return std::unexpected(EngineError{ErrorKind::MalformedResponse,
                                           "unexpected response: " + error_detail(resp->body)});
    }

    auto text = first_string(j, {"text", "transcription"}, "");
    auto detected = first_string(j, {"language", "detected_language", "lang", "detected_lang"}, "en");

    double duration = 0.0;
    if (auto it = j.find("duration"); it != j.end() && it->is_number()) {
        duration = it->get<double>();
    }

    auto short_model = model.substr(model.find_last_of('/') + 1);

    return TranscriptionResult{
        .text = postproc::clean(trim(text)),
        .language = normalize_language(detected),
        .duration_s = duration,
        .processing_ms = processing_ms,
        .engine_label = std::format("remote ({})", short_model),
        .model_id = model,
    };
}

Availability RemoteAdapter::is_available() {
    auto config = snapshot();
    if (!config.is_configured()) return {false, "No endpoint configured"};

    auto resp = http_->perform(HttpRequest{
        .url = base_url(config) + "/v1/models",
        .headers = request_headers(config),
        .timeout = kProbeTimeout,
    });

    if (!resp) return {false, transport_error(resp.error()).message};
    if (resp->ok()) return {true, {}};
    if (is_auth_failure(resp->status)) return {false, "Invalid API key"};
    return {false, std::format("Server returned HTTP {}", resp->status)};
}

EngineHealth RemoteAdapter::get_health() {
    EngineHealth health{.adapter = name()};

    auto config = snapshot();
    if (!config.is_configured()) {
        health.state = HealthState::Unavailable;
        health.error = "No endpoint configured";
        return health;
    }

    auto base = base_url(config);
    auto resp = http_->perform(HttpRequest{
        .url = base + "/health",
        .headers = request_headers(config),
        .timeout = kProbeTimeout,
    });

    if (!resp) {
        health.state = HealthState::Unavailable;
        health.error = transport_error(resp.error()).message;
        return health;
    }
    if (!resp->ok()) {
        health.state = HealthState::Error;
        health.error = is_auth_failure(resp->status) ? "Invalid API key"
                                                     : std::format("Server returned HTTP {}", resp->status);
        return health;
    }

    json server;
    try {
        server = json::parse(resp->body);
    } catch (const json::exception&) {
        health.state = HealthState::Error;
        health.error = "Malformed health response";
        return health;
    }

    json engine = server.is_object() ? server.value("engine", json::object()) : json::object();
    if (!engine.is_object()) engine = json::object();

    health.state = config_file::string_field(engine, "state") == "loaded" ? HealthState::Loaded
                                                                          : HealthState::Degraded;
    auto model_id = config_file::string_field(engine, "model_id");
    if (!model_id.empty()) health.model = model_id;

    // Supplementary; the health result stands even if this fails.
    size_t model_count = 0;
    auto models = http_->perform(HttpRequest{
        .url = base + "/v1/models",
        .headers = request_headers(config),
        .timeout = kProbeTimeout,
    });
    if (models && models->ok()) {
        try {
            auto data = json::parse(models->body).value("data", json::array());
            if (data.is_array()) model_count = data.size();
        } catch (const json::exception&) {
        }
    }

    health.extra = {{"server", server}, {"modelCount", model_count}};
    return health;
}

std::vector<ModelInfo> RemoteAdapter::list_models() {
    auto config = snapshot();
    if (!config.is_configured()) return {};

    auto resp = http_->perform(HttpRequest{
        .url = base_url(config) + "/v1/models",
        .headers = request_headers(config),
        .timeout = kProbeTimeout,
    });
    if (!resp || !resp->ok()) return {};

    std::vector<ModelInfo> models;
    try {
        auto data = json::parse(resp->body).value("data", json::array());
        if (!data.is_array()) return {};

        for (const auto& m : data) {
            if (!m.is_object()) continue;
            auto id = config_file::string_field(m, "id");
            if (id.empty()) continue;

            bool active = m.contains("active") && m["active"].is_boolean() && m["active"].get<bool>();
            models.push_back(ModelInfo{
                .id = id,
                .label = config_file::string_field(m, "label", id),
                .group = config_file::string_field(m, "group") == "local" ? ModelGroup::Local
                                                                          : ModelGroup::Gpu,
                .state = active ? ModelState::Loaded : ModelState::Available,
            });
        }
    } catch (const json::exception& e) {
        logging::warn("remote: could not parse model list: {}", e.what());
        return {};
    }
    return models;
}

std::expected<void, EngineError> RemoteAdapter::switch_model(const std::string& model_id) {
    auto config = snapshot();
    if (!config.is_configured()) {
        return std::unexpected(EngineError{ErrorKind::NotConfigured, "Remote endpoint not configured."});
    }
    if (model_id.empty()) {
        return std::unexpected(EngineError{ErrorKind::ModelUnavailable, "No model id given"});
    }

    auto resp = perform_with_retry(HttpRequest{
        .method = "POST",
        .url = base_url(config) + "/v1/models/switch",
        .headers = request_headers(config, {"Content-Type: application/json"}),
        .body = json{{"model_id", model_id}}.dump(),
        .timeout = kSwitchTimeout,
    });

    if (!resp) return std::unexpected(transport_error(resp.error()));

    if (!resp->ok()) {
        if (is_auth_failure(resp->status)) {
            return std::unexpected(EngineError{ErrorKind::AuthFailed, "Invalid API key"});
        }
        auto detail = error_detail(resp->body);
        auto message = detail.empty() ? std::format("Model switch failed: HTTP {}", resp->status)
                                      : detail;
        auto kind = resp->status >= 400 && resp->status < 500 ? ErrorKind::ModelUnavailable
                                                              : ErrorKind::ServerError;
        return std::unexpected(EngineError{kind, std::move(message)});
    }

    std::lock_guard lock(mutex_);
    auto updated = config_;
    updated.selected_model = model_id;
    if (auto saved = save_config(updated); !saved) return saved;
    config_ = std::move(updated);
    logging::info("remote: switched model to {}", model_id);
    return {};
}

AdapterConfig RemoteAdapter::get_config() const {
    return snapshot();
}

std::expected<void, EngineError> RemoteAdapter::configure(const ConfigPatch& patch) {
    std::lock_guard lock(mutex_);
    auto updated = config_;
    if (patch.endpoint_url) updated.endpoint_url = *patch.endpoint_url;
    if (patch.api_key) updated.api_key = *patch.api_key;
    // A cleared model falls back to the default, as it would on reload.
    if (patch.selected_model) {
        updated.selected_model = patch.selected_model->empty() ? RemoteConfig{}.selected_model
                                                               : *patch.selected_model;
    }
    if (patch.language) updated.language = *patch.language;

    if (auto saved = save_config(updated); !saved) return saved;
    config_ = std::move(updated);
    logging::info("remote: configured endpoint {}",
                  config_.endpoint_url.empty() ? "(none)" : config_.endpoint_url);
    return {};
}

std::expected<HttpResponse, TransportError>
RemoteAdapter::perform_with_retry(const HttpRequest& request) {
    for (int attempt = 0;; attempt++) {
        auto resp = http_->perform(request);

        bool transient = resp ? is_transient(resp->status)
                              : resp.error().kind == TransportFailure::ConnectionReset;
        if (!transient || attempt >= max_retries_) return resp;

        auto delay = std::chrono::milliseconds(1000 << attempt);
        if (resp) {
            logging::warn("remote: HTTP {}, retrying in {}ms (attempt {}/{})", resp->status,
                          delay.count(), attempt + 1, max_retries_);
        } else {
            logging::warn("remote: {}, retrying in {}ms (attempt {}/{})", resp.error().message,
                          delay.count(), attempt + 1, max_retries_);
        }
        sleep_(delay);
    }
}

RemoteConfig RemoteAdapter::snapshot() const {
    std::lock_guard lock(mutex_);
    return config_;
}

std::string RemoteAdapter::base_url(const RemoteConfig& config) {
    std::string url = config.endpoint_url;
    while (!url.empty() && url.back() == '/') url.pop_back();
    if (url.ends_with(kTranscriptionPath)) {
        url.erase(url.size() - kTranscriptionPath.size());
    }
    return url;
}

std::vector<std::string> RemoteAdapter::request_headers(const RemoteConfig& config,
                                                        std::vector<std::string> extra) {
    std::vector<std::string> headers = {
        "User-Agent: echo-dictate/" ECHO_DICTATE_VERSION,
        "Accept: application/json, text/plain, */*",
        "Cache-Control: no-cache",
    };
    headers.insert(headers.end(), std::make_move_iterator(extra.begin()),
                   std::make_move_iterator(extra.end()));
    if (!config.api_key.empty()) {
        headers.push_back("Authorization: Bearer " + config.api_key);
    }
    return headers;
}

void RemoteAdapter::load_config() {
    auto j = config_file::read(config_path_);
    if (!j) {
        logging::debug("remote: no config at {}, using defaults", config_path_.string());
        return;
    }

    RemoteConfig defaults;
    config_.endpoint_url = config_file::string_field(*j, "endpointUrl");
    config_.api_key = config_file::string_field(*j, "apiKey");
    config_.selected_model = config_file::string_field(*j, "selectedModel", defaults.selected_model);
    if (config_.selected_model.empty()) config_.selected_model = defaults.selected_model;
    config_.language = config_file::string_field(*j, "language");

    logging::info("remote: loaded config, endpoint {}",
                  config_.endpoint_url.empty() ? "(none)" : config_.endpoint_url);
}

std::expected<void, EngineError> RemoteAdapter::save_config(const RemoteConfig& config) const {
    auto or_null = [](const std::string& s) { return s.empty() ? json(nullptr) : json(s); };
    json j = {
        {"endpointUrl", or_null(config.endpoint_url)},
        {"apiKey", or_null(config.api_key)},
        {"selectedModel", config.selected_model},
        {"language", or_null(config.language)},
    };

    auto res = config_file::write(config_path_, j);
    if (!res) {
        logging::error("remote: failed to save config: {}", res.error());
        return std::unexpected(EngineError{ErrorKind::Internal, res.error()});
    }
    return {};
}
