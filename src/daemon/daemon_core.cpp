#include "daemon_core.hpp"

#include "logging.hpp"

#include <algorithm>
#include <format>

using json = nlohmann::json;

namespace {

json error_response(ErrorKind kind, const std::string& message) {
    return {{"status", "error"}, {"kind", to_string(kind)}, {"message", message}};
}

json error_response(const ErrorResult& e) {
    return error_response(e.kind, e.message);
}

json bad_request(const std::string& message) {
    return {{"status", "error"}, {"message", message}};
}

std::string string_arg(const json& cmd, const char* key) {
    auto it = cmd.find(key);
    if (it == cmd.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

} // namespace

DaemonCore::DaemonCore(Config config, EngineManager& engine, AudioArtifactManager& artifacts,
                       IpcServer& ipc, OutputFactory output_factory, NotifyCallback notify)
    : config_(std::move(config)), engine_(engine), artifacts_(artifacts), ipc_(ipc),
      output_factory_(std::move(output_factory)), notify_(std::move(notify)) {}

DaemonCore::~DaemonCore() {
    engine_.set_state_listener({});
}

void DaemonCore::init() {
    auto swept = artifacts_.sweep_orphans();
    if (swept > 0) {
        logging::info("Removed {} orphaned audio file(s) from {}", swept, artifacts_.directory().string());
    }

    engine_.set_state_listener([this](ManagerState state) {
        broadcast({{"event", "state"}, {"state", to_string(state)}});
    });

    auto active = engine_.initialize();
    logging::info("Active engine: {}", active.value_or("none"));
}

void DaemonCore::add_client(int fd) {
    clients_[fd] = next_serial_++;
}

void DaemonCore::remove_client(int fd) {
    clients_.erase(fd);
    std::erase(subscribers_, fd);
}

std::optional<json> DaemonCore::handle_command(int client_fd, const json& cmd) {
    if (!cmd.is_object()) return bad_request("command must be a JSON object");
    auto cmd_str = string_arg(cmd, "cmd");

    if (cmd_str == "start") return handle_start(cmd);
    if (cmd_str == "stop") return handle_stop(cmd);
    if (cmd_str == "process_audio") return handle_process_audio(client_fd, cmd);
    if (cmd_str == "last") return handle_last(cmd);
    if (cmd_str == "configure") return handle_configure(cmd);
    if (cmd_str == "get_config") return handle_get_config(cmd);
    if (cmd_str == "copy_last") return handle_copy_last(cmd);
    if (cmd_str == "subscribe") return handle_subscribe(client_fd);

    if (cmd_str == "status") {
        defer(client_fd, [this] {
            json resp = engine_.get_status();
            resp["status"] = "ok";
            return resp;
        });
        return std::nullopt;
    }

    if (cmd_str == "models") {
        defer(client_fd, [this] {
            return json{{"status", "ok"}, {"models", engine_.list_models()}};
        });
        return std::nullopt;
    }

    if (cmd_str == "switch_model") {
        auto model_id = string_arg(cmd, "model_id");
        if (model_id.empty()) return bad_request("switch_model requires model_id");

        defer(client_fd, [this, model_id] {
            auto outcome = engine_.switch_model(model_id);
            json resp = outcome.success ? json{{"status", "ok"}, {"model", model_id}}
                                        : error_response(*outcome.error);
            resp["models"] = outcome.models;
            broadcast({{"event", "models"}, {"models", outcome.models}});
            return resp;
        });
        return std::nullopt;
    }

    if (cmd_str == "health") {
        defer(client_fd, [this] {
            return json{{"status", "ok"}, {"health", engine_.get_health()}};
        });
        return std::nullopt;
    }

    if (cmd_str == "test_connection") {
        auto adapter = string_arg(cmd, "adapter");
        if (adapter.empty()) adapter = "remote";

        defer(client_fd, [this, adapter] {
            auto res = engine_.test_connection(adapter);
            if (!res) return error_response(res.error());

            json resp = {{"status", "ok"}, {"adapter", adapter}, {"available", res->available}};
            if (!res->error.empty()) resp["error"] = res->error;
            resp["active"] = engine_.active_adapter_name().value_or("");
            return resp;
        });
        return std::nullopt;
    }

    if (cmd_str == "select_adapter") {
        auto adapter = string_arg(cmd, "adapter");
        if (adapter.empty()) return bad_request("select_adapter requires adapter");

        defer(client_fd, [this, adapter] {
            auto res = engine_.select_adapter(adapter);
            if (!res) return error_response(res.error());

            json resp = {{"status", "ok"}, {"adapter", adapter}, {"available", res->available}};
            if (!res->error.empty()) resp["error"] = res->error;
            return resp;
        });
        return std::nullopt;
    }

    return bad_request(cmd_str.empty() ? "missing cmd" : "unknown command: " + cmd_str);
}

json DaemonCore::handle_start(const json& cmd) {
    engine_.start_recording(string_arg(cmd, "source"));
    return {{"status", "ok"}, {"state", to_string(engine_.state())}};
}

json DaemonCore::handle_stop(const json& cmd) {
    engine_.stop_recording(string_arg(cmd, "source"));
    return {{"status", "ok"}, {"state", to_string(engine_.state())}};
}

std::optional<json> DaemonCore::handle_process_audio(int client_fd, const json& cmd) {
    auto it = cmd.find("audio");
    if (it == cmd.end() || !it->is_array()) {
        return bad_request("process_audio requires an audio byte array");
    }

    std::vector<uint8_t> audio;
    audio.reserve(it->size());
    for (const auto& b : *it) {
        if (!b.is_number_integer() || b.get<int64_t>() < 0 || b.get<int64_t>() > 255) {
            return bad_request("audio must contain bytes (0-255)");
        }
        audio.push_back(static_cast<uint8_t>(b.get<int64_t>()));
    }
    if (audio.empty()) return bad_request("audio is empty");

    TranscribeOptions options{
        .model = string_arg(cmd, "model"),
        .language = string_arg(cmd, "language"),
    };

    defer(client_fd, [this, audio = std::move(audio), options] {
        auto result = engine_.process_audio(audio, options);
        if (!result) {
            broadcast({{"event", "error"}, {"error", result.error()}});
            return error_response(result.error());
        }

        json resp = {{"status", "ok"}, {"transcription", *result}};
        if (config_.output.auto_copy && !result->text.empty()) {
            auto err = copy_to_clipboard(result->text);
            resp["copied"] = !err.has_value();
        }
        broadcast({{"event", "transcription"}, {"transcription", *result}});
        return resp;
    });
    return std::nullopt;
}

json DaemonCore::handle_last(const json& /*cmd*/) {
    auto last = engine_.last_transcription();
    return {{"status", "ok"}, {"transcription", last ? json(*last) : json(nullptr)}};
}

json DaemonCore::handle_configure(const json& cmd) {
    auto patch = patch_from_json(cmd);

    bool touches_remote = patch.endpoint_url || patch.api_key || patch.selected_model || patch.language;
    if (!touches_remote && !patch.active_model_id) {
        return bad_request("configure: no recognised fields");
    }

    if (touches_remote) {
        auto res = engine_.configure_adapter("remote", patch);
        if (!res) return error_response(res.error());
    }
    if (patch.active_model_id) {
        auto res = engine_.configure_adapter("local-sidecar", patch);
        if (!res) return error_response(res.error());
    }

    json resp = handle_get_config(cmd);
    broadcast({{"event", "config"}, {"config", resp["config"]}});
    return resp;
}

json DaemonCore::handle_get_config(const json& /*cmd*/) {
    json config = json::object();
    for (const char* name : {"remote", "local-sidecar"}) {
        if (auto c = engine_.adapter_config(name)) config[name] = config_to_json(*c);
    }
    return {{"status", "ok"}, {"config", config}, {"active", engine_.active_adapter_name().value_or("")}};
}

json DaemonCore::handle_copy_last(const json& /*cmd*/) {
    auto last = engine_.last_transcription();
    if (!last || last->text.empty()) {
        return bad_request("no transcription to copy");
    }
    if (auto err = copy_to_clipboard(last->text)) {
        return error_response(ErrorKind::Internal, *err);
    }
    return {{"status", "ok"}, {"copied", true}};
}

json DaemonCore::handle_subscribe(int client_fd) {
    if (std::ranges::find(subscribers_, client_fd) == subscribers_.end()) {
        subscribers_.push_back(client_fd);
    }
    return {{"status", "ok"}, {"state", to_string(engine_.state())}};
}

void DaemonCore::defer(int client_fd, std::function<json()> job) {
    auto it = clients_.find(client_fd);
    uint64_t serial = it != clients_.end() ? it->second : 0;

    worker_.push([this, client_fd, serial, job = std::move(job)] {
        json resp;
        try {
            resp = job();
        } catch (const std::exception& e) {
            logging::error("Worker job failed: {}", e.what());
            resp = error_response(ErrorKind::Internal, e.what());
        }
        post(client_fd, serial, std::move(resp));
    });
}

std::optional<std::string> DaemonCore::copy_to_clipboard(const std::string& text) {
    auto output = output_factory_ ? output_factory_() : nullptr;
    if (!output) return "no clipboard output available";

    auto res = output->deliver(text);
    if (!res) {
        logging::warn("Clipboard delivery via {} failed: {}", output->name(), res.error());
        return res.error();
    }
    logging::debug("Copied {} chars to clipboard via {}", text.size(), output->name());
    return std::nullopt;
}

void DaemonCore::post(int fd, uint64_t serial, json message) {
    {
        std::lock_guard lock(outbox_mutex_);
        outbox_.push_back({fd, serial, std::move(message)});
    }
    if (notify_) notify_();
}

void DaemonCore::broadcast(json event) {
    post(-1, 0, std::move(event));
}

void DaemonCore::on_worker_complete() {
    std::vector<Outgoing> pending;
    {
        std::lock_guard lock(outbox_mutex_);
        pending.swap(outbox_);
    }

    for (auto& out : pending) {
        if (out.fd < 0) {
            for (int fd : subscribers_) {
                if (!ipc_.send_response(fd, out.message)) {
                    logging::debug("Dropped event for subscriber {}", fd);
                }
            }
            continue;
        }

        // The requester may have gone away, and its fd been reused, meanwhile.
        auto it = clients_.find(out.fd);
        if (it == clients_.end() || it->second != out.serial) continue;
        if (!ipc_.send_response(out.fd, out.message)) {
            logging::debug("Failed to deliver reply to client {}", out.fd);
        }
    }
}

void DaemonCore::tick() {
    if (auto stuck = engine_.check_watchdog()) {
        broadcast({{"event", "watchdog_reset"}, {"stuck_state", to_string(*stuck)}});
    }
}

void DaemonCore::flush() {
    worker_.wait_idle();
    on_worker_complete();
}

void DaemonCore::shutdown() {
    if (worker_.pending() > 0) {
        logging::info("Waiting for pending engine work to finish...");
    }
    flush();
    engine_.set_state_listener({});
}
