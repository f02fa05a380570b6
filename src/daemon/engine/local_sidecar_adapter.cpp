#include "engine/local_sidecar_adapter.hpp"

#include "engine/config_file.hpp"
#include "logging.hpp"
#include "platform/subprocess.hpp"
#include "text/post_processor.hpp"

#include <cstdlib>
#include <format>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

std::optional<SidecarOutput> scan_lines(std::string_view stream) {
    while (!stream.empty()) {
        auto nl = stream.find('\n');
        auto line = trim(stream.substr(0, nl));
        stream = nl == std::string_view::npos ? std::string_view{} : stream.substr(nl + 1);

        if (!line.starts_with('{')) continue;

        try {
            auto j = json::parse(line);
            if (!j.is_object() || !j.contains("text") || !j["text"].is_string()) continue;
            return SidecarOutput{
                .text = j["text"].get<std::string>(),
                .language = config_file::string_field(j, "lang"),
            };
        } catch (const json::exception&) {
            continue;
        }
    }
    return std::nullopt;
}

} // namespace

LocalSidecarAdapter::LocalSidecarAdapter(fs::path config_path, ModelLocator locator, SidecarOptions options)
    : config_path_(std::move(config_path)), locator_(std::move(locator)), options_(options) {
    load_config();
}

std::optional<SidecarOutput> LocalSidecarAdapter::parse_output(std::string_view out, std::string_view err) {
    if (auto parsed = scan_lines(out)) return parsed;
    return scan_lines(err);
}

std::expected<TranscriptionResult, EngineError>
LocalSidecarAdapter::transcribe(const fs::path& audio_path, const TranscribeOptions& options) {
    auto binary = locator_.find_binary();
    if (!binary) {
        return std::unexpected(EngineError{ErrorKind::NotConfigured, "sherpa-onnx binary not found"});
    }

    auto model_id = options.model.empty() ? effective_model_id() : options.model;
    if (model_id.empty()) {
        return std::unexpected(EngineError{ErrorKind::ModelUnavailable,
                                           "No local model selected or downloaded"});
    }
    auto model = locator_.find(model_id);
    if (!model) {
        return std::unexpected(EngineError{ErrorKind::ModelUnavailable,
                                           std::format("Model {} is not downloaded", model_id)});
    }

    auto bin_dir = binary->parent_path();
    const char* path_env = std::getenv("PATH");
    std::string search_path = bin_dir.string() + (path_env ? std::string(":") + path_env : "");

    ProcessSpec spec{
        .argv = {
            binary->string(),
            "--model=" + model->model_file.string(),
            "--tokens=" + model->tokens_file.string(),
            std::format("--num-threads={}", options_.num_threads),
            audio_path.string(),
        },
        .working_dir = bin_dir,
        .env = {{"PATH", search_path}},
        .timeout = options_.timeout,
    };

    logging::debug("local: running {} with model {}", binary->string(), model_id);

    auto start = std::chrono::steady_clock::now();
    auto run = run_process(spec);
    auto processing_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    if (!run) {
        logging::error("local: could not start sherpa-onnx: {}", run.error());
        return std::unexpected(EngineError{ErrorKind::SubprocessFailed, run.error()});
    }
    if (run->timed_out) {
        logging::error("local: sherpa-onnx killed after {}s", options_.timeout.count());
        return std::unexpected(EngineError{
            ErrorKind::Timeout, std::format("sherpa-onnx timed out after {}s", options_.timeout.count())});
    }
    if (run->exit_code != 0) {
        auto message = run->term_signal != 0
                           ? std::format("sherpa-onnx killed by signal {}: {}", run->term_signal, trim(run->err))
                           : std::format("sherpa-onnx exited with code {}: {}", run->exit_code, trim(run->err));
        logging::error("local: {}", message);
        return std::unexpected(EngineError{ErrorKind::SubprocessFailed, std::move(message)});
    }

    auto parsed = parse_output(run->out, run->err);
    if (!parsed) {
        logging::warn("local: sherpa-onnx exited cleanly without a JSON result; treating as silence");
        parsed = SidecarOutput{};
    }

    return TranscriptionResult{
        .text = postproc::clean(trim(parsed->text)),
        .language = parsed->language.empty() ? "en" : parsed->language,
        .duration_s = 0.0,
        .processing_ms = processing_ms,
        .engine_label = std::format("local-cpu ({})", model_id),
        .model_id = model_id,
    };
}

Availability LocalSidecarAdapter::is_available() {
    if (!locator_.find_binary()) return {false, "sherpa-onnx binary not found"};
    if (locator_.downloaded().empty()) return {false, "No local model downloaded"};
    return {true, {}};
}

EngineHealth LocalSidecarAdapter::get_health() {
    EngineHealth health{.adapter = name()};

    auto binary = locator_.find_binary();
    auto models = locator_.downloaded();
    auto active = effective_model_id();
    bool active_present = !active.empty() && locator_.find(active).has_value();

    json downloaded = json::array();
    for (const auto& m : models) downloaded.push_back(m.id);

    if (!binary) {
        health.state = HealthState::Unavailable;
        health.error = "sherpa-onnx binary not found";
    } else if (models.empty()) {
        health.state = HealthState::Unavailable;
        health.error = "No local model downloaded";
    } else if (!active_present) {
        health.state = HealthState::Degraded;
        health.error = std::format("Model {} is not downloaded", active);
    } else {
        health.state = HealthState::Loaded;
        health.model = active;
    }

    health.extra = {
        {"binaryFound", binary.has_value()},
        {"binaryPath", binary ? json(binary->string()) : json(nullptr)},
        {"modelsDir", locator_.models_dir().string()},
        {"downloadedModels", downloaded},
        {"activeModel", active.empty() ? json(nullptr) : json(active)},
    };
    return health;
}

std::vector<ModelInfo> LocalSidecarAdapter::list_models() {
    auto active = effective_model_id();

    std::vector<ModelInfo> models;
    for (const auto& entry : ModelLocator::catalog()) {
        ModelState state = ModelState::Download;
        if (locator_.find(entry.id)) {
            state = entry.id == active ? ModelState::Loaded : ModelState::Available;
        }
        models.push_back(ModelInfo{
            .id = entry.id,
            .label = entry.label,
            .group = ModelGroup::Local,
            .state = state,
        });
    }
    return models;
}

std::expected<void, EngineError> LocalSidecarAdapter::switch_model(const std::string& model_id) {
    if (!locator_.is_known(model_id)) {
        return std::unexpected(EngineError{ErrorKind::ModelUnavailable,
                                           std::format("Unknown model {}", model_id)});
    }
    if (!locator_.find(model_id)) {
        return std::unexpected(EngineError{ErrorKind::ModelUnavailable,
                                           std::format("Model {} is not downloaded", model_id)});
    }

    std::lock_guard lock(mutex_);
    if (auto saved = save_config(model_id); !saved) return saved;
    active_model_id_ = model_id;
    logging::info("local: active model is now {}", model_id);
    return {};
}

AdapterConfig LocalSidecarAdapter::get_config() const {
    std::lock_guard lock(mutex_);
    return LocalConfig{.active_model_id = active_model_id_};
}

std::expected<void, EngineError> LocalSidecarAdapter::configure(const ConfigPatch& patch) {
    if (!patch.active_model_id) return {};
    if (!patch.active_model_id->empty()) return switch_model(*patch.active_model_id);

    std::lock_guard lock(mutex_);
    if (auto saved = save_config({}); !saved) return saved;
    active_model_id_.clear();
    return {};
}

std::string LocalSidecarAdapter::effective_model_id() const {
    {
        std::lock_guard lock(mutex_);
        if (!active_model_id_.empty()) return active_model_id_;
    }
    auto models = locator_.downloaded();
    return models.empty() ? std::string{} : models.front().id;
}

void LocalSidecarAdapter::load_config() {
    auto j = config_file::read(config_path_);
    if (!j) return;
    active_model_id_ = config_file::string_field(*j, "activeModelId");
    if (!active_model_id_.empty()) {
        logging::info("local: loaded config, active model {}", active_model_id_);
    }
}

std::expected<void, EngineError> LocalSidecarAdapter::save_config(const std::string& active_model_id) const {
    json j = {{"activeModelId", active_model_id.empty() ? json(nullptr) : json(active_model_id)}};
    auto res = config_file::write(config_path_, j);
    if (!res) {
        logging::error("local: failed to save config: {}", res.error());
        return std::unexpected(EngineError{ErrorKind::Internal, res.error()});
    }
    return {};
}
