#include "engine/engine_manager.hpp"

#include "logging.hpp"
#include "text/post_processor.hpp"

#include <algorithm>
#include <exception>
#include <future>

using json = nlohmann::json;

namespace {

ErrorResult to_error_result(const EngineError& e) {
    return ErrorResult{e.kind, e.message};
}

} // namespace

std::string_view to_string(ManagerState state) {
    switch (state) {
        case ManagerState::Uninitialized: return "uninitialized";
        case ManagerState::Ready: return "ready";
        case ManagerState::Recording: return "recording";
        case ManagerState::Processing: return "processing";
    }
    return "uninitialized";
}

void to_json(json& j, const ErrorResult& e) {
    j = {{"kind", to_string(e.kind)}, {"message", e.message}};
}

void to_json(json& j, const EngineStatus& s) {
    j = {
        {"state", to_string(s.state)},
        {"adapter", s.adapter ? json(*s.adapter) : json(nullptr)},
        {"available", s.availability.available},
        {"config", s.config ? config_to_json(*s.config) : json(nullptr)},
        {"forcedResets", s.forced_resets},
    };
    if (!s.availability.error.empty()) j["error"] = s.availability.error;
}

EngineManager::EngineManager(AudioArtifactManager& artifacts, EngineManagerOptions options)
    : artifacts_(artifacts), options_(std::move(options)),
      watchdog_(options_.watchdog_timeout, options_.now) {}

void EngineManager::add_adapter(std::unique_ptr<EnginePort> adapter) {
    std::lock_guard lock(mutex_);
    adapters_.push_back(std::move(adapter));
}

std::optional<std::string> EngineManager::initialize() {
    std::vector<EnginePort*> adapters;
    {
        std::lock_guard lock(mutex_);
        for (auto& a : adapters_) adapters.push_back(a.get());
    }

    std::vector<std::future<Availability>> probes;
    for (auto* adapter : adapters) {
        probes.push_back(std::async(std::launch::async, [adapter] { return adapter->is_available(); }));
    }

    std::vector<Availability> results;
    for (size_t i = 0; i < probes.size(); i++) {
        try {
            results.push_back(probes[i].get());
        } catch (const std::exception& e) {
            results.push_back({false, e.what()});
        }
        if (results.back().available) {
            logging::info("engine: {} is available", adapters[i]->name());
        } else {
            logging::info("engine: {} unavailable: {}", adapters[i]->name(), results.back().error);
        }
    }

    // Preference order first, then whatever else was registered.
    std::vector<size_t> order;
    for (const auto& name : options_.preference) {
        for (size_t i = 0; i < adapters.size(); i++) {
            if (adapters[i]->name() == name && std::ranges::find(order, i) == order.end()) order.push_back(i);
        }
    }
    for (size_t i = 0; i < adapters.size(); i++) {
        if (std::ranges::find(order, i) == order.end()) order.push_back(i);
    }

    EnginePort* chosen = nullptr;
    for (size_t i : order) {
        if (results[i].available) {
            chosen = adapters[i];
            break;
        }
    }

    {
        std::lock_guard lock(mutex_);
        initialized_ = true;
        active_ = chosen;
        watchdog_.enter(ProcessingState::Ready);
    }

    if (chosen) {
        logging::info("engine: using {}", chosen->name());
    } else {
        logging::warn("engine: no adapter available; transcription is disabled until one is configured");
    }
    notify(ManagerState::Ready);

    if (!chosen) return std::nullopt;
    return chosen->name();
}

ProcessResult EngineManager::process_audio(std::span<const uint8_t> audio, const TranscribeOptions& options) {
    EnginePort* adapter = nullptr;
    {
        std::lock_guard lock(mutex_);
        if (!initialized_) {
            return std::unexpected(ErrorResult{ErrorKind::Internal, "Engine manager not initialized"});
        }
        if (watchdog_.state() == ProcessingState::Processing) {
            return std::unexpected(ErrorResult{ErrorKind::Internal, "A transcription is already in progress"});
        }
        adapter = active_;
    }
    if (!adapter) {
        return std::unexpected(ErrorResult{
            ErrorKind::NotConfigured,
            "No engine configured. Set a remote endpoint or download a local model."});
    }

    auto artifact = artifacts_.create(audio);
    if (!artifact) {
        logging::error("engine: could not write audio: {}", artifact.error().message);
        return std::unexpected(to_error_result(artifact.error()));
    }
    ScopedArtifact scoped(artifacts_, std::move(*artifact));

    uint64_t generation = 0;
    {
        std::lock_guard lock(mutex_);
        watchdog_.enter(ProcessingState::Processing);
        generation = watchdog_.generation();
    }
    notify(ManagerState::Processing);

    logging::info("engine: transcribing {} bytes with {}", audio.size(), adapter->name());

    std::expected<TranscriptionResult, EngineError> result;
    try {
        result = adapter->transcribe(scoped.path(), options);
        if (result) result->text = options_.clean(result->text);
    } catch (const std::exception& e) {
        result = std::unexpected(EngineError{ErrorKind::Internal, e.what()});
    }

    scoped.remove();

    bool stale = false;
    {
        std::lock_guard lock(mutex_);
        stale = watchdog_.generation() != generation;
        if (!stale) {
            watchdog_.enter(ProcessingState::Ready);
            if (result) last_ = *result;
        }
    }

    if (stale) {
        logging::warn("engine: discarding result that finished after a watchdog reset");
        return std::unexpected(ErrorResult{ErrorKind::Timeout,
                                           "Transcription finished after the processing timeout; result discarded"});
    }
    notify(ManagerState::Ready);

    if (!result) {
        logging::error("engine: transcription failed ({}): {}", to_string(result.error().kind),
                       result.error().message);
        return std::unexpected(to_error_result(result.error()));
    }

    logging::info("engine: transcription complete: {} chars, {}ms, {}", result->text.size(),
                  result->processing_ms, result->engine_label);
    return std::move(*result);
}

std::vector<ModelInfo> EngineManager::list_models() {
    EnginePort* adapter = nullptr;
    {
        std::lock_guard lock(mutex_);
        adapter = active_;
    }
    if (!adapter) return {};

    std::vector<ModelInfo> models;
    try {
        models = adapter->list_models();
    } catch (const std::exception& e) {
        logging::warn("engine: list_models failed: {}", e.what());
        return {};
    }

    std::lock_guard lock(mutex_);
    if (!switching_model_.empty()) {
        for (auto& m : models) {
            if (m.id == switching_model_) m.state = ModelState::Switching;
        }
    }
    return models;
}

SwitchOutcome EngineManager::switch_model(const std::string& model_id) {
    EnginePort* adapter = nullptr;
    {
        std::lock_guard lock(mutex_);
        adapter = active_;
        if (adapter) switching_model_ = model_id;
    }
    if (!adapter) {
        return SwitchOutcome{.error = ErrorResult{ErrorKind::NotConfigured, "No engine configured"}};
    }

    notify(state());
    logging::info("engine: switching {} to model {}", adapter->name(), model_id);

    std::expected<void, EngineError> res;
    try {
        res = adapter->switch_model(model_id);
    } catch (const std::exception& e) {
        res = std::unexpected(EngineError{ErrorKind::Internal, e.what()});
    }

    {
        std::lock_guard lock(mutex_);
        switching_model_.clear();
    }

    SwitchOutcome outcome;
    outcome.success = res.has_value();
    if (!res) {
        logging::warn("engine: model switch to {} failed: {}", model_id, res.error().message);
        outcome.error = to_error_result(res.error());
    }
    outcome.models = list_models();
    notify(state());
    return outcome;
}

EngineHealth EngineManager::get_health() {
    EnginePort* adapter = nullptr;
    {
        std::lock_guard lock(mutex_);
        adapter = active_;
    }
    if (!adapter) {
        return EngineHealth{.adapter = "none", .state = HealthState::Unavailable,
                            .error = "No engine configured"};
    }

    try {
        return adapter->get_health();
    } catch (const std::exception& e) {
        return EngineHealth{.adapter = adapter->name(), .state = HealthState::Error, .error = e.what()};
    }
}

EngineStatus EngineManager::get_status() {
    EnginePort* adapter = nullptr;
    EngineStatus status;
    {
        std::lock_guard lock(mutex_);
        adapter = active_;
        status.state = state_locked();
        status.forced_resets = watchdog_.forced_resets();
    }

    if (!adapter) {
        status.availability = {false, "No engine configured"};
        return status;
    }

    status.adapter = adapter->name();
    status.config = adapter->get_config();
    try {
        status.availability = adapter->is_available();
    } catch (const std::exception& e) {
        status.availability = {false, e.what()};
    }
    return status;
}

std::expected<Availability, ErrorResult> EngineManager::select_adapter(const std::string& name) {
    auto* adapter = find_adapter(name);
    if (!adapter) {
        return std::unexpected(ErrorResult{ErrorKind::NotConfigured, "Unknown adapter " + name});
    }

    Availability availability;
    try {
        availability = adapter->is_available();
    } catch (const std::exception& e) {
        availability = {false, e.what()};
    }

    {
        std::lock_guard lock(mutex_);
        active_ = adapter;
    }

    if (availability.available) {
        logging::info("engine: switched to {}", name);
    } else {
        logging::warn("engine: switched to {} but it is not available: {}", name, availability.error);
    }
    return availability;
}

std::expected<Availability, ErrorResult> EngineManager::test_connection(const std::string& name) {
    auto* adapter = find_adapter(name);
    if (!adapter) {
        return std::unexpected(ErrorResult{ErrorKind::NotConfigured, "Unknown adapter " + name});
    }

    Availability availability;
    try {
        availability = adapter->is_available();
    } catch (const std::exception& e) {
        availability = {false, e.what()};
    }

    if (availability.available) {
        std::lock_guard lock(mutex_);
        if (!active_ && initialized_) {
            active_ = adapter;
            logging::info("engine: {} is reachable, activating it", name);
        }
    }
    return availability;
}

std::expected<void, ErrorResult> EngineManager::configure_adapter(const std::string& name, const ConfigPatch& patch) {
    auto* adapter = find_adapter(name);
    if (!adapter) {
        return std::unexpected(ErrorResult{ErrorKind::NotConfigured, "Unknown adapter " + name});
    }

    auto res = adapter->configure(patch);
    if (!res) return std::unexpected(to_error_result(res.error()));
    return {};
}

std::optional<AdapterConfig> EngineManager::adapter_config(const std::string& name) const {
    auto* adapter = find_adapter(name);
    if (!adapter) return std::nullopt;
    return adapter->get_config();
}

void EngineManager::start_recording(const std::string& source) {
    bool armed = false;
    {
        std::lock_guard lock(mutex_);
        if (initialized_ && watchdog_.state() == ProcessingState::Ready) {
            watchdog_.enter(ProcessingState::Recording);
            armed = true;
        }
    }
    logging::info("engine: recording started ({})", source.empty() ? "unknown" : source);
    if (armed) notify(ManagerState::Recording);
}

void EngineManager::stop_recording(const std::string& source) {
    logging::info("engine: recording stopped ({})", source.empty() ? "unknown" : source);
}

std::optional<ProcessingState> EngineManager::check_watchdog() {
    std::optional<ProcessingState> stuck;
    {
        std::lock_guard lock(mutex_);
        stuck = watchdog_.poll();
    }
    if (!stuck) return std::nullopt;

    logging::warn("engine: stuck in {} for more than {}s, forcing ready", to_string(*stuck),
                  std::chrono::duration_cast<std::chrono::seconds>(options_.watchdog_timeout).count());
    notify(ManagerState::Ready);
    return stuck;
}

ManagerState EngineManager::state() const {
    std::lock_guard lock(mutex_);
    return state_locked();
}

std::optional<std::string> EngineManager::active_adapter_name() const {
    std::lock_guard lock(mutex_);
    if (!active_) return std::nullopt;
    return active_->name();
}

std::optional<TranscriptionResult> EngineManager::last_transcription() const {
    std::lock_guard lock(mutex_);
    return last_;
}

uint64_t EngineManager::generation() const {
    std::lock_guard lock(mutex_);
    return watchdog_.generation();
}

void EngineManager::set_state_listener(StateListener listener) {
    std::lock_guard lock(mutex_);
    listener_ = std::move(listener);
}

EnginePort* EngineManager::find_adapter(const std::string& name) const {
    std::lock_guard lock(mutex_);
    auto it = std::ranges::find_if(adapters_, [&](const auto& a) { return a->name() == name; });
    return it != adapters_.end() ? it->get() : nullptr;
}

ManagerState EngineManager::state_locked() const {
    if (!initialized_) return ManagerState::Uninitialized;
    switch (watchdog_.state()) {
        case ProcessingState::Ready: return ManagerState::Ready;
        case ProcessingState::Recording: return ManagerState::Recording;
        case ProcessingState::Processing: return ManagerState::Processing;
    }
    return ManagerState::Ready;
}

void EngineManager::notify(ManagerState state) {
    StateListener listener;
    {
        std::lock_guard lock(mutex_);
        listener = listener_;
    }
    if (listener) listener(state);
}
