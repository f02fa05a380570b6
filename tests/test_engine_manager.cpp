#include <catch2/catch_test_macros.hpp>

#include "engine/engine_manager.hpp"
#include "fake_adapter.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <vector>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

using Result = std::expected<TranscriptionResult, EngineError>;

struct ManagerFixture {
    test::TmpDir dir{"ed_test_engine"};
    AudioArtifactManager artifacts{dir.path};
    Watchdog::Clock::time_point now = Watchdog::Clock::time_point{} + 1h;
    std::shared_ptr<FakeAdapter::State> remote = std::make_shared<FakeAdapter::State>();
    std::shared_ptr<FakeAdapter::State> local = std::make_shared<FakeAdapter::State>();
    EngineManager manager{artifacts, EngineManagerOptions{.now = [this] { return now; }}};
    std::vector<uint8_t> audio = {'w', 'e', 'b', 'm', 0x00, 0xff};

    // Registered local first so that selection has to follow the preference
    // list rather than registration order.
    ManagerFixture() {
        manager.add_adapter(std::make_unique<FakeAdapter>("local-sidecar", local));
        manager.add_adapter(std::make_unique<FakeAdapter>("remote", remote));
    }
};

} // namespace

TEST_CASE("Adapter selection", "[engine]") {
    ManagerFixture fx;

    SECTION("PrefersRemote") {
        REQUIRE(fx.manager.initialize() == "remote");
        REQUIRE(fx.manager.active_adapter_name() == "remote");
        REQUIRE(fx.manager.state() == ManagerState::Ready);
        REQUIRE(fx.remote->probe_calls == 1);
        REQUIRE(fx.local->probe_calls == 1);
    }

    SECTION("FallsBackToLocal") {
        fx.remote->availability = {false, "Connection refused - server may be offline"};
        REQUIRE(fx.manager.initialize() == "local-sidecar");
    }

    SECTION("UnlistedAdapterIsLastResort") {
        auto extra = std::make_shared<FakeAdapter::State>();
        fx.manager.add_adapter(std::make_unique<FakeAdapter>("experimental", extra));
        fx.remote->availability = {false, "down"};
        fx.local->availability = {false, "no model"};

        REQUIRE(fx.manager.initialize() == "experimental");
    }

    SECTION("NothingAvailable") {
        fx.remote->availability = {false, "down"};
        fx.local->availability = {false, "no model"};

        REQUIRE_FALSE(fx.manager.initialize().has_value());
        REQUIRE(fx.manager.state() == ManagerState::Ready);

        auto r = fx.manager.process_audio(fx.audio);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::NotConfigured);
        REQUIRE(fx.artifacts.count_artifacts() == 0);

        auto health = fx.manager.get_health();
        REQUIRE(health.adapter == "none");
        REQUIRE(health.state == HealthState::Unavailable);
        REQUIRE(fx.manager.list_models().empty());
    }

    SECTION("ProcessBeforeInitialize") {
        REQUIRE(fx.manager.state() == ManagerState::Uninitialized);
        auto r = fx.manager.process_audio(fx.audio);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::Internal);
    }

    SECTION("SelectUnknownAdapter") {
        fx.manager.initialize();
        auto r = fx.manager.select_adapter("cloud");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::NotConfigured);
        REQUIRE(fx.manager.active_adapter_name() == "remote");
    }

    SECTION("SelectUnavailableAdapterStillActivates") {
        fx.manager.initialize();
        fx.local->availability = {false, "No local model downloaded"};

        auto r = fx.manager.select_adapter("local-sidecar");
        REQUIRE(r.has_value());
        REQUIRE_FALSE(r->available);
        REQUIRE(r->error == "No local model downloaded");
        REQUIRE(fx.manager.active_adapter_name() == "local-sidecar");
    }

    SECTION("TestConnectionActivatesWhenNothingActive") {
        fx.remote->availability = {false, "down"};
        fx.local->availability = {false, "no model"};
        fx.manager.initialize();

        fx.remote->availability = {true, {}};
        auto r = fx.manager.test_connection();
        REQUIRE(r.has_value());
        REQUIRE(r->available);
        REQUIRE(fx.manager.active_adapter_name() == "remote");
    }

    SECTION("TestConnectionDoesNotStealActiveAdapter") {
        fx.remote->availability = {false, "down"};
        fx.manager.initialize();
        REQUIRE(fx.manager.active_adapter_name() == "local-sidecar");

        fx.remote->availability = {true, {}};
        REQUIRE(fx.manager.test_connection("remote")->available);
        REQUIRE(fx.manager.active_adapter_name() == "local-sidecar");
    }
}

TEST_CASE("Audio processing", "[engine]") {
    ManagerFixture fx;
    fx.manager.initialize();

    std::vector<ManagerState> transitions;
    fx.manager.set_state_listener([&](ManagerState s) { transitions.push_back(s); });

    SECTION("Success") {
        auto r = fx.manager.process_audio(fx.audio);
        REQUIRE(r.has_value());
        REQUIRE(r->text == "hello from remote");
        REQUIRE(r->engine_label == "remote (model-a)");

        REQUIRE(fx.remote->audio_existed);
        REQUIRE(fx.remote->audio_bytes == std::string(fx.audio.begin(), fx.audio.end()));
        REQUIRE_FALSE(std::filesystem::exists(fx.remote->last_audio));
        REQUIRE(fx.artifacts.count_artifacts() == 0);

        REQUIRE(fx.manager.last_transcription()->text == "hello from remote");
        REQUIRE(fx.manager.state() == ManagerState::Ready);
        REQUIRE(transitions == std::vector{ManagerState::Processing, ManagerState::Ready});
    }

    SECTION("OptionsArePassedThrough") {
        auto r = fx.manager.process_audio(fx.audio, {.model = "model-b", .language = "de"});
        REQUIRE(r.has_value());
        REQUIRE(r->model_id == "model-b");
        REQUIRE(r->language == "de");
    }

    SECTION("FailureDoesNotFallOver") {
        fx.remote->on_transcribe = [](const std::filesystem::path&) -> Result {
            return std::unexpected(EngineError{ErrorKind::Unreachable, "Connection refused - server may be offline"});
        };

        auto r = fx.manager.process_audio(fx.audio);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::Unreachable);
        REQUIRE(fx.local->transcribe_calls == 0);
        REQUIRE(fx.artifacts.count_artifacts() == 0);
        REQUIRE(fx.manager.state() == ManagerState::Ready);
        REQUIRE_FALSE(fx.manager.last_transcription().has_value());
    }

    SECTION("FailureKeepsPreviousResult") {
        REQUIRE(fx.manager.process_audio(fx.audio).has_value());
        fx.remote->on_transcribe = [](const std::filesystem::path&) -> Result {
            return std::unexpected(EngineError{ErrorKind::ServerError, "HTTP 500"});
        };
        REQUIRE_FALSE(fx.manager.process_audio(fx.audio).has_value());
        REQUIRE(fx.manager.last_transcription()->text == "hello from remote");
    }

    SECTION("ThrowingAdapterIsContained") {
        fx.remote->on_transcribe = [](const std::filesystem::path&) -> Result {
            throw std::runtime_error("adapter blew up");
        };

        auto r = fx.manager.process_audio(fx.audio);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::Internal);
        REQUIRE(r.error().message == "adapter blew up");
        REQUIRE(fx.artifacts.count_artifacts() == 0);
        REQUIRE(fx.manager.state() == ManagerState::Ready);
    }

    SECTION("ThrowingCleanupIsContained") {
        EngineManager manager{fx.artifacts, EngineManagerOptions{
            .now = [&fx] { return fx.now; },
            .clean = [](std::string_view) -> std::string { throw std::runtime_error("regex too complex"); },
        }};
        manager.add_adapter(std::make_unique<FakeAdapter>("remote", fx.remote));
        REQUIRE(manager.initialize() == "remote");

        auto r = manager.process_audio(fx.audio);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::Internal);
        REQUIRE(r.error().message == "regex too complex");
        REQUIRE(manager.state() == ManagerState::Ready);
        REQUIRE_FALSE(manager.last_transcription().has_value());
        REQUIRE(fx.artifacts.count_artifacts() == 0);

        // Not wedged: the next call is accepted rather than rejected as busy.
        auto again = manager.process_audio(fx.audio);
        REQUIRE(again.error().message == "regex too complex");
        REQUIRE(fx.remote->transcribe_calls == 2);
    }

    SECTION("TextIsCleaned") {
        fx.remote->on_transcribe = [](const std::filesystem::path&) -> Result {
            return TranscriptionResult{.text = "Thank you. Thank you. Thank you.", .language = "en"};
        };
        auto r = fx.manager.process_audio(fx.audio);
        REQUIRE(r.has_value());
        REQUIRE(r->text.empty());
    }

    SECTION("OneTranscriptionAtATime") {
        std::optional<ProcessResult> nested;
        fx.remote->on_transcribe = [&](const std::filesystem::path&) -> Result {
            REQUIRE(fx.manager.state() == ManagerState::Processing);
            nested = fx.manager.process_audio(fx.audio);
            return TranscriptionResult{.text = "outer"};
        };

        auto r = fx.manager.process_audio(fx.audio);
        REQUIRE(r.has_value());
        REQUIRE(nested.has_value());
        REQUIRE_FALSE(nested->has_value());
        REQUIRE(nested->error().message == "A transcription is already in progress");
        REQUIRE(fx.remote->transcribe_calls == 1);
    }

    SECTION("ResultAfterWatchdogResetIsDiscarded") {
        fx.remote->on_transcribe = [&](const std::filesystem::path&) -> Result {
            fx.now += 31s;
            REQUIRE(fx.manager.check_watchdog() == ProcessingState::Processing);
            REQUIRE(fx.manager.state() == ManagerState::Ready);
            return TranscriptionResult{.text = "too late"};
        };

        auto r = fx.manager.process_audio(fx.audio);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::Timeout);
        REQUIRE_FALSE(fx.manager.last_transcription().has_value());
        REQUIRE(fx.manager.generation() == 1);
        REQUIRE(fx.artifacts.count_artifacts() == 0);
        REQUIRE(fx.manager.get_status().forced_resets == 1);

        // The manager is usable again afterwards
        fx.remote->on_transcribe = nullptr;
        auto next = fx.manager.process_audio(fx.audio);
        REQUIRE(next.has_value());
        REQUIRE(fx.manager.last_transcription()->text == "hello from remote");
    }
}

TEST_CASE("Recording watchdog", "[engine]") {
    ManagerFixture fx;
    fx.manager.initialize();

    SECTION("StuckRecordingIsReset") {
        fx.manager.start_recording("test");
        REQUIRE(fx.manager.state() == ManagerState::Recording);

        fx.now += 10s;
        REQUIRE_FALSE(fx.manager.check_watchdog().has_value());

        fx.now += 25s;
        REQUIRE(fx.manager.check_watchdog() == ProcessingState::Recording);
        REQUIRE(fx.manager.state() == ManagerState::Ready);
        REQUIRE_FALSE(fx.manager.check_watchdog().has_value());
    }

    SECTION("ProcessingAfterRecording") {
        fx.manager.start_recording("test");
        fx.manager.stop_recording("test");
        REQUIRE(fx.manager.process_audio(fx.audio).has_value());
        REQUIRE(fx.manager.state() == ManagerState::Ready);
    }
}

TEST_CASE("Model switching", "[engine]") {
    ManagerFixture fx;
    fx.manager.initialize();

    SECTION("Success") {
        std::vector<ModelInfo> during;
        fx.remote->on_switch = [&] { during = fx.manager.list_models(); };

        auto outcome = fx.manager.switch_model("model-b");
        REQUIRE(outcome.success);
        REQUIRE_FALSE(outcome.error.has_value());
        REQUIRE(fx.remote->switch_requests == std::vector<std::string>{"model-b"});

        REQUIRE(during.size() == 2);
        REQUIRE(during[1].state == ModelState::Switching);

        REQUIRE(outcome.models[0].state == ModelState::Available);
        REQUIRE(outcome.models[1].state == ModelState::Loaded);
        REQUIRE(fx.manager.list_models()[1].state == ModelState::Loaded);
    }

    SECTION("RejectionResyncsModelList") {
        fx.remote->switch_error = EngineError{ErrorKind::ModelUnavailable, "unknown model model-b"};

        auto outcome = fx.manager.switch_model("model-b");
        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.error->kind == ErrorKind::ModelUnavailable);
        REQUIRE(outcome.error->message == "unknown model model-b");
        REQUIRE(outcome.models[0].state == ModelState::Loaded);
        REQUIRE(outcome.models[1].state == ModelState::Available);
        REQUIRE(std::get<RemoteConfig>(*fx.manager.adapter_config("remote")).selected_model == "model-a");
    }

    SECTION("NoActiveAdapter") {
        ManagerFixture empty;
        empty.remote->availability = {false, "down"};
        empty.local->availability = {false, "down"};
        empty.manager.initialize();

        auto outcome = empty.manager.switch_model("model-b");
        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.error->kind == ErrorKind::NotConfigured);
    }
}

TEST_CASE("Engine status and config", "[engine]") {
    ManagerFixture fx;
    fx.manager.initialize();

    SECTION("StatusJson") {
        json j = fx.manager.get_status();
        REQUIRE(j["state"] == "ready");
        REQUIRE(j["adapter"] == "remote");
        REQUIRE(j["available"] == true);
        REQUIRE(j["config"]["selectedModel"] == "model-a");
        REQUIRE(j["forcedResets"] == 0);
        REQUIRE_FALSE(j.contains("error"));
    }

    SECTION("StatusReportsUnavailability") {
        fx.remote->availability = {false, "Invalid API key"};
        json j = fx.manager.get_status();
        REQUIRE(j["available"] == false);
        REQUIRE(j["error"] == "Invalid API key");
    }

    SECTION("ConfigureNamedAdapter") {
        ConfigPatch patch;
        patch.selected_model = "model-b";
        REQUIRE(fx.manager.configure_adapter("remote", patch).has_value());
        REQUIRE(fx.remote->last_patch.has_value());
        REQUIRE_FALSE(fx.local->last_patch.has_value());

        auto missing = fx.manager.configure_adapter("cloud", patch);
        REQUIRE_FALSE(missing.has_value());
        REQUIRE(missing.error().kind == ErrorKind::NotConfigured);
        REQUIRE_FALSE(fx.manager.adapter_config("cloud").has_value());
    }

    SECTION("ErrorResultJson") {
        json j = ErrorResult{ErrorKind::AuthFailed, "Invalid API key"};
        REQUIRE(j == json{{"kind", "auth_failed"}, {"message", "Invalid API key"}});
    }
}
