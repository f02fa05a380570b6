#include <catch2/catch_test_macros.hpp>

#include "engine/remote_adapter.hpp"
#include "fake_http_client.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <vector>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

struct RemoteFixture {
    test::TmpDir dir{"ed_test_remote"};
    std::shared_ptr<FakeHttpClient::State> http = std::make_shared<FakeHttpClient::State>();
    std::vector<std::chrono::milliseconds> sleeps;
    std::filesystem::path audio = dir / "clip.webm";

    RemoteFixture() { test::write_file(audio, "RIFFfakeaudio"); }

    std::filesystem::path config_path() const { return dir / "remote-adapter.json"; }

    std::unique_ptr<RemoteAdapter> make() {
        return std::make_unique<RemoteAdapter>(
            config_path(), std::make_unique<FakeHttpClient>(http),
            [this](std::chrono::milliseconds d) { sleeps.push_back(d); });
    }

    std::unique_ptr<RemoteAdapter> make_configured(const std::string& key = {}) {
        auto adapter = make();
        ConfigPatch patch;
        patch.endpoint_url = "http://gpu-box:8000";
        if (!key.empty()) patch.api_key = key;
        REQUIRE(adapter->configure(patch).has_value());
        return adapter;
    }
};

const FormField* form_field(const HttpRequest& req, const std::string& name) {
    auto it = std::ranges::find(req.form, name, &FormField::name);
    return it != req.form.end() ? &*it : nullptr;
}

bool has_header(const HttpRequest& req, const std::string& header) {
    return std::ranges::find(req.headers, header) != req.headers.end();
}

} // namespace

TEST_CASE("Remote adapter availability", "[remote]") {
    RemoteFixture fx;

    SECTION("NoEndpoint") {
        auto adapter = fx.make();
        auto a = adapter->is_available();
        REQUIRE_FALSE(a.available);
        REQUIRE(a.error == "No endpoint configured");
        REQUIRE(fx.http->requests.empty());
    }

    SECTION("ProbesModelsEndpoint") {
        auto adapter = fx.make_configured();
        fx.http->script.push_back(http_ok(R"({"data": []})"));

        auto a = adapter->is_available();
        REQUIRE(a.available);
        REQUIRE(fx.http->requests.size() == 1);
        REQUIRE(fx.http->requests[0].url == "http://gpu-box:8000/v1/models");
        REQUIRE(fx.http->requests[0].timeout == 10s);
    }

    SECTION("AuthFailureIsNotReachabilityFailure") {
        auto adapter = fx.make_configured("wrong-key");
        fx.http->script.push_back(http_status(401));
        REQUIRE(adapter->is_available().error == "Invalid API key");

        fx.http->script.push_back(http_status(403));
        REQUIRE(adapter->is_available().error == "Invalid API key");
    }

    SECTION("TransportFailuresMapToMessages") {
        auto adapter = fx.make_configured();

        fx.http->script.push_back(transport_failure(TransportFailure::ConnectionRefused));
        REQUIRE(adapter->is_available().error == "Connection refused - server may be offline");

        fx.http->script.push_back(transport_failure(TransportFailure::HostNotFound));
        REQUIRE(adapter->is_available().error == "Server not found - check the URL");

        fx.http->script.push_back(transport_failure(TransportFailure::Timeout));
        REQUIRE(adapter->is_available().error == "Connection timeout");
    }

    SECTION("OtherStatus") {
        auto adapter = fx.make_configured();
        fx.http->script.push_back(http_status(500));
        auto a = adapter->is_available();
        REQUIRE_FALSE(a.available);
        REQUIRE(a.error == "Server returned HTTP 500");
    }
}

TEST_CASE("Remote adapter transcription", "[remote]") {
    RemoteFixture fx;

    SECTION("NotConfigured") {
        auto adapter = fx.make();
        auto r = adapter->transcribe(fx.audio, {});
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::NotConfigured);
        REQUIRE(fx.http->requests.empty());
    }

    SECTION("SuccessfulRequest") {
        auto adapter = fx.make_configured("secret");
        fx.http->script.push_back(http_ok(R"({"text": "  hello world ", "language": "english", "duration": 2.5})"));

        auto r = adapter->transcribe(fx.audio, {});
        REQUIRE(r.has_value());
        REQUIRE(r->text == "hello world");
        REQUIRE(r->language == "en");
        REQUIRE(r->duration_s == 2.5);
        REQUIRE(r->model_id == "gpu-english");
        REQUIRE(r->engine_label == "remote (gpu-english)");

        REQUIRE(fx.http->requests.size() == 1);
        const auto& req = fx.http->requests[0];
        REQUIRE(req.method == "POST");
        REQUIRE(req.url == "http://gpu-box:8000/v1/audio/transcriptions");
        REQUIRE(req.timeout == 120s);
        REQUIRE(has_header(req, "Authorization: Bearer secret"));

        auto* file = form_field(req, "file");
        REQUIRE(file != nullptr);
        REQUIRE(file->data == "RIFFfakeaudio");
        REQUIRE(file->filename == "recording.webm");
        REQUIRE(form_field(req, "model")->data == "gpu-english");
        REQUIRE(form_field(req, "response_format")->data == "verbose_json");
        REQUIRE(form_field(req, "language")->data == "en");
    }

    SECTION("NoAuthorizationWithoutKey") {
        auto adapter = fx.make_configured();
        fx.http->script.push_back(http_ok(R"({"text": "hi"})"));
        REQUIRE(adapter->transcribe(fx.audio, {}).has_value());
        auto& headers = fx.http->requests[0].headers;
        REQUIRE(std::ranges::none_of(headers, [](const std::string& h) { return h.starts_with("Authorization"); }));
    }

    SECTION("FullTranscriptionUrlIsAccepted") {
        auto adapter = fx.make();
        ConfigPatch patch;
        patch.endpoint_url = "https://stt.example.com/v1/audio/transcriptions/";
        REQUIRE(adapter->configure(patch).has_value());

        fx.http->script.push_back(http_ok(R"({"text": "ok"})"));
        REQUIRE(adapter->transcribe(fx.audio, {}).has_value());
        REQUIRE(fx.http->requests[0].url == "https://stt.example.com/v1/audio/transcriptions");
    }

    SECTION("OptionsOverrideModelAndLanguage") {
        auto adapter = fx.make_configured();
        fx.http->script.push_back(
            http_ok(R"({"transcription": "bonjour", "detected_language": "fr"})"));

        auto r = adapter->transcribe(fx.audio, {.model = "Systran/faster-whisper-large-v3", .language = "fr"});
        REQUIRE(r.has_value());
        REQUIRE(r->text == "bonjour");
        REQUIRE(r->language == "fr");
        REQUIRE(r->engine_label == "remote (faster-whisper-large-v3)");
        REQUIRE(form_field(fx.http->requests[0], "language")->data == "fr");
    }

    SECTION("TextIsPostProcessed") {
        auto adapter = fx.make_configured();
        fx.http->script.push_back(http_ok(R"({"text": "Thank you."})"));

        auto r = adapter->transcribe(fx.audio, {});
        REQUIRE(r.has_value());
        REQUIRE(r->text.empty());
    }

    SECTION("RetriesAreBounded") {
        auto adapter = fx.make_configured();
        for (int i = 0; i < 3; i++) fx.http->script.push_back(http_status(503, "busy"));

        auto r = adapter->transcribe(fx.audio, {});
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::ServerError);
        REQUIRE(fx.http->requests.size() == 3);
        REQUIRE(fx.sleeps == std::vector<std::chrono::milliseconds>{1000ms, 2000ms});
    }

    SECTION("RecoversAfterTransientFailure") {
        auto adapter = fx.make_configured();
        fx.http->script.push_back(http_status(502));
        fx.http->script.push_back(transport_failure(TransportFailure::ConnectionReset));
        fx.http->script.push_back(http_ok(R"({"text": "third time lucky"})"));

        auto r = adapter->transcribe(fx.audio, {});
        REQUIRE(r.has_value());
        REQUIRE(r->text == "third time lucky");
        REQUIRE(fx.http->requests.size() == 3);
    }

    SECTION("AuthFailureIsNotRetried") {
        auto adapter = fx.make_configured("bad");
        fx.http->script.push_back(http_status(401));

        auto r = adapter->transcribe(fx.audio, {});
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::AuthFailed);
        REQUIRE(fx.http->requests.size() == 1);
        REQUIRE(fx.sleeps.empty());
    }

    SECTION("NotFoundIsModelUnavailable") {
        auto adapter = fx.make_configured();
        fx.http->script.push_back(http_status(404, R"({"detail": "model gpu-english is not loaded"})"));

        auto r = adapter->transcribe(fx.audio, {});
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::ModelUnavailable);
        REQUIRE(r.error().message == "HTTP 404: model gpu-english is not loaded");
        REQUIRE(fx.http->requests.size() == 1);
        REQUIRE(fx.sleeps.empty());
    }

    SECTION("OtherClientErrorIsNotRetried") {
        auto adapter = fx.make_configured();
        fx.http->script.push_back(http_status(413));

        auto r = adapter->transcribe(fx.audio, {});
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::ServerError);
        REQUIRE(fx.http->requests.size() == 1);
    }

    SECTION("RefusedConnectionIsNotRetried") {
        auto adapter = fx.make_configured();
        fx.http->script.push_back(transport_failure(TransportFailure::ConnectionRefused));

        auto r = adapter->transcribe(fx.audio, {});
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::Unreachable);
        REQUIRE(fx.http->requests.size() == 1);
    }

    SECTION("MalformedResponse") {
        auto adapter = fx.make_configured();
        fx.http->script.push_back(http_ok("<html>gateway</html>"));

        auto r = adapter->transcribe(fx.audio, {});
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::MalformedResponse);
    }

    SECTION("MissingAudioFile") {
        auto adapter = fx.make_configured();
        auto r = adapter->transcribe(fx.dir / "missing.webm", {});
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::Internal);
        REQUIRE(fx.http->requests.empty());
    }
}

TEST_CASE("Remote adapter models", "[remote]") {
    RemoteFixture fx;
    auto adapter = fx.make_configured();

    SECTION("ListModels") {
        fx.http->script.push_back(http_ok(R"({"data": [
            {"id": "gpu-english", "label": "English (GPU)", "active": true},
            {"id": "gpu-multi", "group": "gpu"},
            {"id": "cpu-small", "group": "local"},
            {"label": "no id, skipped"}
        ]})"));

        auto models = adapter->list_models();
        REQUIRE(models.size() == 3);
        REQUIRE(models[0].id == "gpu-english");
        REQUIRE(models[0].label == "English (GPU)");
        REQUIRE(models[0].state == ModelState::Loaded);
        REQUIRE(models[1].label == "gpu-multi");
        REQUIRE(models[1].group == ModelGroup::Gpu);
        REQUIRE(models[1].state == ModelState::Available);
        REQUIRE(models[2].group == ModelGroup::Local);
    }

    SECTION("ListModelsFailureIsEmpty") {
        fx.http->script.push_back(transport_failure(TransportFailure::Timeout));
        REQUIRE(adapter->list_models().empty());
    }

    SECTION("SwitchCommitsAfterSuccess") {
        fx.http->script.push_back(http_ok(R"({"status": "ok"})"));

        REQUIRE(adapter->switch_model("gpu-multi").has_value());
        const auto& req = fx.http->requests.back();
        REQUIRE(req.method == "POST");
        REQUIRE(req.url == "http://gpu-box:8000/v1/models/switch");
        REQUIRE(req.timeout == 60s);
        REQUIRE(json::parse(req.body) == json{{"model_id", "gpu-multi"}});
        REQUIRE(std::get<RemoteConfig>(adapter->get_config()).selected_model == "gpu-multi");

        // Persisted
        auto reloaded = fx.make();
        REQUIRE(std::get<RemoteConfig>(reloaded->get_config()).selected_model == "gpu-multi");
    }

    SECTION("SwitchRejected") {
        fx.http->script.push_back(http_status(400, R"({"error": "unknown model gpu-nope"})"));

        auto r = adapter->switch_model("gpu-nope");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::ModelUnavailable);
        REQUIRE(r.error().message == "unknown model gpu-nope");
        REQUIRE(std::get<RemoteConfig>(adapter->get_config()).selected_model == "gpu-english");
    }

    SECTION("SwitchKeepsModelWhenSaveFails") {
        // A directory where the file should be makes the save fail.
        std::filesystem::remove(fx.config_path());
        std::filesystem::create_directory(fx.config_path());
        fx.http->script.push_back(http_ok(R"({"status": "ok"})"));

        auto r = adapter->switch_model("gpu-multi");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::Internal);
        REQUIRE(std::get<RemoteConfig>(adapter->get_config()).selected_model == "gpu-english");
    }

    SECTION("SwitchServerErrorWithoutBody") {
        for (int i = 0; i < 3; i++) fx.http->script.push_back(http_status(503));

        auto r = adapter->switch_model("gpu-multi");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::ServerError);
        REQUIRE(r.error().message == "Model switch failed: HTTP 503");
    }
}

TEST_CASE("Remote adapter health", "[remote]") {
    RemoteFixture fx;

    SECTION("Loaded") {
        auto adapter = fx.make_configured();
        fx.http->script.push_back(http_ok(R"({"status": "ok", "engine": {"state": "loaded", "model_id": "gpu-english"}})"));
        fx.http->script.push_back(http_ok(R"({"data": [{"id": "a"}, {"id": "b"}]})"));

        auto h = adapter->get_health();
        REQUIRE(h.adapter == "remote");
        REQUIRE(h.state == HealthState::Loaded);
        REQUIRE(h.model == "gpu-english");
        REQUIRE(h.extra["modelCount"] == 2);
        REQUIRE(h.extra["server"]["status"] == "ok");
        REQUIRE(fx.http->requests[0].url == "http://gpu-box:8000/health");
    }

    SECTION("DegradedWhenEngineNotLoaded") {
        auto adapter = fx.make_configured();
        fx.http->script.push_back(http_ok(R"({"engine": {"state": "loading"}})"));

        auto h = adapter->get_health();
        REQUIRE(h.state == HealthState::Degraded);
        REQUIRE_FALSE(h.model.has_value());
    }

    SECTION("UnreachableServer") {
        auto adapter = fx.make_configured();
        fx.http->script.push_back(transport_failure(TransportFailure::ConnectionRefused));

        auto h = adapter->get_health();
        REQUIRE(h.state == HealthState::Unavailable);
        REQUIRE(h.error == "Connection refused - server may be offline");
    }

    SECTION("NotConfigured") {
        auto adapter = fx.make();
        REQUIRE(adapter->get_health().state == HealthState::Unavailable);
    }
}

TEST_CASE("Remote adapter config file", "[remote]") {
    RemoteFixture fx;

    SECTION("DefaultsWithoutFile") {
        auto adapter = fx.make();
        auto c = std::get<RemoteConfig>(adapter->get_config());
        REQUIRE(c.endpoint_url.empty());
        REQUIRE(c.selected_model == "gpu-english");
        REQUIRE_FALSE(c.is_configured());
    }

    SECTION("RoundTrip") {
        {
            auto adapter = fx.make();
            ConfigPatch patch;
            patch.endpoint_url = "http://10.0.0.5:9000";
            patch.api_key = "k-123";
            patch.selected_model = "gpu-multi";
            patch.language = "de";
            REQUIRE(adapter->configure(patch).has_value());
        }

        auto reloaded = fx.make();
        auto c = std::get<RemoteConfig>(reloaded->get_config());
        REQUIRE(c.endpoint_url == "http://10.0.0.5:9000");
        REQUIRE(c.api_key == "k-123");
        REQUIRE(c.selected_model == "gpu-multi");
        REQUIRE(c.language == "de");
        REQUIRE(c.is_configured());
    }

    SECTION("EmptyFieldsSavedAsNull") {
        auto adapter = fx.make_configured();
        auto saved = json::parse(test::read_file(fx.config_path()));
        REQUIRE(saved["endpointUrl"] == "http://gpu-box:8000");
        REQUIRE(saved["apiKey"].is_null());
        REQUIRE(saved["selectedModel"] == "gpu-english");
    }

    SECTION("ValuesAreKeptAsGiven") {
        auto adapter = fx.make();
        ConfigPatch patch;
        patch.endpoint_url = "http://gpu-box:8000/ ";
        patch.api_key = " k-123";
        REQUIRE(adapter->configure(patch).has_value());

        auto c = std::get<RemoteConfig>(adapter->get_config());
        REQUIRE(c.endpoint_url == "http://gpu-box:8000/ ");
        REQUIRE(c.api_key == " k-123");

        auto reloaded = std::get<RemoteConfig>(fx.make()->get_config());
        REQUIRE(reloaded.endpoint_url == c.endpoint_url);
        REQUIRE(reloaded.api_key == c.api_key);
    }

    SECTION("ClearedModelFallsBackToDefault") {
        auto adapter = fx.make_configured();
        ConfigPatch patch;
        patch.selected_model = "gpu-multi";
        REQUIRE(adapter->configure(patch).has_value());

        patch.selected_model = "";
        REQUIRE(adapter->configure(patch).has_value());
        REQUIRE(std::get<RemoteConfig>(adapter->get_config()).selected_model == "gpu-english");
        REQUIRE(std::get<RemoteConfig>(fx.make()->get_config()).selected_model == "gpu-english");
    }

    SECTION("ConfigureKeepsPreviousWhenSaveFails") {
        auto adapter = fx.make_configured();
        std::filesystem::remove(fx.config_path());
        std::filesystem::create_directory(fx.config_path());

        ConfigPatch patch;
        patch.endpoint_url = "http://elsewhere:8000";
        auto r = adapter->configure(patch);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == ErrorKind::Internal);
        REQUIRE(std::get<RemoteConfig>(adapter->get_config()).endpoint_url == "http://gpu-box:8000");
    }

    SECTION("FileIsOwnerOnly") {
        test::write_file(fx.config_path(), "{}");
        std::filesystem::permissions(fx.config_path(), std::filesystem::perms::owner_all |
                                                           std::filesystem::perms::group_read |
                                                           std::filesystem::perms::others_read);
        fx.make_configured("secret");

        auto perms = std::filesystem::status(fx.config_path()).permissions() & std::filesystem::perms::all;
        REQUIRE(perms == (std::filesystem::perms::owner_read | std::filesystem::perms::owner_write));
        REQUIRE(json::parse(test::read_file(fx.config_path()))["apiKey"] == "secret");
    }

    SECTION("GarbageFileFallsBackToDefaults") {
        test::write_file(fx.config_path(), "{not json");
        auto adapter = fx.make();
        REQUIRE(std::get<RemoteConfig>(adapter->get_config()).selected_model == "gpu-english");
    }

    SECTION("PartialFileKeepsDefaults") {
        test::write_file(fx.config_path(), R"({"endpointUrl": "http://box", "selectedModel": null})");
        auto adapter = fx.make();
        auto c = std::get<RemoteConfig>(adapter->get_config());
        REQUIRE(c.endpoint_url == "http://box");
        REQUIRE(c.selected_model == "gpu-english");
    }
}
