#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

// Three 120s attempts plus backoff.
constexpr int kSlowTimeoutMs = 400'000;
constexpr int kProbeTimeoutMs = 60'000;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  transcribe FILE [--model ID] [--language CODE]   Transcribe an audio file");
    std::println(stderr, "  start [--source NAME]                          Mark recording started");
    std::println(stderr, "  stop [--source NAME]                           Mark recording stopped");
    std::println(stderr, "  status                                         Show engine status");
    std::println(stderr, "  last                                           Print the last transcription");
    std::println(stderr, "  models                                         List models of the active engine");
    std::println(stderr, "  switch-model ID                                Switch the active engine's model");
    std::println(stderr, "  health                                         Show engine health");
    std::println(stderr, "  configure [--url URL] [--key KEY] [--model ID] [--language CODE] [--local-model ID]");
    std::println(stderr, "  test [--adapter NAME]                          Test an adapter's connection");
    std::println(stderr, "  config                                         Show adapter configuration");
    std::println(stderr, "  use ADAPTER                                    Select remote or local-sidecar");
    std::println(stderr, "  copy                                           Copy the last transcription");
    std::println(stderr, "  watch                                          Print daemon events");
}

static bool read_file(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return false;
    out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    return true;
}

static void print_transcription(const json& t) {
    if (t.is_null()) {
        std::println("(no transcription yet)");
        return;
    }
    std::println("{}", t.value("text", ""));
}

static void print_models(const json& models) {
    for (auto& m : models) {
        std::println("{:<20} {:<10} {:<10} {}", m.value("id", ""), m.value("group", ""),
                     m.value("state", ""), m.value("label", ""));
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> positional;
    std::string model, language, source, url, key, local_model, adapter;
    bool has_url = false, has_key = false, has_model = false, has_language = false, has_local = false;

    // Parse optional args
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        auto take = [&](std::string& dst, bool* seen = nullptr) {
            if (i + 1 < argc) {
                dst = argv[++i];
                if (seen) *seen = true;
            }
        };
        if (arg == "--model") take(model, &has_model);
        else if (arg == "--language") take(language, &has_language);
        else if (arg == "--source") take(source);
        else if (arg == "--url") take(url, &has_url);
        else if (arg == "--key") take(key, &has_key);
        else if (arg == "--local-model") take(local_model, &has_local);
        else if (arg == "--adapter") take(adapter);
        else positional.push_back(arg);
    }

    // Build command JSON
    json cmd;
    int timeout_ms = 30000;

    if (command == "transcribe") {
        if (positional.empty()) {
            std::println(stderr, "transcribe needs a FILE");
            return 1;
        }
        std::vector<uint8_t> audio;
        if (!read_file(positional[0], audio)) {
            std::println(stderr, "Could not read {}", positional[0]);
            return 1;
        }
        cmd = {{"cmd", "process_audio"}, {"audio", audio}};
        if (!model.empty()) cmd["model"] = model;
        if (!language.empty()) cmd["language"] = language;
        timeout_ms = kSlowTimeoutMs;
    } else if (command == "start" || command == "stop") {
        cmd = {{"cmd", command}, {"source", source.empty() ? "cli" : source}};
    } else if (command == "status" || command == "health" || command == "models") {
        cmd = {{"cmd", command}};
        timeout_ms = kProbeTimeoutMs;
    } else if (command == "last") {
        cmd = {{"cmd", "last"}};
    } else if (command == "switch-model") {
        if (positional.empty()) {
            std::println(stderr, "switch-model needs a model ID");
            return 1;
        }
        cmd = {{"cmd", "switch_model"}, {"model_id", positional[0]}};
        timeout_ms = kSlowTimeoutMs;
    } else if (command == "configure") {
        cmd = {{"cmd", "configure"}};
        if (has_url) cmd["endpointUrl"] = url;
        if (has_key) cmd["apiKey"] = key;
        if (has_model) cmd["selectedModel"] = model;
        if (has_language) cmd["language"] = language;
        if (has_local) cmd["activeModelId"] = local_model;
    } else if (command == "test") {
        cmd = {{"cmd", "test_connection"}};
        if (!adapter.empty()) cmd["adapter"] = adapter;
        timeout_ms = kProbeTimeoutMs;
    } else if (command == "config") {
        cmd = {{"cmd", "get_config"}};
    } else if (command == "use") {
        if (positional.empty()) {
            std::println(stderr, "use needs an adapter name");
            return 1;
        }
        cmd = {{"cmd", "select_adapter"}, {"adapter", positional[0]}};
        timeout_ms = kProbeTimeoutMs;
    } else if (command == "copy") {
        cmd = {{"cmd", "copy_last"}};
    } else if (command == "watch") {
        cmd = {{"cmd", "subscribe"}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    // Connect and send
    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is echo-dictate running?");
        return 1;
    }

    auto reply = client.request(cmd, timeout_ms);
    if (!reply) {
        std::println(stderr, "{}", reply.error());
        return 1;
    }
    json response = std::move(*reply);

    // Display response
    auto status = response.value("status", "");

    if (status == "error") {
        auto kind = response.value("kind", "");
        std::println(stderr, "Error{}: {}", kind.empty() ? "" : " (" + kind + ")",
                     response.value("message", "unknown error"));
        if (command == "switch-model" && response.contains("models")) {
            print_models(response["models"]);
        }
        return 1;
    }

    if (command == "transcribe" || command == "last") {
        print_transcription(response.value("transcription", json(nullptr)));
    } else if (command == "models") {
        print_models(response.value("models", json::array()));
    } else if (command == "status") {
        std::println("State:     {}", response.value("state", "unknown"));
        auto active = response.value("adapter", json(nullptr));
        std::println("Engine:    {}", active.is_string() ? active.get<std::string>() : "none");
        std::println("Available: {}", response.value("available", false) ? "yes" : "no");
        if (response.contains("error")) std::println("Error:     {}", response.value("error", ""));
    } else if (command == "health" || command == "config") {
        std::println("{}", response.value(command == "health" ? "health" : "config", json::object()).dump(2));
    } else if (command == "test" || command == "use") {
        bool available = response.value("available", false);
        std::println("{}: {}", response.value("adapter", ""), available ? "available" : "unavailable");
        if (response.contains("error")) std::println("  {}", response.value("error", ""));
        return available ? 0 : 2;
    } else if (command == "watch") {
        std::println("state: {}", response.value("state", "unknown"));
        json event;
        while (client.recv(event, -1)) {
            std::println("{}", event.dump());
        }
    } else {
        std::println("OK");
    }

    return 0;
}
