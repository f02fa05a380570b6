#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Engine {
        std::vector<std::string> preference = {"remote", "local-sidecar"};
        uint32_t watchdog_seconds = 30;
    } engine;

    struct Remote {
        std::string config_file;   // empty: <config dir>/remote-adapter.json
    } remote;

    struct Local {
        std::string binary;        // empty: search <data dir>/sherpa-onnx-bin, then PATH
        std::string models_dir;    // empty: <data dir>/local-models
        std::string config_file;   // empty: <config dir>/local-sidecar.json
        int num_threads = 4;
        uint32_t timeout_seconds = 120;
    } local;

    struct Audio {
        std::string extension = "webm";
    } audio;

    struct Output {
        bool auto_copy = true;
    } output;

    struct Log {
        std::string file;          // empty: <temp dir>/echo-dictate-debug.log
    } log;

    static Config load(const std::string& path);
    static Config load_default();
};
