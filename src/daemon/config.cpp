#include "config.hpp"

#include "logging.hpp"
#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        logging::warn("config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("engine")) {
            auto& e = j["engine"];
            if (e.contains("preference")) cfg.engine.preference = e["preference"].get<std::vector<std::string>>();
            if (e.contains("watchdog_seconds")) cfg.engine.watchdog_seconds = e["watchdog_seconds"].get<uint32_t>();
        }

        if (j.contains("remote")) {
            auto& r = j["remote"];
            if (r.contains("config_file")) cfg.remote.config_file = r["config_file"].get<std::string>();
        }

        if (j.contains("local")) {
            auto& l = j["local"];
            if (l.contains("binary")) cfg.local.binary = l["binary"].get<std::string>();
            if (l.contains("models_dir")) cfg.local.models_dir = l["models_dir"].get<std::string>();
            if (l.contains("config_file")) cfg.local.config_file = l["config_file"].get<std::string>();
            if (l.contains("num_threads")) cfg.local.num_threads = l["num_threads"].get<int>();
            if (l.contains("timeout_seconds")) cfg.local.timeout_seconds = l["timeout_seconds"].get<uint32_t>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("extension")) cfg.audio.extension = a["extension"].get<std::string>();
        }

        if (j.contains("output")) {
            auto& o = j["output"];
            if (o.contains("auto_copy")) cfg.output.auto_copy = o["auto_copy"].get<bool>();
        }

        if (j.contains("log")) {
            auto& l = j["log"];
            if (l.contains("file")) cfg.log.file = l["file"].get<std::string>();
        }

    } catch (const json::exception& e) {
        logging::warn("config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
