#include "logging.hpp"

#include <chrono>
#include <fstream>
#include <mutex>
#include <print>

namespace logging {

namespace {

struct State {
    std::mutex mutex;
    bool verbose = false;
    std::filesystem::path file;
    std::ofstream out;
    Observer observer;
};

State& state() {
    static State s;
    return s;
}

} // namespace

std::string_view to_string(Level level) {
    switch (level) {
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
    }
    return "info";
}

void init(bool verbose, const std::filesystem::path& file) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.verbose = verbose;
    s.file = file;
    if (s.out.is_open()) s.out.close();
    if (file.empty()) return;

    s.out.open(file, std::ios::out | std::ios::trunc);
    if (!s.out.is_open()) {
        std::println(stderr, "[echo-dictate] error: could not open log file {}", file.string());
    }
}

bool verbose() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    return s.verbose;
}

std::filesystem::path file_path() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    return s.file;
}

void set_observer(Observer observer) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.observer = std::move(observer);
}

void write(Level level, std::string_view msg) {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    if (s.verbose || level >= Level::Warn) {
        if (level >= Level::Warn) {
            std::println(stderr, "[echo-dictate] {}: {}", to_string(level), msg);
        } else {
            std::println(stderr, "[echo-dictate] {}", msg);
        }
    }

    if (s.out.is_open()) {
        auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
        s.out << std::format("[{:%FT%TZ}] {} {}\n", now, to_string(level), msg);
        s.out.flush();
    }

    if (s.observer) s.observer(level, msg);
}

} // namespace logging
