#pragma once

#include <filesystem>
#include <format>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

// Process-wide logger. Every line goes to stderr tagged "[echo-dictate]"
// (debug/info only when verbose) and, once init() has run, to a per-session
// debug log file that is truncated at startup.
namespace logging {

enum class Level { Debug, Info, Warn, Error };

std::string_view to_string(Level level);

void init(bool verbose, const std::filesystem::path& file);
bool verbose();
std::filesystem::path file_path();

// Receives every emitted line regardless of verbosity. Used by tests.
using Observer = std::function<void(Level, std::string_view)>;
void set_observer(Observer observer);

void write(Level level, std::string_view msg);

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
    write(Level::Warn, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace logging
