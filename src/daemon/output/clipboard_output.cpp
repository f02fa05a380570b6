#include "clipboard_output.hpp"

#include "platform/subprocess.hpp"

#include <format>

ClipboardOutput::ClipboardOutput(std::vector<std::string> command, std::chrono::milliseconds timeout)
    : command_(std::move(command)), timeout_(timeout) {}

std::expected<void, std::string> ClipboardOutput::deliver(const std::string& text) {
    // wl-copy leaves a child behind to serve the selection; it must not
    // inherit our output pipes or we would wait on it.
    auto run = run_process(ProcessSpec{
        .argv = command_,
        .stdin_data = text,
        .feed_stdin = true,
        .capture_output = false,
        .timeout = timeout_,
    });
    if (!run) return std::unexpected(run.error());

    if (run->timed_out) {
        return std::unexpected(std::format("{} timed out", command_.front()));
    }
    if (run->exit_code == 127) {
        return std::unexpected(std::format("{} not found", command_.front()));
    }
    if (run->exit_code != 0) {
        return std::unexpected(std::format("{} exited with code {}", command_.front(), run->exit_code));
    }
    return {};
}
