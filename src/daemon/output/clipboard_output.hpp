#pragma once

#include "output.hpp"

#include <chrono>
#include <string>
#include <vector>

// Copies text to the Wayland clipboard by piping it into wl-copy.
class ClipboardOutput : public OutputMethod {
public:
    explicit ClipboardOutput(std::vector<std::string> command = {"wl-copy"},
                             std::chrono::milliseconds timeout = std::chrono::seconds(5));

    std::string name() const override { return command_.empty() ? "clipboard" : command_.front(); }
    std::expected<void, std::string> deliver(const std::string& text) override;

private:
    std::vector<std::string> command_;
    std::chrono::milliseconds timeout_;
};
