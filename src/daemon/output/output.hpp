#pragma once

#include <expected>
#include <string>

// Somewhere a finished transcription can be handed off to.
class OutputMethod {
public:
    virtual ~OutputMethod() = default;

    // Short label for logs, e.g. the helper program's name.
    virtual std::string name() const = 0;

    // Blocks until the text has been handed over.
    virtual std::expected<void, std::string> deliver(const std::string& text) = 0;
};
