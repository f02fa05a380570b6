#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// Newline-delimited JSON over a local stream socket.
class IpcClient {
public:
    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool connected() const = 0;
    virtual bool send(const nlohmann::json& cmd) = 0;
    // Reads one newline-terminated JSON message. A negative timeout waits forever.
    virtual bool recv(nlohmann::json& response, int timeout_ms = 30000) = 0;
    virtual void close() = 0;

    // send() followed by recv(); the error says which half failed.
    std::expected<nlohmann::json, std::string> request(const nlohmann::json& cmd, int timeout_ms) {
        if (!send(cmd)) return std::unexpected(std::string("Failed to send command"));
        nlohmann::json response;
        if (!recv(response, timeout_ms)) {
            return std::unexpected(std::string("No response from daemon (timeout)"));
        }
        return response;
    }
};
