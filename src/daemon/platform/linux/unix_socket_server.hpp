#pragma once

#include "platform/ipc_server.hpp"

#include <cstddef>
#include <string>
#include <vector>

class UnixSocketServer : public IpcServer {
public:
    // process_audio carries the whole recording as a JSON byte array.
    static constexpr size_t kMaxMessageBytes = 64 * 1024 * 1024;

    UnixSocketServer();
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    bool start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return server_fd_; }
    int accept_client() override;
    ReadStatus read_command(int client_fd, nlohmann::json& cmd) override;
    bool send_response(int client_fd, const nlohmann::json& response) override;
    void close_client(int client_fd) override;

private:
    struct ClientBuffer {
        int fd;
        std::string buf;
    };

    ClientBuffer* find_client(int fd);
    static ReadStatus take_line(ClientBuffer& client, nlohmann::json& cmd);

    int server_fd_ = -1;
    std::string socket_path_;
    std::vector<ClientBuffer> clients_;
};
