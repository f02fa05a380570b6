#include "platform/linux/unix_socket_server.hpp"

#include "logging.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketServer::UnixSocketServer() = default;

UnixSocketServer::~UnixSocketServer() {
    stop();
}

bool UnixSocketServer::start(const std::string& socket_path) {
    socket_path_ = socket_path;

    // Remove stale socket
    ::unlink(socket_path.c_str());

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        logging::error("ipc: socket() failed: {}", std::strerror(errno));
        return false;
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (socket_path.size() >= sizeof(addr.sun_path)) {
        logging::error("ipc: socket path too long: {}", socket_path);
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        logging::error("ipc: bind() failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (::listen(server_fd_, 8) < 0) {
        logging::error("ipc: listen() failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    return true;
}

void UnixSocketServer::stop() {
    for (auto& c : clients_) {
        ::close(c.fd);
    }
    clients_.clear();

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) return -1;
    clients_.push_back({fd, {}});
    return fd;
}

ReadStatus UnixSocketServer::read_command(int client_fd, nlohmann::json& cmd) {
    auto* client = find_client(client_fd);
    if (!client) return ReadStatus::Closed;

    // A previous read may have pulled in more than one line.
    if (auto status = take_line(*client, cmd); status != ReadStatus::Incomplete) return status;

    char buf[65536];
    ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
    if (n == 0) return ReadStatus::Closed;
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return ReadStatus::Incomplete;
        return ReadStatus::Closed;
    }

    client->buf.append(buf, static_cast<size_t>(n));
    if (client->buf.size() > kMaxMessageBytes && client->buf.find('\n') == std::string::npos) {
        logging::warn("ipc: client {} exceeded {} bytes without a newline, dropping", client_fd,
                      kMaxMessageBytes);
        return ReadStatus::Closed;
    }

    return take_line(*client, cmd);
}

bool UnixSocketServer::send_response(int client_fd, const nlohmann::json& response) {
    std::string msg = response.dump() + "\n";
    size_t sent = 0;

    while (sent < msg.size()) {
        ssize_t n = ::send(client_fd, msg.data() + sent, msg.size() - sent, MSG_NOSIGNAL);
        if (n >= 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) return false;

        // Slow reader; wait a bounded time for buffer space.
        pollfd pfd{.fd = client_fd, .events = POLLOUT, .revents = 0};
        if (::poll(&pfd, 1, 1000) <= 0) return false;
    }
    return true;
}

void UnixSocketServer::close_client(int client_fd) {
    ::close(client_fd);
    std::erase_if(clients_, [client_fd](const ClientBuffer& c) { return c.fd == client_fd; });
}

UnixSocketServer::ClientBuffer* UnixSocketServer::find_client(int fd) {
    auto it = std::ranges::find_if(clients_, [fd](const ClientBuffer& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}

ReadStatus UnixSocketServer::take_line(ClientBuffer& client, nlohmann::json& cmd) {
    auto pos = client.buf.find('\n');
    if (pos == std::string::npos) return ReadStatus::Incomplete;

    std::string line = client.buf.substr(0, pos);
    client.buf.erase(0, pos + 1);

    try {
        cmd = nlohmann::json::parse(line);
        return ReadStatus::Message;
    } catch (const nlohmann::json::exception&) {
        return ReadStatus::Invalid;
    }
}
