#pragma once

#include "audio/artifact_manager.hpp"
#include "config.hpp"
#include "daemon_core.hpp"
#include "engine/engine_manager.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <atomic>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void handle_client(int fd);
    void drop_client(int fd);

    Config config_;

    // Platform implementations (constructed before core_)
    AudioArtifactManager artifacts_;
    EngineManager engine_;
    UnixSocketServer ipc_server_;

    // Portable business logic
    DaemonCore core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;
    int timer_fd_ = -1;

    std::atomic<bool> running_{false};
};
