#pragma once

#include "config.hpp"
#include "engine/engine_manager.hpp"
#include "output/output.hpp"
#include "platform/ipc_server.hpp"
#include "work_queue.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Maps IPC commands onto the EngineManager. Anything that may touch the
// network or spawn a process runs on the worker queue; its reply is parked in
// an outbox and delivered from the event loop thread once notify() fires.
class DaemonCore {
public:
    using OutputFactory = std::function<std::unique_ptr<OutputMethod>()>;
    using NotifyCallback = std::function<void()>;

    DaemonCore(Config config, EngineManager& engine, AudioArtifactManager& artifacts,
               IpcServer& ipc, OutputFactory output_factory, NotifyCallback notify);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Sweeps orphaned audio and probes the adapters. Blocks for at most the
    // slowest adapter probe.
    void init();

    void add_client(int fd);
    void remove_client(int fd);

    // Returns the reply, or nullopt if it will be delivered later through
    // the outbox.
    std::optional<nlohmann::json> handle_command(int client_fd, const nlohmann::json& cmd);

    // Delivers replies and events queued by the worker. Event loop thread only.
    void on_worker_complete();

    // Drives the processing watchdog; called once a second.
    void tick();

    // Blocks until queued engine work has finished, then delivers its output.
    void flush();

    size_t subscriber_count() const { return subscribers_.size(); }

    void shutdown();

private:
    struct Outgoing {
        int fd;              // -1: broadcast to subscribers
        uint64_t serial;
        nlohmann::json message;
    };

    nlohmann::json handle_start(const nlohmann::json& cmd);
    nlohmann::json handle_stop(const nlohmann::json& cmd);
    std::optional<nlohmann::json> handle_process_audio(int client_fd, const nlohmann::json& cmd);
    nlohmann::json handle_last(const nlohmann::json& cmd);
    nlohmann::json handle_configure(const nlohmann::json& cmd);
    nlohmann::json handle_get_config(const nlohmann::json& cmd);
    nlohmann::json handle_copy_last(const nlohmann::json& cmd);
    nlohmann::json handle_subscribe(int client_fd);

    // Runs job on the worker and sends its result back to client_fd.
    void defer(int client_fd, std::function<nlohmann::json()> job);

    std::optional<std::string> copy_to_clipboard(const std::string& text);

    void post(int fd, uint64_t serial, nlohmann::json message);
    void broadcast(nlohmann::json event);

    Config config_;
    EngineManager& engine_;
    AudioArtifactManager& artifacts_;
    IpcServer& ipc_;

    OutputFactory output_factory_;
    NotifyCallback notify_;

    // Event loop thread only
    std::map<int, uint64_t> clients_;   // fd -> connection serial
    uint64_t next_serial_ = 1;
    std::vector<int> subscribers_;

    std::mutex outbox_mutex_;
    std::vector<Outgoing> outbox_;

    WorkQueue worker_;   // last: drained and joined first on destruction
};
