#include "platform/linux/linux_event_loop.hpp"

#include "engine/curl_http_client.hpp"
#include "engine/local_sidecar_adapter.hpp"
#include "engine/model_locator.hpp"
#include "engine/remote_adapter.hpp"
#include "logging.hpp"
#include "output/clipboard_output.hpp"
#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

fs::path config_path_or(const std::string& configured, const char* file_name) {
    if (!configured.empty()) return configured;
    auto dir = platform::config_dir();
    if (dir.empty()) return fs::temp_directory_path() / "echo-dictate" / file_name;
    return fs::path(dir) / file_name;
}

fs::path data_path() {
    auto dir = platform::data_dir();
    if (dir.empty()) return fs::temp_directory_path() / "echo-dictate";
    return dir;
}

std::vector<fs::path> binary_candidates(const Config& config) {
    if (!config.local.binary.empty()) return {config.local.binary};
    return ModelLocator::default_binary_candidates(data_path());
}

EngineManagerOptions manager_options(const Config& config) {
    return EngineManagerOptions{
        .preference = config.engine.preference,
        .watchdog_timeout = std::chrono::seconds(config.engine.watchdog_seconds),
    };
}

} // namespace

LinuxEventLoop::LinuxEventLoop(Config config)
    : config_(std::move(config)),
      artifacts_(fs::temp_directory_path(), config_.audio.extension),
      engine_(artifacts_, manager_options(config_)),
      core_(config_, engine_, artifacts_, ipc_server_,
            // OutputFactory
            []() -> std::unique_ptr<OutputMethod> {
                return std::make_unique<ClipboardOutput>();
            },
            // NotifyCallback
            [this]() {
                uint64_t val = 1;
                if (::write(worker_event_fd_, &val, sizeof(val)) < 0) {
                    logging::warn("eventfd write failed: {}", std::strerror(errno));
                }
            }) {
    engine_.add_adapter(std::make_unique<RemoteAdapter>(
        config_path_or(config_.remote.config_file, "remote-adapter.json"),
        std::make_unique<CurlHttpClient>()));

    auto models_dir = config_.local.models_dir.empty() ? data_path() / "local-models"
                                                       : fs::path(config_.local.models_dir);
    engine_.add_adapter(std::make_unique<LocalSidecarAdapter>(
        config_path_or(config_.local.config_file, "local-sidecar.json"),
        ModelLocator(models_dir, binary_candidates(config_)),
        SidecarOptions{
            .num_threads = config_.local.num_threads,
            .timeout = std::chrono::seconds(config_.local.timeout_seconds),
        }));
}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
    if (timer_fd_ >= 0) ::close(timer_fd_);
}

bool LinuxEventLoop::init() {
    // Worker notification eventfd; the engine starts posting events from core init
    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        logging::error("eventfd failed: {}", std::strerror(errno));
        return false;
    }

    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    logging::info("IPC listening on {}", ipc_path);

    // Artifact sweep, adapter probes
    core_.init();

    // epoll setup
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        logging::error("epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        logging::error("signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Watchdog tick, once a second
    timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer_fd_ < 0) {
        logging::error("timerfd_create failed: {}", std::strerror(errno));
        return false;
    }
    itimerspec interval{.it_interval = {.tv_sec = 1, .tv_nsec = 0}, .it_value = {.tv_sec = 1, .tv_nsec = 0}};
    if (timerfd_settime(timer_fd_, 0, &interval, nullptr) < 0) {
        logging::error("timerfd_settime failed: {}", std::strerror(errno));
        return false;
    }

    // Register FDs with epoll
    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(worker_event_fd_, EPOLLIN) || !add_fd(timer_fd_, EPOLLIN)) {
        logging::error("epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    // Events posted during init()
    core_.on_worker_complete();

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            logging::error("epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    logging::info("Received signal {}, shutting down", info.ssi_signo);
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev);
                    core_.add_client(client_fd);
                }
                continue;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                while (::read(worker_event_fd_, &val, sizeof(val)) > 0) {}
                core_.on_worker_complete();
                continue;
            }

            if (fd == timer_fd_) {
                uint64_t expirations;
                while (::read(timer_fd_, &expirations, sizeof(expirations)) > 0) {}
                core_.tick();
                continue;
            }

            handle_client(fd);
        }
    }

    // Clean shutdown
    core_.shutdown();
}

void LinuxEventLoop::handle_client(int fd) {
    while (true) {
        nlohmann::json cmd;
        auto status = ipc_server_.read_command(fd, cmd);

        switch (status) {
            case ReadStatus::Message:
                if (auto response = core_.handle_command(fd, cmd)) {
                    ipc_server_.send_response(fd, *response);
                }
                continue;
            case ReadStatus::Invalid:
                ipc_server_.send_response(fd, {{"status", "error"}, {"message", "invalid JSON"}});
                continue;
            case ReadStatus::Incomplete:
                return;
            case ReadStatus::Closed:
                drop_client(fd);
                return;
        }
    }
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    core_.remove_client(fd);
    ipc_server_.close_client(fd);
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}
