#include "platform/subprocess.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <optional>
#include <poll.h>
#include <string_view>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace {

using Clock = std::chrono::steady_clock;

struct Pipe {
    int fds[2] = {-1, -1};

    ~Pipe() { close_both(); }

    bool open() { return ::pipe2(fds, O_CLOEXEC) == 0; }
    int read_end() const { return fds[0]; }
    int write_end() const { return fds[1]; }

    void close_read() { close_fd(fds[0]); }
    void close_write() { close_fd(fds[1]); }
    void close_both() { close_read(); close_write(); }

    static void close_fd(int& fd) {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
};

std::string errno_message(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

// Built before fork(); the child must not allocate.
std::vector<std::string> merged_environment(const ProcessSpec& spec) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; e++) {
        std::string_view entry(*e);
        auto key = entry.substr(0, entry.find('='));
        bool overridden = std::ranges::any_of(spec.env, [&](const auto& kv) { return kv.first == key; });
        if (!overridden) env.emplace_back(entry);
    }
    for (const auto& [key, value] : spec.env) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::vector<char*> c_strings(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

int remaining_ms(std::optional<Clock::time_point> deadline) {
    if (!deadline) return -1;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

void fill_status(ProcessOutput& result, int status) {
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }
}

} // namespace

std::expected<ProcessOutput, std::string> run_process(const ProcessSpec& spec) {
    if (spec.argv.empty()) {
        return std::unexpected(std::string("run_process: empty argv"));
    }

    Pipe in_pipe, out_pipe, err_pipe;
    if (spec.feed_stdin && !in_pipe.open()) return std::unexpected(errno_message("pipe()"));
    if (spec.capture_output && (!out_pipe.open() || !err_pipe.open())) {
        return std::unexpected(errno_message("pipe()"));
    }

    auto args = spec.argv;
    auto argv = c_strings(args);
    auto env_strings = merged_environment(spec);
    auto envp = c_strings(env_strings);
    std::string working_dir = spec.working_dir.string();

    pid_t pid = ::fork();
    if (pid < 0) return std::unexpected(errno_message("fork()"));

    if (pid == 0) {
        // Child: wire up stdio, exec
        if (spec.feed_stdin) {
            ::dup2(in_pipe.read_end(), STDIN_FILENO);
        } else {
            int devnull = ::open("/dev/null", O_RDONLY);
            if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        }

        if (spec.capture_output) {
            ::dup2(out_pipe.write_end(), STDOUT_FILENO);
            ::dup2(err_pipe.write_end(), STDERR_FILENO);
        } else {
            int devnull = ::open("/dev/null", O_WRONLY);
            if (devnull >= 0) {
                ::dup2(devnull, STDOUT_FILENO);
                ::dup2(devnull, STDERR_FILENO);
            }
        }

        if (!working_dir.empty() && ::chdir(working_dir.c_str()) < 0) ::_exit(127);

        ::execvpe(argv[0], argv.data(), envp.data());
        ::_exit(127);
    }

    // Parent
    in_pipe.close_read();
    out_pipe.close_write();
    err_pipe.close_write();

    std::optional<Clock::time_point> deadline;
    if (spec.timeout.count() > 0) deadline = Clock::now() + spec.timeout;

    ProcessOutput result;
    size_t written = 0;

    if (spec.feed_stdin) {
        ::fcntl(in_pipe.write_end(), F_SETFL, O_NONBLOCK);
        if (spec.stdin_data.empty()) in_pipe.close_write();
    }

    while (in_pipe.write_end() >= 0 || out_pipe.read_end() >= 0 || err_pipe.read_end() >= 0) {
        pollfd fds[3];
        nfds_t nfds = 0;
        if (in_pipe.write_end() >= 0) fds[nfds++] = {in_pipe.write_end(), POLLOUT, 0};
        if (out_pipe.read_end() >= 0) fds[nfds++] = {out_pipe.read_end(), POLLIN, 0};
        if (err_pipe.read_end() >= 0) fds[nfds++] = {err_pipe.read_end(), POLLIN, 0};

        int n = ::poll(fds, nfds, remaining_ms(deadline));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) {
            result.timed_out = true;
            break;
        }

        for (nfds_t i = 0; i < nfds; i++) {
            if (fds[i].revents == 0) continue;
            int fd = fds[i].fd;

            if (fd == in_pipe.write_end()) {
                ssize_t w = ::write(fd, spec.stdin_data.data() + written, spec.stdin_data.size() - written);
                if (w < 0 && (errno == EAGAIN || errno == EINTR)) continue;
                if (w < 0) {
                    in_pipe.close_write();
                    continue;
                }
                written += static_cast<size_t>(w);
                if (written >= spec.stdin_data.size()) in_pipe.close_write();
                continue;
            }

            char buf[4096];
            ssize_t r = ::read(fd, buf, sizeof(buf));
            if (r < 0 && errno == EINTR) continue;
            if (r <= 0) {
                if (fd == out_pipe.read_end()) out_pipe.close_read();
                else err_pipe.close_read();
                continue;
            }
            auto& sink = fd == out_pipe.read_end() ? result.out : result.err;
            sink.append(buf, static_cast<size_t>(r));
        }
    }

    in_pipe.close_write();
    out_pipe.close_read();
    err_pipe.close_read();

    // Output is closed; the child may still be running.
    int status = 0;
    while (!result.timed_out) {
        pid_t r = ::waitpid(pid, &status, deadline ? WNOHANG : 0);
        if (r == pid) {
            fill_status(result, status);
            return result;
        }
        if (r < 0 && errno != EINTR) {
            return std::unexpected(errno_message("waitpid()"));
        }
        if (r == 0) {
            if (remaining_ms(deadline) == 0) {
                result.timed_out = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    ::kill(pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return std::unexpected(errno_message("waitpid()"));
    }
    fill_status(result, status);
    return result;
}
