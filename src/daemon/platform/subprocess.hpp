#pragma once

#include <chrono>
#include <expected>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

struct ProcessSpec {
    std::vector<std::string> argv;                              // argv[0] is the program
    std::string stdin_data;
    bool feed_stdin = false;                                    // otherwise stdin is /dev/null
    std::filesystem::path working_dir;                          // empty: inherit
    std::vector<std::pair<std::string, std::string>> env;       // overrides on top of environ
    bool capture_output = true;                                 // false: stdout/stderr to /dev/null
    std::chrono::milliseconds timeout{0};                       // 0: wait forever
};

struct ProcessOutput {
    int exit_code = -1;     // -1 unless the child exited normally
    int term_signal = 0;
    bool timed_out = false;
    std::string out;
    std::string err;

    bool succeeded() const { return exit_code == 0 && !timed_out; }
};

// Runs a child to completion. The child is killed with SIGKILL and reaped if
// it is still running when the timeout expires. Only failures to start the
// child at all (pipe/fork) are errors; a failed exec shows up as exit 127.
std::expected<ProcessOutput, std::string> run_process(const ProcessSpec& spec);
