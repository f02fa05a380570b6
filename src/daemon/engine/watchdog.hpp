#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

enum class ProcessingState { Ready, Recording, Processing };

std::string_view to_string(ProcessingState state);

// Bounds how long the processing state may stay away from Ready. Entering
// Recording or Processing arms a deadline; Ready disarms it. poll() forces the
// state back to Ready once the deadline has passed and bumps the generation
// so that work started before the reset can recognise itself as stale.
//
// Not thread-safe; the owner serialises access.
class Watchdog {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    explicit Watchdog(std::chrono::milliseconds timeout = std::chrono::seconds(30), NowFn now = {});

    void enter(ProcessingState state);

    // Returns the state that was forced back to Ready, or nullopt if the
    // deadline has not fired. Fires at most once per stuck episode.
    std::optional<ProcessingState> poll();

    ProcessingState state() const { return state_; }
    std::optional<Clock::time_point> deadline() const { return deadline_; }
    uint64_t generation() const { return generation_; }
    uint64_t forced_resets() const { return forced_resets_; }
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
    NowFn now_;
    ProcessingState state_ = ProcessingState::Ready;
    std::optional<Clock::time_point> deadline_;
    uint64_t generation_ = 0;
    uint64_t forced_resets_ = 0;
};
