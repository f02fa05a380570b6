#include "engine/watchdog.hpp"

std::string_view to_string(ProcessingState state) {
    switch (state) {
        case ProcessingState::Ready: return "ready";
        case ProcessingState::Recording: return "recording";
        case ProcessingState::Processing: return "processing";
    }
    return "ready";
}

Watchdog::Watchdog(std::chrono::milliseconds timeout, NowFn now)
    : timeout_(timeout), now_(now ? std::move(now) : NowFn([] { return Clock::now(); })) {}

void Watchdog::enter(ProcessingState state) {
    state_ = state;
    if (state == ProcessingState::Ready) {
        deadline_.reset();
    } else {
        deadline_ = now_() + timeout_;
    }
}

std::optional<ProcessingState> Watchdog::poll() {
    if (state_ == ProcessingState::Ready || !deadline_) return std::nullopt;
    if (now_() < *deadline_) return std::nullopt;

    auto stuck = state_;
    state_ = ProcessingState::Ready;
    deadline_.reset();
    generation_++;
    forced_resets_++;
    return stuck;
}
