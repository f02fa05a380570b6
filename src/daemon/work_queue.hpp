#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>

// One background thread running jobs in submission order. Engine calls block
// for up to two minutes, so they never run on the event loop thread.
class WorkQueue {
public:
    using Job = std::function<void()>;

    WorkQueue()
        : thread_([this](std::stop_token stop) { run(stop); }) {}

    ~WorkQueue() {
        thread_.request_stop();
        cv_.notify_all();
    }

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    void push(Job job) {
        {
            std::lock_guard lock(mutex_);
            jobs_.push_back(std::move(job));
        }
        cv_.notify_one();
    }

    size_t pending() const {
        std::lock_guard lock(mutex_);
        return jobs_.size() + (busy_ ? 1 : 0);
    }

    // Blocks until every submitted job has finished.
    void wait_idle() {
        std::unique_lock lock(mutex_);
        idle_cv_.wait(lock, [this] { return jobs_.empty() && !busy_; });
    }

private:
    void run(std::stop_token stop) {
        while (true) {
            Job job;
            {
                std::unique_lock lock(mutex_);
                if (!cv_.wait(lock, stop, [this] { return !jobs_.empty(); })) {
                    return;
                }
                job = std::move(jobs_.front());
                jobs_.pop_front();
                busy_ = true;
            }
            job();
            {
                std::lock_guard lock(mutex_);
                busy_ = false;
            }
            idle_cv_.notify_all();
        }
    }

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::condition_variable idle_cv_;
    std::deque<Job> jobs_;
    bool busy_ = false;
    std::jthread thread_;   // last: joins before the queue is destroyed
};
