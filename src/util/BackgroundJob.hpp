#pragma once
// BackgroundJob.hpp - One-at-a-time worker thread
// Results are reported through Signals from the worker thread

#include <atomic>
#include <functional>
#include <thread>

namespace babel {

class BackgroundJob {
public:
    BackgroundJob() = default;
    ~BackgroundJob() {
        join();
    }

    BackgroundJob(const BackgroundJob&) = delete;
    BackgroundJob& operator=(const BackgroundJob&) = delete;

    // Returns false while a previous job is still running
    bool start(std::function<void()> job) {
        if (busy_.exchange(true))
            return false;
        join();
        thread_ = std::thread([this, job = std::move(job)] {
            job();
            busy_ = false;
        });
        return true;
    }

    bool isBusy() const {
        return busy_;
    }

    void join() {
        if (thread_.joinable())
            thread_.join();
    }

private:
    std::thread thread_;
    std::atomic<bool> busy_{false};
};

} // namespace babel
