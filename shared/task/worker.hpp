#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

#include "common/result.h"

namespace task {

enum class WorkerState {
    Init,
    Running,
    Stopping,
    Stopped,
};

enum class WorkerType {
    Loop,   // run(), then sleep loop_sleep, until stopped
    Event,  // run() once per event()
};

struct WorkerDescriptor {
    std::string name;
    WorkerType type = WorkerType::Event;
    std::chrono::milliseconds loop_sleep{1000};
};

// Background thread driving run().
//
// A failing run() stops the worker. Derived classes must call stop() in their
// own destructor, since run() is gone by the time ~Worker runs.
class Worker
{
public:
    inline static constexpr const char* LOG_TAG = "Worker";

    Worker() = default;
    virtual ~Worker();

    Worker(const Worker&)            = delete;
    Worker& operator=(const Worker&) = delete;

    Result<void> start(WorkerDescriptor desc);
    // Joins the thread. Safe to call more than once.
    Result<void> stop();

    // wakes an Event worker
    void event();

    bool isStopRequested() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stop_requested_;
    }

    WorkerState state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    const std::string& workerName() const noexcept { return desc_.name; }

protected:
    virtual Result<void> run() = 0;

    virtual void onPreStop() { }

private:
    void loopEntry_();
    void eventEntry_();
    Result<void> runGuarded_();

    mutable std::mutex mutex_;
    std::condition_variable cond_;
    bool event_ = false;
    bool stop_requested_ = false;
    WorkerState state_ = WorkerState::Init;

    WorkerDescriptor desc_;
    std::thread thread_;
};

} // namespace task
