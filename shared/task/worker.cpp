#include "worker.hpp"

#include <exception>
#include <system_error>

#include "logging/logging.hpp"

namespace task {

Worker::~Worker()
{
    stop();
}

Result<void> Worker::start(WorkerDescriptor desc)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == WorkerState::Running || state_ == WorkerState::Stopping) {
        return Error(ResultCode::AlreadyExists, "worker " + desc.name + " already running");
    }
    if (thread_.joinable()) thread_.join();

    desc_ = std::move(desc);
    stop_requested_ = false;
    event_ = false;
    try {
        if (desc_.type == WorkerType::Loop) {
            thread_ = std::thread([this]() { loopEntry_(); });
        } else {
            thread_ = std::thread([this]() { eventEntry_(); });
        }
    } catch (const std::system_error& e) {
        state_ = WorkerState::Stopped;
        return Error(ResultCode::ResourceBusy, "worker " + desc_.name + ": " + e.what());
    }
    state_ = WorkerState::Running;
    LOGD("{} started", desc_.name);
    return OK();
}

Result<void> Worker::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!thread_.joinable()) return OK();
        state_ = WorkerState::Stopping;
        stop_requested_ = true;
        cond_.notify_all();
    }
    onPreStop();

    if (thread_.get_id() == std::this_thread::get_id()) {
        thread_.detach();
    } else {
        thread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    state_ = WorkerState::Stopped;
    LOGD("{} stopped", desc_.name);
    return OK();
}

void Worker::event()
{
    std::lock_guard<std::mutex> lock(mutex_);
    event_ = true;
    cond_.notify_all();
}

Result<void> Worker::runGuarded_()
{
    try {
        return run();
    } catch (const std::exception& e) {
        return Error(ResultCode::InternalError, desc_.name + ": " + e.what());
    } catch (...) {
        return Error(ResultCode::InternalError, desc_.name + ": unknown exception");
    }
}

void Worker::loopEntry_()
{
    while (!isStopRequested()) {
        auto result = runGuarded_();
        if (!result) {
            LOGE("loop[{}] stopped: {}", desc_.name, to_string(result));
            break;
        }
        std::unique_lock<std::mutex> lock(mutex_);
        cond_.wait_for(lock, desc_.loop_sleep, [this]() { return stop_requested_; });
    }
}

void Worker::eventEntry_()
{
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cond_.wait(lock, [this]() { return event_ || stop_requested_; });
            if (stop_requested_) break;
            event_ = false;
        }
        auto result = runGuarded_();
        if (!result) {
            LOGE("event[{}] stopped: {}", desc_.name, to_string(result));
            break;
        }
    }
}

} // namespace task
