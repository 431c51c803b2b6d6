#pragma once
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <system_error>
#include <thread>

#include "common/result.h"

namespace task {

using Clock = std::chrono::steady_clock;
using Deadline = Clock::time_point;

inline Deadline noDeadline() { return Deadline::max(); }

inline Deadline deadlineAfter(std::chrono::milliseconds budget) {
    if (budget.count() <= 0) return noDeadline();
    return Clock::now() + budget;
}

inline Deadline earliest(Deadline a, Deadline b) { return a < b ? a : b; }

inline bool expired(Deadline deadline) {
    return deadline != noDeadline() && Clock::now() >= deadline;
}

// Runs func and waits for it until the deadline.
// With no deadline the call runs inline. Otherwise it runs on a detached
// worker thread; on timeout the caller gets ResultCode::Timeout and the
// worker's eventual result is discarded, so func must own everything it
// touches.
template<typename T>
Result<T> runUntil(std::function<Result<T>()> func, Deadline deadline, const std::string& name = "task") {
    auto invoke = [name](const std::function<Result<T>()>& fn) -> Result<T> {
        try {
            return fn();
        } catch (const std::exception& e) {
            return Result<T>::Error(ResultCode::InternalError, name + ": " + e.what());
        } catch (...) {
            return Result<T>::Error(ResultCode::InternalError, name + ": unknown exception");
        }
    };

    if (deadline == noDeadline()) {
        return invoke(func);
    }
    if (expired(deadline)) {
        return Result<T>::Error(ResultCode::Timeout, name + ": deadline exceeded before start");
    }

    auto promise = std::make_shared<std::promise<Result<T>>>();
    auto future = promise->get_future();
    try {
        std::thread([promise, invoke, fn = std::move(func)]() {
            promise->set_value(invoke(fn));
        }).detach();
    } catch (const std::system_error& e) {
        return Result<T>::Error(ResultCode::ResourceBusy, name + ": cannot start worker: " + e.what());
    }

    if (future.wait_until(deadline) != std::future_status::ready) {
        return Result<T>::Error(ResultCode::Timeout, name + ": deadline exceeded");
    }
    return future.get();
}

} // namespace task
