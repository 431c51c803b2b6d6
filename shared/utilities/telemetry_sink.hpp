#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "common/result.h"
#include "logger_utility.hpp"
#include "task/worker.hpp"

namespace utilities {

using Attributes = std::map<std::string, std::string>;

enum class TelemetryKind { Span, Counter };

struct TelemetryEvent {
    TelemetryKind kind = TelemetryKind::Counter;
    std::string service;
    std::string name;
    std::chrono::microseconds duration{0};
    int64_t value = 0;
    Attributes attributes;
    std::chrono::system_clock::time_point timestamp;
};

// Fire-and-forget export target. A failing emit is never fatal.
class TelemetrySink {
public:
    virtual ~TelemetrySink() = default;
    virtual std::string name() const = 0;
    virtual Result<void> emit(const TelemetryEvent& event) = 0;
    // Called once when the telemetry utility is released.
    virtual void close() { }
};

class LogTelemetrySink : public TelemetrySink {
public:
    explicit LogTelemetrySink(std::shared_ptr<LoggerUtility> logger) : logger_(std::move(logger)) {}

    std::string name() const override { return "log"; }
    Result<void> emit(const TelemetryEvent& event) override;

private:
    std::shared_ptr<LoggerUtility> logger_;
};

// Queues events as JSON and POSTs them from a worker thread over one reused
// curl handle. emit() never waits on the network; a full queue drops the
// event with RateLimit. Each request is bounded by `timeout`.
class HttpTelemetrySink : public TelemetrySink, private task::Worker {
public:
    inline static constexpr const char* LOG_TAG = "HttpTelemetrySink";
    static constexpr size_t DEFAULT_CAPACITY = 1024;

    HttpTelemetrySink(std::string endpoint, std::chrono::milliseconds timeout,
                      size_t capacity = DEFAULT_CAPACITY);
    ~HttpTelemetrySink() override;

    HttpTelemetrySink(const HttpTelemetrySink&) = delete;
    HttpTelemetrySink& operator=(const HttpTelemetrySink&) = delete;

    std::string name() const override { return "http"; }
    Result<void> emit(const TelemetryEvent& event) override;
    // Stops the worker; queued events are discarded.
    void close() override;

    static std::string toJson(const TelemetryEvent& event);

    size_t sent() const noexcept { return sent_.load(); }
    size_t failed() const noexcept { return failed_.load(); }
    size_t overflowed() const noexcept { return overflowed_.load(); }
    size_t queued() const;

protected:
    Result<void> run() override;

private:
    Result<void> post_(const std::string& payload);

    std::string endpoint_;
    std::chrono::milliseconds timeout_;
    size_t capacity_;

    std::deque<std::string> queue_;
    mutable std::mutex queue_mutex_;
    // worker thread only
    void* curl_ = nullptr;

    std::atomic<size_t> sent_{0};
    std::atomic<size_t> failed_{0};
    std::atomic<size_t> overflowed_{0};
};

} // namespace utilities
