#pragma once
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "health_sink.hpp"
#include "ioc/utility.hpp"
#include "logger_utility.hpp"

namespace utilities {

// Last known state of each named component, forwarded to the attached sinks.
// Sink failures, thrown or returned, are logged and counted, never returned.
//
// Every `interval` the heartbeat re-publishes all known components so that a
// subscriber joining late still sees the current state. A zero interval
// disables it.
class HealthUtility : public ioc::Utility {
public:
    inline static constexpr const char* NAME = "health";
    inline static constexpr const char* LOG_TAG = "Health";

    HealthUtility(std::string service, std::shared_ptr<LoggerUtility> logger,
                  std::chrono::milliseconds interval = std::chrono::seconds(30));
    ~HealthUtility() override;

    // A given sink is attached in addition to HEALTH_PUBLISH_ENDPOINT.
    static ioc::UtilityDescriptor descriptor(std::shared_ptr<HealthSink> sink = nullptr);

    std::string name() const override { return NAME; }
    Result<void> shutdown() override;

    void addSink(std::shared_ptr<HealthSink> sink);

    void report(const std::string& component, const ioc::UtilityStatus& status);

    Result<void> startHeartbeat();
    void stopHeartbeat();

    std::optional<ioc::UtilityStatus> status(const std::string& component) const;
    std::map<std::string, ioc::UtilityStatus> summary() const;
    bool healthy() const;

    std::chrono::milliseconds interval() const noexcept { return interval_; }
    size_t publishFailures() const noexcept { return publish_failures_.load(); }
    size_t heartbeats() const noexcept { return heartbeats_.load(); }

private:
    class Heartbeat;

    void publish_(const std::vector<std::shared_ptr<HealthSink>>& sinks, const HealthReport& report);
    void republish_();

    std::string service_;
    std::shared_ptr<LoggerUtility> logger_;
    std::chrono::milliseconds interval_;

    std::map<std::string, ioc::UtilityStatus> components_;
    std::vector<std::shared_ptr<HealthSink>> sinks_;
    mutable std::mutex mutex_;
    std::atomic<size_t> publish_failures_{0};
    std::atomic<size_t> heartbeats_{0};

    std::mutex heartbeat_mutex_;
    std::unique_ptr<Heartbeat> heartbeat_;
};

} // namespace utilities
