#pragma once
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "ioc/utility.hpp"
#include "telemetry_sink.hpp"

namespace utilities {

// Spans and counters of one service. TELEMETRY_EXPORTER picks the sink:
// log (default), http (needs TELEMETRY_ENDPOINT) or none.
class TelemetryUtility : public ioc::Utility {
public:
    inline static constexpr const char* NAME = "telemetry";
    inline static constexpr const char* LOG_TAG = "Telemetry";

    TelemetryUtility(std::string service, std::shared_ptr<TelemetrySink> sink);

    // A given sink replaces the one TELEMETRY_EXPORTER would select.
    static ioc::UtilityDescriptor descriptor(std::shared_ptr<TelemetrySink> sink = nullptr);

    std::string name() const override { return NAME; }
    Result<void> shutdown() override;

    void span(const std::string& name, std::chrono::microseconds duration, const Attributes& attributes = {});
    void counter(const std::string& name, int64_t delta = 1, const Attributes& attributes = {});

    int64_t counterValue(const std::string& name) const;
    std::string exporter() const;

    size_t emitted() const noexcept { return emitted_.load(); }
    size_t dropped() const noexcept { return dropped_.load(); }

private:
    // A throwing sink counts as a dropped event, never reaches the caller.
    void emit_(TelemetryEvent event);

    std::string service_;
    std::shared_ptr<TelemetrySink> sink_;
    std::map<std::string, int64_t> counters_;
    mutable std::mutex mutex_;
    std::atomic<bool> closed_{false};
    std::atomic<size_t> emitted_{0};
    std::atomic<size_t> dropped_{0};
};

} // namespace utilities
