#pragma once
#include <chrono>
#include <memory>
#include <string>

#include "common/result.h"
#include "ioc/utility.hpp"
#include "messaging/message_bus.hpp"

namespace utilities {

struct HealthReport {
    std::string service;
    std::string component;
    ioc::UtilityStatus status;
    std::chrono::system_clock::time_point at;
};

class HealthSink {
public:
    virtual ~HealthSink() = default;
    virtual Result<void> publish(const HealthReport& report) = 0;
};

// Publishes every report as a message on `topic`.
class MessageBusHealthSink : public HealthSink {
public:
    MessageBusHealthSink(std::shared_ptr<messaging::MessageBus> bus, std::string topic)
        : bus_(std::move(bus)), topic_(std::move(topic)) {}

    Result<void> publish(const HealthReport& report) override;

private:
    std::shared_ptr<messaging::MessageBus> bus_;
    std::string topic_;
};

} // namespace utilities
