#include "health_sink.hpp"

namespace utilities {

Result<void> MessageBusHealthSink::publish(const HealthReport& report)
{
    if (!bus_) return Error(ResultCode::InvalidState, "no message bus");

    const auto at_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        report.at.time_since_epoch()).count();

    message::Message msg;
    msg.topic = topic_;
    msg.set("service", report.service)
       .set("component", report.component)
       .set("state", std::string(ioc::to_string(report.status.state)))
       .set("reason", std::string(ioc::to_string(report.status.reason)))
       .set("detail", report.status.detail)
       .set("at_ms", static_cast<int64_t>(at_ms));
    return bus_->publish(msg);
}

} // namespace utilities
