#include "telemetry_utility.hpp"

#include "common/helper.hpp"
#include "config_utility.hpp"
#include "logging/logging.hpp"

namespace utilities {

TelemetryUtility::TelemetryUtility(std::string service, std::shared_ptr<TelemetrySink> sink)
    : service_(std::move(service)), sink_(std::move(sink))
{
}

ioc::UtilityDescriptor TelemetryUtility::descriptor(std::shared_ptr<TelemetrySink> sink)
{
    ioc::UtilityDescriptor d;
    d.name = NAME;
    d.dependencies = {ConfigUtility::NAME, LoggerUtility::NAME};
    d.config_keys = {
        config::optionalKey("TELEMETRY_EXPORTER"),
        config::optionalKey("TELEMETRY_ENDPOINT"),
        config::optionalKey("TELEMETRY_TIMEOUT_MS", config::ValueType::Int),
        config::optionalKey("TELEMETRY_QUEUE_SIZE", config::ValueType::Int),
    };
    d.factory = [sink](const ioc::UtilityContext& ctx) -> Result<ioc::UtilityHandle> {
        using Handle = Result<ioc::UtilityHandle>;

        auto logger = ctx.dependency<LoggerUtility>(LoggerUtility::NAME);
        if (!logger) return Handle::Error(ResultCode::DependencyFailed, "logger");

        if (sink) {
            return Handle::OK(std::make_shared<TelemetryUtility>(ctx.serviceName(), sink));
        }

        const auto& cfg = ctx.config();
        const auto exporter = toLower(cfg.getString("TELEMETRY_EXPORTER", "log"));

        std::shared_ptr<TelemetrySink> selected;
        if (exporter == "log") {
            selected = std::make_shared<LogTelemetrySink>(logger);
        } else if (exporter == "http") {
            const auto endpoint = cfg.getString("TELEMETRY_ENDPOINT", "");
            if (endpoint.empty()) {
                return Handle::Error(ResultCode::ConfigMissingRequired,
                    "TELEMETRY_EXPORTER=http requires TELEMETRY_ENDPOINT");
            }
            const auto timeout = cfg.getInt("TELEMETRY_TIMEOUT_MS", 200);
            const auto capacity = cfg.getInt("TELEMETRY_QUEUE_SIZE",
                                             static_cast<int64_t>(HttpTelemetrySink::DEFAULT_CAPACITY));
            if (capacity <= 0) {
                return Handle::Error(ResultCode::InvalidArgument, "TELEMETRY_QUEUE_SIZE must be positive");
            }
            selected = std::make_shared<HttpTelemetrySink>(endpoint, std::chrono::milliseconds(timeout),
                                                           static_cast<size_t>(capacity));
        } else if (exporter != "none") {
            return Handle::Error(ResultCode::InvalidArgument, "unknown TELEMETRY_EXPORTER '" + exporter + "'");
        }

        logger->debug("telemetry exporter: {}", exporter);
        return Handle::OK(std::make_shared<TelemetryUtility>(ctx.serviceName(), std::move(selected)));
    };
    return d;
}

Result<void> TelemetryUtility::shutdown()
{
    if (closed_.exchange(true) || !sink_) return OK();
    try {
        sink_->close();
    } catch (const std::exception& e) {
        LOGW("sink {} close failed: {}", sink_->name(), e.what());
    } catch (...) {
        LOGW("sink {} close failed: unknown exception", sink_->name());
    }
    return OK();
}

std::string TelemetryUtility::exporter() const
{
    return sink_ ? sink_->name() : "none";
}

void TelemetryUtility::span(const std::string& name, std::chrono::microseconds duration,
                            const Attributes& attributes)
{
    TelemetryEvent event;
    event.kind = TelemetryKind::Span;
    event.name = name;
    event.duration = duration;
    event.attributes = attributes;
    emit_(std::move(event));
}

void TelemetryUtility::counter(const std::string& name, int64_t delta, const Attributes& attributes)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name] += delta;
    }
    TelemetryEvent event;
    event.kind = TelemetryKind::Counter;
    event.name = name;
    event.value = delta;
    event.attributes = attributes;
    emit_(std::move(event));
}

int64_t TelemetryUtility::counterValue(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
}

void TelemetryUtility::emit_(TelemetryEvent event)
{
    if (!sink_ || closed_.load()) return;

    event.service = service_;
    event.timestamp = std::chrono::system_clock::now();
    Result<void> res = OK();
    try {
        res = sink_->emit(event);
    } catch (const std::exception& e) {
        res = Error(ResultCode::InternalError, e.what());
    } catch (...) {
        res = Error(ResultCode::InternalError, "unknown exception");
    }
    if (res) {
        ++emitted_;
        return;
    }
    const auto dropped = ++dropped_;
    if (res.code() == ResultCode::InternalError) {
        LOGW("{} dropped by sink {}: {}", event.name, sink_->name(), to_string(res));
    } else if (dropped == 1) {
        LOGD("{} dropped by sink {}: {}", event.name, sink_->name(), to_string(res));
    }
}

} // namespace utilities
