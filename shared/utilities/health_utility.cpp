#include "health_utility.hpp"

#include <exception>

#include "logging/logging.hpp"
#include "messaging/zmq_message_bus.hpp"
#include "task/worker.hpp"

namespace utilities {

class HealthUtility::Heartbeat : public task::Worker {
public:
    explicit Heartbeat(HealthUtility& owner) : owner_(owner) {}
    ~Heartbeat() override { stop(); }

protected:
    Result<void> run() override
    {
        owner_.republish_();
        return OK();
    }

private:
    HealthUtility& owner_;
};

HealthUtility::HealthUtility(std::string service, std::shared_ptr<LoggerUtility> logger,
                             std::chrono::milliseconds interval)
    : service_(std::move(service)), logger_(std::move(logger)), interval_(interval)
{
}

HealthUtility::~HealthUtility()
{
    stopHeartbeat();
}

ioc::UtilityDescriptor HealthUtility::descriptor(std::shared_ptr<HealthSink> sink)
{
    ioc::UtilityDescriptor d;
    d.name = NAME;
    d.dependencies = {LoggerUtility::NAME};
    d.config_keys = {
        config::optionalKey("HEALTH_CHECK_INTERVAL", config::ValueType::Int),
        config::optionalKey("HEALTH_PUBLISH_ENDPOINT"),
        config::optionalKey("HEALTH_TOPIC"),
    };
    d.factory = [sink](const ioc::UtilityContext& ctx) -> Result<ioc::UtilityHandle> {
        using Handle = Result<ioc::UtilityHandle>;

        auto logger = ctx.dependency<LoggerUtility>(LoggerUtility::NAME);
        if (!logger) return Handle::Error(ResultCode::DependencyFailed, "logger");

        const auto& cfg = ctx.config();
        const auto seconds = cfg.getInt("HEALTH_CHECK_INTERVAL", 30);
        if (seconds < 0) {
            return Handle::Error(ResultCode::InvalidArgument, "HEALTH_CHECK_INTERVAL must not be negative");
        }
        auto health = std::make_shared<HealthUtility>(ctx.serviceName(), logger, std::chrono::seconds(seconds));

        const auto endpoint = cfg.getString("HEALTH_PUBLISH_ENDPOINT", "");
        if (!endpoint.empty()) {
            auto bus = std::make_shared<messaging::ZmqMessageBus>(endpoint);
            health->addSink(std::make_shared<MessageBusHealthSink>(bus, cfg.getString("HEALTH_TOPIC", "health")));
            logger->info("health reports published on {}", endpoint);
        }
        health->addSink(sink);

        auto started = health->startHeartbeat();
        if (!started) return Handle::Error(started.code(), "health heartbeat: " + to_string(started));
        return Handle::OK(health);
    };
    return d;
}

Result<void> HealthUtility::shutdown()
{
    stopHeartbeat();
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
    return OK();
}

void HealthUtility::addSink(std::shared_ptr<HealthSink> sink)
{
    if (!sink) return;
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

Result<void> HealthUtility::startHeartbeat()
{
    std::lock_guard<std::mutex> lock(heartbeat_mutex_);
    if (interval_.count() <= 0 || heartbeat_) return OK();

    auto heartbeat = std::make_unique<Heartbeat>(*this);
    task::WorkerDescriptor desc;
    desc.name = "health-heartbeat";
    desc.type = task::WorkerType::Loop;
    desc.loop_sleep = interval_;
    auto res = heartbeat->start(desc);
    if (!res) return res;
    heartbeat_ = std::move(heartbeat);
    return OK();
}

void HealthUtility::stopHeartbeat()
{
    std::unique_ptr<Heartbeat> heartbeat;
    {
        std::lock_guard<std::mutex> lock(heartbeat_mutex_);
        heartbeat = std::move(heartbeat_);
    }
    if (heartbeat) {
        auto res = heartbeat->stop();
        if (!res) LOGW("heartbeat stop: {}", to_string(res));
    }
}

void HealthUtility::report(const std::string& component, const ioc::UtilityStatus& status)
{
    std::vector<std::shared_ptr<HealthSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        components_[component] = status;
        sinks = sinks_;
    }

    if (status.failed()) {
        logger_->warn("{} is {} ({}): {}", component, ioc::to_string(status.state),
                      ioc::to_string(status.reason), status.detail);
    }

    publish_(sinks, HealthReport{service_, component, status, std::chrono::system_clock::now()});
}

void HealthUtility::republish_()
{
    std::map<std::string, ioc::UtilityStatus> components;
    std::vector<std::shared_ptr<HealthSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        components = components_;
        sinks = sinks_;
    }
    if (sinks.empty() || components.empty()) return;

    const auto now = std::chrono::system_clock::now();
    for (const auto& [component, status] : components) {
        publish_(sinks, HealthReport{service_, component, status, now});
    }
    ++heartbeats_;
}

void HealthUtility::publish_(const std::vector<std::shared_ptr<HealthSink>>& sinks, const HealthReport& report)
{
    for (const auto& sink : sinks) {
        Result<void> res = OK();
        try {
            res = sink->publish(report);
        } catch (const std::exception& e) {
            res = Error(ResultCode::InternalError, e.what());
        } catch (...) {
            res = Error(ResultCode::InternalError, "unknown exception");
        }
        if (!res) {
            ++publish_failures_;
            logger_->warn("health publish failed for {}: {}", report.component, to_string(res));
        }
    }
}

std::optional<ioc::UtilityStatus> HealthUtility::status(const std::string& component) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = components_.find(component);
    if (it == components_.end()) return std::nullopt;
    return it->second;
}

std::map<std::string, ioc::UtilityStatus> HealthUtility::summary() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return components_;
}

bool HealthUtility::healthy() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [name, status] : components_) {
        if (!status.ready()) return false;
    }
    return true;
}

} // namespace utilities
