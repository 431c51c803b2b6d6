#include <chrono>
#include <memory>
#include <string>

#include "ioc/ioc.hpp"
#include "logging/logging.hpp"
#include "system_control/system_control.hpp"
#include "usage_report_agent.hpp"

static constexpr const char* TAG = "Host";

// tenantcore_host [service_name] [config_dir]
int main(int argc, char** argv)
{
    const std::string service = argc > 1 ? argv[1] : "tenantcore";
    const std::string config_dir = argc > 2 ? argv[2] : "config";

    system_control::block_shutdown_signals();

    auto logged = logging::init(logging::Type::SpdLog, config_dir + "/logging.yaml");
    if (!logged) {
        logged = logging::Logger::instance().initDefault(logging::Type::SpdLog);
    }
    if (!logged) {
        system_control::notify_status("logging unavailable: " + to_string(logged));
    }

    ioc::DIContainer container;
    container.loader().addStandardSources(config_dir);

    auto init = container.initialize(service);
    if (!init) {
        LOG_FATAL(TAG, "{} failed to initialize: {}", service, to_string(init));
        system_control::notify_status("initialization failed: " + to_string(init));
        return 1;
    }

    auto agent = std::make_shared<sample::UsageReportAgent>(container);
    LOG_INFO(TAG, "{}: {}", agent->name(), agent->getAgentDescription());
    for (const auto& capability : agent->getAgentCapabilities()) {
        LOG_INFO(TAG, "  {} - {}", capability.command, capability.description);
    }

    auto registered = container.registerService(agent);
    if (!registered) {
        LOG_FATAL(TAG, "{} not registered: {}", agent->name(), to_string(registered));
        return 1;
    }
    auto services = container.startAllServices();
    if (!services) {
        LOG_WARN(TAG, "{}: {}", service, to_string(services));
    }

    const auto summary = container.summary();
    system_control::notify_ready(summary);
    if (!container.aggregatedHealth().healthy) {
        LOG_WARN(TAG, "{} is not fully healthy", service);
    }
    if (!summary.failed.empty()) {
        LOG_WARN(TAG, "{} running degraded, {} utilities failed", service, summary.failed.size());
    }

    const auto watchdog = system_control::watchdog_interval();
    const auto tick = watchdog
        ? std::chrono::duration_cast<std::chrono::milliseconds>(*watchdog)
        : std::chrono::milliseconds(1000);

    int sig = 0;
    while (sig == 0) {
        sig = system_control::wait_for_shutdown_signal(tick);
        if (watchdog) system_control::notify_watchdog();
    }

    LOG_INFO(TAG, "signal {} received, shutting down {}", sig, service);
    system_control::notify_stopping();
    container.shutdown();
    LOG_INFO(TAG, "{} stopped", service);
    return 0;
}
