#include "system_control.hpp"

#include <pthread.h>
#include <csignal>
#include <ctime>
#include <systemd/sd-daemon.h>

namespace system_control {

namespace {

std::string join(const std::vector<std::string>& names)
{
    std::string out;
    for (const auto& name : names) {
        if (!out.empty()) out += ",";
        out += name;
    }
    return out;
}

sigset_t shutdownSignals()
{
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

} // namespace

void notify_ready(const ioc::ContainerSummary& summary)
{
    if (summary.failed.empty()) {
        sd_notifyf(0, "READY=1\nSTATUS=%s generation %llu running",
                   summary.service_name.c_str(), static_cast<unsigned long long>(summary.generation));
    } else {
        sd_notifyf(0, "READY=1\nSTATUS=%s degraded: %s",
                   summary.service_name.c_str(), join(summary.failed).c_str());
    }
}

void notify_status(const std::string& msg)
{
    sd_notifyf(0, "STATUS=%s", msg.c_str());
}

void notify_stopping()
{
    sd_notify(0, "STOPPING=1");
}

void notify_watchdog()
{
    sd_notify(0, "WATCHDOG=1");
}

std::optional<std::chrono::microseconds> watchdog_interval()
{
    uint64_t usec = 0;
    if (sd_watchdog_enabled(0, &usec) <= 0 || usec == 0) return std::nullopt;
    return std::chrono::microseconds(usec / 2);
}

void block_shutdown_signals()
{
    sigset_t set = shutdownSignals();
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
}

int wait_for_shutdown_signal(std::chrono::milliseconds timeout)
{
    sigset_t set = shutdownSignals();
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(timeout);
    timespec ts{};
    ts.tv_sec = static_cast<time_t>(secs.count());
    ts.tv_nsec = static_cast<long>(std::chrono::duration_cast<std::chrono::nanoseconds>(timeout - secs).count());

    const int sig = sigtimedwait(&set, nullptr, &ts);
    return sig > 0 ? sig : 0;
}

} // namespace system_control
