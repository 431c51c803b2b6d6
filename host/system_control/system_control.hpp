#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "ioc/di_container.hpp"

namespace system_control {

// systemd notification for the host process. All calls are no-ops when the
// process was not started by systemd.

void notify_ready(const ioc::ContainerSummary& summary);
void notify_status(const std::string& msg);
void notify_stopping();
void notify_watchdog();

// Half the configured WatchdogSec, or nullopt when the watchdog is off.
std::optional<std::chrono::microseconds> watchdog_interval();

// Blocks SIGINT/SIGTERM for the calling thread and the threads it starts.
// Call before any worker thread is created.
void block_shutdown_signals();

// Waits up to timeout for SIGINT/SIGTERM. Returns the signal, or 0.
int wait_for_shutdown_signal(std::chrono::milliseconds timeout);

} // namespace system_control
