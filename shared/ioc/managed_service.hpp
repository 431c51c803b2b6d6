#pragma once
#include <memory>
#include <string>

#include "common/result.h"

namespace ioc {

enum class ServiceState { Created, Running, Stopped, Failed };

constexpr const char* to_string(ServiceState state) {
    switch (state) {
        case ServiceState::Created: return "Created";
        case ServiceState::Running: return "Running";
        case ServiceState::Stopped: return "Stopped";
        case ServiceState::Failed:  return "Failed";
    }
    return "Unknown";
}

struct ServiceHealth {
    ServiceState state = ServiceState::Created;
    std::string detail;

    bool running() const noexcept { return state == ServiceState::Running; }
};

// A long-lived service registered with a container, such as an agent.
// Unlike utilities it is owned by the application and outlives generations;
// the container starts it on request and stops it before any utility is
// released.
class ManagedService {
public:
    virtual ~ManagedService() = default;

    virtual std::string serviceName() const = 0;
    virtual std::string serviceType() const = 0;
    virtual std::string realm() const = 0;

    virtual Result<void> startService() = 0;
    virtual Result<void> stopService() = 0;
    virtual ServiceHealth serviceHealth() const = 0;
};

using ManagedServicePtr = std::shared_ptr<ManagedService>;

} // namespace ioc
