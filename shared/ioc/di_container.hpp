#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "bootstrap_sequencer.hpp"
#include "common/result.h"
#include "config/configuration_loader.hpp"
#include "managed_service.hpp"
#include "utility.hpp"

namespace ioc {

struct ContainerOptions {
    // 0 disables the deadline
    std::chrono::milliseconds init_timeout{0};
    std::chrono::milliseconds shutdown_timeout{10000};
    // per utility teardown
    std::chrono::milliseconds teardown_budget{2000};
    // wait for in-flight calls before releasing utilities
    std::chrono::milliseconds drain_grace{2000};
};

enum class ContainerState { Created, Initializing, Running, Degraded, ShuttingDown, Stopped };

constexpr const char* to_string(ContainerState state) {
    switch (state) {
        case ContainerState::Created:      return "Created";
        case ContainerState::Initializing: return "Initializing";
        case ContainerState::Running:      return "Running";
        case ContainerState::Degraded:     return "Degraded";
        case ContainerState::ShuttingDown: return "ShuttingDown";
        case ContainerState::Stopped:      return "Stopped";
    }
    return "Unknown";
}

struct InitResult {
    uint64_t generation = 0;
    std::map<std::string, UtilityStatus> states;
    std::vector<std::string> degraded;
};

struct ContainerSummary {
    std::string service_name;
    ContainerState state = ContainerState::Created;
    uint64_t generation = 0;
    std::chrono::seconds uptime{0};
    std::vector<std::string> ready;
    std::vector<std::string> failed;
};

// Container, utility and registered service state in one view. healthy
// requires a Running container, every utility Ready and every registered
// service Running.
struct AggregatedHealth {
    ContainerState container = ContainerState::Created;
    std::map<std::string, UtilityStatus> utilities;
    std::map<std::string, ServiceHealth> services;
    bool healthy = false;
};

class DIContainer;

// Marks a call in flight so that shutdown() waits for it.
class CallGuard {
public:
    CallGuard() = default;
    ~CallGuard() { release(); }

    CallGuard(CallGuard&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
    CallGuard& operator=(CallGuard&& other) noexcept {
        if (this != &other) {
            release();
            owner_ = other.owner_;
            other.owner_ = nullptr;
        }
        return *this;
    }
    CallGuard(const CallGuard&) = delete;
    CallGuard& operator=(const CallGuard&) = delete;

    explicit operator bool() const noexcept { return owner_ != nullptr; }

private:
    friend class DIContainer;
    explicit CallGuard(const DIContainer* owner) : owner_(owner) {}
    void release() noexcept;

    const DIContainer* owner_ = nullptr;
};

// The only object application code talks to.
//
// initialize() builds a new generation (snapshot + registry) and publishes
// it atomically; getUtility() reads the published generation without
// locking. Containers share nothing, so several may live in one process.
class DIContainer {
public:
    inline static constexpr const char* LOG_TAG = "DIContainer";

    // standard utility set
    DIContainer();
    explicit DIContainer(ContainerOptions options);
    DIContainer(std::vector<UtilityDescriptor> descriptors, ContainerOptions options = {});
    ~DIContainer();

    DIContainer(const DIContainer&) = delete;
    DIContainer& operator=(const DIContainer&) = delete;

    // Add sources before initialize().
    config::ConfigurationLoader& loader() noexcept { return loader_; }

    // Not idempotent: a previous generation is drained and released first.
    Result<InitResult> initialize(const std::string& service_name, const config::Values& overrides = {});

    Result<UtilityHandle> getUtility(const std::string& name) const;

    template<typename T>
    Result<std::shared_ptr<T>> getUtility(const std::string& name) const {
        auto handle = getUtility(name);
        if (!handle) return Result<std::shared_ptr<T>>::Error(handle.code(), handle.error());
        auto typed = std::dynamic_pointer_cast<T>(handle.value());
        if (!typed) {
            return Result<std::shared_ptr<T>>::Error(ResultCode::UtilityUnavailable,
                "utility '" + name + "' has an unexpected type");
        }
        return Result<std::shared_ptr<T>>::OK(std::move(typed));
    }

    // Always completes; errors are logged. Safe to call more than once.
    void shutdown();

    // Returns an empty guard once shutdown has started.
    CallGuard enter() const;

    // -------------------------------
    // managed services
    // -------------------------------

    // Registrations survive re-initialization; names are unique.
    Result<void> registerService(ManagedServicePtr service);
    Result<ManagedServicePtr> getService(const std::string& name) const;
    std::vector<ManagedServicePtr> servicesByType(const std::string& type) const;
    std::vector<ManagedServicePtr> servicesByRealm(const std::string& realm) const;
    std::vector<std::string> serviceNames() const;

    // Starts every registered service in registration order. Requires a
    // Running or Degraded container; a failing service does not stop the
    // others, the first failure is returned.
    Result<void> startAllServices();
    // Reverse registration order. Errors are logged. shutdown() and
    // re-initialization call it before releasing utilities.
    void stopAllServices();

    std::map<std::string, UtilityStatus> healthSummary() const;
    AggregatedHealth aggregatedHealth() const;
    ContainerSummary summary() const;

    std::optional<config::ConfigurationSnapshot> configuration() const;

    ContainerState state() const noexcept { return state_.load(); }
    uint64_t generation() const noexcept { return generation_.load(); }
    std::string serviceName() const;
    size_t inFlight() const noexcept { return in_flight_.load(); }

private:
    friend class CallGuard;

    struct Generation {
        uint64_t id = 0;
        config::ConfigurationSnapshot snapshot;
        BootstrapResult bootstrap;
        std::chrono::steady_clock::time_point started;
    };

    void leave_() const noexcept;
    void release_(const std::shared_ptr<const Generation>& generation, task::Deadline deadline);
    void report_(const Generation& generation, std::chrono::microseconds elapsed) const;
    void count_(const std::string& name, const std::string& service) const;
    std::vector<ManagedServicePtr> servicesSnapshot_() const;

    std::vector<UtilityDescriptor> descriptors_;
    ContainerOptions options_;
    config::ConfigurationLoader loader_;
    BootstrapSequencer sequencer_;

    std::string service_name_;
    mutable std::mutex name_mutex_;
    std::shared_ptr<const Generation> active_;
    std::atomic<ContainerState> state_{ContainerState::Created};
    std::atomic<uint64_t> generation_{0};
    std::atomic<bool> accepting_{false};

    mutable std::atomic<size_t> in_flight_{0};
    mutable std::mutex drain_mutex_;
    mutable std::condition_variable drained_;

    std::mutex lifecycle_mutex_;

    std::vector<ManagedServicePtr> services_;
    mutable std::mutex services_mutex_;
};

} // namespace ioc
