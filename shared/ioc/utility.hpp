#pragma once
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "common/result.h"
#include "config/config_key.hpp"
#include "config/configuration_snapshot.hpp"

namespace ioc {

// A cross-cutting capability owned by a container generation.
class Utility {
public:
    virtual ~Utility() = default;

    virtual std::string name() const = 0;

    // Called once when the generation is released, in reverse construction
    // order. Must return within the teardown budget the registry gives it.
    virtual Result<void> shutdown() { return OK(); }
};

using UtilityHandle = std::shared_ptr<Utility>;

enum class UtilityState { Pending, Initializing, Ready, Failed };

enum class FailureReason {
    None,
    ConstructorFailed,
    DependencyFailed,
    MissingDependency,
    ConfigError,
    Timeout,
};

constexpr const char* to_string(UtilityState state) {
    switch (state) {
        case UtilityState::Pending:      return "Pending";
        case UtilityState::Initializing: return "Initializing";
        case UtilityState::Ready:        return "Ready";
        case UtilityState::Failed:       return "Failed";
    }
    return "Unknown";
}

constexpr const char* to_string(FailureReason reason) {
    switch (reason) {
        case FailureReason::None:              return "None";
        case FailureReason::ConstructorFailed: return "ConstructorFailed";
        case FailureReason::DependencyFailed:  return "DependencyFailed";
        case FailureReason::MissingDependency: return "MissingDependency";
        case FailureReason::ConfigError:       return "ConfigError";
        case FailureReason::Timeout:           return "Timeout";
    }
    return "Unknown";
}

struct UtilityStatus {
    UtilityState state = UtilityState::Pending;
    FailureReason reason = FailureReason::None;
    std::string detail;

    bool ready() const noexcept { return state == UtilityState::Ready; }
    bool failed() const noexcept { return state == UtilityState::Failed; }
};

// What a factory gets: its configuration slice and its Ready dependencies.
class UtilityContext {
public:
    UtilityContext(std::string service_name,
                   config::ConfigurationSnapshot config,
                   std::map<std::string, UtilityHandle> dependencies)
        : service_name_(std::move(service_name)),
          config_(std::move(config)),
          dependencies_(std::move(dependencies)) {}

    const std::string& serviceName() const noexcept { return service_name_; }
    const config::ConfigurationSnapshot& config() const noexcept { return config_; }

    UtilityHandle dependency(const std::string& name) const {
        auto it = dependencies_.find(name);
        return it == dependencies_.end() ? nullptr : it->second;
    }

    template<typename T>
    std::shared_ptr<T> dependency(const std::string& name) const {
        return std::dynamic_pointer_cast<T>(dependency(name));
    }

private:
    std::string service_name_;
    config::ConfigurationSnapshot config_;
    std::map<std::string, UtilityHandle> dependencies_;
};

using UtilityFactory = std::function<Result<UtilityHandle>(const UtilityContext&)>;

struct UtilityDescriptor {
    std::string name;
    UtilityFactory factory;
    std::vector<std::string> dependencies;
    std::vector<config::ConfigKey> config_keys;
    // Every key starting with this prefix is part of the slice as well.
    std::string config_prefix;
    // Hands the whole snapshot to the factory instead of a slice.
    bool full_configuration = false;
};

} // namespace ioc
