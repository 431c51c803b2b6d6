#include "di_container.hpp"

#include <algorithm>
#include <exception>

#include "logging/logging.hpp"
#include "utilities/health_utility.hpp"
#include "utilities/standard_utilities.hpp"
#include "utilities/telemetry_utility.hpp"

namespace ioc {

void CallGuard::release() noexcept
{
    if (owner_) {
        owner_->leave_();
        owner_ = nullptr;
    }
}

DIContainer::DIContainer()
    : DIContainer(utilities::standardDescriptors(), ContainerOptions{})
{
}

DIContainer::DIContainer(ContainerOptions options)
    : DIContainer(utilities::standardDescriptors(), options)
{
}

DIContainer::DIContainer(std::vector<UtilityDescriptor> descriptors, ContainerOptions options)
    : descriptors_(std::move(descriptors)), options_(options)
{
}

DIContainer::~DIContainer()
{
    shutdown();
}

std::string DIContainer::serviceName() const
{
    std::lock_guard<std::mutex> lock(name_mutex_);
    return service_name_;
}

Result<InitResult> DIContainer::initialize(const std::string& service_name, const config::Values& overrides)
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    if (service_name.empty()) {
        return Result<InitResult>::Error(ResultCode::InvalidArgument, "service name is empty");
    }

    const auto started = std::chrono::steady_clock::now();
    const auto deadline = task::deadlineAfter(options_.init_timeout);

    // -------------------------------
    // retire the previous generation
    // -------------------------------
    auto previous = std::atomic_load(&active_);
    if (previous) {
        LOGI("[{}] re-initializing, releasing generation {}", serviceName(), previous->id);
        state_.store(ContainerState::ShuttingDown);
        stopAllServices();
        release_(previous, task::deadlineAfter(options_.shutdown_timeout));
        std::atomic_store(&active_, std::shared_ptr<const Generation>());
    }

    {
        std::lock_guard<std::mutex> lock(name_mutex_);
        service_name_ = service_name;
    }
    state_.store(ContainerState::Initializing);

    // -------------------------------
    // configuration
    // -------------------------------
    auto snapshot = loader_.load(service_name, overrides);
    if (!snapshot) {
        LOGE("[{}] initialization failed: {}", service_name, to_string(snapshot));
        state_.store(ContainerState::Stopped);
        return Result<InitResult>::Error(snapshot.code(), snapshot.error());
    }

    // -------------------------------
    // bootstrap
    // -------------------------------
    auto booted = sequencer_.bootstrap(descriptors_, snapshot.value(), deadline);
    if (!booted) {
        LOGE("[{}] bootstrap rejected: {}", service_name, to_string(booted));
        state_.store(ContainerState::Stopped);
        return Result<InitResult>::Error(booted.code(), booted.error());
    }

    auto generation = std::make_shared<Generation>();
    generation->id = ++generation_;
    generation->snapshot = snapshot.value();
    generation->bootstrap = std::move(booted.value());
    generation->started = started;

    InitResult result;
    result.generation = generation->id;
    result.states = generation->bootstrap.states;
    result.degraded = generation->bootstrap.failed();

    std::atomic_store(&active_, std::shared_ptr<const Generation>(generation));
    accepting_.store(true);
    state_.store(result.degraded.empty() ? ContainerState::Running : ContainerState::Degraded);

    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);
    report_(*generation, elapsed);

    if (result.degraded.empty()) {
        LOGI("[{}] generation {} running, {} utilities", service_name, result.generation,
             generation->bootstrap.registry->size());
    } else {
        LOGW("[{}] generation {} degraded, failed: {}", service_name, result.generation, result.degraded.size());
    }
    return Result<InitResult>::OK(std::move(result));
}

void DIContainer::report_(const Generation& generation, std::chrono::microseconds elapsed) const
{
    const auto& registry = *generation.bootstrap.registry;

    if (auto health = registry.find<utilities::HealthUtility>(utilities::HealthUtility::NAME)) {
        for (const auto& name : generation.bootstrap.order) {
            health->report(name, generation.bootstrap.states.at(name));
        }
    }

    if (auto telemetry = registry.find<utilities::TelemetryUtility>(utilities::TelemetryUtility::NAME)) {
        telemetry->span("container.initialize", elapsed, {
            {"service", generation.snapshot.serviceName()},
            {"generation", std::to_string(generation.id)},
            {"ready", std::to_string(registry.size())},
            {"failed", std::to_string(generation.bootstrap.failed().size())},
        });
    }
}

Result<UtilityHandle> DIContainer::getUtility(const std::string& name) const
{
    auto generation = std::atomic_load(&active_);
    if (!generation || !accepting_.load()) {
        return Result<UtilityHandle>::Error(ResultCode::UtilityUnavailable,
            "container is " + std::string(to_string(state())));
    }

    auto handle = generation->bootstrap.registry->find(name);
    if (handle) return Result<UtilityHandle>::OK(std::move(handle));

    auto state = generation->bootstrap.states.find(name);
    if (state == generation->bootstrap.states.end()) {
        return Result<UtilityHandle>::Error(ResultCode::UtilityUnavailable, "unknown utility '" + name + "'");
    }
    return Result<UtilityHandle>::Error(ResultCode::UtilityUnavailable,
        "utility '" + name + "' is " + to_string(state->second.state) + " (" + to_string(state->second.reason) + ")");
}

CallGuard DIContainer::enter() const
{
    ++in_flight_;
    if (!accepting_.load()) {
        leave_();
        return CallGuard();
    }
    return CallGuard(this);
}

void DIContainer::leave_() const noexcept
{
    if (--in_flight_ == 0) {
        std::lock_guard<std::mutex> lock(drain_mutex_);
        drained_.notify_all();
    }
}

void DIContainer::release_(const std::shared_ptr<const Generation>& generation, task::Deadline deadline)
{
    accepting_.store(false);

    const auto grace = task::earliest(task::deadlineAfter(options_.drain_grace), deadline);
    {
        std::unique_lock<std::mutex> lock(drain_mutex_);
        auto idle = [this] { return in_flight_.load() == 0; };
        bool drained = true;
        if (grace == task::noDeadline()) {
            drained_.wait(lock, idle);
        } else {
            drained = drained_.wait_until(lock, grace, idle);
        }
        if (!drained) {
            LOGW("[{}] {} calls still in flight after grace period", serviceName(), in_flight_.load());
        }
    }

    const auto errors = generation->bootstrap.registry->releaseAll(options_.teardown_budget, deadline);
    if (errors > 0) {
        LOGW("[{}] generation {} released with {} teardown errors", serviceName(), generation->id, errors);
    } else {
        LOGI("[{}] generation {} released", serviceName(), generation->id);
    }
}

void DIContainer::shutdown()
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    const auto current = state_.load();
    if (current == ContainerState::Stopped) return;

    auto generation = std::atomic_load(&active_);
    if (!generation) {
        state_.store(ContainerState::Stopped);
        return;
    }

    state_.store(ContainerState::ShuttingDown);
    stopAllServices();
    release_(generation, task::deadlineAfter(options_.shutdown_timeout));
    std::atomic_store(&active_, std::shared_ptr<const Generation>());
    state_.store(ContainerState::Stopped);
}

void DIContainer::count_(const std::string& name, const std::string& service) const
{
    auto generation = std::atomic_load(&active_);
    if (!generation) return;
    auto telemetry = generation->bootstrap.registry->find<utilities::TelemetryUtility>(
        utilities::TelemetryUtility::NAME);
    if (telemetry) telemetry->counter(name, 1, {{"service", service}});
}

std::vector<ManagedServicePtr> DIContainer::servicesSnapshot_() const
{
    std::lock_guard<std::mutex> lock(services_mutex_);
    return services_;
}

Result<void> DIContainer::registerService(ManagedServicePtr service)
{
    if (!service) return Error(ResultCode::InvalidArgument, "service is null");

    const auto name = service->serviceName();
    if (name.empty()) return Error(ResultCode::InvalidArgument, "service name is empty");
    {
        std::lock_guard<std::mutex> lock(services_mutex_);
        auto same = [&name](const ManagedServicePtr& s) { return s->serviceName() == name; };
        if (std::any_of(services_.begin(), services_.end(), same)) {
            return Error(ResultCode::AlreadyExists, "service '" + name + "' already registered");
        }
        services_.push_back(service);
    }

    LOGI("[{}] service {} registered, type {} realm {}", serviceName(), name, service->serviceType(),
         service->realm());
    count_("container.service_registered", name);
    return OK();
}

Result<ManagedServicePtr> DIContainer::getService(const std::string& name) const
{
    for (auto& service : servicesSnapshot_()) {
        if (service->serviceName() == name) return Result<ManagedServicePtr>::OK(service);
    }
    return Result<ManagedServicePtr>::Error(ResultCode::NotFound, "no service '" + name + "'");
}

std::vector<ManagedServicePtr> DIContainer::servicesByType(const std::string& type) const
{
    auto services = servicesSnapshot_();
    services.erase(std::remove_if(services.begin(), services.end(),
                       [&type](const ManagedServicePtr& s) { return s->serviceType() != type; }),
                   services.end());
    return services;
}

std::vector<ManagedServicePtr> DIContainer::servicesByRealm(const std::string& realm) const
{
    auto services = servicesSnapshot_();
    services.erase(std::remove_if(services.begin(), services.end(),
                       [&realm](const ManagedServicePtr& s) { return s->realm() != realm; }),
                   services.end());
    return services;
}

std::vector<std::string> DIContainer::serviceNames() const
{
    std::vector<std::string> names;
    for (const auto& service : servicesSnapshot_()) names.push_back(service->serviceName());
    return names;
}

Result<void> DIContainer::startAllServices()
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    const auto current = state_.load();
    if (current != ContainerState::Running && current != ContainerState::Degraded) {
        return Error(ResultCode::InvalidState,
            std::string("cannot start services, container is ") + to_string(current));
    }

    Result<void> first = OK();
    size_t started = 0;
    for (const auto& service : servicesSnapshot_()) {
        Result<void> res = OK();
        try {
            res = service->startService();
        } catch (const std::exception& e) {
            res = Error(ResultCode::InternalError, std::string("startService threw: ") + e.what());
        } catch (...) {
            res = Error(ResultCode::InternalError, "startService threw an unknown exception");
        }

        if (res) {
            ++started;
            count_("container.service_started", service->serviceName());
            continue;
        }
        LOGE("[{}] service {} failed to start: {}", serviceName(), service->serviceName(), to_string(res));
        if (first) first = Error(res.code(), service->serviceName() + ": " + res.c_str());
    }

    LOGI("[{}] {} services started", serviceName(), started);
    return first;
}

void DIContainer::stopAllServices()
{
    auto services = servicesSnapshot_();
    for (auto it = services.rbegin(); it != services.rend(); ++it) {
        const auto& service = *it;
        if (service->serviceHealth().state != ServiceState::Running) continue;

        Result<void> res = OK();
        try {
            res = service->stopService();
        } catch (const std::exception& e) {
            res = Error(ResultCode::InternalError, std::string("stopService threw: ") + e.what());
        } catch (...) {
            res = Error(ResultCode::InternalError, "stopService threw an unknown exception");
        }
        if (!res) {
            LOGW("[{}] service {} stop: {}", serviceName(), service->serviceName(), to_string(res));
        } else {
            LOGD("[{}] service {} stopped", serviceName(), service->serviceName());
        }
    }
}

AggregatedHealth DIContainer::aggregatedHealth() const
{
    AggregatedHealth out;
    out.container = state();
    out.utilities = healthSummary();

    bool healthy = out.container == ContainerState::Running;
    for (const auto& [name, status] : out.utilities) {
        if (!status.ready()) healthy = false;
    }
    for (const auto& service : servicesSnapshot_()) {
        auto health = service->serviceHealth();
        if (!health.running()) healthy = false;
        out.services[service->serviceName()] = std::move(health);
    }
    out.healthy = healthy;
    return out;
}

std::map<std::string, UtilityStatus> DIContainer::healthSummary() const
{
    auto generation = std::atomic_load(&active_);
    if (!generation) return {};
    return generation->bootstrap.states;
}

ContainerSummary DIContainer::summary() const
{
    ContainerSummary out;
    out.service_name = serviceName();
    out.state = state();

    auto generation = std::atomic_load(&active_);
    if (!generation) return out;

    out.generation = generation->id;
    out.uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - generation->started);
    for (const auto& name : generation->bootstrap.order) {
        const auto& status = generation->bootstrap.states.at(name);
        (status.ready() ? out.ready : out.failed).push_back(name);
    }
    return out;
}

std::optional<config::ConfigurationSnapshot> DIContainer::configuration() const
{
    auto generation = std::atomic_load(&active_);
    if (!generation) return std::nullopt;
    return generation->snapshot;
}

} // namespace ioc
