#include "agent_service.hpp"

#include <exception>

#include "logging/logging.hpp"

namespace agent {

AgentService::AgentService(std::string name, ioc::DIContainer& container, std::string realm)
    : name_(std::move(name)), realm_(std::move(realm)), container_(container), protocol_(container)
{
}

AgentService::~AgentService()
{
    commands_.clear();
}

Result<void> AgentService::startService()
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_.load() == ioc::ServiceState::Running) return OK();

    auto started = onStart();
    if (!started) {
        failure_ = to_string(started);
        state_.store(ioc::ServiceState::Failed);
        LOGE("[{}] start failed: {}", name_, failure_);
        return started;
    }
    failure_.clear();
    state_.store(ioc::ServiceState::Running);
    LOGI("[{}] started, {} commands", name_, commands_.size());
    return OK();
}

Result<void> AgentService::stopService()
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_.load() != ioc::ServiceState::Running) {
        state_.store(ioc::ServiceState::Stopped);
        return OK();
    }
    state_.store(ioc::ServiceState::Stopped);

    auto stopped = onStop();
    if (!stopped) {
        LOGW("[{}] stop: {}", name_, to_string(stopped));
        return stopped;
    }
    LOGI("[{}] stopped", name_);
    return OK();
}

ioc::ServiceHealth AgentService::serviceHealth() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return ioc::ServiceHealth{state_.load(), failure_};
}

std::optional<Capability> AgentService::capability(const std::string& command) const
{
    for (auto& capability : getAgentCapabilities()) {
        if (capability.command == command) return capability;
    }
    return std::nullopt;
}

Result<AgentResponse> AgentService::dispatch(const AgentRequest& request)
{
    auto it = commands_.find(request.command);
    if (it == commands_.end()) {
        return Result<AgentResponse>::Error(ResultCode::NotSupported,
                                            name_ + " has no handler for '" + request.command + "'");
    }
    return it->second(request);
}

Result<AgentResponse> AgentService::admit_(const AgentRequest& request) const
{
    auto found = capability(request.command);
    if (!found) {
        return Result<AgentResponse>::Error(ResultCode::NotSupported,
                                            "unknown command '" + request.command + "'");
    }
    if (!request.caller.valid()) {
        return Result<AgentResponse>::Error(ResultCode::AccessDenied, "caller is not authenticated");
    }
    if (!protocol_.validateTenantAccess(request.caller.user_id, request.tenant_id)) {
        return Result<AgentResponse>::Error(ResultCode::AccessDenied,
            "'" + request.caller.user_id + "' has no access to '" + request.tenant_id + "'");
    }
    for (const auto& feature : found->required_features) {
        if (!protocol_.validateTenantFeatureAccess(request.tenant_id, feature)) {
            return Result<AgentResponse>::Error(ResultCode::AccessDenied,
                "tenant '" + request.tenant_id + "' lacks feature '" + feature + "'");
        }
    }
    return Result<AgentResponse>::OK(AgentResponse{});
}

Result<AgentResponse> AgentService::handle(const AgentRequest& request)
{
    const auto state = state_.load();
    if (state == ioc::ServiceState::Stopped || state == ioc::ServiceState::Failed) {
        return Result<AgentResponse>::Error(ResultCode::UtilityUnavailable,
            name_ + " is " + ioc::to_string(state));
    }

    auto guard = container_.enter();
    if (!guard) {
        return Result<AgentResponse>::Error(ResultCode::UtilityUnavailable, "container is not accepting calls");
    }

    Result<AgentResponse> result = admit_(request);
    if (result) {
        try {
            result = processRequest(request);
        } catch (const std::exception& e) {
            result = Result<AgentResponse>::Error(ResultCode::InternalError,
                                                  std::string("processRequest threw: ") + e.what());
        } catch (...) {
            result = Result<AgentResponse>::Error(ResultCode::InternalError,
                                                  "processRequest threw an unknown exception");
        }
    }

    tenancy::AuditOutcome outcome = tenancy::AuditOutcome::Success;
    if (!result) {
        const bool denied = result.code() == ResultCode::AccessDenied || result.code() == ResultCode::TenantInactive;
        outcome = denied ? tenancy::AuditOutcome::Denied : tenancy::AuditOutcome::Failed;
        LOGW("[{}] {} for {}@{}: {}", name_, request.command, request.caller.user_id, request.tenant_id,
             to_string(result));
    } else {
        LOGD("[{}] {} for {}@{} done", name_, request.command, request.caller.user_id, request.tenant_id);
    }

    if (!request.tenant_id.empty()) {
        protocol_.auditTenantAction(request.tenant_id, request.caller.user_id,
                                    "agent." + name_ + "." + request.command, outcome);
    }
    return result;
}

} // namespace agent
