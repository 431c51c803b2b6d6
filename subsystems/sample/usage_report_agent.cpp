#include "usage_report_agent.hpp"

#include "ioc/ioc.hpp"
#include "utilities/serialization_utility.hpp"

namespace sample {

UsageReportAgent::UsageReportAgent(ioc::DIContainer& container)
    : agent::AgentService(AGENT_NAME, container, REALM)
{
    registerCommand();
}

std::vector<agent::Capability> UsageReportAgent::getAgentCapabilities() const
{
    return {
        {"UsageReport", {REPORT_FEATURE}, "usage statistics of the caller's tenant"},
        {"ListMembers", {}, "active members of the caller's tenant"},
        {"TenantInfo", {}, "the caller's tenant record"},
    };
}

std::string UsageReportAgent::getAgentDescription() const
{
    return "Reports tenant usage and membership";
}

Result<agent::AgentResponse> UsageReportAgent::processRequest(const agent::AgentRequest& request)
{
    return dispatch(request);
}

Result<agent::AgentResponse> UsageReportAgent::cmdUsageReport(const agent::AgentRequest& request)
{
    auto serialization = container().getUtility<utilities::SerializationUtility>(
        utilities::SerializationUtility::NAME);
    if (!serialization) return Result<agent::AgentResponse>::Error(serialization.code(), serialization.error());

    auto stats = protocol().getTenantUsageStats(request.caller, request.tenant_id);
    if (!stats) return Result<agent::AgentResponse>::Error(stats.code(), stats.error());

    agent::AgentResponse response;
    response.topic = "usage_report";
    response.set("report", serialization.value()->toJson(stats.value()));
    response.set("total_actions", static_cast<int64_t>(stats->total_actions));
    response.set("usage_percentage", stats->usage_percentage);
    return Result<agent::AgentResponse>::OK(std::move(response));
}

Result<agent::AgentResponse> UsageReportAgent::cmdListMembers(const agent::AgentRequest& request)
{
    auto users = protocol().getTenantUsers(request.caller, request.tenant_id);
    if (!users) return Result<agent::AgentResponse>::Error(users.code(), users.error());

    std::vector<std::string> entries;
    for (const auto& user : users.value()) {
        entries.push_back(user.user_id + ":" + user.role);
    }

    agent::AgentResponse response;
    response.topic = "members";
    response.set("count", static_cast<int64_t>(entries.size()));
    response.set("users", std::move(entries));
    return Result<agent::AgentResponse>::OK(std::move(response));
}

Result<agent::AgentResponse> UsageReportAgent::cmdTenantInfo(const agent::AgentRequest& request)
{
    auto context = protocol().getTenantContext(request.tenant_id);
    if (!context) return Result<agent::AgentResponse>::Error(context.code(), context.error());
    if (!context.value()) {
        return Result<agent::AgentResponse>::Error(ResultCode::TenantNotFound,
                                                   "tenant '" + request.tenant_id + "' not found");
    }

    agent::AgentResponse response;
    response.topic = "tenant";
    // Falls back to the bare id when serialization is down.
    auto serialization = ioc::tryGetUtility<utilities::SerializationUtility>(
        container(), utilities::SerializationUtility::NAME);
    response.set("tenant", serialization ? serialization->toJson(context.value()->tenant)
                                         : context.value()->tenant.tenant_id);
    response.set("user_count", static_cast<int64_t>(context.value()->user_count));
    return Result<agent::AgentResponse>::OK(std::move(response));
}

} // namespace sample
