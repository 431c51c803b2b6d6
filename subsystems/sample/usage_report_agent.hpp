#pragma once

#include <string>
#include <vector>

#include "agent/agent_service.hpp"

namespace sample {

class UsageReportAgent : public agent::AgentService {
public:
    inline static constexpr const char* AGENT_NAME = "usage_report";
    inline static constexpr const char* REPORT_FEATURE = "usage_reports";
    inline static constexpr const char* REALM = "sample";

    explicit UsageReportAgent(ioc::DIContainer& container);

    Result<agent::AgentResponse> processRequest(const agent::AgentRequest& request) override;
    std::vector<agent::Capability> getAgentCapabilities() const override;
    std::string getAgentDescription() const override;

    /**
     * @command: UsageReport
     * @requires: usage_reports
     * @emit: report (json)
     * @description: usage statistics of the caller's tenant
     */
    Result<agent::AgentResponse> cmdUsageReport(const agent::AgentRequest& request);

    /**
     * @command: ListMembers
     * @emit: users ("user:role" list), count
     * @description: active members of the caller's tenant
     */
    Result<agent::AgentResponse> cmdListMembers(const agent::AgentRequest& request);

    /**
     * @command: TenantInfo
     * @emit: tenant (json), user_count
     * @description: the caller's tenant record
     */
    Result<agent::AgentResponse> cmdTenantInfo(const agent::AgentRequest& request);

protected:
    void registerCommand() override {
        REGISTER_AGENT_COMMAND(cmdUsageReport);
        REGISTER_AGENT_COMMAND(cmdListMembers);
        REGISTER_AGENT_COMMAND(cmdTenantInfo);
    }
};

} // namespace sample
