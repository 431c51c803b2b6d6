#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/message.hpp"
#include "common/result.h"
#include "ioc/di_container.hpp"
#include "ioc/managed_service.hpp"
#include "tenancy/tenant_protocol_enforcer.hpp"
#include "utilities/security_utility.hpp"

namespace agent {

// Binds a handler named cmdXxx to the command "Xxx".
#define REGISTER_AGENT_COMMAND(name)                                        \
    do {                                                                    \
        static_assert(#name[0]=='c' && #name[1]=='m' && #name[2]=='d',      \
                      "Agent command handler must start with 'cmd'");       \
        commands_[ std::string(#name).substr(3) ] =                         \
            [this](const agent::AgentRequest& request) {                    \
                return this->name(request);                                 \
            };                                                              \
    } while(0)

struct Capability {
    std::string command;
    std::set<std::string> required_features;
    std::string description;
};

struct AgentRequest {
    std::string command;
    security::SecurityContext caller;
    std::string tenant_id;
    message::Message args;
};

using AgentResponse = message::Message;

// Base of every agent service.
//
// Business logic lives in processRequest(); the tenant protocol is the
// enforcer returned by protocol(), shared by all commands of the agent.
// handle() is the entry point for callers: it checks the command, the
// caller's tenant access and the command's required features, runs
// processRequest() and audits the outcome as "agent.<name>.<command>".
//
// Registered with the container as a managed service of type "agent". A
// stopped or failed agent refuses requests.
class AgentService : public ioc::ManagedService {
public:
    inline static constexpr const char* LOG_TAG = "AgentService";
    inline static constexpr const char* SERVICE_TYPE = "agent";

    AgentService(std::string name, ioc::DIContainer& container, std::string realm = "default");
    virtual ~AgentService();

    AgentService(const AgentService&) = delete;
    AgentService& operator=(const AgentService&) = delete;

    virtual Result<AgentResponse> processRequest(const AgentRequest& request) = 0;
    virtual std::vector<Capability> getAgentCapabilities() const = 0;
    virtual std::string getAgentDescription() const = 0;

    Result<AgentResponse> handle(const AgentRequest& request);

    std::optional<Capability> capability(const std::string& command) const;

    std::string serviceName() const override { return name_; }
    std::string serviceType() const override { return SERVICE_TYPE; }
    std::string realm() const override { return realm_; }
    Result<void> startService() override;
    Result<void> stopService() override;
    ioc::ServiceHealth serviceHealth() const override;

    const std::string& name() const noexcept { return name_; }
    const tenancy::TenantProtocolEnforcer& protocol() const noexcept { return protocol_; }
    ioc::DIContainer& container() const noexcept { return container_; }

protected:
    virtual void registerCommand() = 0;

    // Hooks around the managed lifecycle. A failing onStart() leaves the
    // agent Failed.
    virtual Result<void> onStart() { return OK(); }
    virtual Result<void> onStop() { return OK(); }

    // Runs the handler registered for request.command.
    Result<AgentResponse> dispatch(const AgentRequest& request);

    std::unordered_map<std::string, std::function<Result<AgentResponse>(const AgentRequest&)>> commands_;

private:
    Result<AgentResponse> admit_(const AgentRequest& request) const;

    std::string name_;
    std::string realm_;
    ioc::DIContainer& container_;
    tenancy::TenantProtocolEnforcer protocol_;

    std::atomic<ioc::ServiceState> state_{ioc::ServiceState::Created};
    std::string failure_;
    mutable std::mutex state_mutex_;
};

} // namespace agent
