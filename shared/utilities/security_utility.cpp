#include "security_utility.hpp"

#include "config_utility.hpp"

namespace utilities {

SecurityUtility::SecurityUtility(std::string platform_admin_role, std::shared_ptr<LoggerUtility> logger)
    : platform_admin_role_(std::move(platform_admin_role)),
      logger_(std::move(logger)),
      engine_(std::make_shared<security::AllowAllPolicyEngine>())
{
}

ioc::UtilityDescriptor SecurityUtility::descriptor(std::shared_ptr<security::PolicyEngine> engine)
{
    ioc::UtilityDescriptor d;
    d.name = NAME;
    d.dependencies = {ConfigUtility::NAME, LoggerUtility::NAME};
    d.config_keys = {config::optionalKey("SECURITY_PLATFORM_ADMIN_ROLE")};
    d.config_prefix = "SECURITY_";
    d.factory = [engine](const ioc::UtilityContext& ctx) -> Result<ioc::UtilityHandle> {
        auto logger = ctx.dependency<LoggerUtility>(LoggerUtility::NAME);
        if (!logger) return Result<ioc::UtilityHandle>::Error(ResultCode::DependencyFailed, "logger");

        const auto role = ctx.config().getString("SECURITY_PLATFORM_ADMIN_ROLE", "platform_admin");
        if (role.empty()) {
            return Result<ioc::UtilityHandle>::Error(ResultCode::InvalidArgument,
                "SECURITY_PLATFORM_ADMIN_ROLE is empty");
        }
        auto utility = std::make_shared<SecurityUtility>(role, logger);
        if (engine) utility->setPolicyEngine(engine);
        return Result<ioc::UtilityHandle>::OK(utility);
    };
    return d;
}

bool SecurityUtility::isPlatformAdmin(const security::SecurityContext& caller) const
{
    return caller.valid() && caller.hasRole(platform_admin_role_);
}

Result<void> SecurityUtility::authorize(const security::SecurityContext& caller,
                                        const std::string& action,
                                        const std::string& resource) const
{
    if (!caller.valid()) {
        return Error(ResultCode::AccessDenied, "no authenticated user for " + action);
    }

    std::shared_ptr<security::PolicyEngine> engine;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        engine = engine_;
    }

    auto res = engine->enforce(caller, action, resource);
    if (!res) {
        logger_->warn("policy denied {} on {} for {}: {}", action, resource, caller.user_id, to_string(res));
        if (res.code() != ResultCode::AccessDenied) {
            return Error(ResultCode::AccessDenied, to_string(res));
        }
    }
    return res;
}

void SecurityUtility::setPolicyEngine(std::shared_ptr<security::PolicyEngine> engine)
{
    if (!engine) engine = std::make_shared<security::AllowAllPolicyEngine>();
    std::lock_guard<std::mutex> lock(mutex_);
    engine_ = std::move(engine);
}

} // namespace utilities
