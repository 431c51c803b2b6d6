#pragma once
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "common/result.h"
#include "ioc/utility.hpp"
#include "logger_utility.hpp"

namespace security {

// Who is calling. An empty user_id is never authorized.
struct SecurityContext {
    std::string user_id;
    std::string tenant_id;
    std::set<std::string> roles;
    std::set<std::string> permissions;
    std::string session_id;

    bool valid() const noexcept { return !user_id.empty(); }
    bool hasRole(const std::string& role) const { return roles.count(role) > 0; }
    bool hasPermission(const std::string& permission) const { return permissions.count(permission) > 0; }
};

// Extra policy applied after the built-in checks. AccessDenied to refuse.
class PolicyEngine {
public:
    virtual ~PolicyEngine() = default;
    virtual Result<void> enforce(const SecurityContext& caller,
                                 const std::string& action,
                                 const std::string& resource) = 0;
};

class AllowAllPolicyEngine : public PolicyEngine {
public:
    Result<void> enforce(const SecurityContext&, const std::string&, const std::string&) override {
        return OK();
    }
};

} // namespace security

namespace utilities {

class SecurityUtility : public ioc::Utility {
public:
    inline static constexpr const char* NAME = "security";

    SecurityUtility(std::string platform_admin_role, std::shared_ptr<LoggerUtility> logger);

    static ioc::UtilityDescriptor descriptor(std::shared_ptr<security::PolicyEngine> engine = nullptr);

    std::string name() const override { return NAME; }

    const std::string& platformAdminRole() const noexcept { return platform_admin_role_; }
    bool isPlatformAdmin(const security::SecurityContext& caller) const;

    // Invalid context first, then the policy engine.
    Result<void> authorize(const security::SecurityContext& caller,
                           const std::string& action,
                           const std::string& resource) const;

    void setPolicyEngine(std::shared_ptr<security::PolicyEngine> engine);

private:
    std::string platform_admin_role_;
    std::shared_ptr<LoggerUtility> logger_;
    std::shared_ptr<security::PolicyEngine> engine_;
    mutable std::mutex mutex_;
};

} // namespace utilities
