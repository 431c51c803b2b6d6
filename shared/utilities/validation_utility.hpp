#pragma once
#include <memory>
#include <string>
#include <vector>

#include "common/result.h"
#include "ioc/utility.hpp"
#include "logger_utility.hpp"
#include "tenancy/tenant_types.hpp"

namespace utilities {

// Input checks shared by every tenant-facing operation. Failures are
// InvalidArgument with the offending field in the message.
class ValidationUtility : public ioc::Utility {
public:
    inline static constexpr const char* NAME = "validation";
    static constexpr size_t MAX_ID_LENGTH = 64;
    static constexpr size_t MAX_NAME_LENGTH = 256;

    ValidationUtility(std::vector<std::string> allowed_roles, std::shared_ptr<LoggerUtility> logger);

    static ioc::UtilityDescriptor descriptor();

    std::string name() const override { return NAME; }

    // [A-Za-z0-9._-], 1..64
    Result<void> validateTenantId(const std::string& tenant_id) const;
    Result<void> validateUserId(const std::string& user_id) const;
    Result<void> validateFeature(const std::string& feature) const;
    Result<void> validateRole(const std::string& role) const;
    // empty is accepted
    Result<void> validateEmail(const std::string& email) const;
    Result<void> validateSpec(const tenancy::TenantSpec& spec) const;
    Result<void> validatePatch(const tenancy::TenantPatch& patch) const;

    const std::vector<std::string>& allowedRoles() const noexcept { return allowed_roles_; }

private:
    std::vector<std::string> allowed_roles_;
    std::shared_ptr<LoggerUtility> logger_;
};

} // namespace utilities
