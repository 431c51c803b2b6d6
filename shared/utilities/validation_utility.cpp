#include "validation_utility.hpp"

#include <algorithm>
#include <cctype>

#include "common/helper.hpp"
#include "common/result_helper.hpp"
#include "config_utility.hpp"

namespace utilities {

namespace {

bool identifierChar(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.';
}

Result<void> checkIdentifier(const char* what, const std::string& value, size_t max_length) {
    if (value.empty()) {
        return Error(ResultCode::InvalidArgument, std::string(what) + " is empty");
    }
    if (value.size() > max_length) {
        return Error(ResultCode::InvalidArgument,
            std::string(what) + " longer than " + std::to_string(max_length));
    }
    if (!std::all_of(value.begin(), value.end(), [](char c) { return identifierChar(static_cast<unsigned char>(c)); })) {
        return Error(ResultCode::InvalidArgument, std::string(what) + " '" + value + "' has invalid characters");
    }
    return OK();
}

} // namespace

ValidationUtility::ValidationUtility(std::vector<std::string> allowed_roles, std::shared_ptr<LoggerUtility> logger)
    : allowed_roles_(std::move(allowed_roles)), logger_(std::move(logger))
{
}

ioc::UtilityDescriptor ValidationUtility::descriptor()
{
    ioc::UtilityDescriptor d;
    d.name = NAME;
    d.dependencies = {ConfigUtility::NAME, LoggerUtility::NAME};
    d.config_keys = {config::optionalKey("TENANT_ALLOWED_ROLES", config::ValueType::List)};
    d.factory = [](const ioc::UtilityContext& ctx) -> Result<ioc::UtilityHandle> {
        auto logger = ctx.dependency<LoggerUtility>(LoggerUtility::NAME);
        if (!logger) return Result<ioc::UtilityHandle>::Error(ResultCode::DependencyFailed, "logger");

        auto roles = ctx.config().getList("TENANT_ALLOWED_ROLES");
        std::vector<std::string> allowed = roles ? roles.value() : std::vector<std::string>{"admin", "member", "viewer"};
        if (allowed.empty()) {
            return Result<ioc::UtilityHandle>::Error(ResultCode::InvalidArgument, "TENANT_ALLOWED_ROLES is empty");
        }
        return Result<ioc::UtilityHandle>::OK(std::make_shared<ValidationUtility>(std::move(allowed), logger));
    };
    return d;
}

Result<void> ValidationUtility::validateTenantId(const std::string& tenant_id) const
{
    return checkIdentifier("tenant_id", tenant_id, MAX_ID_LENGTH);
}

Result<void> ValidationUtility::validateUserId(const std::string& user_id) const
{
    return checkIdentifier("user_id", user_id, MAX_NAME_LENGTH);
}

Result<void> ValidationUtility::validateFeature(const std::string& feature) const
{
    return checkIdentifier("feature", feature, MAX_ID_LENGTH);
}

Result<void> ValidationUtility::validateRole(const std::string& role) const
{
    if (std::find(allowed_roles_.begin(), allowed_roles_.end(), role) == allowed_roles_.end()) {
        return Error(ResultCode::InvalidArgument, "role '" + role + "' is not allowed");
    }
    return OK();
}

Result<void> ValidationUtility::validateEmail(const std::string& email) const
{
    if (email.empty()) return OK();
    const auto at = email.find('@');
    if (at == std::string::npos || at == 0 || at == email.size() - 1 ||
        email.find('@', at + 1) != std::string::npos ||
        email.find_first_of(" \t\r\n") != std::string::npos) {
        return Error(ResultCode::InvalidArgument, "admin_email '" + email + "' is not an address");
    }
    return OK();
}

Result<void> ValidationUtility::validateSpec(const tenancy::TenantSpec& spec) const
{
    auto res = validateTenantId(spec.tenant_id);
    RETURN_IF_ERR(res);

    if (trim(spec.name).empty() || spec.name.size() > MAX_NAME_LENGTH) {
        return Error(ResultCode::InvalidArgument, "name must be 1.." + std::to_string(MAX_NAME_LENGTH) + " characters");
    }
    res = validateUserId(spec.admin_user_id);
    RETURN_IF_ERR(res);
    res = validateEmail(spec.admin_email);
    RETURN_IF_ERR(res);

    if (spec.max_users < 0) {
        return Error(ResultCode::InvalidArgument, "max_users is negative");
    }
    for (const auto& feature : spec.features) {
        res = validateFeature(feature);
        RETURN_IF_ERR(res);
    }
    return OK();
}

Result<void> ValidationUtility::validatePatch(const tenancy::TenantPatch& patch) const
{
    if (patch.name && (trim(*patch.name).empty() || patch.name->size() > MAX_NAME_LENGTH)) {
        return Error(ResultCode::InvalidArgument, "name must be 1.." + std::to_string(MAX_NAME_LENGTH) + " characters");
    }
    if (patch.admin_email) {
        auto res = validateEmail(*patch.admin_email);
        RETURN_IF_ERR(res);
    }
    if (patch.max_users && *patch.max_users <= 0) {
        return Error(ResultCode::InvalidArgument, "max_users must be positive");
    }
    if (patch.status && *patch.status == tenancy::TenantStatus::Deleted) {
        return Error(ResultCode::InvalidArgument, "use delete_tenant to delete a tenant");
    }
    for (const auto& [key, value] : patch.metadata) {
        if (key.empty()) return Error(ResultCode::InvalidArgument, "metadata key is empty");
    }
    return OK();
}

} // namespace utilities
