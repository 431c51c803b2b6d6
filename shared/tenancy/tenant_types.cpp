#include "tenant_types.hpp"

#include "common/helper.hpp"

namespace tenancy {

std::optional<TenantStatus> parseTenantStatus(const std::string& value) {
    const auto status = toLower(trim(value));
    if (status == "active") return TenantStatus::Active;
    if (status == "suspended") return TenantStatus::Suspended;
    if (status == "deleted") return TenantStatus::Deleted;
    return std::nullopt;
}

std::optional<TenantType> parseTenantType(const std::string& value) {
    const auto type = toLower(trim(value));
    if (type == "individual") return TenantType::Individual;
    if (type == "organization" || type == "organisation") return TenantType::Organization;
    if (type == "enterprise") return TenantType::Enterprise;
    return std::nullopt;
}

} // namespace tenancy
