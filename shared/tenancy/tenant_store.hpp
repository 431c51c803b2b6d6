#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/result.h"
#include "tenant_types.hpp"

namespace tenancy {

// Persistence for tenants, memberships and the audit trail.
// Tenants are never physically removed; audit records are write-once.
class TenantStore {
public:
    virtual ~TenantStore() = default;

    // DuplicateTenant if the id exists, whatever its status
    virtual Result<void> insertTenant(const Tenant& tenant) = 0;
    // Deleted tenants are returned as well
    virtual Result<Tenant> findTenant(const std::string& tenant_id) const = 0;
    virtual Result<void> updateTenant(const Tenant& tenant) = 0;
    virtual Result<void> softDeleteTenant(const std::string& tenant_id, Timestamp when) = 0;
    virtual std::vector<Tenant> listTenants() const = 0;

    // one record per (tenant_id, user_id)
    virtual Result<void> upsertMembership(const TenantMembership& membership) = 0;
    virtual std::optional<TenantMembership> findMembership(const std::string& tenant_id,
                                                           const std::string& user_id) const = 0;
    virtual std::vector<TenantMembership> memberships(const std::string& tenant_id) const = 0;
    virtual std::vector<TenantMembership> membershipsOf(const std::string& user_id) const = 0;

    // Assigns the sequence number.
    virtual Result<void> appendAudit(AuditRecord record) = 0;
    virtual std::vector<AuditRecord> auditTrail(const std::string& tenant_id) const = 0;
};

using TenantStorePtr = std::shared_ptr<TenantStore>;

} // namespace tenancy
