#pragma once
#include <array>
#include <atomic>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

#include "tenant_store.hpp"

namespace tenancy {

// Process-local store. The audit trail is split into shards keyed by tenant
// id, each guarded only for the push itself, so appends for different
// tenants rarely meet on a lock.
class InMemoryTenantStore : public TenantStore {
public:
    static constexpr size_t AUDIT_SHARDS = 16;

    Result<void> insertTenant(const Tenant& tenant) override;
    Result<Tenant> findTenant(const std::string& tenant_id) const override;
    Result<void> updateTenant(const Tenant& tenant) override;
    Result<void> softDeleteTenant(const std::string& tenant_id, Timestamp when) override;
    std::vector<Tenant> listTenants() const override;

    Result<void> upsertMembership(const TenantMembership& membership) override;
    std::optional<TenantMembership> findMembership(const std::string& tenant_id,
                                                   const std::string& user_id) const override;
    std::vector<TenantMembership> memberships(const std::string& tenant_id) const override;
    std::vector<TenantMembership> membershipsOf(const std::string& user_id) const override;

    Result<void> appendAudit(AuditRecord record) override;
    std::vector<AuditRecord> auditTrail(const std::string& tenant_id) const override;

    size_t auditSize() const noexcept { return audit_count_.load(); }

private:
    struct AuditShard {
        mutable std::mutex mutex;
        std::vector<AuditRecord> records;
    };

    AuditShard& shard_(const std::string& tenant_id) const;

    std::map<std::string, Tenant> tenants_;
    mutable std::shared_mutex tenants_mutex_;

    // (tenant_id, user_id)
    std::map<std::pair<std::string, std::string>, TenantMembership> memberships_;
    mutable std::shared_mutex memberships_mutex_;

    mutable std::array<AuditShard, AUDIT_SHARDS> audit_;
    std::atomic<uint64_t> audit_sequence_{0};
    std::atomic<size_t> audit_count_{0};
};

} // namespace tenancy
