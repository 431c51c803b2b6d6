#include "in_memory_tenant_store.hpp"

#include <algorithm>
#include <functional>

namespace tenancy {

Result<void> InMemoryTenantStore::insertTenant(const Tenant& tenant)
{
    std::unique_lock<std::shared_mutex> lock(tenants_mutex_);
    auto [it, inserted] = tenants_.try_emplace(tenant.tenant_id, tenant);
    if (!inserted) {
        return Error(ResultCode::DuplicateTenant, "tenant '" + tenant.tenant_id + "' already exists");
    }
    return OK();
}

Result<Tenant> InMemoryTenantStore::findTenant(const std::string& tenant_id) const
{
    std::shared_lock<std::shared_mutex> lock(tenants_mutex_);
    auto it = tenants_.find(tenant_id);
    if (it == tenants_.end()) {
        return Result<Tenant>::Error(ResultCode::TenantNotFound, "tenant '" + tenant_id + "' not found");
    }
    return Result<Tenant>::OK(it->second);
}

Result<void> InMemoryTenantStore::updateTenant(const Tenant& tenant)
{
    std::unique_lock<std::shared_mutex> lock(tenants_mutex_);
    auto it = tenants_.find(tenant.tenant_id);
    if (it == tenants_.end()) {
        return Error(ResultCode::TenantNotFound, "tenant '" + tenant.tenant_id + "' not found");
    }
    it->second = tenant;
    return OK();
}

Result<void> InMemoryTenantStore::softDeleteTenant(const std::string& tenant_id, Timestamp when)
{
    std::unique_lock<std::shared_mutex> lock(tenants_mutex_);
    auto it = tenants_.find(tenant_id);
    if (it == tenants_.end()) {
        return Error(ResultCode::TenantNotFound, "tenant '" + tenant_id + "' not found");
    }
    it->second.status = TenantStatus::Deleted;
    it->second.updated_at = when;
    return OK();
}

std::vector<Tenant> InMemoryTenantStore::listTenants() const
{
    std::shared_lock<std::shared_mutex> lock(tenants_mutex_);
    std::vector<Tenant> out;
    out.reserve(tenants_.size());
    for (const auto& [id, tenant] : tenants_) out.push_back(tenant);
    return out;
}

Result<void> InMemoryTenantStore::upsertMembership(const TenantMembership& membership)
{
    std::unique_lock<std::shared_mutex> lock(memberships_mutex_);
    memberships_[{membership.tenant_id, membership.user_id}] = membership;
    return OK();
}

std::optional<TenantMembership> InMemoryTenantStore::findMembership(const std::string& tenant_id,
                                                                    const std::string& user_id) const
{
    std::shared_lock<std::shared_mutex> lock(memberships_mutex_);
    auto it = memberships_.find({tenant_id, user_id});
    if (it == memberships_.end()) return std::nullopt;
    return it->second;
}

std::vector<TenantMembership> InMemoryTenantStore::memberships(const std::string& tenant_id) const
{
    std::shared_lock<std::shared_mutex> lock(memberships_mutex_);
    std::vector<TenantMembership> out;
    for (auto it = memberships_.lower_bound({tenant_id, std::string()});
         it != memberships_.end() && it->first.first == tenant_id; ++it) {
        out.push_back(it->second);
    }
    return out;
}

std::vector<TenantMembership> InMemoryTenantStore::membershipsOf(const std::string& user_id) const
{
    std::shared_lock<std::shared_mutex> lock(memberships_mutex_);
    std::vector<TenantMembership> out;
    for (const auto& [key, membership] : memberships_) {
        if (key.second == user_id) out.push_back(membership);
    }
    return out;
}

InMemoryTenantStore::AuditShard& InMemoryTenantStore::shard_(const std::string& tenant_id) const
{
    return audit_[std::hash<std::string>{}(tenant_id) % AUDIT_SHARDS];
}

Result<void> InMemoryTenantStore::appendAudit(AuditRecord record)
{
    record.sequence = ++audit_sequence_;
    auto& shard = shard_(record.tenant_id);
    {
        std::lock_guard<std::mutex> lock(shard.mutex);
        shard.records.push_back(std::move(record));
    }
    ++audit_count_;
    return OK();
}

std::vector<AuditRecord> InMemoryTenantStore::auditTrail(const std::string& tenant_id) const
{
    std::vector<AuditRecord> out;
    auto& shard = shard_(tenant_id);
    {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto& record : shard.records) {
            if (record.tenant_id == tenant_id) out.push_back(record);
        }
    }
    std::sort(out.begin(), out.end(),
        [](const AuditRecord& a, const AuditRecord& b) { return a.sequence < b.sequence; });
    return out;
}

} // namespace tenancy
