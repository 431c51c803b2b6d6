#pragma once
#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/result.h"
#include "ioc/utility.hpp"
#include "logger_utility.hpp"
#include "security_utility.hpp"
#include "tenancy/tenant_store.hpp"
#include "validation_utility.hpp"

namespace utilities {

// Owns tenants and memberships through a TenantStore.
//
// Writes to one tenant are serialized by a striped lock keyed by tenant id;
// the checks that protect store invariants (existence, deletion, member
// limit) run under that lock. Caller authorization is not done here.
class TenantUtility : public ioc::Utility {
public:
    inline static constexpr const char* NAME = "tenant";
    static constexpr size_t LOCK_STRIPES = 32;

    TenantUtility(tenancy::TenantStorePtr store,
                  std::shared_ptr<LoggerUtility> logger,
                  std::shared_ptr<ValidationUtility> validation,
                  std::shared_ptr<SecurityUtility> security,
                  int64_t default_max_users,
                  bool multi_tenant_enabled = true);

    // A null store gives every generation a fresh InMemoryTenantStore.
    static ioc::UtilityDescriptor descriptor(tenancy::TenantStorePtr store = nullptr);

    std::string name() const override { return NAME; }

    const std::shared_ptr<ValidationUtility>& validation() const noexcept { return validation_; }
    const std::shared_ptr<SecurityUtility>& security() const noexcept { return security_; }
    const tenancy::TenantStorePtr& store() const noexcept { return store_; }
    int64_t defaultMaxUsers() const noexcept { return default_max_users_; }
    bool multiTenantEnabled() const noexcept { return multi_tenant_enabled_; }

    // Includes deleted tenants.
    std::optional<tenancy::Tenant> find(const std::string& tenant_id) const;
    std::vector<tenancy::Tenant> list() const;

    // Admin user becomes an "admin" member.
    Result<tenancy::Tenant> create(const tenancy::TenantSpec& spec);
    Result<tenancy::Tenant> update(const std::string& tenant_id, const tenancy::TenantPatch& patch);
    Result<void> remove(const std::string& tenant_id);
    Result<tenancy::Tenant> setFeature(const std::string& tenant_id, const std::string& feature, bool enabled);

    std::optional<tenancy::TenantMembership> membership(const std::string& tenant_id,
                                                        const std::string& user_id) const;
    std::vector<tenancy::TenantMembership> members(const std::string& tenant_id, bool active_only = true) const;
    std::vector<tenancy::TenantMembership> membershipsOf(const std::string& user_id) const;

    // Upsert: role change or reactivation, never a second record.
    Result<void> addMember(const std::string& tenant_id, const std::string& user_id, const std::string& role);
    // Absent or inactive membership is a no-op.
    Result<void> removeMember(const std::string& tenant_id, const std::string& user_id);

    // Never throws; a store failure comes back as AuditWriteFailed.
    Result<void> audit(const std::string& tenant_id, const std::string& user_id,
                       const std::string& action, tenancy::AuditOutcome outcome);

    Result<tenancy::UsageStats> usage(const std::string& tenant_id) const;

private:
    std::mutex& stripe_(const std::string& tenant_id);
    bool hasLiveTenant_() const;

    tenancy::TenantStorePtr store_;
    std::shared_ptr<LoggerUtility> logger_;
    std::shared_ptr<ValidationUtility> validation_;
    std::shared_ptr<SecurityUtility> security_;
    int64_t default_max_users_;
    bool multi_tenant_enabled_;

    std::array<std::mutex, LOCK_STRIPES> stripes_;
    // held across the check and the insert while multi-tenancy is disabled
    std::mutex single_tenant_mutex_;
};

} // namespace utilities
