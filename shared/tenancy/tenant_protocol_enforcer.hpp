#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/result.h"
#include "ioc/di_container.hpp"
#include "tenant_types.hpp"
#include "utilities/security_utility.hpp"

namespace utilities { class TenantUtility; }

namespace tenancy {

// Per-call progress. Every call ends in Completed, Denied or Errored.
enum class CallState {
    Unauthenticated,
    TenantResolved,
    AccessValidated,
    Delegated,
    Completed,
    Denied,
    Errored,
};

constexpr const char* to_string(CallState state) {
    switch (state) {
        case CallState::Unauthenticated: return "unauthenticated";
        case CallState::TenantResolved:  return "tenant_resolved";
        case CallState::AccessValidated: return "access_validated";
        case CallState::Delegated:       return "delegated";
        case CallState::Completed:       return "completed";
        case CallState::Denied:          return "denied";
        case CallState::Errored:         return "errored";
    }
    return "unknown";
}

struct ProtocolCounters {
    size_t completed = 0;
    size_t denied = 0;
    size_t errored = 0;
    size_t audit_failures = 0;
};

// The multi-tenant protocol every agent service delegates to.
//
// Each call resolves the tenant utility from the container, reads the tenant
// and the caller's membership, decides, and only then delegates the change
// (snapshot-then-act). Access decisions are not repeated under the write
// lock; the tenant utility re-checks existence and limits there. A denied
// call never reaches the tenant utility's mutators.
//
// Roles: "admin" members and platform admins may change a tenant and its
// members. Only platform admins may suspend or reactivate a tenant, change
// max_users, grant or revoke features, or see deleted tenants.
//
// Every call that acts for a caller on a tenant is audited as
// "tenant.<operation>" against that tenant id.
class TenantProtocolEnforcer {
public:
    inline static constexpr const char* LOG_TAG = "TenantProtocol";
    inline static constexpr const char* ADMIN_ROLE = "admin";

    using CallObserver = std::function<void(const std::string& operation, CallState state)>;

    explicit TenantProtocolEnforcer(ioc::DIContainer& container) : container_(container) {}

    // nullopt for unknown and deleted tenants
    Result<std::optional<TenantContext>> getTenantContext(const std::string& tenant_id) const;

    // Active membership in an Active tenant.
    bool validateTenantAccess(const std::string& user_id, const std::string& tenant_id) const;

    Result<Tenant> createTenant(const security::SecurityContext& caller, const TenantSpec& spec) const;
    Result<Tenant> updateTenant(const security::SecurityContext& caller,
                                const std::string& tenant_id, const TenantPatch& patch) const;
    Result<void> deleteTenant(const security::SecurityContext& caller, const std::string& tenant_id) const;
    Result<std::vector<Tenant>> listTenants(const security::SecurityContext& caller,
                                            const TenantFilter& filter = {}) const;

    Result<void> addUserToTenant(const security::SecurityContext& caller, const std::string& tenant_id,
                                 const std::string& user_id, const std::string& role) const;
    Result<void> removeUserFromTenant(const security::SecurityContext& caller, const std::string& tenant_id,
                                      const std::string& user_id) const;
    Result<std::vector<TenantUser>> getTenantUsers(const security::SecurityContext& caller,
                                                   const std::string& tenant_id) const;

    Result<Tenant> grantTenantFeature(const security::SecurityContext& caller,
                                      const std::string& tenant_id, const std::string& feature) const;
    Result<Tenant> revokeTenantFeature(const security::SecurityContext& caller,
                                       const std::string& tenant_id, const std::string& feature) const;

    // false when the tenant lacks the feature or is not Active
    bool validateTenantFeatureAccess(const std::string& tenant_id, const std::string& feature) const;

    // Members and platform admins; for a suspended or deleted tenant also
    // anyone who was ever a member.
    Result<UsageStats> getTenantUsageStats(const security::SecurityContext& caller,
                                           const std::string& tenant_id) const;

    // Never fails; errors are logged and counted.
    void auditTenantAction(const std::string& tenant_id, const std::string& user_id,
                           const std::string& action, AuditOutcome outcome) const;

    ProtocolCounters counters() const;

    // Sees every state transition. Must be thread-safe.
    void setObserver(CallObserver observer);

    ioc::DIContainer& container() const noexcept { return container_; }

private:
    struct Call {
        std::string operation;
        std::string tenant_id;
        std::string user_id;
        bool audited = true;
        CallState state = CallState::Unauthenticated;
    };

    // Read-only checks (audited == false) answer questions and leave no audit record.
    template<typename T, typename Body>
    Result<T> run_(const char* operation, const std::string& tenant_id, const std::string& user_id,
                   bool audited, Body&& body) const;

    void transition_(Call& call, CallState next) const;
    void finish_(Call& call, ResultCode code, const std::optional<std::string>& detail) const;

    // active member (optionally with the admin role) of an Active tenant,
    // or a platform admin
    Result<void> checkMember_(const utilities::TenantUtility& tenants,
                              const security::SecurityContext& caller,
                              const Tenant& tenant, bool require_admin) const;
    Result<Tenant> resolveTenant_(const utilities::TenantUtility& tenants, const std::string& tenant_id) const;
    Result<Tenant> changeFeature_(const char* operation, const security::SecurityContext& caller,
                                  const std::string& tenant_id, const std::string& feature, bool enabled) const;

    ioc::DIContainer& container_;

    mutable std::atomic<size_t> completed_{0};
    mutable std::atomic<size_t> denied_{0};
    mutable std::atomic<size_t> errored_{0};
    mutable std::atomic<size_t> audit_failures_{0};

    std::shared_ptr<const CallObserver> observer_;
};

} // namespace tenancy
