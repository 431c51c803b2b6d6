#include "tenant_protocol_enforcer.hpp"

#include "ioc/ioc.hpp"
#include "logging/logging.hpp"
#include "utilities/error_handler_utility.hpp"
#include "utilities/telemetry_utility.hpp"
#include "utilities/tenant_utility.hpp"

namespace tenancy {

namespace {

Result<void> requireCaller(const security::SecurityContext& caller)
{
    if (!caller.valid()) return Error(ResultCode::AccessDenied, "caller is not authenticated");
    return OK();
}

bool deniedCode(ResultCode code)
{
    return code == ResultCode::AccessDenied || code == ResultCode::TenantInactive;
}

AuditOutcome outcomeOf(CallState state)
{
    switch (state) {
        case CallState::Completed: return AuditOutcome::Success;
        case CallState::Denied:    return AuditOutcome::Denied;
        default:                   return AuditOutcome::Failed;
    }
}

} // namespace

// -------------------------------
// call lifecycle
// -------------------------------

template<typename T, typename Body>
Result<T> TenantProtocolEnforcer::run_(const char* operation, const std::string& tenant_id,
                                       const std::string& user_id, bool audited, Body&& body) const
{
    Call call{operation, tenant_id, user_id, audited, CallState::Unauthenticated};
    if (auto observer = std::atomic_load(&observer_)) (*observer)(call.operation, call.state);

    auto guard = container_.enter();
    if (!guard) {
        const std::string detail = "container is " + std::string(ioc::to_string(container_.state()));
        finish_(call, ResultCode::UtilityUnavailable, detail);
        return Result<T>::Error(ResultCode::UtilityUnavailable, detail);
    }

    auto tenants = container_.getUtility<utilities::TenantUtility>(utilities::TenantUtility::NAME);
    if (!tenants) {
        finish_(call, tenants.code(), tenants.error());
        return Result<T>::Error(tenants.code(), tenants.error());
    }

    Result<T> result = body(call, *tenants.value());
    finish_(call, result.code(), result.error());
    return result;
}

void TenantProtocolEnforcer::transition_(Call& call, CallState next) const
{
    call.state = next;
    if (auto observer = std::atomic_load(&observer_)) {
        (*observer)(call.operation, next);
    }
}

void TenantProtocolEnforcer::finish_(Call& call, ResultCode code, const std::optional<std::string>& detail) const
{
    CallState terminal = CallState::Errored;
    if (isSuccess(code)) {
        terminal = CallState::Completed;
        ++completed_;
    } else if (deniedCode(code)) {
        terminal = CallState::Denied;
        ++denied_;
    } else {
        ++errored_;
    }
    transition_(call, terminal);

    const std::string reason = detail.value_or(to_string(code));
    if (terminal == CallState::Denied) {
        LOGW("{} denied: tenant={} user={} ({})", call.operation, call.tenant_id, call.user_id, reason);
    }

    if (call.audited && !call.tenant_id.empty()) {
        auditTenantAction(call.tenant_id, call.user_id, "tenant." + call.operation, outcomeOf(terminal));
    }

    if (auto telemetry = ioc::tryGetUtility<utilities::TelemetryUtility>(container_,
                                                                          utilities::TelemetryUtility::NAME)) {
        telemetry->counter(std::string("tenant_protocol.") + to_string(terminal), 1, {{"op", call.operation}});
    }

    if (terminal == CallState::Errored) {
        auto errors = ioc::tryGetUtility<utilities::ErrorHandlerUtility>(container_,
                                                                         utilities::ErrorHandlerUtility::NAME);
        if (errors) {
            errors->record("tenant." + call.operation, code, reason);
        } else {
            LOGE("{} failed: tenant={} {}: {}", call.operation, call.tenant_id, to_string(code), reason);
        }
    }
}

// -------------------------------
// access helpers
// -------------------------------

Result<void> TenantProtocolEnforcer::checkMember_(const utilities::TenantUtility& tenants,
                                                  const security::SecurityContext& caller,
                                                  const Tenant& tenant, bool require_admin) const
{
    if (tenants.security()->isPlatformAdmin(caller)) return OK();

    if (!tenant.active()) {
        return Error(ResultCode::TenantInactive, "tenant '" + tenant.tenant_id + "' is " + to_string(tenant.status));
    }

    auto membership = tenants.membership(tenant.tenant_id, caller.user_id);
    if (!membership || !membership->active) {
        return Error(ResultCode::AccessDenied,
                     "'" + caller.user_id + "' is not a member of '" + tenant.tenant_id + "'");
    }
    if (require_admin && membership->role != ADMIN_ROLE) {
        return Error(ResultCode::AccessDenied,
                     "'" + caller.user_id + "' is not an admin of '" + tenant.tenant_id + "'");
    }
    return OK();
}

Result<Tenant> TenantProtocolEnforcer::resolveTenant_(const utilities::TenantUtility& tenants,
                                                      const std::string& tenant_id) const
{
    auto tenant = tenants.find(tenant_id);
    if (!tenant || tenant->status == TenantStatus::Deleted) {
        return Result<Tenant>::Error(ResultCode::TenantNotFound, "tenant '" + tenant_id + "' not found");
    }
    return Result<Tenant>::OK(std::move(*tenant));
}

// -------------------------------
// read-only checks
// -------------------------------

Result<std::optional<TenantContext>> TenantProtocolEnforcer::getTenantContext(const std::string& tenant_id) const
{
    using Out = std::optional<TenantContext>;
    return run_<Out>("get_tenant_context", tenant_id, "", false,
        [&](Call& call, utilities::TenantUtility& tenants) -> Result<Out> {
            auto tenant = tenants.find(tenant_id);
            transition_(call, CallState::TenantResolved);
            if (!tenant || tenant->status == TenantStatus::Deleted) {
                return Result<Out>::OK(std::nullopt);
            }
            transition_(call, CallState::AccessValidated);
            transition_(call, CallState::Delegated);
            TenantContext context;
            context.user_count = tenants.members(tenant_id, true).size();
            context.tenant = std::move(*tenant);
            return Result<Out>::OK(std::move(context));
        });
}

bool TenantProtocolEnforcer::validateTenantAccess(const std::string& user_id, const std::string& tenant_id) const
{
    auto allowed = run_<bool>("validate_tenant_access", tenant_id, user_id, false,
        [&](Call& call, utilities::TenantUtility& tenants) -> Result<bool> {
            if (user_id.empty()) return Result<bool>::Error(ResultCode::AccessDenied, "empty user id");
            auto tenant = tenants.find(tenant_id);
            transition_(call, CallState::TenantResolved);
            if (!tenant || !tenant->active()) {
                return Result<bool>::Error(ResultCode::AccessDenied, "tenant '" + tenant_id + "' is not active");
            }
            auto membership = tenants.membership(tenant_id, user_id);
            if (!membership || !membership->active) {
                return Result<bool>::Error(ResultCode::AccessDenied, "no active membership");
            }
            transition_(call, CallState::AccessValidated);
            return Result<bool>::OK(true);
        });
    return allowed && allowed.value();
}

bool TenantProtocolEnforcer::validateTenantFeatureAccess(const std::string& tenant_id,
                                                         const std::string& feature) const
{
    auto allowed = run_<bool>("validate_tenant_feature_access", tenant_id, "", false,
        [&](Call& call, utilities::TenantUtility& tenants) -> Result<bool> {
            auto tenant = tenants.find(tenant_id);
            transition_(call, CallState::TenantResolved);
            if (!tenant || !tenant->active()) {
                return Result<bool>::Error(ResultCode::AccessDenied, "tenant '" + tenant_id + "' is not active");
            }
            if (!tenant->hasFeature(feature)) {
                return Result<bool>::Error(ResultCode::AccessDenied, "feature '" + feature + "' not granted");
            }
            transition_(call, CallState::AccessValidated);
            return Result<bool>::OK(true);
        });
    return allowed && allowed.value();
}

// -------------------------------
// tenant lifecycle
// -------------------------------

Result<Tenant> TenantProtocolEnforcer::createTenant(const security::SecurityContext& caller,
                                                    const TenantSpec& spec) const
{
    return run_<Tenant>("create_tenant", spec.tenant_id, caller.user_id, true,
        [&](Call& call, utilities::TenantUtility& tenants) -> Result<Tenant> {
            auto authenticated = requireCaller(caller);
            if (!authenticated) return authenticated;
            auto authorized = tenants.security()->authorize(caller, "tenant.create", spec.tenant_id);
            if (!authorized) return authorized;

            if (tenants.find(spec.tenant_id)) {
                return Result<Tenant>::Error(ResultCode::DuplicateTenant,
                                             "tenant '" + spec.tenant_id + "' already exists");
            }
            transition_(call, CallState::TenantResolved);

            TenantSpec effective = spec;
            if (effective.admin_user_id.empty()) {
                effective.admin_user_id = caller.user_id;
            } else if (effective.admin_user_id != caller.user_id && !tenants.security()->isPlatformAdmin(caller)) {
                return Result<Tenant>::Error(ResultCode::AccessDenied,
                                             "only a platform admin may create a tenant for another user");
            }
            transition_(call, CallState::AccessValidated);

            transition_(call, CallState::Delegated);
            return tenants.create(effective);
        });
}

Result<Tenant> TenantProtocolEnforcer::updateTenant(const security::SecurityContext& caller,
                                                    const std::string& tenant_id, const TenantPatch& patch) const
{
    return run_<Tenant>("update_tenant", tenant_id, caller.user_id, true,
        [&](Call& call, utilities::TenantUtility& tenants) -> Result<Tenant> {
            auto authenticated = requireCaller(caller);
            if (!authenticated) return authenticated;
            auto authorized = tenants.security()->authorize(caller, "tenant.update", tenant_id);
            if (!authorized) return authorized;

            auto tenant = resolveTenant_(tenants, tenant_id);
            if (!tenant) return tenant;
            transition_(call, CallState::TenantResolved);

            if ((patch.status || patch.max_users) && !tenants.security()->isPlatformAdmin(caller)) {
                return Result<Tenant>::Error(ResultCode::AccessDenied,
                                             "status and max_users require a platform admin");
            }
            auto access = checkMember_(tenants, caller, tenant.value(), true);
            if (!access) return access;
            transition_(call, CallState::AccessValidated);

            transition_(call, CallState::Delegated);
            return tenants.update(tenant_id, patch);
        });
}

Result<void> TenantProtocolEnforcer::deleteTenant(const security::SecurityContext& caller,
                                                  const std::string& tenant_id) const
{
    return run_<void>("delete_tenant", tenant_id, caller.user_id, true,
        [&](Call& call, utilities::TenantUtility& tenants) -> Result<void> {
            auto authenticated = requireCaller(caller);
            if (!authenticated) return authenticated;
            auto authorized = tenants.security()->authorize(caller, "tenant.delete", tenant_id);
            if (!authorized) return authorized;

            auto tenant = resolveTenant_(tenants, tenant_id);
            if (!tenant) return Error(tenant.code(), tenant.error());
            transition_(call, CallState::TenantResolved);

            auto access = checkMember_(tenants, caller, tenant.value(), true);
            if (!access) return access;
            transition_(call, CallState::AccessValidated);

            transition_(call, CallState::Delegated);
            return tenants.remove(tenant_id);
        });
}

Result<std::vector<Tenant>> TenantProtocolEnforcer::listTenants(const security::SecurityContext& caller,
                                                                const TenantFilter& filter) const
{
    using Out = std::vector<Tenant>;
    return run_<Out>("list_tenants", "", caller.user_id, true,
        [&](Call& call, utilities::TenantUtility& tenants) -> Result<Out> {
            auto authenticated = requireCaller(caller);
            if (!authenticated) return authenticated;
            auto authorized = tenants.security()->authorize(caller, "tenant.list", "*");
            if (!authorized) return authorized;

            const bool platform_admin = tenants.security()->isPlatformAdmin(caller);
            transition_(call, CallState::TenantResolved);
            transition_(call, CallState::AccessValidated);
            transition_(call, CallState::Delegated);

            Out out;
            for (auto& tenant : tenants.list()) {
                if (tenant.status == TenantStatus::Deleted && !(platform_admin && filter.include_deleted)) continue;
                if (filter.status && tenant.status != *filter.status) continue;
                if (filter.type && tenant.type != *filter.type) continue;
                if (!platform_admin) {
                    auto membership = tenants.membership(tenant.tenant_id, caller.user_id);
                    if (!membership || !membership->active) continue;
                }
                out.push_back(std::move(tenant));
            }
            return Result<Out>::OK(std::move(out));
        });
}

// -------------------------------
// membership
// -------------------------------

Result<void> TenantProtocolEnforcer::addUserToTenant(const security::SecurityContext& caller,
                                                     const std::string& tenant_id,
                                                     const std::string& user_id, const std::string& role) const
{
    return run_<void>("add_user_to_tenant", tenant_id, caller.user_id, true,
        [&](Call& call, utilities::TenantUtility& tenants) -> Result<void> {
            auto authenticated = requireCaller(caller);
            if (!authenticated) return authenticated;
            auto authorized = tenants.security()->authorize(caller, "tenant.add_user", tenant_id);
            if (!authorized) return authorized;

            auto tenant = resolveTenant_(tenants, tenant_id);
            if (!tenant) return Error(tenant.code(), tenant.error());
            transition_(call, CallState::TenantResolved);

            auto access = checkMember_(tenants, caller, tenant.value(), true);
            if (!access) return access;
            transition_(call, CallState::AccessValidated);

            transition_(call, CallState::Delegated);
            return tenants.addMember(tenant_id, user_id, role);
        });
}

Result<void> TenantProtocolEnforcer::removeUserFromTenant(const security::SecurityContext& caller,
                                                          const std::string& tenant_id,
                                                          const std::string& user_id) const
{
    return run_<void>("remove_user_from_tenant", tenant_id, caller.user_id, true,
        [&](Call& call, utilities::TenantUtility& tenants) -> Result<void> {
            auto authenticated = requireCaller(caller);
            if (!authenticated) return authenticated;
            auto authorized = tenants.security()->authorize(caller, "tenant.remove_user", tenant_id);
            if (!authorized) return authorized;

            auto tenant = resolveTenant_(tenants, tenant_id);
            if (!tenant) return Error(tenant.code(), tenant.error());
            transition_(call, CallState::TenantResolved);

            auto access = checkMember_(tenants, caller, tenant.value(), true);
            if (!access) return access;
            transition_(call, CallState::AccessValidated);

            transition_(call, CallState::Delegated);
            return tenants.removeMember(tenant_id, user_id);
        });
}

Result<std::vector<TenantUser>> TenantProtocolEnforcer::getTenantUsers(const security::SecurityContext& caller,
                                                                       const std::string& tenant_id) const
{
    using Out = std::vector<TenantUser>;
    return run_<Out>("get_tenant_users", tenant_id, caller.user_id, true,
        [&](Call& call, utilities::TenantUtility& tenants) -> Result<Out> {
            auto authenticated = requireCaller(caller);
            if (!authenticated) return authenticated;
            auto authorized = tenants.security()->authorize(caller, "tenant.list_users", tenant_id);
            if (!authorized) return authorized;

            auto tenant = resolveTenant_(tenants, tenant_id);
            if (!tenant) return Result<Out>::Error(tenant.code(), tenant.error());
            transition_(call, CallState::TenantResolved);

            auto access = checkMember_(tenants, caller, tenant.value(), false);
            if (!access) return access;
            transition_(call, CallState::AccessValidated);

            transition_(call, CallState::Delegated);
            Out out;
            for (const auto& membership : tenants.members(tenant_id, true)) {
                out.push_back(TenantUser{membership.user_id, membership.role});
            }
            return Result<Out>::OK(std::move(out));
        });
}

// -------------------------------
// features
// -------------------------------

Result<Tenant> TenantProtocolEnforcer::changeFeature_(const char* operation, const security::SecurityContext& caller,
                                                      const std::string& tenant_id, const std::string& feature,
                                                      bool enabled) const
{
    return run_<Tenant>(operation, tenant_id, caller.user_id, true,
        [&](Call& call, utilities::TenantUtility& tenants) -> Result<Tenant> {
            auto authenticated = requireCaller(caller);
            if (!authenticated) return authenticated;
            auto authorized = tenants.security()->authorize(caller, std::string("tenant.") + operation, tenant_id);
            if (!authorized) return authorized;

            auto tenant = resolveTenant_(tenants, tenant_id);
            if (!tenant) return tenant;
            transition_(call, CallState::TenantResolved);

            if (!tenants.security()->isPlatformAdmin(caller)) {
                return Result<Tenant>::Error(ResultCode::AccessDenied, "features are managed by platform admins");
            }
            transition_(call, CallState::AccessValidated);

            transition_(call, CallState::Delegated);
            return tenants.setFeature(tenant_id, feature, enabled);
        });
}

Result<Tenant> TenantProtocolEnforcer::grantTenantFeature(const security::SecurityContext& caller,
                                                          const std::string& tenant_id,
                                                          const std::string& feature) const
{
    return changeFeature_("grant_tenant_feature", caller, tenant_id, feature, true);
}

Result<Tenant> TenantProtocolEnforcer::revokeTenantFeature(const security::SecurityContext& caller,
                                                           const std::string& tenant_id,
                                                           const std::string& feature) const
{
    return changeFeature_("revoke_tenant_feature", caller, tenant_id, feature, false);
}

// -------------------------------
// usage & audit
// -------------------------------

Result<UsageStats> TenantProtocolEnforcer::getTenantUsageStats(const security::SecurityContext& caller,
                                                               const std::string& tenant_id) const
{
    return run_<UsageStats>("get_tenant_usage_stats", tenant_id, caller.user_id, true,
        [&](Call& call, utilities::TenantUtility& tenants) -> Result<UsageStats> {
            auto authenticated = requireCaller(caller);
            if (!authenticated) return authenticated;
            auto authorized = tenants.security()->authorize(caller, "tenant.usage", tenant_id);
            if (!authorized) return authorized;

            auto tenant = tenants.find(tenant_id);
            if (!tenant) {
                return Result<UsageStats>::Error(ResultCode::TenantNotFound, "tenant '" + tenant_id + "' not found");
            }
            transition_(call, CallState::TenantResolved);

            if (!tenants.security()->isPlatformAdmin(caller)) {
                auto membership = tenants.membership(tenant_id, caller.user_id);
                const bool allowed = tenant->active() ? (membership && membership->active)
                                                      : membership.has_value();
                if (!allowed) {
                    return Result<UsageStats>::Error(ResultCode::AccessDenied,
                        "'" + caller.user_id + "' may not read usage of '" + tenant_id + "'");
                }
            }
            transition_(call, CallState::AccessValidated);

            transition_(call, CallState::Delegated);
            return tenants.usage(tenant_id);
        });
}

void TenantProtocolEnforcer::auditTenantAction(const std::string& tenant_id, const std::string& user_id,
                                               const std::string& action, AuditOutcome outcome) const
{
    auto guard = container_.enter();
    auto tenants = guard ? ioc::tryGetUtility<utilities::TenantUtility>(container_, utilities::TenantUtility::NAME)
                         : nullptr;
    if (!tenants) {
        ++audit_failures_;
        LOGW("audit dropped, tenant utility unavailable: {} {} {}", tenant_id, action, to_string(outcome));
        return;
    }

    auto written = tenants->audit(tenant_id, user_id, action, outcome);
    if (!written) {
        ++audit_failures_;
        LOGW("audit write failed: {} {} {}: {}", tenant_id, action, to_string(outcome), to_string(written));
    }
}

ProtocolCounters TenantProtocolEnforcer::counters() const
{
    ProtocolCounters out;
    out.completed = completed_.load();
    out.denied = denied_.load();
    out.errored = errored_.load();
    out.audit_failures = audit_failures_.load();
    return out;
}

void TenantProtocolEnforcer::setObserver(CallObserver observer)
{
    std::shared_ptr<const CallObserver> next;
    if (observer) next = std::make_shared<const CallObserver>(std::move(observer));
    std::atomic_store(&observer_, next);
}

} // namespace tenancy
