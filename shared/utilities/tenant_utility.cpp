#include "tenant_utility.hpp"

#include <exception>
#include <functional>

#include "common/result_helper.hpp"
#include "config_utility.hpp"
#include "tenancy/in_memory_tenant_store.hpp"

namespace utilities {

namespace {

constexpr const char* ADMIN_ROLE = "admin";

tenancy::Timestamp now() { return tenancy::Clock::now(); }

Result<tenancy::Tenant> notFound(const std::string& tenant_id) {
    return Result<tenancy::Tenant>::Error(ResultCode::TenantNotFound, "tenant '" + tenant_id + "' not found");
}

} // namespace

TenantUtility::TenantUtility(tenancy::TenantStorePtr store,
                             std::shared_ptr<LoggerUtility> logger,
                             std::shared_ptr<ValidationUtility> validation,
                             std::shared_ptr<SecurityUtility> security,
                             int64_t default_max_users,
                             bool multi_tenant_enabled)
    : store_(std::move(store)),
      logger_(std::move(logger)),
      validation_(std::move(validation)),
      security_(std::move(security)),
      default_max_users_(default_max_users),
      multi_tenant_enabled_(multi_tenant_enabled)
{
}

ioc::UtilityDescriptor TenantUtility::descriptor(tenancy::TenantStorePtr store)
{
    ioc::UtilityDescriptor d;
    d.name = NAME;
    d.dependencies = {ConfigUtility::NAME, LoggerUtility::NAME, ValidationUtility::NAME, SecurityUtility::NAME};
    d.config_keys = {
        config::optionalKey("MULTI_TENANT_ENABLED", config::ValueType::Bool),
        config::optionalKey("DEFAULT_TENANT_MAX_USERS", config::ValueType::Int),
    };
    d.config_prefix = "TENANT_";
    d.factory = [store](const ioc::UtilityContext& ctx) -> Result<ioc::UtilityHandle> {
        using Handle = Result<ioc::UtilityHandle>;

        auto logger = ctx.dependency<LoggerUtility>(LoggerUtility::NAME);
        auto validation = ctx.dependency<ValidationUtility>(ValidationUtility::NAME);
        auto security = ctx.dependency<SecurityUtility>(SecurityUtility::NAME);
        if (!logger || !validation || !security) {
            return Handle::Error(ResultCode::DependencyFailed, "logger, validation and security are required");
        }

        const auto& cfg = ctx.config();
        const auto max_users = cfg.getInt("DEFAULT_TENANT_MAX_USERS", 50);
        if (max_users <= 0) {
            return Handle::Error(ResultCode::InvalidArgument, "DEFAULT_TENANT_MAX_USERS must be positive");
        }

        auto backing = store ? store : std::make_shared<tenancy::InMemoryTenantStore>();
        return Handle::OK(std::make_shared<TenantUtility>(backing, logger, validation, security,
            max_users, cfg.getBool("MULTI_TENANT_ENABLED", true)));
    };
    return d;
}

std::mutex& TenantUtility::stripe_(const std::string& tenant_id)
{
    return stripes_[std::hash<std::string>{}(tenant_id) % LOCK_STRIPES];
}

std::optional<tenancy::Tenant> TenantUtility::find(const std::string& tenant_id) const
{
    auto found = store_->findTenant(tenant_id);
    if (!found) return std::nullopt;
    return found.value();
}

std::vector<tenancy::Tenant> TenantUtility::list() const
{
    return store_->listTenants();
}

bool TenantUtility::hasLiveTenant_() const
{
    for (const auto& tenant : store_->listTenants()) {
        if (tenant.status != tenancy::TenantStatus::Deleted) return true;
    }
    return false;
}

Result<tenancy::Tenant> TenantUtility::create(const tenancy::TenantSpec& spec)
{
    auto valid = validation_->validateSpec(spec);
    if (!valid) return valid;

    std::unique_lock<std::mutex> single_tenant;
    if (!multi_tenant_enabled_) {
        single_tenant = std::unique_lock<std::mutex>(single_tenant_mutex_);
        if (hasLiveTenant_()) {
            return Result<tenancy::Tenant>::Error(ResultCode::NotSupported,
                "multi-tenancy disabled, a tenant already exists");
        }
    }

    tenancy::Tenant tenant;
    tenant.tenant_id = spec.tenant_id;
    tenant.name = spec.name;
    tenant.type = spec.type;
    tenant.admin_user_id = spec.admin_user_id;
    tenant.admin_email = spec.admin_email;
    tenant.max_users = spec.max_users > 0 ? spec.max_users : default_max_users_;
    tenant.features = spec.features;
    tenant.metadata = spec.metadata;
    tenant.created_at = tenant.updated_at = now();

    std::lock_guard<std::mutex> lock(stripe_(spec.tenant_id));
    auto inserted = store_->insertTenant(tenant);
    if (!inserted) return inserted;

    auto admin = store_->upsertMembership(
        tenancy::TenantMembership{tenant.tenant_id, tenant.admin_user_id, ADMIN_ROLE, true, tenant.created_at});
    if (!admin) {
        logger_->error("tenant {} created without admin membership: {}", tenant.tenant_id, to_string(admin));
        return admin;
    }

    logger_->info("tenant {} created, admin {}", tenant.tenant_id, tenant.admin_user_id);
    return Result<tenancy::Tenant>::OK(std::move(tenant));
}

Result<tenancy::Tenant> TenantUtility::update(const std::string& tenant_id, const tenancy::TenantPatch& patch)
{
    auto valid = validation_->validatePatch(patch);
    if (!valid) return valid;

    std::lock_guard<std::mutex> lock(stripe_(tenant_id));
    auto found = store_->findTenant(tenant_id);
    if (!found || found->status == tenancy::TenantStatus::Deleted) return notFound(tenant_id);

    tenancy::Tenant tenant = found.value();
    if (patch.name) tenant.name = *patch.name;
    if (patch.admin_email) tenant.admin_email = *patch.admin_email;
    if (patch.status) tenant.status = *patch.status;
    if (patch.max_users) {
        const auto active = members(tenant_id, true).size();
        if (static_cast<int64_t>(active) > *patch.max_users) {
            return Result<tenancy::Tenant>::Error(ResultCode::UserLimitExceeded,
                "tenant '" + tenant_id + "' has " + std::to_string(active) + " active users");
        }
        tenant.max_users = *patch.max_users;
    }
    for (const auto& [key, value] : patch.metadata) {
        if (value.empty()) {
            tenant.metadata.erase(key);
        } else {
            tenant.metadata[key] = value;
        }
    }
    tenant.updated_at = now();

    auto stored = store_->updateTenant(tenant);
    if (!stored) return stored;
    return Result<tenancy::Tenant>::OK(std::move(tenant));
}

Result<void> TenantUtility::remove(const std::string& tenant_id)
{
    std::lock_guard<std::mutex> lock(stripe_(tenant_id));
    auto found = store_->findTenant(tenant_id);
    if (!found || found->status == tenancy::TenantStatus::Deleted) {
        return Error(ResultCode::TenantNotFound, "tenant '" + tenant_id + "' not found");
    }
    auto res = store_->softDeleteTenant(tenant_id, now());
    if (res) logger_->info("tenant {} deleted", tenant_id);
    return res;
}

Result<tenancy::Tenant> TenantUtility::setFeature(const std::string& tenant_id, const std::string& feature, bool enabled)
{
    auto valid = validation_->validateFeature(feature);
    if (!valid) return valid;

    std::lock_guard<std::mutex> lock(stripe_(tenant_id));
    auto found = store_->findTenant(tenant_id);
    if (!found || found->status == tenancy::TenantStatus::Deleted) return notFound(tenant_id);

    tenancy::Tenant tenant = found.value();
    const bool changed = enabled ? tenant.features.insert(feature).second : tenant.features.erase(feature) > 0;
    if (!changed) return Result<tenancy::Tenant>::OK(std::move(tenant));

    tenant.updated_at = now();
    auto stored = store_->updateTenant(tenant);
    if (!stored) return stored;
    return Result<tenancy::Tenant>::OK(std::move(tenant));
}

std::optional<tenancy::TenantMembership> TenantUtility::membership(const std::string& tenant_id,
                                                                   const std::string& user_id) const
{
    return store_->findMembership(tenant_id, user_id);
}

std::vector<tenancy::TenantMembership> TenantUtility::members(const std::string& tenant_id, bool active_only) const
{
    auto all = store_->memberships(tenant_id);
    if (!active_only) return all;

    std::vector<tenancy::TenantMembership> out;
    for (auto& membership : all) {
        if (membership.active) out.push_back(std::move(membership));
    }
    return out;
}

std::vector<tenancy::TenantMembership> TenantUtility::membershipsOf(const std::string& user_id) const
{
    return store_->membershipsOf(user_id);
}

Result<void> TenantUtility::addMember(const std::string& tenant_id, const std::string& user_id, const std::string& role)
{
    auto valid = validation_->validateUserId(user_id);
    RETURN_IF_ERR(valid);
    valid = validation_->validateRole(role);
    RETURN_IF_ERR_MSG(valid, "add " + user_id + " to " + tenant_id);

    std::lock_guard<std::mutex> lock(stripe_(tenant_id));
    auto found = store_->findTenant(tenant_id);
    if (!found || found->status == tenancy::TenantStatus::Deleted) {
        return Error(ResultCode::TenantNotFound, "tenant '" + tenant_id + "' not found");
    }

    auto existing = store_->findMembership(tenant_id, user_id);
    if (!existing || !existing->active) {
        const auto active = members(tenant_id, true).size();
        if (static_cast<int64_t>(active) >= found->max_users) {
            return Error(ResultCode::UserLimitExceeded,
                "tenant '" + tenant_id + "' reached max_users " + std::to_string(found->max_users));
        }
    }

    tenancy::TenantMembership membership;
    membership.tenant_id = tenant_id;
    membership.user_id = user_id;
    membership.role = role;
    membership.active = true;
    membership.joined_at = (existing && existing->active) ? existing->joined_at : now();
    return store_->upsertMembership(membership);
}

Result<void> TenantUtility::removeMember(const std::string& tenant_id, const std::string& user_id)
{
    std::lock_guard<std::mutex> lock(stripe_(tenant_id));
    auto existing = store_->findMembership(tenant_id, user_id);
    if (!existing || !existing->active) return OK();

    existing->active = false;
    return store_->upsertMembership(*existing);
}

Result<void> TenantUtility::audit(const std::string& tenant_id, const std::string& user_id,
                                  const std::string& action, tenancy::AuditOutcome outcome)
{
    tenancy::AuditRecord record;
    record.tenant_id = tenant_id;
    record.user_id = user_id;
    record.action = action;
    record.outcome = outcome;
    record.timestamp = now();

    try {
        auto res = store_->appendAudit(std::move(record));
        if (!res) return Error(ResultCode::AuditWriteFailed, to_string(res));
    } catch (const std::exception& e) {
        return Error(ResultCode::AuditWriteFailed, e.what());
    } catch (...) {
        return Error(ResultCode::AuditWriteFailed, "unknown exception from tenant store");
    }
    return OK();
}

Result<tenancy::UsageStats> TenantUtility::usage(const std::string& tenant_id) const
{
    auto found = store_->findTenant(tenant_id);
    if (!found) return Result<tenancy::UsageStats>::Error(found.code(), found.error());

    tenancy::UsageStats stats;
    stats.tenant_id = tenant_id;
    stats.current_users = members(tenant_id, true).size();
    stats.max_users = found->max_users;
    if (stats.max_users > 0) {
        stats.usage_percentage = 100.0 * static_cast<double>(stats.current_users) / static_cast<double>(stats.max_users);
    }

    for (const auto& record : store_->auditTrail(tenant_id)) {
        ++stats.total_actions;
        ++stats.actions_by_type[record.action];
        switch (record.outcome) {
            case tenancy::AuditOutcome::Success: ++stats.successful_actions; break;
            case tenancy::AuditOutcome::Denied:  ++stats.denied_actions; break;
            case tenancy::AuditOutcome::Failed:  ++stats.failed_actions; break;
        }
        if (!stats.last_active || *stats.last_active < record.timestamp) stats.last_active = record.timestamp;
    }
    return Result<tenancy::UsageStats>::OK(std::move(stats));
}

} // namespace utilities
