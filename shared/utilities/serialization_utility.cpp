#include "serialization_utility.hpp"

#include <nlohmann/json.hpp>

#include "messaging/message_helper.hpp"

namespace utilities {

using json = nlohmann::json;

namespace {

int64_t toMillis(tenancy::Timestamp at) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch()).count();
}

tenancy::Timestamp fromMillis(int64_t ms) {
    return tenancy::Timestamp(std::chrono::duration_cast<tenancy::Timestamp::duration>(
        std::chrono::milliseconds(ms)));
}

} // namespace

ioc::UtilityDescriptor SerializationUtility::descriptor()
{
    ioc::UtilityDescriptor d;
    d.name = NAME;
    d.dependencies = {LoggerUtility::NAME};
    d.factory = [](const ioc::UtilityContext& ctx) -> Result<ioc::UtilityHandle> {
        auto logger = ctx.dependency<LoggerUtility>(LoggerUtility::NAME);
        if (!logger) return Result<ioc::UtilityHandle>::Error(ResultCode::DependencyFailed, "logger");
        return Result<ioc::UtilityHandle>::OK(std::make_shared<SerializationUtility>(std::move(logger)));
    };
    return d;
}

std::string SerializationUtility::toJson(const tenancy::Tenant& tenant) const
{
    json j;
    j["tenant_id"] = tenant.tenant_id;
    j["name"] = tenant.name;
    j["type"] = tenancy::to_string(tenant.type);
    j["admin_user_id"] = tenant.admin_user_id;
    j["admin_email"] = tenant.admin_email;
    j["max_users"] = tenant.max_users;
    j["status"] = tenancy::to_string(tenant.status);
    j["features"] = tenant.features;
    j["metadata"] = tenant.metadata;
    j["created_at_ms"] = toMillis(tenant.created_at);
    j["updated_at_ms"] = toMillis(tenant.updated_at);
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string SerializationUtility::toJson(const tenancy::UsageStats& stats) const
{
    json j;
    j["tenant_id"] = stats.tenant_id;
    j["current_users"] = stats.current_users;
    j["max_users"] = stats.max_users;
    j["usage_percentage"] = stats.usage_percentage;
    j["total_actions"] = stats.total_actions;
    j["successful_actions"] = stats.successful_actions;
    j["denied_actions"] = stats.denied_actions;
    j["failed_actions"] = stats.failed_actions;
    j["actions_by_type"] = stats.actions_by_type;
    j["last_active_ms"] = stats.last_active ? json(toMillis(*stats.last_active)) : json(nullptr);
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string SerializationUtility::toJson(const tenancy::AuditRecord& record) const
{
    json j;
    j["sequence"] = record.sequence;
    j["tenant_id"] = record.tenant_id;
    j["user_id"] = record.user_id;
    j["action"] = record.action;
    j["outcome"] = tenancy::to_string(record.outcome);
    j["timestamp_ms"] = toMillis(record.timestamp);
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string SerializationUtility::toJson(const std::map<std::string, ioc::UtilityStatus>& health) const
{
    json j = json::object();
    for (const auto& [name, status] : health) {
        json entry;
        entry["state"] = ioc::to_string(status.state);
        if (status.failed()) {
            entry["reason"] = ioc::to_string(status.reason);
            entry["detail"] = status.detail;
        }
        j[name] = entry;
    }
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

Result<tenancy::Tenant> SerializationUtility::tenantFromJson(const std::string& payload) const
{
    using TenantResult = Result<tenancy::Tenant>;
    try {
        const auto j = json::parse(payload);
        tenancy::Tenant tenant;
        tenant.tenant_id = j.at("tenant_id").get<std::string>();
        tenant.name = j.value("name", std::string());
        tenant.admin_user_id = j.value("admin_user_id", std::string());
        tenant.admin_email = j.value("admin_email", std::string());
        tenant.max_users = j.value("max_users", int64_t{0});

        const auto type = tenancy::parseTenantType(j.value("type", std::string("organization")));
        if (!type) return TenantResult::Error(ResultCode::InvalidArgument, "unknown tenant type");
        tenant.type = *type;

        const auto status = tenancy::parseTenantStatus(j.value("status", std::string("active")));
        if (!status) return TenantResult::Error(ResultCode::InvalidArgument, "unknown tenant status");
        tenant.status = *status;

        if (j.contains("features")) tenant.features = j.at("features").get<std::set<std::string>>();
        if (j.contains("metadata")) tenant.metadata = j.at("metadata").get<std::map<std::string, std::string>>();
        tenant.created_at = fromMillis(j.value("created_at_ms", int64_t{0}));
        tenant.updated_at = fromMillis(j.value("updated_at_ms", int64_t{0}));
        return TenantResult::OK(std::move(tenant));
    } catch (const json::exception& e) {
        logger_->warn("tenant payload rejected: {}", e.what());
        return TenantResult::Error(ResultCode::ProtocolError, e.what());
    }
}

Result<std::string> SerializationUtility::encode(const message::Message& msg) const
{
    return message::serialize(msg);
}

Result<message::Message> SerializationUtility::decode(const std::string& topic, const std::string& payload) const
{
    return message::deserialize(topic, payload);
}

} // namespace utilities
