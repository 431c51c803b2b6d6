#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tenancy {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

enum class TenantStatus { Active, Suspended, Deleted };
enum class TenantType { Individual, Organization, Enterprise };
enum class AuditOutcome { Success, Denied, Failed };

constexpr const char* to_string(TenantStatus status) {
    switch (status) {
        case TenantStatus::Active:    return "active";
        case TenantStatus::Suspended: return "suspended";
        case TenantStatus::Deleted:   return "deleted";
    }
    return "unknown";
}

constexpr const char* to_string(TenantType type) {
    switch (type) {
        case TenantType::Individual:   return "individual";
        case TenantType::Organization: return "organization";
        case TenantType::Enterprise:   return "enterprise";
    }
    return "unknown";
}

constexpr const char* to_string(AuditOutcome outcome) {
    switch (outcome) {
        case AuditOutcome::Success: return "success";
        case AuditOutcome::Denied:  return "denied";
        case AuditOutcome::Failed:  return "failed";
    }
    return "unknown";
}

std::optional<TenantStatus> parseTenantStatus(const std::string& value);
std::optional<TenantType> parseTenantType(const std::string& value);

struct Tenant {
    std::string tenant_id;
    std::string name;
    TenantType type = TenantType::Organization;
    std::string admin_user_id;
    std::string admin_email;
    int64_t max_users = 0;
    TenantStatus status = TenantStatus::Active;
    std::set<std::string> features;
    std::map<std::string, std::string> metadata;
    Timestamp created_at{};
    Timestamp updated_at{};

    bool active() const noexcept { return status == TenantStatus::Active; }
    bool hasFeature(const std::string& feature) const { return features.count(feature) > 0; }
};

// Input of create_tenant. max_users <= 0 takes DEFAULT_TENANT_MAX_USERS.
struct TenantSpec {
    std::string tenant_id;
    std::string name;
    TenantType type = TenantType::Organization;
    std::string admin_user_id;
    std::string admin_email;
    int64_t max_users = 0;
    std::set<std::string> features;
    std::map<std::string, std::string> metadata;
};

// Unset fields are left alone. Metadata entries are merged; an empty value
// removes the entry.
struct TenantPatch {
    std::optional<std::string> name;
    std::optional<std::string> admin_email;
    std::optional<TenantStatus> status;
    std::optional<int64_t> max_users;
    std::map<std::string, std::string> metadata;

    bool empty() const {
        return !name && !admin_email && !status && !max_users && metadata.empty();
    }
};

struct TenantMembership {
    std::string tenant_id;
    std::string user_id;
    std::string role;
    bool active = true;
    Timestamp joined_at{};
};

struct AuditRecord {
    uint64_t sequence = 0;
    std::string tenant_id;
    std::string user_id;
    std::string action;
    Timestamp timestamp{};
    AuditOutcome outcome = AuditOutcome::Success;
};

struct UsageStats {
    std::string tenant_id;
    size_t current_users = 0;
    int64_t max_users = 0;
    double usage_percentage = 0.0;
    size_t total_actions = 0;
    size_t successful_actions = 0;
    size_t denied_actions = 0;
    size_t failed_actions = 0;
    std::map<std::string, size_t> actions_by_type;
    std::optional<Timestamp> last_active;
};

struct TenantContext {
    Tenant tenant;
    size_t user_count = 0;
};

struct TenantFilter {
    std::optional<TenantStatus> status;
    std::optional<TenantType> type;
    bool include_deleted = false;
};

struct TenantUser {
    std::string user_id;
    std::string role;
};

} // namespace tenancy
