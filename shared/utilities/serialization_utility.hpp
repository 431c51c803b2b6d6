#pragma once
#include <map>
#include <memory>
#include <string>

#include "common/message.hpp"
#include "common/result.h"
#include "ioc/utility.hpp"
#include "logger_utility.hpp"
#include "tenancy/tenant_types.hpp"

namespace utilities {

// JSON encoding of the payloads services hand to their own transports.
// Timestamps are milliseconds since the epoch.
class SerializationUtility : public ioc::Utility {
public:
    inline static constexpr const char* NAME = "serialization";

    explicit SerializationUtility(std::shared_ptr<LoggerUtility> logger) : logger_(std::move(logger)) {}

    static ioc::UtilityDescriptor descriptor();

    std::string name() const override { return NAME; }

    std::string toJson(const tenancy::Tenant& tenant) const;
    std::string toJson(const tenancy::UsageStats& stats) const;
    std::string toJson(const tenancy::AuditRecord& record) const;
    std::string toJson(const std::map<std::string, ioc::UtilityStatus>& health) const;

    Result<tenancy::Tenant> tenantFromJson(const std::string& payload) const;

    Result<std::string> encode(const message::Message& msg) const;
    Result<message::Message> decode(const std::string& topic, const std::string& payload) const;

private:
    std::shared_ptr<LoggerUtility> logger_;
};

} // namespace utilities
