#pragma once
#include <memory>
#include <vector>

#include "config_utility.hpp"
#include "error_handler_utility.hpp"
#include "health_utility.hpp"
#include "ioc/utility.hpp"
#include "logger_utility.hpp"
#include "security_utility.hpp"
#include "serialization_utility.hpp"
#include "telemetry_utility.hpp"
#include "tenant_utility.hpp"
#include "validation_utility.hpp"

namespace utilities {

// Replaceable collaborators of the standard set. Unset members use the
// defaults selected from configuration.
struct StandardOptions {
    tenancy::TenantStorePtr tenant_store;
    std::shared_ptr<TelemetrySink> telemetry_sink;
    std::shared_ptr<HealthSink> health_sink;
    std::shared_ptr<security::PolicyEngine> policy_engine;
};

// config, logger, error_handler, health, telemetry, security, validation,
// serialization, tenant
std::vector<ioc::UtilityDescriptor> standardDescriptors(const StandardOptions& options = {});

} // namespace utilities
