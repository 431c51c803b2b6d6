#include "standard_utilities.hpp"

namespace utilities {

std::vector<ioc::UtilityDescriptor> standardDescriptors(const StandardOptions& options)
{
    return {
        ConfigUtility::descriptor(),
        LoggerUtility::descriptor(),
        ErrorHandlerUtility::descriptor(),
        HealthUtility::descriptor(options.health_sink),
        TelemetryUtility::descriptor(options.telemetry_sink),
        SecurityUtility::descriptor(options.policy_engine),
        ValidationUtility::descriptor(),
        SerializationUtility::descriptor(),
        TenantUtility::descriptor(options.tenant_store),
    };
}

} // namespace utilities
