#include "config_utility.hpp"

namespace utilities {

ioc::UtilityDescriptor ConfigUtility::descriptor()
{
    ioc::UtilityDescriptor d;
    d.name = NAME;
    d.full_configuration = true;
    d.config_keys = {
        config::optionalKey("ENVIRONMENT"),
        config::optionalKey("MULTI_TENANT_ENABLED", config::ValueType::Bool),
    };
    d.factory = [](const ioc::UtilityContext& ctx) -> Result<ioc::UtilityHandle> {
        return Result<ioc::UtilityHandle>::OK(std::make_shared<ConfigUtility>(ctx.config()));
    };
    return d;
}

} // namespace utilities
