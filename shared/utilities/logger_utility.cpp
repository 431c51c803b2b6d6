#include "logger_utility.hpp"

#include "common/helper.hpp"
#include "config_utility.hpp"

namespace utilities {

logging::Level LoggerUtility::parseLevel(const std::string& value)
{
    const auto name = toLower(trim(value));
    const auto level = logging::Logger::toLevel(name);
    if (level == logging::Level::Off && name != "off") return logging::Level::Info;
    return level;
}

ioc::UtilityDescriptor LoggerUtility::descriptor()
{
    ioc::UtilityDescriptor d;
    d.name = NAME;
    d.dependencies = {ConfigUtility::NAME};
    d.config_keys = {config::optionalKey("LOG_LEVEL")};
    d.config_prefix = "LOG_";
    d.factory = [](const ioc::UtilityContext& ctx) -> Result<ioc::UtilityHandle> {
        const auto level = parseLevel(ctx.config().getString("LOG_LEVEL", "info"));
        auto logger = std::make_shared<LoggerUtility>(ctx.serviceName(), level);

        auto& facade = logging::Logger::instance();
        if (facade.isInitialized()) {
            auto res = facade.setLevel(logger->tag(), level);
            if (!res) return Result<ioc::UtilityHandle>::Error(res.code(), res.error());
        }
        logger->debug("logger ready for {}", ctx.serviceName());
        return Result<ioc::UtilityHandle>::OK(logger);
    };
    return d;
}

} // namespace utilities
