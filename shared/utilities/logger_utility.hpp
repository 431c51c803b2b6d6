#pragma once
#include <string>
#include <string_view>

#include "common/logging_def.hpp"
#include "ioc/utility.hpp"
#include "logging/logging.hpp"

namespace utilities {

// Logging bound to the service name of the container. LOG_LEVEL sets the
// level of that tag.
class LoggerUtility : public ioc::Utility {
public:
    inline static constexpr const char* NAME = "logger";

    LoggerUtility(std::string tag, logging::Level level) : tag_(std::move(tag)), level_(level) {}

    // unknown names fall back to Info
    static logging::Level parseLevel(const std::string& value);

    static ioc::UtilityDescriptor descriptor();

    std::string name() const override { return NAME; }

    const std::string& tag() const noexcept { return tag_; }
    logging::Level level() const noexcept { return level_; }

    template <typename... Args>
    void debug(std::string_view fmt_str, const Args&... args) const {
        logging::log(tag_.c_str(), logging::Level::Debug, fmt_str, args...);
    }

    template <typename... Args>
    void info(std::string_view fmt_str, const Args&... args) const {
        logging::log(tag_.c_str(), logging::Level::Info, fmt_str, args...);
    }

    template <typename... Args>
    void warn(std::string_view fmt_str, const Args&... args) const {
        logging::log(tag_.c_str(), logging::Level::Warn, fmt_str, args...);
    }

    template <typename... Args>
    void error(std::string_view fmt_str, const Args&... args) const {
        logging::log(tag_.c_str(), logging::Level::Error, fmt_str, args...);
    }

private:
    std::string tag_;
    logging::Level level_;
};

} // namespace utilities
