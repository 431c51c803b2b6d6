#include "error_handler_utility.hpp"

namespace utilities {

ioc::UtilityDescriptor ErrorHandlerUtility::descriptor()
{
    ioc::UtilityDescriptor d;
    d.name = NAME;
    d.dependencies = {LoggerUtility::NAME};
    d.factory = [](const ioc::UtilityContext& ctx) -> Result<ioc::UtilityHandle> {
        auto logger = ctx.dependency<LoggerUtility>(LoggerUtility::NAME);
        if (!logger) return Result<ioc::UtilityHandle>::Error(ResultCode::DependencyFailed, "logger");
        return Result<ioc::UtilityHandle>::OK(std::make_shared<ErrorHandlerUtility>(std::move(logger)));
    };
    return d;
}

void ErrorHandlerUtility::record(const std::string& source, ResultCode code, const std::string& detail)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[code];
        ++total_;
    }
    if (detail.empty()) {
        logger_->error("{}: {}", source, to_string(code));
    } else {
        logger_->error("{}: {}: {}", source, to_string(code), detail);
    }
}

size_t ErrorHandlerUtility::count(ResultCode code) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(code);
    return it == counts_.end() ? 0 : it->second;
}

size_t ErrorHandlerUtility::total() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

std::map<ResultCode, size_t> ErrorHandlerUtility::counts() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return counts_;
}

} // namespace utilities
