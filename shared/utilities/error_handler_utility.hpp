#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "common/result.h"
#include "ioc/utility.hpp"
#include "logger_utility.hpp"

namespace utilities {

// Central sink for errors that are handled locally rather than returned:
// logs them through the service logger and keeps per-code counts.
class ErrorHandlerUtility : public ioc::Utility {
public:
    inline static constexpr const char* NAME = "error_handler";

    explicit ErrorHandlerUtility(std::shared_ptr<LoggerUtility> logger) : logger_(std::move(logger)) {}

    static ioc::UtilityDescriptor descriptor();

    std::string name() const override { return NAME; }

    void record(const std::string& source, ResultCode code, const std::string& detail);

    template<typename T>
    void record(const std::string& source, const Result<T>& result) {
        if (result) return;
        record(source, result.code(), result.error().value_or(""));
    }

    size_t count(ResultCode code) const;
    size_t total() const;
    std::map<ResultCode, size_t> counts() const;

private:
    std::shared_ptr<LoggerUtility> logger_;
    std::map<ResultCode, size_t> counts_;
    size_t total_ = 0;
    mutable std::mutex mutex_;
};

} // namespace utilities
