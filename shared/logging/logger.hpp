#pragma once
#include <memory>
#include <mutex>
#include <string>
#include "common/result.h"
#include "common/logging_def.hpp"
#include "logger_backend.hpp"
#include <yaml-cpp/yaml.h>

namespace logging {

// Process-wide logging facade. Until init() succeeds every call is a no-op,
// which keeps library code usable from tests without any logging setup.
class Logger {
public:
    static Logger& instance();

    Result<void> init(logging::Type logger, const std::string& filename);
    Result<void> initDefault(logging::Type logger, Level level = Level::Info);
    Result<void> apply();
    void shutdown();

    void log(const std::string& tag, Level level, const std::string& msg) {
        auto backend = backend_();
        if (backend) backend->log(tag, level, msg);
    }

    Result<void> setLevel(const std::string& tag, Level level) {
        auto backend = backend_();
        if (backend) return backend->setLevel(tag, level);
        return Error(ResultCode::InvalidState, "logger not initialized");
    }
    void enableTag(const std::string& tag) { if (auto b = backend_()) b->enableTag(tag); }
    void disableTag(const std::string& tag) { if (auto b = backend_()) b->disableTag(tag); }

    bool isInitialized() const { return backend_() != nullptr; }

    static Level toLevel(const std::string& s);

private:
    Logger() = default;
    ~Logger();

    // no copy / move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::shared_ptr<LoggerBackend> backend_() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return logger_;
    }
    Result<void> createBackend_(logging::Type logger_type);
    Result<void> configureSink(const std::string& tag, const YAML::Node& sink);

    YAML::Node config_;
    std::shared_ptr<LoggerBackend> logger_;
    mutable std::mutex mutex_;
};

} // namespace logging
