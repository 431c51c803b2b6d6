#include "logger.hpp"
#include "logger_spdlog.hpp"
#include "common/helper.hpp"
#include <iostream>

namespace logging {

Logger& Logger::instance() {
    static Logger instance;  // thread-safe since C++11
    return instance;
}

Logger::~Logger() {
    shutdown();
}

Result<void> Logger::createBackend_(logging::Type logger_type) {
    std::shared_ptr<LoggerBackend> backend;
    switch (logger_type)
    {
    case logging::Type::SpdLog:
        backend = std::make_shared<SpdlogBackend>();
        break;
    default:
        return Error(ResultCode::NotSupported, "unknown logger type");
    }

    auto res = backend->init();
    if (!res) return res;

    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) logger_->shutdown();
    logger_ = std::move(backend);
    return OK();
}

Result<void> Logger::init(logging::Type logger_type, const std::string& filename) {
    try {
        config_ = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        std::cerr << "logging yaml load error: " << e.what() << std::endl;
        return Error(ResultCode::InvalidArgument, std::string("logging yaml: ") + e.what());
    }

    auto res = createBackend_(logger_type);
    if (!res) return res;
    return apply();
}

Result<void> Logger::initDefault(logging::Type logger_type, Level level) {
    config_ = YAML::Node();
    auto res = createBackend_(logger_type);
    if (!res) return res;
    return setLevel(std::string(GLOBAL_TAG), level);
}

void Logger::shutdown() {
    std::shared_ptr<LoggerBackend> backend;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        backend.swap(logger_);
    }
    if (backend) backend->shutdown();
}

logging::Level Logger::toLevel(const std::string& s) {
    const auto level = toLower(s);
    if (level == "trace") return logging::Level::Trace;
    if (level == "debug") return logging::Level::Debug;
    if (level == "info")  return logging::Level::Info;
    if (level == "warn" || level == "warning") return logging::Level::Warn;
    if (level == "error") return logging::Level::Error;
    if (level == "fatal" || level == "critical") return logging::Level::Fatal;
    return logging::Level::Off;
}

Result<void> Logger::apply() {
    auto backend = backend_();
    if (!backend) return Error(ResultCode::InvalidState, "logger not initialized");
    if (!config_["log"]) return OK();

    try {
        const auto g_tag = std::string(GLOBAL_TAG);
        if (config_["log"][g_tag]) {
            auto node = config_["log"][g_tag];

            if (node["level"]) {
                backend->setLevel(g_tag, toLevel(node["level"].as<std::string>()));
            }
            if (node["sinks"]) {
                for (const auto& sink : node["sinks"]) {
                    auto res = configureSink(g_tag, sink);
                    if (!res) std::cerr << "logging sink: " << to_string(res) << std::endl;
                }
            }
        }

        for (const auto& it : config_["log"]) {
            const auto tag = it.first.as<std::string>();
            if (tag == g_tag) continue;
            const auto node = it.second;

            if (node["sinks"]) {
                for (const auto& sink : node["sinks"]) {
                    auto res = configureSink(tag, sink);
                    if (!res) std::cerr << "logging sink: " << to_string(res) << std::endl;
                }
            }
            if (node["level"]) {
                backend->setLevel(tag, toLevel(node["level"].as<std::string>()));
            }
            backend->registerLogger(tag);
        }
    } catch (const YAML::Exception& e) {
        return Error(ResultCode::InvalidArgument, std::string("logging yaml: ") + e.what());
    }
    return OK();
}

Result<void> Logger::configureSink(const std::string& tag, const YAML::Node& sink) {
    auto backend = backend_();
    if (!backend) return Error(ResultCode::InvalidState, "logger not initialized");

    const auto type = sink["type"].as<std::string>("");

    if (type == "console") {
        return backend->setConsoleSink(tag);
    } else if (type == "file") {
        return backend->setFileSink(tag, sink["filename"].as<std::string>());
    } else if (type == "rotating_file") {
        return backend->setRotatingFileSink(tag,
            sink["filename"].as<std::string>(),
            sink["max_size"].as<size_t>(),
            sink["max_files"].as<size_t>());
    } else if (type == "syslog") {
        return backend->setSyslogSink(tag, sink["ident"].as<std::string>(tag));
    } else if (type == "loki") {
        return backend->setLokiSink(tag,
            sink["url"].as<std::string>(""),
            sink["job"].as<std::string>("tenantcore"));
    }
    return Error(ResultCode::NotSupported, "unknown sink type: " + type);
}

} // namespace logging
