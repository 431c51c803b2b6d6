#include "logger_spdlog.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/syslog_sink.h>
#include <spdlog/sinks/base_sink.h>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <exception>


namespace logging {

namespace {

std::string levelToString(spdlog::level::level_enum level)
{
    switch (level)
    {
    case spdlog::level::trace:    return "trace";
    case spdlog::level::debug:    return "debug";
    case spdlog::level::info:     return "info";
    case spdlog::level::warn:     return "warn";
    case spdlog::level::err:      return "error";
    case spdlog::level::critical: return "critical";
    case spdlog::level::off:      return "off";
    default:                      return "unknown";
    }
}

// ---------- Loki Sink ----------
// Pushes every record to a Loki push endpoint. A slow collector never blocks
// the caller for longer than the request timeout.
class LokiSink : public spdlog::sinks::base_sink<std::mutex> {
public:
    LokiSink(const std::string& url, const std::string& job, const std::string& tag)
        : url_(url), job_(job), tag_(tag) {
        curl_global_init(CURL_GLOBAL_ALL);
    }
    ~LokiSink() override { curl_global_cleanup(); }
protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        spdlog::memory_buf_t formatted;
        base_sink<std::mutex>::formatter_->format(msg, formatted);
        auto ns_since_epoch = std::chrono::duration_cast<std::chrono::nanoseconds>(
            msg.time.time_since_epoch()).count();

        nlohmann::json stream;
        stream["stream"] = {{"job", job_}, {"tag", tag_}, {"level", levelToString(msg.level)}};
        stream["values"] = nlohmann::json::array(
            {nlohmann::json::array({std::to_string(ns_since_epoch),
                                    std::string(formatted.data(), formatted.size())})});
        nlohmann::json body;
        body["streams"] = nlohmann::json::array({stream});
        const std::string payload = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

        CURL* curl = curl_easy_init();
        if (!curl) return;
        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, 200L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        // delivery failures are dropped, the sink must not recurse into logging
        (void)curl_easy_perform(curl);
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);
    }
    void flush_() override {}
private:
    std::string url_;
    std::string job_;
    std::string tag_;
};

} // namespace


SpdlogBackend::~SpdlogBackend() {
    shutdown();
}

Result<void> SpdlogBackend::init() {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] [%^%l%$] %v");
    initialized_ = true;
    shut_down_ = false;
    return OK();
}

void SpdlogBackend::shutdown() {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (shut_down_) return;
    shut_down_ = true;
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& l){ l->flush(); });
    spdlog::drop_all();
}

void SpdlogBackend::registerLogger(const std::string& tag) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    registerLoggerLocked_(tag);
}

void SpdlogBackend::registerLoggerLocked_(const std::string& tag) {
    if (spdlog::get(tag)) return;

    std::vector<spdlog::sink_ptr> sinks;
    auto own = tag_sinks_.find(tag);
    if (own != tag_sinks_.end()) sinks = own->second;

    auto global = tag_sinks_.find(std::string(GLOBAL_TAG));
    if (global != tag_sinks_.end()) {
        sinks.insert(sinks.end(), global->second.begin(), global->second.end());
    }
    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>(tag, sinks.begin(), sinks.end());
    auto level = tag_levels_.find(tag);
    logger->set_level(toSpd_(level != tag_levels_.end() ? level->second : global_level_));
    try {
        spdlog::register_logger(logger);
    } catch (const spdlog::spdlog_ex&) {
        // registered concurrently by another thread, keep the existing one
    }
}

Result<void> SpdlogBackend::setLevel(const std::string& tag, Level level) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (tag == GLOBAL_TAG) {
        global_level_ = level;
        spdlog::apply_all([this](const std::shared_ptr<spdlog::logger>& l) {
            if (tag_levels_.count(l->name()) == 0) l->set_level(toSpd_(global_level_));
        });
        return OK();
    }
    tag_levels_[tag] = level;
    if (auto logger = spdlog::get(tag)) {
        logger->set_level(toSpd_(level));
    }
    return OK();
}

Result<void> SpdlogBackend::addSink_(const std::string& tag, spdlog::sink_ptr sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    tag_sinks_[tag].push_back(std::move(sink));
    return OK();
}

Result<void> SpdlogBackend::setConsoleSink(const std::string& tag) {
    return addSink_(tag, std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
}

Result<void> SpdlogBackend::setFileSink(const std::string& tag, const std::string& filename) {
    try {
        return addSink_(tag, std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, true));
    } catch (const spdlog::spdlog_ex& e) {
        return Error(ResultCode::InvalidArgument, e.what());
    }
}

Result<void> SpdlogBackend::setRotatingFileSink(const std::string& tag, const std::string& filename,
                                                size_t max_size, size_t max_files) {
    try {
        return addSink_(tag, std::make_shared<spdlog::sinks::rotating_file_sink_mt>(filename, max_size, max_files));
    } catch (const spdlog::spdlog_ex& e) {
        return Error(ResultCode::InvalidArgument, e.what());
    }
}

Result<void> SpdlogBackend::setSyslogSink(const std::string& tag, const std::string& ident) {
    return addSink_(tag, std::make_shared<spdlog::sinks::syslog_sink_mt>(ident, LOG_PID, LOG_USER, true));
}

Result<void> SpdlogBackend::setLokiSink(const std::string& tag, const std::string& url, const std::string& job) {
    if (url.empty()) return Error(ResultCode::InvalidArgument, "loki sink requires url");
    return addSink_(tag, std::make_shared<LokiSink>(url, job, tag));
}

void SpdlogBackend::log(const std::string& tag, Level level, const std::string& msg) {
    std::shared_ptr<spdlog::logger> logger;
    {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        if (shut_down_ || disabled_tags_.count(tag)) return;
        logger = spdlog::get(tag);
        if (!logger) {
            registerLoggerLocked_(tag);
            logger = spdlog::get(tag);
        }
    }
    if (!logger) return;

    logger->log(toSpd_(level), msg);
    if (level == Level::Fatal) {
        spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& l){ l->flush(); });
    }
}


} // namespace logging
