#include "telemetry_sink.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "logging/logging.hpp"

namespace utilities {

Result<void> LogTelemetrySink::emit(const TelemetryEvent& event)
{
    if (!logger_) return Error(ResultCode::InvalidState, "no logger");

    std::string attrs;
    for (const auto& [key, value] : event.attributes) {
        if (!attrs.empty()) attrs += " ";
        attrs += key + "=" + value;
    }
    if (event.kind == TelemetryKind::Span) {
        logger_->debug("span {} {}us {}", event.name, event.duration.count(), attrs);
    } else {
        logger_->debug("counter {} {:+} {}", event.name, event.value, attrs);
    }
    return OK();
}

HttpTelemetrySink::HttpTelemetrySink(std::string endpoint, std::chrono::milliseconds timeout, size_t capacity)
    : endpoint_(std::move(endpoint)), timeout_(timeout), capacity_(capacity > 0 ? capacity : 1)
{
    curl_global_init(CURL_GLOBAL_ALL);
    curl_ = curl_easy_init();

    task::WorkerDescriptor desc;
    desc.name = "telemetry-http";
    desc.type = task::WorkerType::Event;
    auto started = start(desc);
    if (!started) {
        LOG_ERROR(LOG_TAG, "exporter for {} not started: {}", endpoint_, to_string(started));
    }
}

HttpTelemetrySink::~HttpTelemetrySink()
{
    close();
    if (curl_) curl_easy_cleanup(curl_);
    curl_global_cleanup();
}

void HttpTelemetrySink::close()
{
    auto stopped = stop();
    if (!stopped) LOG_WARN(LOG_TAG, "exporter for {} stop: {}", endpoint_, to_string(stopped));
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.clear();
}

std::string HttpTelemetrySink::toJson(const TelemetryEvent& event)
{
    nlohmann::json body;
    body["kind"] = event.kind == TelemetryKind::Span ? "span" : "counter";
    body["service"] = event.service;
    body["name"] = event.name;
    if (event.kind == TelemetryKind::Span) {
        body["duration_us"] = event.duration.count();
    } else {
        body["value"] = event.value;
    }
    body["attributes"] = event.attributes;
    body["timestamp_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        event.timestamp.time_since_epoch()).count();
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

size_t HttpTelemetrySink::queued() const
{
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

Result<void> HttpTelemetrySink::emit(const TelemetryEvent& event)
{
    if (isStopRequested() || state() != task::WorkerState::Running) {
        return Error(ResultCode::InvalidState, "telemetry exporter is not running");
    }
    auto payload = toJson(event);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (queue_.size() >= capacity_) {
            ++overflowed_;
            return Error(ResultCode::RateLimit, "telemetry queue full");
        }
        queue_.push_back(std::move(payload));
    }
    task::Worker::event();
    return OK();
}

Result<void> HttpTelemetrySink::run()
{
    while (!isStopRequested()) {
        std::string payload;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (queue_.empty()) break;
            payload = std::move(queue_.front());
            queue_.pop_front();
        }
        auto res = post_(payload);
        if (res) {
            ++sent_;
        } else {
            ++failed_;
            LOG_DEBUG(LOG_TAG, "export to {} failed: {}", endpoint_, to_string(res));
        }
    }
    return OK();
}

Result<void> HttpTelemetrySink::post_(const std::string& payload)
{
    if (!curl_) return Error(ResultCode::InternalError, "curl_easy_init failed");

    curl_easy_reset(curl_);
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    curl_easy_setopt(curl_, CURLOPT_URL, endpoint_.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    const CURLcode rc = curl_easy_perform(curl_);
    long status = 0;
    if (rc == CURLE_OK) curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
    curl_slist_free_all(headers);

    if (rc == CURLE_OPERATION_TIMEDOUT) {
        return Error(ResultCode::Timeout, "telemetry export timed out");
    }
    if (rc != CURLE_OK) {
        return Error(ResultCode::NetworkError, std::string("telemetry export: ") + curl_easy_strerror(rc));
    }
    if (status >= 400) {
        return Error(ResultCode::ProtocolError, "telemetry export: HTTP " + std::to_string(status));
    }
    return OK();
}

} // namespace utilities
