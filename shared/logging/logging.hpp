#pragma once
#include "common/logging_def.hpp"
#include "logger.hpp"
#include <string>
#include <fmt/core.h>
#include <fmt/format.h>
#include <iterator>
#include <string_view>
#include <type_traits>
#include <utility>



namespace logging {


inline Result<void> init(logging::Type logger_type, const std::string& filename) {
    return Logger::instance().init(logger_type, filename);
}

inline Result<void> apply() {
    return Logger::instance().apply();
}


template <typename... Args>
inline void log(const char* tag, logging::Level level,
                std::string_view fmt_str, const Args&... args) {
    if (!Logger::instance().isInitialized()) return;
    fmt::memory_buffer buf;
    fmt::vformat_to(std::back_inserter(buf), fmt_str, fmt::make_format_args(args...));
    Logger::instance().log(tag, level, std::string(buf.data(), buf.size()));
}


} // namespace logging


template <typename... Args>
inline void LOG_TRACE(const char* tag, std::string_view fmt_str, const Args&... args) {
    logging::log(tag, logging::Level::Trace, fmt_str, args...);
}

template <typename... Args>
inline void LOG_DEBUG(const char* tag, std::string_view fmt_str, const Args&... args) {
    logging::log(tag, logging::Level::Debug, fmt_str, args...);
}

template <typename... Args>
inline void LOG_INFO(const char* tag, std::string_view fmt_str, const Args&... args) {
    logging::log(tag, logging::Level::Info, fmt_str, args...);
}

template <typename... Args>
inline void LOG_WARN(const char* tag, std::string_view fmt_str, const Args&... args) {
    logging::log(tag, logging::Level::Warn, fmt_str, args...);
}

template <typename... Args>
inline void LOG_ERROR(const char* tag, std::string_view fmt_str, const Args&... args) {
    logging::log(tag, logging::Level::Error, fmt_str, args...);
}

template <typename... Args>
inline void LOG_FATAL(const char* tag, std::string_view fmt_str, const Args&... args) {
    logging::log(tag, logging::Level::Fatal, fmt_str, args...);
}


#define LOGT(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Trace, __VA_ARGS__)
#define LOGD(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Debug, __VA_ARGS__)
#define LOGI(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Info, __VA_ARGS__)
#define LOGW(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Warn, __VA_ARGS__)
#define LOGE(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Error, __VA_ARGS__)
#define LOGF(...) logging::log(std::decay_t<decltype(*this)>::LOG_TAG, logging::Level::Fatal, __VA_ARGS__)
