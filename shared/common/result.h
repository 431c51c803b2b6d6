// ============================================================================
// File: shared/common/result.h
// Description: Unified Result / Error handling structure for entire system
// ============================================================================

#pragma once
#include <string>
#include <utility>
#include <optional>
#include <cstdint>


// NOTE: int-based so codes stay stable across modules. Extend by appending.
enum class ResultCode : int32_t {
    OK                  = 0,
    Fail                = 1,
    Cancelled           = 2,

    // input & state error
    InvalidArgument     = 100,
    AlreadyExists       = 101,
    DuplicateIgnored    = 102,
    NotFound            = 103,
    OutOfRange          = 104,

    // system & resource error
    PermissionDenied    = 200,
    Timeout             = 201,
    OutOfMemory         = 202,
    ResourceBusy        = 203,
    InvalidState        = 204,
    RateLimit           = 205,

    // internal error
    InternalError       = 300,
    NotSupported        = 301,
    SocketError         = 302,

    // network error
    NetworkError        = 400,
    ConnectionFail      = 402,
    ConnectionLost      = 403,
    ProtocolError       = 404,

    // configuration
    ConfigMissingRequired = 500,
    ConfigTypeMismatch    = 501,

    // bootstrap & container
    CyclicDependency      = 510,
    DependencyFailed      = 511,
    UtilityUnavailable    = 512,

    // tenancy
    TenantNotFound        = 520,
    DuplicateTenant       = 521,
    AccessDenied          = 522,
    TenantInactive        = 523,
    UserLimitExceeded     = 524,
    AuditWriteFailed      = 530,

    Unknown
};

inline constexpr bool isSuccess(ResultCode code) noexcept {
    switch (code) {
        case ResultCode::OK:
        case ResultCode::DuplicateIgnored:
            return true;
        default:
            return false;
    }
}

inline constexpr bool isFailure(ResultCode code) noexcept {
    return !isSuccess(code);
}

template <typename T, typename E = std::optional<std::string>>
class Result;

// ----------------------------------------------------------------------------
// Partial specialization for void
// ----------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    Result() : code_(ResultCode::OK), error_(std::nullopt) {}
    static Result OK() { return Result(ResultCode::OK, std::nullopt); }
    static Result Fail() { return Error(ResultCode::Fail); }
    static Result Error(ResultCode code, E error = std::nullopt) { return Result(code, std::move(error)); }

    [[nodiscard]] bool hasError() const noexcept { return isFailure(code_); }
    [[nodiscard]] explicit operator bool() const noexcept { return isSuccess(code_); }

    [[nodiscard]] const E& error() const noexcept  { return error_; }
    [[nodiscard]] ResultCode code() const noexcept  { return code_; }

    [[nodiscard]] const char* c_str() const noexcept  {
        return error_.has_value() ? error_->c_str() : "";
    }

private:
    ResultCode code_;
    E error_;

    Result(ResultCode code, E e)
        : code_(code), error_(std::move(e)) {}
};

// ----------------------------------------------------------------------------
// Result<T, E> template
// ----------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    // Default constructor: success by default
    Result() : code_(ResultCode::OK), error_(std::nullopt) {}

    // Carries the failure of a Result<void> into a typed result.
    Result(const Result<void, E>& failure)
        : code_(failure.code()), error_(failure.error()) {}

    // Factory methods
    static Result OK(T value) { return Result(std::move(value)); }
    static Result Fail() { return Error(ResultCode::Fail); }
    static Result Error(ResultCode code, E error = std::nullopt) { return Result(code, std::move(error)); }

    // Query
    [[nodiscard]] bool hasError() const noexcept { return isFailure(code_); }
    [[nodiscard]] explicit operator bool() const noexcept { return isSuccess(code_); }

    [[nodiscard]] ResultCode code() const noexcept { return code_; }
    [[nodiscard]] const T& value() const noexcept { return value_; }
    [[nodiscard]] T& value() noexcept  { return value_; }
    [[nodiscard]] const E& error() const noexcept  { return error_; }

    const T* operator->() const noexcept { return &value_; }
    T* operator->() noexcept { return &value_; }

private:
    ResultCode code_;
    T value_{};
    E error_;

    // Success constructor
    explicit Result(T val)
        : code_(ResultCode::OK), value_(std::move(val)), error_(std::nullopt) {}

    // Error constructor
    Result(ResultCode code, E err)
        : code_(code), error_(std::move(err)) {}
};

// ----------------------------------------------------------------------------
// String conversion (for logging / debugging)
// ----------------------------------------------------------------------------

constexpr const char* to_string(ResultCode code) {
    switch (code) {
        case ResultCode::OK:                    return "OK";
        case ResultCode::Fail:                  return "Fail";
        case ResultCode::Cancelled:             return "Cancelled";
        case ResultCode::InvalidArgument:       return "InvalidArgument";
        case ResultCode::AlreadyExists:         return "AlreadyExists";
        case ResultCode::DuplicateIgnored:      return "DuplicateIgnored";
        case ResultCode::NotFound:              return "NotFound";
        case ResultCode::OutOfRange:            return "OutOfRange";
        case ResultCode::PermissionDenied:      return "PermissionDenied";
        case ResultCode::Timeout:               return "Timeout";
        case ResultCode::OutOfMemory:           return "OutOfMemory";
        case ResultCode::ResourceBusy:          return "ResourceBusy";
        case ResultCode::InvalidState:          return "InvalidState";
        case ResultCode::RateLimit:             return "RateLimit";
        case ResultCode::InternalError:         return "InternalError";
        case ResultCode::NotSupported:          return "NotSupported";
        case ResultCode::SocketError:           return "SocketError";
        case ResultCode::NetworkError:          return "NetworkError";
        case ResultCode::ConnectionFail:        return "ConnectionFail";
        case ResultCode::ConnectionLost:        return "ConnectionLost";
        case ResultCode::ProtocolError:         return "ProtocolError";
        case ResultCode::ConfigMissingRequired: return "ConfigMissingRequired";
        case ResultCode::ConfigTypeMismatch:    return "ConfigTypeMismatch";
        case ResultCode::CyclicDependency:      return "CyclicDependency";
        case ResultCode::DependencyFailed:      return "DependencyFailed";
        case ResultCode::UtilityUnavailable:    return "UtilityUnavailable";
        case ResultCode::TenantNotFound:        return "TenantNotFound";
        case ResultCode::DuplicateTenant:       return "DuplicateTenant";
        case ResultCode::AccessDenied:          return "AccessDenied";
        case ResultCode::TenantInactive:        return "TenantInactive";
        case ResultCode::UserLimitExceeded:     return "UserLimitExceeded";
        case ResultCode::AuditWriteFailed:      return "AuditWriteFailed";
        default:                                return "Unknown";
    }
}

// LOGI("result: {}", to_string(result));
inline std::string to_string(const Result<void>& r) {
    return std::string(to_string(r.code())) +
           (r.error().has_value() ? (": " + *r.error()) : "");
}

template <typename T>
inline std::string to_string(const Result<T>& r) {
    return std::string(to_string(r.code())) +
           (r.error().has_value() ? (": " + *r.error()) : "");
}


inline Result<void> OK() noexcept { return Result<void>::OK(); }
inline Result<void> Fail() noexcept { return Result<void>::Fail(); }
inline Result<void> Error(ResultCode code, std::optional<std::string> msg = std::nullopt) noexcept  {
    return Result<void>::Error(code, std::move(msg));
}

// Duplicate that is allowed and reported as success.
inline Result<void> DuplicateIgnored(std::optional<std::string> msg = std::nullopt) noexcept  {
    return Result<void>::Error(ResultCode::DuplicateIgnored, std::move(msg));
}
