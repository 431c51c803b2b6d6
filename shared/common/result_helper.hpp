// ============================================================================
// File: shared/common/result_helper.hpp
// Description: Result<T> helper macros
// Depends on: shared/common/result.h, shared/logging/logging.hpp
// ============================================================================

#pragma once
#include "result.h"
#include <fmt/format.h>

// ----------------------------------------------------------------------------
// 1. RETURN_IF_ERR
// ----------------------------------------------------------------------------
// Usage:
//   auto r = store->insertTenant(tenant);
//   RETURN_IF_ERR(r);
// Works in functions returning Result<void> or Result<T>.
// ----------------------------------------------------------------------------
#define RETURN_IF_ERR(res)                                           \
    do {                                                             \
        if (!(res)) {                                                \
            return Result<void>::Error((res).code(), (res).error()); \
        }                                                            \
    } while (0)

#define RETURN_IF_ERR_MSG(res, msg)                                  \
    do {                                                             \
        if (!(res)) {                                                \
            auto err_str = (res).error().has_value()                 \
                ? fmt::format("{}: {}", msg, *(res).error())         \
                : std::string(msg);                                  \
            return Result<void>::Error((res).code(), err_str);       \
        }                                                            \
    } while (0)

// ----------------------------------------------------------------------------
// 2. LOG_IF_ERR (needs a LOG_TAG in scope of *this)
// ----------------------------------------------------------------------------
#define LOG_IF_ERR(res)                                              \
    do {                                                             \
        if (!(res)) {                                                \
            LOGE("Error: {}", to_string(res));                       \
        }                                                            \
    } while (0)
