#pragma once

// ============================================================================
// Arrow Status / Result -> exception bridge
// ============================================================================
// Arrow reports failures through arrow::Status and arrow::Result<T> instead of
// exceptions. Every Arrow call in BulkBridge goes through one of these macros
// so a failure surfaces as StagingError carrying the failing expression.
//
//   BULKBRIDGE_THROW_IF_NOT_OK(builder.Append(x));
//   BULKBRIDGE_ASSIGN_OR_THROW(auto out, fs->OpenOutputStream(path));
// ============================================================================

#include <string>
#include <arrow/status.h>
#include <arrow/result.h>
#include "Errors.hpp"

#define BULKBRIDGE_THROW_IF_NOT_OK(expr)                        \
    do                                                          \
    {                                                           \
        ::arrow::Status _bb_status = (expr);                    \
        if (!_bb_status.ok())                                   \
        {                                                       \
            throw ::BulkBridge::StagingError(                   \
                std::string("[ARROW ERROR] ") + #expr +         \
                " -> " + _bb_status.ToString());                \
        }                                                       \
    } while (0)

#define BULKBRIDGE_CONCAT_INNER(a, b) a##b
#define BULKBRIDGE_CONCAT(a, b) BULKBRIDGE_CONCAT_INNER(a, b)

#define BULKBRIDGE_ASSIGN_OR_THROW_IMPL(result_name, lhs, rexpr)   \
    auto result_name = (rexpr);                                    \
    if (!result_name.ok())                                         \
    {                                                              \
        throw ::BulkBridge::StagingError(                          \
            std::string("[ARROW ERROR] ") + #rexpr +               \
            " -> " + result_name.status().ToString());             \
    }                                                              \
    lhs = std::move(result_name).ValueOrDie()

#define BULKBRIDGE_ASSIGN_OR_THROW(lhs, rexpr) \
    BULKBRIDGE_ASSIGN_OR_THROW_IMPL(BULKBRIDGE_CONCAT(_bb_result_, __LINE__), lhs, rexpr)
