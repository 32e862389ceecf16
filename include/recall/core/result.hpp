/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for the recall library
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for recall, integrating with common_system's Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace recall {

/**
 * @brief Result type alias for recall operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief recall-specific error codes
 *
 * Error code range: -700 to -799
 * Provides access to both common error codes and recall-specific codes.
 */
namespace error_codes {
    // Import common error codes (invalid_argument, not_found, ...)
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int recall_base = -700;

    // Scheduling errors (-700 to -719)
    constexpr int invalid_rating = recall_base - 0;
    constexpr int invalid_learning_ladder = recall_base - 1;
    constexpr int invalid_daily_limit = recall_base - 2;

    // Card store errors (-720 to -749)
    constexpr int card_not_found = recall_base - 20;
    constexpr int deck_not_found = recall_base - 21;
    constexpr int duplicate_card = recall_base - 22;
    constexpr int empty_term = recall_base - 23;

    constexpr int database_open_error = recall_base - 30;
    constexpr int database_query_error = recall_base - 31;
    constexpr int database_transaction_error = recall_base - 32;
    constexpr int database_migration_error = recall_base - 33;

    // Sync / remote store errors (-750 to -779)
    constexpr int remote_fetch_failed = recall_base - 50;
    constexpr int remote_write_failed = recall_base - 51;
    constexpr int remote_decode_error = recall_base - 52;
    constexpr int sync_identity_missing = recall_base - 53;
    constexpr int sync_invalid_state = recall_base - 54;

    // Configuration / import errors (-780 to -799)
    constexpr int config_parse_error = recall_base - 80;
    constexpr int config_invalid_value = recall_base - 81;
    constexpr int import_malformed_row = recall_base - 82;
} // namespace error_codes

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create a recall error result with module context
 * @tparam T The result value type
 * @param code Error code from recall::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> recall_error(int code, const std::string& message,
                              const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "recall");
    }
    return kcenon::common::make_error<T>(code, message, "recall", details);
}

/**
 * @brief Create a recall void error result
 * @param code Error code from recall::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return VoidResult containing the error
 */
inline VoidResult recall_void_error(int code, const std::string& message,
                                    const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "recall"});
    }
    return VoidResult(error_info{code, message, "recall", details});
}

} // namespace recall
