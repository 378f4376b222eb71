/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for the XNAT transfer engine
 *
 * Every fallible operation of the engine reports through common_system's
 * Result pattern. Error codes below are specific to archive transfers;
 * the message carries a human summary and `details` carries the server
 * response body or the underlying cause where one exists.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace xnat {

/**
 * @brief Result type alias for XNAT operations
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
 * @brief Transfer-engine error codes
 *
 * Error code range: -700 to -779
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int xnat_base = -700;

    // Session errors (-700 to -719)
    constexpr int authentication_failed = xnat_base - 0;
    constexpr int session_closed = xnat_base - 1;

    // Request errors (-720 to -739)
    constexpr int request_failed = xnat_base - 20;
    constexpr int retry_exhausted = xnat_base - 21;
    constexpr int connection_failed = xnat_base - 22;
    constexpr int connection_timeout = xnat_base - 23;
    constexpr int transport_error = xnat_base - 24;

    // Transfer errors (-740 to -759)
    constexpr int validation_failed = xnat_base - 40;
    constexpr int verification_failed = xnat_base - 41;
    constexpr int archive_error = xnat_base - 42;
    constexpr int extraction_error = xnat_base - 43;
    constexpr int file_io_error = xnat_base - 44;
    constexpr int operation_cancelled = xnat_base - 45;

    // Prearchive errors (-760 to -769)
    constexpr int invalid_state_transition = xnat_base - 60;

    // Configuration errors (-770 to -779)
    constexpr int invalid_configuration = xnat_base - 70;
} // namespace error_codes

using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create an XNAT error result with module context
 * @tparam T The result value type
 * @param code Error code from xnat::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> xnat_error(int code, const std::string& message,
                            const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "xnat");
    }
    return kcenon::common::make_error<T>(code, message, "xnat", details);
}

/**
 * @brief Create an XNAT void error result
 * @param code Error code from xnat::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return VoidResult containing the error
 */
inline VoidResult xnat_void_error(int code, const std::string& message,
                                  const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "xnat"});
    }
    return VoidResult(error_info{code, message, "xnat", details});
}

/**
 * @brief Re-wrap an existing error into a Result of another value type
 */
template <typename T>
inline Result<T> forward_error(const error_info& err) {
    return Result<T>(err);
}

} // namespace xnat

/**
 * @brief Return early if expression is an error
 */
#define XNAT_RETURN_IF_ERROR(expr) COMMON_RETURN_IF_ERROR(expr)

/**
 * @brief Assign value or return error
 */
#define XNAT_ASSIGN_OR_RETURN(decl, expr) COMMON_ASSIGN_OR_RETURN(decl, expr)

/**
 * @brief Return XNAT error if condition is true
 */
#define XNAT_RETURN_ERROR_IF(condition, code, message) \
    COMMON_RETURN_ERROR_IF(condition, code, message, "xnat")
