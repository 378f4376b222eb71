/**
 * @file retry_policy.hpp
 * @brief Classification of request attempts and backoff computation
 */

#pragma once

#include <xnat/core/result.hpp>
#include <xnat/http/http_types.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <set>

namespace xnat::client {

/**
 * @brief What the retry loop should do after one attempt
 */
enum class attempt_outcome {
    success,       ///< 2xx response
    transient,     ///< Connect/timeout error or retryable gateway status
    unauthorized,  ///< 401/403: re-authenticate once
    fatal          ///< Anything else; surface immediately
};

[[nodiscard]] constexpr const char* to_string(attempt_outcome outcome) noexcept {
    switch (outcome) {
        case attempt_outcome::success: return "success";
        case attempt_outcome::transient: return "transient";
        case attempt_outcome::unauthorized: return "unauthorized";
        case attempt_outcome::fatal: return "fatal";
        default: return "unknown";
    }
}

/// Blocks the calling worker for the given backoff delay
using sleeper = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief Default sleeper (std::this_thread::sleep_for)
 */
[[nodiscard]] auto thread_sleeper() -> sleeper;

/**
 * @brief Transient-failure retry parameters
 */
struct retry_policy {
    std::size_t max_retries{3};                       ///< Additional attempts
    std::chrono::milliseconds backoff_unit{1000};     ///< Scaled by 2^attempt
    std::set<int> retryable_statuses{502, 503, 504};

    /**
     * @brief Classify the result of one transport exchange
     */
    [[nodiscard]] auto classify(const Result<http::http_response>& result) const
        -> attempt_outcome;

    /**
     * @brief Delay before retry number @p attempt (1-based): unit * 2^attempt
     */
    [[nodiscard]] auto backoff_for(std::size_t attempt) const noexcept
        -> std::chrono::milliseconds;
};

}  // namespace xnat::client
