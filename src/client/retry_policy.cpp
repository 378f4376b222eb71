/**
 * @file retry_policy.cpp
 * @brief Attempt classification and exponential backoff
 */

#include <xnat/client/retry_policy.hpp>

#include <cstdint>
#include <thread>

namespace xnat::client {

auto thread_sleeper() -> sleeper {
    return [](std::chrono::milliseconds delay) {
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
    };
}

auto retry_policy::classify(const Result<http::http_response>& result) const
    -> attempt_outcome {
    if (result.is_err()) {
        const auto code = result.error().code;
        if (code == error_codes::connection_failed ||
            code == error_codes::connection_timeout) {
            return attempt_outcome::transient;
        }
        return attempt_outcome::fatal;
    }

    const int status = result.value().status;
    if (status >= 200 && status < 300) {
        return attempt_outcome::success;
    }
    if (status == 401 || status == 403) {
        return attempt_outcome::unauthorized;
    }
    if (retryable_statuses.count(status) != 0) {
        return attempt_outcome::transient;
    }
    return attempt_outcome::fatal;
}

auto retry_policy::backoff_for(std::size_t attempt) const noexcept
    -> std::chrono::milliseconds {
    // Exponent capped at 20
    const auto exponent = attempt > 20 ? std::size_t{20} : attempt;
    return backoff_unit * (std::int64_t{1} << exponent);
}

}  // namespace xnat::client
