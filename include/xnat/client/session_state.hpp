/**
 * @file session_state.hpp
 * @brief Token state shared by a session_client and all of its forks
 */

#pragma once

#include <xnat/core/result.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

namespace xnat::client {

/**
 * @brief Token issued by the server together with its expiry
 */
struct token_grant {
    std::string token;
    std::chrono::system_clock::time_point expires_at;
};

/**
 * @brief Consistent view of the token at one instant
 *
 * The generation increases with every refresh attempt (successful or
 * not). A worker that received 401 passes the generation it sent with
 * to refresh() so that only the first of many concurrent failures
 * re-authenticates.
 */
struct token_snapshot {
    std::optional<std::string> token;
    std::chrono::system_clock::time_point expires_at{};
    std::uint64_t generation{0};

    [[nodiscard]] bool is_expired(std::chrono::system_clock::time_point now) const noexcept {
        return token.has_value() && now >= expires_at;
    }
};

/**
 * @brief Mutex-guarded session token with single-flight refresh
 *
 * Readers take a shared lock. refresh() is serialized by a dedicated
 * mutex; the authenticate callback runs without the state lock held so
 * snapshot() never blocks on the network.
 */
class session_state {
public:
    using authenticator = std::function<Result<token_grant>()>;

    session_state() = default;

    session_state(const session_state&) = delete;
    session_state& operator=(const session_state&) = delete;

    [[nodiscard]] auto snapshot() const -> token_snapshot;

    /**
     * @brief Store a token without contacting the server
     */
    void install(token_grant grant);

    /**
     * @brief Re-authenticate unless someone already did since @p observed_generation
     *
     * If the generation moved on, returns the newer outcome: the current
     * token, or the error of the refresh that failed.
     */
    [[nodiscard]] auto refresh(std::uint64_t observed_generation,
                               const authenticator& authenticate) -> Result<token_snapshot>;

    /**
     * @brief Drop the token (logout)
     */
    void clear();

    /**
     * @brief Number of authenticate callbacks actually executed
     */
    [[nodiscard]] auto authentication_count() const noexcept -> std::size_t {
        return authentication_count_.load();
    }

private:
    mutable std::shared_mutex mutex_;
    std::mutex refresh_mutex_;

    std::optional<std::string> token_;
    std::chrono::system_clock::time_point expires_at_{};
    std::uint64_t generation_{0};
    std::optional<error_info> last_failure_;

    std::atomic<std::size_t> authentication_count_{0};
};

}  // namespace xnat::client
