/**
 * @file session_client.hpp
 * @brief Authenticated XNAT HTTP session with retry and re-authentication
 *
 * Every request goes through one retry loop:
 * - connect/timeout errors and 502/503/504 are retried up to max_retries
 *   extra times with backoff unit * 2^attempt (attempt starts at 1);
 *   exhaustion yields retry_exhausted carrying the attempt count and the
 *   last cause;
 * - 401/403 clears the token, re-authenticates once (single-flight across
 *   all forks) and replays the request once; a second rejection or a
 *   failed login yields authentication_failed;
 * - any other non-2xx status yields request_failed immediately, with the
 *   response body in the error details.
 *
 * POST and PUT are retried under the same policy.
 */

#pragma once

#include <xnat/client/retry_policy.hpp>
#include <xnat/client/session_state.hpp>
#include <xnat/core/client_config.hpp>
#include <xnat/core/result.hpp>
#include <xnat/di/ilogger.hpp>
#include <xnat/http/http_transport.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace xnat::client {

class paged_listing;

/**
 * @brief Everything needed to issue one logical request
 */
struct request_options {
    http::http_method method{http::http_method::get};
    std::string path;                                   ///< Server path, e.g. /data/projects
    http::query_params params;
    std::string body;
    std::optional<std::filesystem::path> body_file;     ///< Streamed body, reopened per attempt
    std::string content_type;
    std::optional<std::filesystem::path> download_to;   ///< Stream 2xx body to this file
    http::header_list headers;
};

/**
 * @brief Session-bound HTTP client
 *
 * A session_client owns one transport and is intended for use by one
 * thread at a time (calls on one handle are serialized). Concurrent
 * workers call fork() to get their own handle bound to the same
 * session_state.
 */
class session_client {
public:
    /**
     * @brief Connect through libcurl
     */
    explicit session_client(core::client_config config,
                            std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Connect through a caller-supplied transport factory
     */
    session_client(core::client_config config,
                   http::transport_factory factory,
                   std::shared_ptr<di::ILogger> logger = nullptr);

    ~session_client();

    session_client(const session_client&) = delete;
    session_client& operator=(const session_client&) = delete;
    session_client(session_client&&) noexcept;
    session_client& operator=(session_client&&) noexcept;

    // =========================================================================
    // Session Lifecycle
    // =========================================================================

    /**
     * @brief POST /data/JSESSION with basic credentials and store the token
     *
     * Fails with authentication_failed on a non-2xx status, an HTML body,
     * an empty body, a transport error, or when no credentials are set.
     */
    [[nodiscard]] auto authenticate() -> VoidResult;

    /**
     * @brief Best-effort DELETE /data/JSESSION, then drop the token
     *
     * The token is cleared even if the server call fails.
     */
    void logout();

    /**
     * @brief Release this handle's transport; idempotent
     */
    void close();

    [[nodiscard]] bool is_closed() const noexcept;

    [[nodiscard]] bool is_authenticated() const;

    /**
     * @brief New handle with its own transport sharing this session's token
     */
    [[nodiscard]] auto fork() const -> session_client;

    // =========================================================================
    // Requests
    // =========================================================================

    [[nodiscard]] auto request(const request_options& options)
        -> Result<http::http_response>;

    [[nodiscard]] auto get(const std::string& path, http::query_params params = {})
        -> Result<http::http_response>;

    [[nodiscard]] auto post(const std::string& path, http::query_params params = {},
                            std::string body = {})
        -> Result<http::http_response>;

    [[nodiscard]] auto put(const std::string& path, http::query_params params = {},
                           std::string body = {})
        -> Result<http::http_response>;

    [[nodiscard]] auto del(const std::string& path, http::query_params params = {})
        -> Result<http::http_response>;

    /**
     * @brief GET with format=json and parse the body
     */
    [[nodiscard]] auto get_json(const std::string& path, http::query_params params = {})
        -> Result<nlohmann::json>;

    /**
     * @brief Lazy offset/limit listing over @p path (see pagination.hpp)
     */
    [[nodiscard]] auto paginate(const std::string& path,
                                std::size_t page_size = 100,
                                const std::string& result_key = "ResultSet.Result",
                                http::query_params params = {}) -> paged_listing;

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] auto config() const noexcept -> const core::client_config&;

    [[nodiscard]] auto state() const noexcept -> std::shared_ptr<session_state>;

    [[nodiscard]] auto logger() const noexcept -> std::shared_ptr<di::ILogger>;

    /**
     * @brief Replace the backoff sleeper (tests use a recording no-op)
     */
    void set_sleeper(sleeper fn);

private:
    struct impl;
    std::unique_ptr<impl> impl_;

    explicit session_client(std::unique_ptr<impl> state);
};

}  // namespace xnat::client
