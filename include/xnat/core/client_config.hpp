/**
 * @file client_config.hpp
 * @brief Connection parameters for an XNAT session
 *
 * A client_config is the fully-resolved parameter set a session_client is
 * built from. It can be filled in directly, from XNAT_* environment
 * variables, or from a flat JSON document.
 */

#pragma once

#include <xnat/core/result.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace xnat::core {

/**
 * @brief Environment lookup used by client_config::from_environment
 *
 * Returns std::nullopt when the variable is unset.
 */
using env_lookup = std::function<std::optional<std::string>(const std::string&)>;

/**
 * @brief Connection and retry parameters
 */
struct client_config {
    std::string base_url;                         ///< e.g. https://xnat.example.org
    std::optional<std::string> username;          ///< Basic-auth user
    std::optional<std::string> password;          ///< Basic-auth password
    std::optional<std::string> token;             ///< Pre-issued JSESSIONID
    bool verify_ssl{true};                        ///< Verify TLS peer and host
    std::chrono::seconds timeout{30};             ///< Per-request timeout
    std::size_t max_retries{3};                   ///< Additional attempts on transient errors
    std::chrono::milliseconds backoff_unit{1000}; ///< Backoff is unit * 2^attempt
    std::chrono::hours session_window{12};        ///< Token lifetime when the server does not say
    std::string user_agent{"xnat_transfer/1.0"};

    /**
     * @brief True if basic-auth credentials are present
     */
    [[nodiscard]] bool has_credentials() const noexcept {
        return username.has_value() && password.has_value();
    }

    /**
     * @brief Strip trailing slashes from base_url
     */
    void normalize();

    /**
     * @brief Check that the configuration can be used to open a session
     *
     * Fails with invalid_configuration when the URL is empty or not http(s)
     * or when neither credentials nor a token are present.
     */
    [[nodiscard]] auto validate() const -> VoidResult;

    /**
     * @brief Build from XNAT_URL, XNAT_USER, XNAT_PASS, XNAT_TOKEN,
     *        XNAT_VERIFY_SSL, XNAT_TIMEOUT and XNAT_MAX_RETRIES
     */
    [[nodiscard]] static auto from_environment() -> Result<client_config>;

    /**
     * @brief Same as from_environment() but reading through @p lookup
     */
    [[nodiscard]] static auto from_environment(const env_lookup& lookup)
        -> Result<client_config>;

    /**
     * @brief Parse a flat JSON object (url, username, password, token,
     *        verify_ssl, timeout, max_retries)
     */
    [[nodiscard]] static auto from_json_string(std::string_view text)
        -> Result<client_config>;

    /**
     * @brief Read and parse a JSON configuration file
     */
    [[nodiscard]] static auto from_json_file(const std::filesystem::path& path)
        -> Result<client_config>;
};

/**
 * @brief Interpret "true", "1" and "yes" (any case) as true
 */
[[nodiscard]] bool parse_bool_flag(std::string_view value) noexcept;

}  // namespace xnat::core
