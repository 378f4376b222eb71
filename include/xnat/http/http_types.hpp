/**
 * @file http_types.hpp
 * @brief Request and response values exchanged with an HTTP transport
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xnat::http {

// =============================================================================
// Method
// =============================================================================

enum class http_method {
    get,
    post,
    put,
    del
};

[[nodiscard]] constexpr const char* to_string(http_method method) noexcept {
    switch (method) {
        case http_method::get: return "GET";
        case http_method::post: return "POST";
        case http_method::put: return "PUT";
        case http_method::del: return "DELETE";
        default: return "GET";
    }
}

// =============================================================================
// Query Parameters & Headers
// =============================================================================

/// Ordered name/value pairs; order is preserved on the wire
using query_params = std::vector<std::pair<std::string, std::string>>;

/// Ordered header list; names compare case-insensitively
using header_list = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Percent-encode a query component (RFC 3986 unreserved set kept)
 */
[[nodiscard]] auto url_encode(std::string_view value) -> std::string;

/**
 * @brief Encode params as "a=1&b=2"
 */
[[nodiscard]] auto encode_query(const query_params& params) -> std::string;

/**
 * @brief Case-insensitive header lookup
 * @return First value for @p name, or std::nullopt
 */
[[nodiscard]] auto find_header(const header_list& headers, std::string_view name)
    -> std::optional<std::string>;

/**
 * @brief All values for @p name (Set-Cookie may repeat)
 */
[[nodiscard]] auto find_headers(const header_list& headers, std::string_view name)
    -> std::vector<std::string>;

// =============================================================================
// Request
// =============================================================================

struct basic_credentials {
    std::string username;
    std::string password;
};

/**
 * @brief One HTTP exchange as seen by a transport
 */
struct http_request {
    http_method method{http_method::get};
    std::string base_url;                              ///< Scheme and host, no trailing slash
    std::string path;                                  ///< Absolute path, e.g. /data/JSESSION
    query_params params;
    header_list headers;
    std::string body;                                  ///< In-memory body
    std::optional<std::filesystem::path> body_file;    ///< Streamed body, reopened per attempt
    std::optional<std::filesystem::path> download_to;  ///< Write a 2xx body here instead of memory
    std::optional<basic_credentials> credentials;
    std::string cookie;                                ///< Full Cookie header value
    std::chrono::seconds timeout{30};
    bool verify_ssl{true};
    std::string user_agent;

    /**
     * @brief base_url + path + encoded query
     */
    [[nodiscard]] auto full_url() const -> std::string;
};

// =============================================================================
// Response
// =============================================================================

struct http_response {
    int status{0};
    std::string body;           ///< Empty when the body went to download_to
    header_list headers;
    std::size_t bytes_received{0};

    [[nodiscard]] bool is_success() const noexcept {
        return status >= 200 && status < 300;
    }

    [[nodiscard]] auto header(std::string_view name) const -> std::optional<std::string> {
        return find_header(headers, name);
    }
};

}  // namespace xnat::http
