/**
 * @file curl_transport.hpp
 * @brief libcurl implementation of http_transport
 */

#pragma once

#include <xnat/http/http_transport.hpp>

#include <memory>

namespace xnat::http {

/**
 * @brief http_transport backed by one CURL easy handle
 *
 * The handle is reused across perform() calls so keep-alive connections
 * survive between requests of the same worker. Request bodies are streamed
 * from body_file and 2xx response bodies are streamed to download_to, so
 * multi-gigabyte archives never sit in memory.
 *
 * The request timeout bounds connection setup and stalls (no bytes for
 * the timeout period), not the total transfer time.
 */
class curl_transport final : public http_transport {
public:
    curl_transport();
    ~curl_transport() override;

    curl_transport(curl_transport&&) = delete;
    curl_transport& operator=(curl_transport&&) = delete;

    [[nodiscard]] auto perform(const http_request& request)
        -> Result<http_response> override;

    void close() override;

    /**
     * @brief Factory producing curl transports
     */
    [[nodiscard]] static auto factory() -> transport_factory;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace xnat::http
