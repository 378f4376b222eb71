/**
 * @file http_transport.hpp
 * @brief Abstract single-exchange HTTP transport
 *
 * A transport performs exactly one blocking request; it knows nothing about
 * sessions or retries. Instances are not shared between threads: every
 * worker gets its own from a transport_factory.
 */

#pragma once

#include <xnat/core/result.hpp>
#include <xnat/http/http_types.hpp>

#include <functional>
#include <memory>

namespace xnat::http {

/**
 * @brief Blocking HTTP client interface
 *
 * Error contract for perform():
 * - connection_failed: DNS, connect, send/receive reset
 * - connection_timeout: connect or stall timeout
 * - file_io_error: body_file could not be read or download_to written
 * - transport_error: anything else (TLS, malformed URL)
 *
 * Any HTTP status, including 4xx/5xx, is a successful exchange.
 */
class http_transport {
public:
    virtual ~http_transport() = default;

    [[nodiscard]] virtual auto perform(const http_request& request)
        -> Result<http_response> = 0;

    /**
     * @brief Release connections; perform() must not be called afterwards
     */
    virtual void close() = 0;

protected:
    http_transport() = default;
    http_transport(const http_transport&) = delete;
    http_transport& operator=(const http_transport&) = delete;
};

/// Produces a fresh, independent transport
using transport_factory = std::function<std::unique_ptr<http_transport>()>;

}  // namespace xnat::http
