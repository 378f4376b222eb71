/**
 * @file mock_http_transport.hpp
 * @brief Scripted in-memory XNAT server for unit tests
 *
 * A mock_server maps (method, path) to handlers and records every request
 * it sees. Each transport created by factory() forwards to the same
 * server, so forked clients and their requests are all observable.
 *
 * @code
 * auto server = std::make_shared<mock_server>();
 * server->serve_login("TOKEN");
 * server->on(http_method::get, "/data/projects", [](const recorded_request&) {
 *     return mock_server::respond(200, R"({"ResultSet":{"Result":[]}})");
 * });
 * session_client client(test_config(), server->factory());
 * @endcode
 */

#pragma once

#include <xnat/core/client_config.hpp>
#include <xnat/http/http_transport.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace xnat::http::testing {

/**
 * @brief Request as observed by the mock server
 */
struct recorded_request {
    http_method method{http_method::get};
    std::string path;
    query_params params;
    header_list headers;
    std::string body;  ///< In-memory body, or the streamed file's content
    std::string cookie;
    bool has_credentials{false};

    [[nodiscard]] auto param(const std::string& name) const -> std::optional<std::string> {
        for (const auto& [key, value] : params) {
            if (key == name) {
                return value;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] auto header(const std::string& name) const -> std::optional<std::string> {
        return find_header(headers, name);
    }
};

using route_handler = std::function<Result<http_response>(const recorded_request&)>;

class mock_server : public std::enable_shared_from_this<mock_server> {
public:
    // =========================================================================
    // Scripting
    // =========================================================================

    void on(http_method method, const std::string& path, route_handler handler) {
        std::lock_guard lock(mutex_);
        routes_[{method, path}] = std::move(handler);
    }

    /**
     * @brief Answer POST /data/JSESSION with @p token and count logins
     */
    void serve_login(const std::string& token) {
        on(http_method::post, "/data/JSESSION", [this, token](const recorded_request& req) {
            if (!req.has_credentials) {
                return respond(401, "<html>Login required</html>");
            }
            ++logins_;
            return respond(200, token);
        });
    }

    [[nodiscard]] static auto respond(int status, std::string body = {},
                                      header_list headers = {}) -> Result<http_response> {
        http_response response;
        response.status = status;
        response.body = std::move(body);
        response.headers = std::move(headers);
        response.bytes_received = response.body.size();
        return ok(std::move(response));
    }

    [[nodiscard]] static auto respond_json(const nlohmann::json& body) -> Result<http_response> {
        return respond(200, body.dump(), {{"Content-Type", "application/json"}});
    }

    /**
     * @brief {"ResultSet": {"Result": records}}
     */
    [[nodiscard]] static auto respond_records(const nlohmann::json& records)
        -> Result<http_response> {
        return respond_json({{"ResultSet", {{"Result", records}}}});
    }

    [[nodiscard]] static auto fail(int code, const std::string& message)
        -> Result<http_response> {
        return Result<http_response>(error_info{code, message, "mock"});
    }

    // =========================================================================
    // Transport Side
    // =========================================================================

    auto handle(const http_request& request) -> Result<http_response> {
        recorded_request seen;
        seen.method = request.method;
        seen.path = request.path;
        seen.params = request.params;
        seen.headers = request.headers;
        seen.body = request.body;
        seen.cookie = request.cookie;
        seen.has_credentials = request.credentials.has_value();
        if (request.body_file) {
            std::ifstream in(*request.body_file, std::ios::binary);
            seen.body.assign(std::istreambuf_iterator<char>(in),
                             std::istreambuf_iterator<char>());
        }

        route_handler handler;
        {
            std::lock_guard lock(mutex_);
            requests_.push_back(seen);
            auto it = routes_.find({request.method, request.path});
            if (it != routes_.end()) {
                handler = it->second;
            }
        }

        // Handlers run unlocked so they may block on each other
        auto result = handler ? handler(seen) : respond(404, "Not found: " + request.path);
        if (result.is_ok() && request.download_to && result.value().is_success()) {
            std::ofstream out(*request.download_to, std::ios::binary | std::ios::trunc);
            out << result.value().body;
            result.value().body.clear();
        }
        return result;
    }

    [[nodiscard]] auto factory() -> transport_factory;

    // =========================================================================
    // Verification
    // =========================================================================

    [[nodiscard]] auto requests() const -> std::vector<recorded_request> {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    [[nodiscard]] auto requests_to(http_method method, const std::string& path) const
        -> std::vector<recorded_request> {
        std::lock_guard lock(mutex_);
        std::vector<recorded_request> matching;
        std::copy_if(requests_.begin(), requests_.end(), std::back_inserter(matching),
                     [&](const recorded_request& r) {
                         return r.method == method && r.path == path;
                     });
        return matching;
    }

    [[nodiscard]] auto count(http_method method, const std::string& path) const
        -> std::size_t {
        return requests_to(method, path).size();
    }

    [[nodiscard]] auto login_count() const noexcept -> std::size_t { return logins_.load(); }

    [[nodiscard]] auto transports_created() const noexcept -> std::size_t {
        return transports_.load();
    }

    [[nodiscard]] auto transports_closed() const noexcept -> std::size_t {
        return closed_.load();
    }

private:
    friend class mock_transport;

    mutable std::mutex mutex_;
    std::map<std::pair<http_method, std::string>, route_handler> routes_;
    std::vector<recorded_request> requests_;
    std::atomic<std::size_t> logins_{0};
    std::atomic<std::size_t> transports_{0};
    std::atomic<std::size_t> closed_{0};
};

/**
 * @brief http_transport forwarding to a shared mock_server
 */
class mock_transport final : public http_transport {
public:
    explicit mock_transport(std::shared_ptr<mock_server> server) : server_(std::move(server)) {
        ++server_->transports_;
    }

    auto perform(const http_request& request) -> Result<http_response> override {
        if (closed_) {
            return mock_server::fail(error_codes::transport_error, "transport closed");
        }
        return server_->handle(request);
    }

    void close() override {
        if (!closed_) {
            closed_ = true;
            ++server_->closed_;
        }
    }

private:
    std::shared_ptr<mock_server> server_;
    bool closed_{false};
};

inline auto mock_server::factory() -> transport_factory {
    auto self = shared_from_this();
    return [self]() -> std::unique_ptr<http_transport> {
        return std::make_unique<mock_transport>(self);
    };
}

/**
 * @brief Credentials-based config with zero backoff
 */
[[nodiscard]] inline auto test_config() -> core::client_config {
    core::client_config config;
    config.base_url = "https://xnat.test";
    config.username = "alice";
    config.password = "secret";
    config.max_retries = 3;
    config.backoff_unit = std::chrono::milliseconds{0};
    return config;
}

}  // namespace xnat::http::testing
