/**
 * @file session_client.cpp
 * @brief Implementation of the authenticated retrying session client
 */

#include <xnat/client/session_client.hpp>
#include <xnat/client/pagination.hpp>
#include <xnat/http/curl_transport.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <mutex>

namespace xnat::client {

namespace {

constexpr const char* session_path = "/data/JSESSION";
constexpr std::size_t error_snippet_length = 200;

auto trim(std::string_view text) -> std::string {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(begin, end - begin + 1));
}

auto to_lower(std::string_view text) -> std::string {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

auto snippet(const std::string& body) -> std::string {
    return body.size() > error_snippet_length ? body.substr(0, error_snippet_length) : body;
}

/**
 * @brief Max-Age of the JSESSIONID cookie, if the server advertised one
 */
auto session_max_age(const http::http_response& response)
    -> std::optional<std::chrono::seconds> {
    for (const auto& cookie : http::find_headers(response.headers, "Set-Cookie")) {
        if (cookie.rfind("JSESSIONID=", 0) != 0) {
            continue;
        }
        auto lowered = to_lower(cookie);
        auto pos = lowered.find("max-age=");
        if (pos == std::string::npos) {
            continue;
        }
        const char* first = cookie.data() + pos + 8;
        const char* last = cookie.data() + cookie.size();
        long long seconds = 0;
        auto [ptr, ec] = std::from_chars(first, last, seconds);
        if (ec == std::errc{} && ptr != first && seconds > 0) {
            return std::chrono::seconds(seconds);
        }
    }
    return std::nullopt;
}

auto describe_failure(const Result<http::http_response>& result) -> std::string {
    if (result.is_err()) {
        return result.error().message;
    }
    return "HTTP " + std::to_string(result.value().status);
}

}  // namespace

// =============================================================================
// Implementation
// =============================================================================

struct session_client::impl {
    core::client_config config;
    http::transport_factory factory;
    std::unique_ptr<http::http_transport> transport;
    std::shared_ptr<session_state> state;
    std::shared_ptr<di::ILogger> logger;
    retry_policy policy;
    sleeper sleep{thread_sleeper()};
    std::mutex request_mutex;
    std::atomic<bool> closed{false};

    auto base_request(http::http_method method, const std::string& path) const
        -> http::http_request {
        http::http_request req;
        req.method = method;
        if (path.rfind("http://", 0) == 0 || path.rfind("https://", 0) == 0) {
            req.path = path;
        } else {
            req.base_url = config.base_url;
            req.path = path;
        }
        req.timeout = config.timeout;
        req.verify_ssl = config.verify_ssl;
        req.user_agent = config.user_agent;
        return req;
    }

    /**
     * @brief One POST /data/JSESSION exchange; caller holds request_mutex
     */
    auto login() -> Result<token_grant> {
        if (!config.has_credentials()) {
            return xnat_error<token_grant>(error_codes::authentication_failed,
                                           "No credentials configured");
        }
        if (!transport) {
            return xnat_error<token_grant>(error_codes::session_closed,
                                           "Session client is closed");
        }

        auto req = base_request(http::http_method::post, session_path);
        req.credentials = http::basic_credentials{*config.username, *config.password};

        auto result = transport->perform(req);
        if (result.is_err()) {
            return xnat_error<token_grant>(error_codes::authentication_failed,
                                           "Authentication request failed",
                                           result.error().message);
        }

        const auto& response = result.value();
        if (!response.is_success()) {
            return xnat_error<token_grant>(
                error_codes::authentication_failed,
                compat::format("Authentication failed (HTTP {})", response.status),
                snippet(response.body));
        }
        if (to_lower(response.body).find("<html") != std::string::npos) {
            return xnat_error<token_grant>(error_codes::authentication_failed,
                                           "Authentication failed: server returned an HTML page",
                                           snippet(response.body));
        }

        auto token = trim(response.body);
        if (token.empty()) {
            return xnat_error<token_grant>(error_codes::authentication_failed,
                                           "Authentication failed: empty session token");
        }

        const auto window = session_max_age(response).value_or(
            std::chrono::duration_cast<std::chrono::seconds>(config.session_window));
        logger->info_fmt("Authenticated as {} against {}", *config.username, config.base_url);
        return ok(token_grant{std::move(token), std::chrono::system_clock::now() + window});
    }

    auto refresh(std::uint64_t observed_generation) -> Result<token_snapshot> {
        return state->refresh(observed_generation, [this] { return login(); });
    }

    auto ensure_token() -> Result<token_snapshot> {
        auto snap = state->snapshot();
        const bool missing = !snap.token.has_value();
        const bool expired = snap.is_expired(std::chrono::system_clock::now());
        if ((!missing && !expired) || !config.has_credentials()) {
            return ok(std::move(snap));
        }
        if (expired) {
            logger->info("Session token expired; re-authenticating");
        }
        return refresh(snap.generation);
    }

    auto build(const request_options& options, const token_snapshot& snap) const
        -> http::http_request {
        auto req = base_request(options.method, options.path);
        req.params = options.params;
        req.headers = options.headers;
        if (!options.content_type.empty()) {
            req.headers.emplace_back("Content-Type", options.content_type);
        }
        req.body = options.body;
        req.body_file = options.body_file;
        req.download_to = options.download_to;
        if (snap.token) {
            req.cookie = "JSESSIONID=" + *snap.token;
        }
        return req;
    }

    auto execute(const request_options& options) -> Result<http::http_response> {
        std::lock_guard lock(request_mutex);

        const char* method = http::to_string(options.method);
        std::size_t attempts = 0;
        std::size_t transient_retries = 0;
        bool reauthenticated = false;

        while (true) {
            if (closed.load() || !transport) {
                return xnat_error<http::http_response>(error_codes::session_closed,
                                                       "Session client is closed");
            }

            auto snap = ensure_token();
            if (snap.is_err()) {
                return forward_error<http::http_response>(snap.error());
            }

            auto result = transport->perform(build(options, snap.value()));
            ++attempts;

            switch (policy.classify(result)) {
                case attempt_outcome::success:
                    return result;

                case attempt_outcome::unauthorized: {
                    const int status = result.value().status;
                    if (reauthenticated || !config.has_credentials()) {
                        state->clear();
                        return xnat_error<http::http_response>(
                            error_codes::authentication_failed,
                            compat::format("{} {} rejected with HTTP {}", method,
                                           options.path, status),
                            snippet(result.value().body));
                    }
                    logger->info_fmt("{} {} returned HTTP {}; re-authenticating",
                                     method, options.path, status);
                    auto refreshed = refresh(snap.value().generation);
                    if (refreshed.is_err()) {
                        return forward_error<http::http_response>(refreshed.error());
                    }
                    reauthenticated = true;
                    continue;
                }

                case attempt_outcome::transient: {
                    auto cause = describe_failure(result);
                    if (transient_retries >= policy.max_retries) {
                        logger->error_fmt("{} {} failed after {} attempts: {}",
                                          method, options.path, attempts, cause);
                        return xnat_error<http::http_response>(
                            error_codes::retry_exhausted,
                            compat::format("{} {} failed after {} attempts", method,
                                           options.path, attempts),
                            cause);
                    }
                    ++transient_retries;
                    auto delay = policy.backoff_for(transient_retries);
                    logger->warn_fmt("{} {} attempt {} failed ({}); retrying in {} ms",
                                     method, options.path, attempts, cause, delay.count());
                    sleep(delay);
                    continue;
                }

                case attempt_outcome::fatal:
                default: {
                    if (result.is_err()) {
                        return result;
                    }
                    const auto& response = result.value();
                    return xnat_error<http::http_response>(
                        error_codes::request_failed,
                        compat::format("HTTP {}: {} {}", response.status, method,
                                       options.path),
                        response.body);
                }
            }
        }
    }
};

// =============================================================================
// Construction
// =============================================================================

session_client::session_client(core::client_config config,
                               std::shared_ptr<di::ILogger> logger)
    : session_client(std::move(config), http::curl_transport::factory(), std::move(logger)) {}

session_client::session_client(core::client_config config,
                               http::transport_factory factory,
                               std::shared_ptr<di::ILogger> logger)
    : impl_(std::make_unique<impl>()) {
    config.normalize();
    impl_->config = std::move(config);
    impl_->factory = std::move(factory);
    impl_->transport = impl_->factory();
    impl_->state = std::make_shared<session_state>();
    impl_->logger = logger ? std::move(logger) : di::null_logger();
    impl_->policy.max_retries = impl_->config.max_retries;
    impl_->policy.backoff_unit = impl_->config.backoff_unit;

    if (impl_->config.token) {
        impl_->state->install(token_grant{
            *impl_->config.token,
            std::chrono::system_clock::now() + impl_->config.session_window});
    }
}

session_client::session_client(std::unique_ptr<impl> state) : impl_(std::move(state)) {}

session_client::~session_client() = default;
session_client::session_client(session_client&&) noexcept = default;
session_client& session_client::operator=(session_client&&) noexcept = default;

auto session_client::fork() const -> session_client {
    auto forked = std::make_unique<impl>();
    forked->config = impl_->config;
    forked->factory = impl_->factory;
    forked->transport = forked->factory();
    forked->state = impl_->state;
    forked->logger = impl_->logger;
    forked->policy = impl_->policy;
    forked->sleep = impl_->sleep;
    return session_client(std::move(forked));
}

// =============================================================================
// Session Lifecycle
// =============================================================================

auto session_client::authenticate() -> VoidResult {
    std::lock_guard lock(impl_->request_mutex);
    if (impl_->closed.load()) {
        return xnat_void_error(error_codes::session_closed, "Session client is closed");
    }
    auto refreshed = impl_->refresh(impl_->state->snapshot().generation);
    if (refreshed.is_err()) {
        return VoidResult(refreshed.error());
    }
    return ok();
}

void session_client::logout() {
    std::lock_guard lock(impl_->request_mutex);
    auto snap = impl_->state->snapshot();
    if (snap.token && impl_->transport && !impl_->closed.load()) {
        auto req = impl_->base_request(http::http_method::del, session_path);
        req.cookie = "JSESSIONID=" + *snap.token;
        auto result = impl_->transport->perform(req);
        if (result.is_err()) {
            impl_->logger->debug_fmt("Logout request failed: {}", result.error().message);
        }
    }
    impl_->state->clear();
}

void session_client::close() {
    if (impl_->closed.exchange(true)) {
        return;
    }
    std::lock_guard lock(impl_->request_mutex);
    if (impl_->transport) {
        impl_->transport->close();
        impl_->transport.reset();
    }
}

bool session_client::is_closed() const noexcept {
    return impl_->closed.load();
}

bool session_client::is_authenticated() const {
    auto snap = impl_->state->snapshot();
    return snap.token.has_value() && !snap.is_expired(std::chrono::system_clock::now());
}

// =============================================================================
// Requests
// =============================================================================

auto session_client::request(const request_options& options)
    -> Result<http::http_response> {
    return impl_->execute(options);
}

auto session_client::get(const std::string& path, http::query_params params)
    -> Result<http::http_response> {
    request_options options;
    options.method = http::http_method::get;
    options.path = path;
    options.params = std::move(params);
    return impl_->execute(options);
}

auto session_client::post(const std::string& path, http::query_params params,
                          std::string body) -> Result<http::http_response> {
    request_options options;
    options.method = http::http_method::post;
    options.path = path;
    options.params = std::move(params);
    options.body = std::move(body);
    return impl_->execute(options);
}

auto session_client::put(const std::string& path, http::query_params params,
                         std::string body) -> Result<http::http_response> {
    request_options options;
    options.method = http::http_method::put;
    options.path = path;
    options.params = std::move(params);
    options.body = std::move(body);
    return impl_->execute(options);
}

auto session_client::del(const std::string& path, http::query_params params)
    -> Result<http::http_response> {
    request_options options;
    options.method = http::http_method::del;
    options.path = path;
    options.params = std::move(params);
    return impl_->execute(options);
}

auto session_client::get_json(const std::string& path, http::query_params params)
    -> Result<nlohmann::json> {
    const bool has_format = std::any_of(params.begin(), params.end(),
                                        [](const auto& p) { return p.first == "format"; });
    if (!has_format) {
        params.emplace_back("format", "json");
    }

    auto response = get(path, std::move(params));
    if (response.is_err()) {
        return forward_error<nlohmann::json>(response.error());
    }

    auto parsed = nlohmann::json::parse(response.value().body, nullptr, false);
    if (parsed.is_discarded()) {
        return xnat_error<nlohmann::json>(error_codes::request_failed,
                                          "Malformed JSON response from " + path,
                                          snippet(response.value().body));
    }
    return ok(std::move(parsed));
}

auto session_client::paginate(const std::string& path, std::size_t page_size,
                              const std::string& result_key,
                              http::query_params params) -> paged_listing {
    pagination_options options;
    options.page_size = page_size;
    options.result_key = result_key;
    options.params = std::move(params);
    return paged_listing(*this, path, std::move(options));
}

// =============================================================================
// Accessors
// =============================================================================

auto session_client::config() const noexcept -> const core::client_config& {
    return impl_->config;
}

auto session_client::state() const noexcept -> std::shared_ptr<session_state> {
    return impl_->state;
}

auto session_client::logger() const noexcept -> std::shared_ptr<di::ILogger> {
    return impl_->logger;
}

void session_client::set_sleeper(sleeper fn) {
    std::lock_guard lock(impl_->request_mutex);
    impl_->sleep = fn ? std::move(fn) : thread_sleeper();
}

}  // namespace xnat::client
