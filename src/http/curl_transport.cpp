/**
 * @file curl_transport.cpp
 * @brief libcurl implementation of http_transport
 */

#include <xnat/http/curl_transport.hpp>

#include <curl/curl.h>

#include <fstream>
#include <mutex>
#include <string>
#include <system_error>

namespace xnat::http {

namespace {

std::once_flag g_curl_init;

void ensure_global_init() {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

struct slist_deleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};
using slist_ptr = std::unique_ptr<curl_slist, slist_deleter>;

/// Per-exchange state handed to the libcurl callbacks
struct exchange_state {
    CURL* handle{nullptr};
    http_response* response{nullptr};
    std::ofstream* download{nullptr};
    bool download_failed{false};
    std::size_t bytes{0};
};

auto write_body(char* ptr, std::size_t size, std::size_t nmemb, void* userdata)
    -> std::size_t {
    auto* state = static_cast<exchange_state*>(userdata);
    const auto total = size * nmemb;
    state->bytes += total;

    long code = 0;
    curl_easy_getinfo(state->handle, CURLINFO_RESPONSE_CODE, &code);

    // Error bodies always land in memory so callers can report them.
    if (state->download != nullptr && code >= 200 && code < 300) {
        state->download->write(ptr, static_cast<std::streamsize>(total));
        if (!*state->download) {
            state->download_failed = true;
            return 0;
        }
    } else {
        state->response->body.append(ptr, total);
    }
    return total;
}

auto read_header(char* buffer, std::size_t size, std::size_t nitems, void* userdata)
    -> std::size_t {
    auto* state = static_cast<exchange_state*>(userdata);
    const auto total = size * nitems;
    std::string_view line(buffer, total);

    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    if (line.rfind("HTTP/", 0) == 0) {
        // New status line: interim (100) or redirected response
        state->response->headers.clear();
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return total;
    }

    auto name = line.substr(0, colon);
    auto value = line.substr(colon + 1);
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    state->response->headers.emplace_back(std::string(name), std::string(value));
    return total;
}

auto read_body(char* buffer, std::size_t size, std::size_t nitems, void* userdata)
    -> std::size_t {
    auto* in = static_cast<std::ifstream*>(userdata);
    in->read(buffer, static_cast<std::streamsize>(size * nitems));
    if (in->bad()) {
        return CURL_READFUNC_ABORT;
    }
    return static_cast<std::size_t>(in->gcount());
}

auto map_curl_error(CURLcode code, const std::string& url) -> Result<http_response> {
    const std::string message = curl_easy_strerror(code);
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return xnat_error<http_response>(error_codes::connection_failed, message, url);
        case CURLE_OPERATION_TIMEDOUT:
            return xnat_error<http_response>(error_codes::connection_timeout, message, url);
        case CURLE_READ_ERROR:
        case CURLE_WRITE_ERROR:
        case CURLE_ABORTED_BY_CALLBACK:
            return xnat_error<http_response>(error_codes::file_io_error, message, url);
        default:
            return xnat_error<http_response>(error_codes::transport_error, message, url);
    }
}

}  // namespace

// =============================================================================
// Implementation
// =============================================================================

struct curl_transport::impl {
    CURL* handle{nullptr};

    impl() {
        ensure_global_init();
        handle = curl_easy_init();
    }

    ~impl() { release(); }

    void release() {
        if (handle != nullptr) {
            curl_easy_cleanup(handle);
            handle = nullptr;
        }
    }
};

curl_transport::curl_transport() : impl_(std::make_unique<impl>()) {}

curl_transport::~curl_transport() = default;

void curl_transport::close() { impl_->release(); }

auto curl_transport::factory() -> transport_factory {
    return []() -> std::unique_ptr<http_transport> {
        return std::make_unique<curl_transport>();
    };
}

auto curl_transport::perform(const http_request& request) -> Result<http_response> {
    CURL* handle = impl_->handle;
    if (handle == nullptr) {
        return xnat_error<http_response>(error_codes::transport_error,
                                         "Transport is closed or failed to initialize");
    }
    curl_easy_reset(handle);

    const auto url = request.full_url();
    http_response response;
    exchange_state state;
    state.handle = handle;
    state.response = &response;

    std::ofstream download;
    if (request.download_to) {
        download.open(*request.download_to, std::ios::binary | std::ios::trunc);
        if (!download) {
            return xnat_error<http_response>(error_codes::file_io_error,
                                             "Cannot open download target",
                                             request.download_to->string());
        }
        state.download = &download;
    }

    std::ifstream upload;
    curl_off_t upload_size = 0;
    if (request.body_file) {
        std::error_code ec;
        auto size = std::filesystem::file_size(*request.body_file, ec);
        upload.open(*request.body_file, std::ios::binary);
        if (ec || !upload) {
            return xnat_error<http_response>(error_codes::file_io_error,
                                             "Cannot open request body",
                                             request.body_file->string());
        }
        upload_size = static_cast<curl_off_t>(size);
    }

    const long timeout = static_cast<long>(request.timeout.count());

    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, timeout);
    curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, timeout);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, request.verify_ssl ? 1L : 0L);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, request.verify_ssl ? 2L : 0L);
    if (!request.user_agent.empty()) {
        curl_easy_setopt(handle, CURLOPT_USERAGENT, request.user_agent.c_str());
    }

    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, read_header);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &state);

    if (request.credentials) {
        curl_easy_setopt(handle, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(handle, CURLOPT_USERNAME, request.credentials->username.c_str());
        curl_easy_setopt(handle, CURLOPT_PASSWORD, request.credentials->password.c_str());
    }
    if (!request.cookie.empty()) {
        curl_easy_setopt(handle, CURLOPT_COOKIE, request.cookie.c_str());
    }

    slist_ptr headers;
    for (const auto& [name, value] : request.headers) {
        auto line = name + ": " + value;
        auto* appended = curl_slist_append(headers.get(), line.c_str());
        if (appended == nullptr) {
            return xnat_error<http_response>(error_codes::transport_error,
                                             "Out of memory building headers");
        }
        (void)headers.release();
        headers.reset(appended);
    }
    if (headers) {
        curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
    }

    switch (request.method) {
        case http_method::get:
            curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
            break;
        case http_method::post:
            curl_easy_setopt(handle, CURLOPT_POST, 1L);
            if (request.body_file) {
                curl_easy_setopt(handle, CURLOPT_READFUNCTION, read_body);
                curl_easy_setopt(handle, CURLOPT_READDATA, &upload);
                curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, upload_size);
            } else {
                curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
                curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.data());
            }
            break;
        case http_method::put:
            if (request.body_file) {
                curl_easy_setopt(handle, CURLOPT_UPLOAD, 1L);
                curl_easy_setopt(handle, CURLOPT_READFUNCTION, read_body);
                curl_easy_setopt(handle, CURLOPT_READDATA, &upload);
                curl_easy_setopt(handle, CURLOPT_INFILESIZE_LARGE, upload_size);
            } else {
                curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, "PUT");
                curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
                curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.data());
            }
            break;
        case http_method::del:
            curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, "DELETE");
            if (!request.body.empty()) {
                curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
                curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.data());
            }
            break;
    }

    const CURLcode rc = curl_easy_perform(handle);

    if (state.download_failed) {
        return xnat_error<http_response>(error_codes::file_io_error,
                                         "Failed writing download target",
                                         request.download_to->string());
    }
    if (rc != CURLE_OK) {
        return map_curl_error(rc, url);
    }

    long status = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<int>(status);
    response.bytes_received = state.bytes;

    if (download.is_open()) {
        download.close();
    }
    return ok(std::move(response));
}

}  // namespace xnat::http
