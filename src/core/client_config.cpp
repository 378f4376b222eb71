/**
 * @file client_config.cpp
 * @brief Environment and JSON loading for client_config
 */

#include <xnat/core/client_config.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iterator>

using json = nlohmann::json;

namespace xnat::core {

namespace {

auto parse_unsigned(std::string_view text, std::string_view name)
    -> Result<std::size_t> {
    std::size_t value = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return xnat_error<std::size_t>(
            error_codes::invalid_configuration,
            std::string(name) + " must be a non-negative integer",
            std::string(text));
    }
    return ok(value);
}

}  // namespace

bool parse_bool_flag(std::string_view value) noexcept {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on";
}

// =============================================================================
// Validation
// =============================================================================

void client_config::normalize() {
    while (!base_url.empty() && base_url.back() == '/') {
        base_url.pop_back();
    }
}

auto client_config::validate() const -> VoidResult {
    if (base_url.empty()) {
        return xnat_void_error(error_codes::invalid_configuration,
                               "Server URL is required");
    }
    if (base_url.rfind("http://", 0) != 0 && base_url.rfind("https://", 0) != 0) {
        return xnat_void_error(error_codes::invalid_configuration,
                               "Server URL must start with http:// or https://",
                               base_url);
    }
    if (!has_credentials() && !token.has_value()) {
        return xnat_void_error(error_codes::invalid_configuration,
                               "Either username/password or a session token is required");
    }
    if (timeout.count() <= 0) {
        return xnat_void_error(error_codes::invalid_configuration,
                               "Timeout must be positive");
    }
    return ok();
}

// =============================================================================
// Environment
// =============================================================================

auto client_config::from_environment() -> Result<client_config> {
    return from_environment([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value != nullptr) {
            return std::string(value);
        }
        return std::nullopt;
    });
}

auto client_config::from_environment(const env_lookup& lookup)
    -> Result<client_config> {
    client_config config;

    if (auto value = lookup("XNAT_URL")) {
        config.base_url = *value;
    }
    if (auto value = lookup("XNAT_USER")) {
        config.username = *value;
    }
    if (auto value = lookup("XNAT_PASS")) {
        config.password = *value;
    }
    if (auto value = lookup("XNAT_TOKEN"); value && !value->empty()) {
        config.token = *value;
    }
    if (auto value = lookup("XNAT_VERIFY_SSL")) {
        config.verify_ssl = parse_bool_flag(*value);
    }
    if (auto value = lookup("XNAT_TIMEOUT")) {
        auto seconds = parse_unsigned(*value, "XNAT_TIMEOUT");
        if (seconds.is_err()) {
            return forward_error<client_config>(seconds.error());
        }
        config.timeout = std::chrono::seconds(static_cast<long long>(seconds.value()));
    }
    if (auto value = lookup("XNAT_MAX_RETRIES")) {
        auto retries = parse_unsigned(*value, "XNAT_MAX_RETRIES");
        if (retries.is_err()) {
            return forward_error<client_config>(retries.error());
        }
        config.max_retries = retries.value();
    }

    config.normalize();
    auto valid = config.validate();
    if (valid.is_err()) {
        return forward_error<client_config>(valid.error());
    }
    return ok(std::move(config));
}

// =============================================================================
// JSON
// =============================================================================

auto client_config::from_json_string(std::string_view text) -> Result<client_config> {
    client_config config;
    try {
        auto doc = json::parse(text);
        if (!doc.is_object()) {
            return xnat_error<client_config>(error_codes::invalid_configuration,
                                             "Configuration must be a JSON object");
        }

        if (doc.contains("url")) {
            config.base_url = doc["url"].get<std::string>();
        }
        if (doc.contains("username")) {
            config.username = doc["username"].get<std::string>();
        }
        if (doc.contains("password")) {
            config.password = doc["password"].get<std::string>();
        }
        if (doc.contains("token") && !doc["token"].is_null()) {
            config.token = doc["token"].get<std::string>();
        }
        if (doc.contains("verify_ssl")) {
            config.verify_ssl = doc["verify_ssl"].get<bool>();
        }
        if (doc.contains("timeout")) {
            auto seconds = doc["timeout"].get<long long>();
            if (seconds < 0) {
                return xnat_error<client_config>(error_codes::invalid_configuration,
                                                 "timeout must be non-negative");
            }
            config.timeout = std::chrono::seconds(seconds);
        }
        if (doc.contains("max_retries")) {
            auto retries = doc["max_retries"].get<long long>();
            if (retries < 0) {
                return xnat_error<client_config>(error_codes::invalid_configuration,
                                                 "max_retries must be non-negative");
            }
            config.max_retries = static_cast<std::size_t>(retries);
        }
    } catch (const json::exception& ex) {
        return xnat_error<client_config>(error_codes::invalid_configuration,
                                         "Failed to parse configuration",
                                         ex.what());
    }

    config.normalize();
    auto valid = config.validate();
    if (valid.is_err()) {
        return forward_error<client_config>(valid.error());
    }
    return ok(std::move(config));
}

auto client_config::from_json_file(const std::filesystem::path& path)
    -> Result<client_config> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return xnat_error<client_config>(error_codes::file_io_error,
                                         "Failed to open configuration file",
                                         path.string());
    }
    std::string text((std::istreambuf_iterator<char>(file)),
                     std::istreambuf_iterator<char>());
    return from_json_string(text);
}

}  // namespace xnat::core
