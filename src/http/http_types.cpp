/**
 * @file http_types.cpp
 * @brief URL encoding and header helpers
 */

#include <xnat/http/http_types.hpp>

#include <cctype>

namespace xnat::http {

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

auto url_encode(std::string_view value) -> std::string {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

auto encode_query(const query_params& params) -> std::string {
    std::string out;
    for (const auto& [name, value] : params) {
        if (!out.empty()) {
            out.push_back('&');
        }
        out += url_encode(name);
        out.push_back('=');
        out += url_encode(value);
    }
    return out;
}

auto find_header(const header_list& headers, std::string_view name)
    -> std::optional<std::string> {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

auto find_headers(const header_list& headers, std::string_view name)
    -> std::vector<std::string> {
    std::vector<std::string> values;
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            values.push_back(value);
        }
    }
    return values;
}

auto http_request::full_url() const -> std::string {
    std::string url = base_url + path;
    if (!params.empty()) {
        url.push_back(url.find('?') == std::string::npos ? '?' : '&');
        url += encode_query(params);
    }
    return url;
}

}  // namespace xnat::http
