/**
 * @file http_types_test.cpp
 * @brief Unit tests for URL encoding and header helpers
 */

#include <xnat/http/http_types.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace xnat::http;

TEST_CASE("url_encode keeps the unreserved set", "[http]") {
    CHECK(url_encode("XNAT_E00001") == "XNAT_E00001");
    CHECK(url_encode("a-b.c~d") == "a-b.c~d");
    CHECK(url_encode("MR Session/1") == "MR%20Session%2F1");
    CHECK(url_encode("a&b=c") == "a%26b%3Dc");
}

TEST_CASE("encode_query preserves order", "[http]") {
    const query_params params{{"format", "json"}, {"offset", "100"}, {"label", "T1 w"}};
    CHECK(encode_query(params) == "format=json&offset=100&label=T1%20w");
    CHECK(encode_query({}).empty());
}

TEST_CASE("http_request::full_url", "[http]") {
    http_request request;
    request.base_url = "https://xnat.example.org";
    request.path = "/data/projects";
    CHECK(request.full_url() == "https://xnat.example.org/data/projects");

    request.params = {{"format", "json"}};
    CHECK(request.full_url() == "https://xnat.example.org/data/projects?format=json");
}

TEST_CASE("header lookup is case-insensitive", "[http]") {
    http_response response;
    response.status = 200;
    response.headers = {
        {"Content-Type", "application/json"},
        {"Set-Cookie", "JSESSIONID=ABC; Path=/"},
        {"set-cookie", "OTHER=1"},
    };

    CHECK(response.is_success());
    CHECK(response.header("content-type") == std::optional<std::string>("application/json"));
    CHECK_FALSE(response.header("Location").has_value());
    CHECK(find_headers(response.headers, "SET-COOKIE") ==
          std::vector<std::string>{"JSESSIONID=ABC; Path=/", "OTHER=1"});
}

TEST_CASE("http_method names", "[http]") {
    CHECK(std::string(to_string(http_method::del)) == "DELETE");
    CHECK(std::string(to_string(http_method::post)) == "POST");
}
