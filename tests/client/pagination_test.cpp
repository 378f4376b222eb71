/**
 * @file pagination_test.cpp
 * @brief Unit tests for paged_listing
 */

#include "../mocks/mock_http_transport.hpp"

#include <xnat/client/pagination.hpp>
#include <xnat/client/session_client.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>

using namespace xnat;
using namespace xnat::client;
using namespace xnat::http;
using namespace xnat::http::testing;

namespace {

/**
 * @brief Serve @p total records at @p path honouring offset and limit
 */
void serve_listing(mock_server& server, const std::string& path, int total) {
    server.on(http_method::get, path, [total](const recorded_request& req) {
        const int offset = std::stoi(req.param("offset").value_or("0"));
        const int limit = std::stoi(req.param("limit").value_or("100"));
        auto records = nlohmann::json::array();
        for (int i = offset; i < total && i < offset + limit; ++i) {
            records.push_back({{"ID", "E" + std::to_string(i)}});
        }
        return mock_server::respond_records(records);
    });
}

}  // namespace

TEST_CASE("extract_records follows the dotted key", "[pagination]") {
    const auto envelope = nlohmann::json::parse(
        R"({"ResultSet": {"Result": [{"ID": "a"}, {"ID": "b"}], "totalRecords": "2"}})");

    CHECK(extract_records(envelope, "ResultSet.Result").size() == 2);
    CHECK(extract_records(envelope, "ResultSet.Missing").empty());
    CHECK(extract_records(envelope, "ResultSet.totalRecords").empty());
    CHECK(extract_records(nlohmann::json::array({1, 2, 3}), "").size() == 3);
}

TEST_CASE("paged_listing walks every page", "[pagination]") {
    auto server = std::make_shared<mock_server>();
    server->serve_login("TOKEN");
    session_client client(test_config(), server->factory());

    SECTION("250 records in pages of 100") {
        serve_listing(*server, "/data/experiments", 250);
        auto listing = client.paginate("/data/experiments");
        auto all = listing.collect_all();

        REQUIRE(all.is_ok());
        REQUIRE(all.value().size() == 250);
        CHECK(all.value().front()["ID"] == "E0");
        CHECK(all.value().back()["ID"] == "E249");
        CHECK(listing.pages_fetched() == 3);
        CHECK(listing.is_exhausted());

        auto pages = server->requests_to(http_method::get, "/data/experiments");
        REQUIRE(pages.size() == 3);
        CHECK(pages[1].param("offset") == std::optional<std::string>("100"));
        CHECK(pages[2].param("limit") == std::optional<std::string>("100"));
        CHECK(pages[0].param("format") == std::optional<std::string>("json"));
    }

    SECTION("An exact multiple needs one empty page") {
        serve_listing(*server, "/data/experiments", 200);
        auto listing = client.paginate("/data/experiments");
        auto all = listing.collect_all();

        REQUIRE(all.is_ok());
        CHECK(all.value().size() == 200);
        CHECK(listing.pages_fetched() == 3);
    }

    SECTION("Nothing is fetched until the first record is requested") {
        serve_listing(*server, "/data/experiments", 5);
        auto listing = client.paginate("/data/experiments", 2);
        CHECK(server->count(http_method::get, "/data/experiments") == 0);

        auto first = listing.next();
        REQUIRE(first.is_ok());
        REQUIRE(first.value().has_value());
        CHECK((*first.value())["ID"] == "E0");
        CHECK(listing.pages_fetched() == 1);
    }

    SECTION("Extra filters ride along on every page") {
        serve_listing(*server, "/data/experiments", 3);
        auto listing = client.paginate("/data/experiments", 100, "ResultSet.Result",
                                       {{"project", "P1"}});
        REQUIRE(listing.collect_all().is_ok());
        auto pages = server->requests_to(http_method::get, "/data/experiments");
        REQUIRE(pages.size() == 1);
        CHECK(pages[0].param("project") == std::optional<std::string>("P1"));
    }

    SECTION("Paging keys override caller-supplied ones") {
        serve_listing(*server, "/data/experiments", 3);
        auto listing = client.paginate("/data/experiments", 100, "ResultSet.Result",
                                       {{"format", "xml"}, {"limit", "7"}});
        REQUIRE(listing.collect_all().is_ok());
        auto pages = server->requests_to(http_method::get, "/data/experiments");
        REQUIRE(pages.size() == 1);
        auto named = [&](const std::string& key) {
            return std::count_if(pages[0].params.begin(), pages[0].params.end(),
                                 [&](const auto& param) { return param.first == key; });
        };
        CHECK(named("format") == 1);
        CHECK(named("limit") == 1);
        CHECK(pages[0].param("format") == std::optional<std::string>("json"));
        CHECK(pages[0].param("limit") == std::optional<std::string>("100"));
    }
}

TEST_CASE("paged_listing reports a failed page once", "[pagination]") {
    auto server = std::make_shared<mock_server>();
    server->serve_login("TOKEN");
    server->on(http_method::get, "/data/projects", [](const recorded_request& req) {
        if (req.param("offset") == std::optional<std::string>("0")) {
            auto records = nlohmann::json::array();
            for (int i = 0; i < 2; ++i) {
                records.push_back({{"ID", "P" + std::to_string(i)}});
            }
            return mock_server::respond_records(records);
        }
        return mock_server::respond(500, "boom");
    });

    session_client client(test_config(), server->factory());
    auto listing = client.paginate("/data/projects", 2);

    REQUIRE(listing.next().is_ok());
    REQUIRE(listing.next().is_ok());

    auto failed = listing.next();
    REQUIRE(failed.is_err());
    CHECK(failed.error().code == error_codes::request_failed);

    auto after = listing.next();
    REQUIRE(after.is_ok());
    CHECK_FALSE(after.value().has_value());
}
