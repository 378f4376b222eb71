/**
 * @file gradual_upload_coordinator_test.cpp
 * @brief Unit tests for the per-file gradual-DICOM uploader
 */

#include "../mocks/mock_http_transport.hpp"
#include "../mocks/mock_thread_pool.hpp"

#include <xnat/transfer/archive_builder.hpp>
#include <xnat/transfer/file_collector.hpp>
#include <xnat/transfer/gradual_upload_coordinator.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace xnat;
using namespace xnat::transfer;
using namespace xnat::http;
using namespace xnat::http::testing;
using xnat::integration::testing::mock_thread_pool;
namespace fs = std::filesystem;

namespace {

constexpr const char* import_path = "/data/services/import";

auto make_files(const fs::path& root, int count) -> std::vector<fs::path> {
    std::vector<fs::path> files;
    for (int i = 1; i <= count; ++i) {
        const std::string id = (i < 10 ? "0" : "") + std::to_string(i);
        const auto path = root / "series" / ("f" + id + ".dcm");
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << "file-" << id;
        files.push_back(path);
    }
    return files;
}

auto gradual_options(std::size_t workers) -> gradual_upload_options {
    gradual_upload_options options;
    options.destination = {"PROJ", "SUBJ", "SESS"};
    options.workers = workers;
    options.warmup_files = 2;
    return options;
}

}  // namespace

TEST_CASE("gradual import_params", "[gradual_upload][params]") {
    const auto params = gradual_upload_coordinator::import_params({"P", "S", "E"});
    const http::query_params expected{
        {"inbody", "true"},
        {"import-handler", "gradual-DICOM"},
        {"PROJECT_ID", "P"},
        {"SUBJECT_ID", "S"},
        {"EXPT_LABEL", "E"},
    };
    CHECK(params == expected);
}

TEST_CASE("gradual_upload_coordinator uploads file by file", "[gradual_upload]") {
    auto dir = scoped_temp_directory::create("xnat_gradual_src_");
    REQUIRE(dir.is_ok());
    const auto root = dir.value()->path();
    auto files = make_files(root, 10);

    auto server = std::make_shared<mock_server>();
    server->serve_login("TOKEN");

    auto config = test_config();
    config.max_retries = 1;
    client::session_client client(config, server->factory());
    auto pool = std::make_shared<mock_thread_pool>(mock_thread_pool::execution_mode::threaded);
    gradual_upload_coordinator coordinator(client, pool);

    SECTION("A file failing in the parallel pass succeeds in the retry pass") {
        std::atomic<int> seventh_attempts{0};
        server->on(http_method::post, import_path, [&](const recorded_request& req) {
            if (req.body == "file-07" && seventh_attempts++ < 2) {
                return mock_server::respond(503, "busy");
            }
            return mock_server::respond(200, "ok");
        });

        auto summary = coordinator.upload(root, gradual_options(2));
        REQUIRE(summary.is_ok());
        CHECK(summary.value().total == 10);
        CHECK(summary.value().succeeded == 10);
        CHECK(summary.value().failed == 0);
        CHECK(seventh_attempts == 3);
        CHECK(server->count(http_method::post, import_path) == 12);

        auto uploads = server->requests_to(http_method::post, import_path);
        CHECK(uploads[0].param("import-handler") == std::optional<std::string>("gradual-DICOM"));
        CHECK(uploads[0].param("EXPT_LABEL") == std::optional<std::string>("SESS"));
        CHECK(uploads[0].header("Content-Type") ==
              std::optional<std::string>("application/dicom"));
        // Warm-up goes first, in order
        CHECK(uploads[0].body == "file-01");
        CHECK(uploads[1].body == "file-02");
    }

    SECTION("Persistent failures are reported with the relative path") {
        server->on(http_method::post, import_path, [](const recorded_request& req) {
            if (req.body == "file-03") {
                return mock_server::respond(400, "Bad\nrequest   ");
            }
            return mock_server::respond(200, "ok");
        });

        auto options = gradual_options(3);
        options.retry_failed = false;
        auto summary = coordinator.upload_files(files, root, options);
        REQUIRE(summary.is_ok());
        CHECK(summary.value().succeeded == 9);
        REQUIRE(summary.value().errors.size() == 1);
        CHECK(summary.value().errors[0].message == "series/f03.dcm: HTTP 400: Bad request");
        CHECK(summary.value().errors[0].code == error_codes::request_failed);
    }

    SECTION("Succeeded ids resume an interrupted run") {
        server->on(http_method::post, import_path, [](const recorded_request&) {
            return mock_server::respond(200, "ok");
        });

        auto options = gradual_options(2);
        for (int i = 0; i < 3; ++i) {
            options.already_done.insert(canonical_key(files[i]));
        }

        auto summary = coordinator.upload_files(files, root, options);
        REQUIRE(summary.is_ok());
        CHECK(summary.value().total == 7);
        CHECK(summary.value().skipped == 3);
        CHECK(summary.value().succeeded == 7);
        CHECK(server->count(http_method::post, import_path) == 7);
        CHECK(std::find(summary.value().succeeded_ids.begin(),
                        summary.value().succeeded_ids.end(),
                        canonical_key(files[9])) != summary.value().succeeded_ids.end());
    }

    SECTION("Nothing left to upload skips authentication") {
        auto options = gradual_options(2);
        for (const auto& file : files) {
            options.already_done.insert(canonical_key(file));
        }
        auto summary = coordinator.upload_files(files, root, options);
        REQUIRE(summary.is_ok());
        CHECK(summary.value().total == 0);
        CHECK(summary.value().skipped == 10);
        CHECK(server->requests().empty());
    }

    SECTION("Duplicate sources are rejected before any transfer") {
        auto doubled = files;
        doubled.push_back(root / "series" / ".." / "series" / "f04.dcm");
        auto result = coordinator.upload_files(doubled, root, gradual_options(2));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::validation_failed);
        CHECK(server->requests().empty());
    }

    SECTION("Progress is throttled to the interval") {
        server->on(http_method::post, import_path, [](const recorded_request&) {
            return mock_server::respond(200, "ok");
        });

        std::vector<progress_event> events;
        auto options = gradual_options(2);
        options.progress_interval = 5;
        options.on_progress = [&](const progress_event& event) { events.push_back(event); };

        REQUIRE(coordinator.upload_files(files, root, options).is_ok());
        auto transferring = std::count_if(events.begin(), events.end(), [](const auto& e) {
            return e.phase == transfer_phase::transferring;
        });
        CHECK(transferring == 2);
        CHECK(events.back().phase == transfer_phase::complete);
    }

    SECTION("Cancellation leaves remaining files cancelled") {
        auto options = gradual_options(2);
        server->on(http_method::post, import_path, [&](const recorded_request&) {
            options.cancel.cancel();
            return mock_server::respond(200, "ok");
        });

        auto summary = coordinator.upload_files(files, root, options);
        REQUIRE(summary.is_ok());
        CHECK(summary.value().succeeded == 1);
        CHECK(summary.value().failed == 9);
        CHECK(summary.value().errors[0].code == error_codes::operation_cancelled);
        CHECK(server->count(http_method::post, import_path) == 1);
    }
}

TEST_CASE("gradual_upload_coordinator sources", "[gradual_upload][source]") {
    auto dir = scoped_temp_directory::create("xnat_gradual_zip_");
    REQUIRE(dir.is_ok());
    const auto root = dir.value()->path();
    auto files = make_files(root / "in", 4);

    auto server = std::make_shared<mock_server>();
    server->serve_login("TOKEN");
    server->on(http_method::post, import_path, [](const recorded_request&) {
        return mock_server::respond(200, "ok");
    });
    client::session_client client(test_config(), server->factory());
    auto pool = std::make_shared<mock_thread_pool>();
    gradual_upload_coordinator coordinator(client, pool);

    SECTION("A ZIP archive is extracted and uploaded") {
        const auto archive = root / "session.ZIP";
        REQUIRE(build_archive(files, root / "in", archive, archive_format::zip).is_ok());

        auto summary = coordinator.upload(archive, gradual_options(2));
        REQUIRE(summary.is_ok());
        CHECK(summary.value().succeeded == 4);

        std::vector<std::string> bodies;
        for (const auto& req : server->requests_to(http_method::post, import_path)) {
            bodies.push_back(req.body);
        }
        std::sort(bodies.begin(), bodies.end());
        CHECK(bodies == std::vector<std::string>{"file-01", "file-02", "file-03", "file-04"});
    }

    SECTION("A ZIP upload resumes from the ids of a previous run") {
        const auto archive = root / "session.zip";
        REQUIRE(build_archive(files, root / "in", archive, archive_format::zip).is_ok());

        auto first = coordinator.upload(archive, gradual_options(2));
        REQUIRE(first.is_ok());
        REQUIRE(first.value().succeeded_ids.size() == 4);
        CHECK(std::find(first.value().succeeded_ids.begin(), first.value().succeeded_ids.end(),
                        canonical_key(archive) + "!series/f02.dcm") !=
              first.value().succeeded_ids.end());
        const auto uploads_before = server->count(http_method::post, import_path);

        auto options = gradual_options(2);
        options.already_done.insert(first.value().succeeded_ids.begin(),
                                    first.value().succeeded_ids.end());
        auto second = coordinator.upload(archive, options);
        REQUIRE(second.is_ok());
        CHECK(second.value().total == 0);
        CHECK(second.value().skipped == 4);
        CHECK(server->count(http_method::post, import_path) == uploads_before);
    }

    SECTION("Other regular files are rejected") {
        auto result = coordinator.upload(files.front(), gradual_options(2));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::validation_failed);
    }

    SECTION("An empty directory is rejected") {
        fs::create_directories(root / "empty");
        auto result = coordinator.upload(root / "empty", gradual_options(2));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::validation_failed);
    }
}
