/**
 * @file parallel_download_coordinator_test.cpp
 * @brief Unit tests for session download planning, transfer and extraction
 */

#include "../mocks/mock_http_transport.hpp"
#include "../mocks/mock_thread_pool.hpp"

#include <xnat/transfer/archive_builder.hpp>
#include <xnat/transfer/checksum.hpp>
#include <xnat/transfer/file_collector.hpp>
#include <xnat/transfer/parallel_download_coordinator.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

using namespace xnat;
using namespace xnat::transfer;
using namespace xnat::http;
using namespace xnat::http::testing;
using xnat::integration::testing::mock_thread_pool;
namespace fs = std::filesystem;

namespace {

constexpr const char* experiment = "/data/experiments/XNAT_E00001";

auto read_file(const fs::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/**
 * @brief ZIP bytes holding @p entries (name -> content)
 */
auto make_zip(const fs::path& scratch, const std::map<std::string, std::string>& entries)
    -> std::string {
    static int counter = 0;
    const auto staging = scratch / ("staging_" + std::to_string(++counter));
    std::vector<fs::path> files;
    for (const auto& [name, content] : entries) {
        const auto path = staging / name;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
        files.push_back(path);
    }
    const auto archive = scratch / ("archive_" + std::to_string(counter) + ".zip");
    auto built = build_archive(files, staging, archive, archive_format::zip);
    REQUIRE(built.is_ok());
    return read_file(archive);
}

auto mapped(const std::optional<fs::path>& path) -> std::string {
    return path ? path->generic_string() : "<skipped>";
}

/**
 * @brief Relative paths of every regular file under @p root
 */
auto file_set(const fs::path& root) -> std::set<std::string> {
    std::set<std::string> names;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (entry.is_regular_file()) {
            names.insert(entry.path().lexically_relative(root).generic_string());
        }
    }
    return names;
}

/**
 * @brief Server with two scans (1-T1 and 2-FLAIR) and one NOTES resource
 */
struct session_fixture {
    std::unique_ptr<scoped_temp_directory> scratch;
    std::shared_ptr<mock_server> server = std::make_shared<mock_server>();
    std::string scan2_zip;

    session_fixture() {
        auto dir = scoped_temp_directory::create("xnat_download_test_");
        REQUIRE(dir.is_ok());
        scratch = std::move(dir.value());
        const auto& root = scratch->path();

        const auto scan1 = make_zip(root, {{"SESS/scans/1-T1/resources/DICOM/files/a.dcm", "alpha"}});
        scan2_zip = make_zip(root, {{"SESS/scans/2-FLAIR/resources/DICOM/files/b.dcm", "bravo"}});
        const auto all = make_zip(root, {
            {"SESS/scans/1-T1/resources/DICOM/files/a.dcm", "alpha"},
            {"SESS/scans/2-FLAIR/resources/DICOM/files/b.dcm", "bravo"},
        });
        const auto notes = make_zip(root, {{"n.txt", "notes"}});

        server->serve_login("TOKEN");
        server->on(http_method::get, std::string(experiment) + "/scans",
                   [](const recorded_request&) {
                       return mock_server::respond_records(
                           nlohmann::json::array({{{"ID", "1"}}, {{"ID", "2"}}}));
                   });
        serve_zip(std::string(experiment) + "/scans/1/files", scan1);
        serve_zip(std::string(experiment) + "/scans/2/files", scan2_zip);
        serve_zip(std::string(experiment) + "/scans/ALL/files", all);
        serve_zip(std::string(experiment) + "/scans/1,2/files", all);
        serve_zip(std::string(experiment) + "/resources/NOTES/files", notes);
        server->on(http_method::get, std::string(experiment) + "/resources",
                   [](const recorded_request&) {
                       return mock_server::respond_records(nlohmann::json::array(
                           {{{"label", "NOTES"}, {"file_count", 1}, {"file_size", "5"}}}));
                   });
    }

    void serve_zip(const std::string& path, const std::string& bytes) {
        server->on(http_method::get, path, [bytes](const recorded_request& req) {
            if (req.param("format") != std::optional<std::string>("zip")) {
                return mock_server::respond(400, "format=zip expected");
            }
            return mock_server::respond(200, bytes, {{"Content-Type", "application/zip"}});
        });
    }

    [[nodiscard]] auto output() const -> fs::path { return scratch->path() / "out"; }

    [[nodiscard]] auto options(std::size_t workers) const -> download_options {
        download_options opts;
        opts.output_dir = output();
        opts.workers = workers;
        return opts;
    }
};

}  // namespace

// =============================================================================
// Entry Mapping
// =============================================================================

TEST_CASE("map_scan_entry", "[download][mapping]") {
    using coordinator = parallel_download_coordinator;

    CHECK(mapped(coordinator::map_scan_entry("SESS/scans/1-T1/resources/DICOM/files/a.dcm")) ==
          "scans/1/resources/DICOM/files/a.dcm");
    CHECK(mapped(coordinator::map_scan_entry("SESS/scans/1-T1/resources/DICOM/files/sub/b.dcm", "7")) ==
          "scans/7/resources/DICOM/files/sub/b.dcm");
    CHECK(mapped(coordinator::map_scan_entry("SESS/scans/3/resources/SNAPSHOTS/t.gif")) ==
          "scans/3/resources/SNAPSHOTS/files/t.gif");
    CHECK(mapped(coordinator::map_scan_entry("a.dcm", "4")) == "scans/4/a.dcm");
    CHECK_FALSE(coordinator::map_scan_entry("SESS/scans/1-T1/").has_value());
}

TEST_CASE("map_resource_entry", "[download][mapping]") {
    using coordinator = parallel_download_coordinator;

    CHECK(mapped(coordinator::map_resource_entry("SESS/resources/NOTES/files/n.txt", "NOTES")) ==
          "resources/NOTES/files/n.txt");
    CHECK(mapped(coordinator::map_resource_entry("deep/dir/n.txt", "NOTES")) ==
          "resources/NOTES/files/n.txt");
    CHECK_FALSE(coordinator::map_resource_entry("SESS/resources/", "NOTES").has_value());
}

// =============================================================================
// Planning
// =============================================================================

TEST_CASE("parallel_download_coordinator plans archives", "[download][plan]") {
    session_fixture fx;
    client::session_client client(test_config(), fx.server->factory());
    parallel_download_coordinator coordinator(client, std::make_shared<mock_thread_pool>());

    SECTION("One worker asks for a single combined archive") {
        auto plan = coordinator.plan("XNAT_E00001", fx.options(1));
        REQUIRE(plan.is_ok());
        REQUIRE(plan.value().items.size() == 1);
        CHECK(plan.value().items[0].kind == download_kind::combined);
        CHECK(plan.value().items[0].remote_path == std::string(experiment) + "/scans/ALL/files");
        CHECK(plan.value().session_dir.string() == (fx.output() / "XNAT_E00001").string());
    }

    SECTION("Combined archive with a scan filter lists the ids") {
        auto opts = fx.options(1);
        opts.scan_ids = {"1", "2"};
        auto plan = coordinator.plan("XNAT_E00001", opts);
        REQUIRE(plan.is_ok());
        CHECK(plan.value().items[0].remote_path == std::string(experiment) + "/scans/1,2/files");
        CHECK(plan.value().items[0].label == "1,2");
    }

    SECTION("Several workers plan one archive per scan") {
        auto opts = fx.options(4);
        opts.include_resources = true;
        auto plan = coordinator.plan("XNAT_E00001", opts);
        REQUIRE(plan.is_ok());
        REQUIRE(plan.value().items.size() == 3);
        CHECK(plan.value().items[0].unit_id == "scan_1");
        CHECK(plan.value().items[1].unit_id == "scan_2");
        CHECK(plan.value().items[2].unit_id == "resource_NOTES");
        CHECK(plan.value().items[2].kind == download_kind::resource);
        CHECK(plan.value().items[2].size_bytes == 5);
    }

    SECTION("An unknown scan id is rejected") {
        auto opts = fx.options(4);
        opts.scan_ids = {"1", "99"};
        auto plan = coordinator.plan("XNAT_E00001", opts);
        REQUIRE(plan.is_err());
        CHECK(plan.error().code == error_codes::validation_failed);
    }

    SECTION("An output directory is required") {
        auto opts = fx.options(4);
        opts.output_dir.clear();
        REQUIRE(coordinator.plan("XNAT_E00001", opts).is_err());
    }
}

TEST_CASE("parallel_download_coordinator resolves session labels", "[download][resolve]") {
    session_fixture fx;
    fx.server->on(http_method::get, "/data/projects/PROJ/experiments/SESS",
                  [](const recorded_request&) {
                      return mock_server::respond_json(
                          {{"items", nlohmann::json::array(
                                         {{{"data_fields", {{"ID", "XNAT_E00001"}}}}})}});
                  });
    client::session_client client(test_config(), fx.server->factory());
    parallel_download_coordinator coordinator(client, std::make_shared<mock_thread_pool>());

    SECTION("Labels are looked up in the project") {
        auto id = coordinator.resolve_experiment_id("SESS", std::string("PROJ"));
        REQUIRE(id.is_ok());
        CHECK(id.value() == "XNAT_E00001");
    }

    SECTION("Experiment ids and project-less sessions pass through") {
        auto id = coordinator.resolve_experiment_id("XNAT_E00042", std::string("PROJ"));
        REQUIRE(id.is_ok());
        CHECK(id.value() == "XNAT_E00042");
        CHECK(coordinator.resolve_experiment_id("SESS", std::nullopt).value() == "SESS");
        CHECK(fx.server->requests().empty());
    }

    SECTION("An unknown label is a validation error") {
        auto id = coordinator.resolve_experiment_id("NOPE", std::string("PROJ"));
        REQUIRE(id.is_err());
        CHECK(id.error().code == error_codes::validation_failed);
        CHECK(id.error().message == "Session 'NOPE' not found in project 'PROJ'");
    }

    SECTION("The session directory keeps the label") {
        auto opts = fx.options(4);
        opts.project = "PROJ";
        auto plan = coordinator.plan("SESS", opts);
        REQUIRE(plan.is_ok());
        CHECK(plan.value().experiment_id == "XNAT_E00001");
        CHECK(plan.value().session_dir.string() == (fx.output() / "SESS").string());
    }
}

// =============================================================================
// Downloading
// =============================================================================

TEST_CASE("parallel_download_coordinator downloads and extracts", "[download]") {
    session_fixture fx;
    client::session_client client(test_config(), fx.server->factory());
    auto pool = std::make_shared<mock_thread_pool>(mock_thread_pool::execution_mode::threaded);
    parallel_download_coordinator coordinator(client, pool);

    const std::set<std::string> expected{
        "scans/1/resources/DICOM/files/a.dcm",
        "scans/2/resources/DICOM/files/b.dcm",
    };

    SECTION("Per-scan and combined modes produce the same layout") {
        auto per_scan = coordinator.download_session("XNAT_E00001", fx.options(4));
        REQUIRE(per_scan.is_ok());
        CHECK(per_scan.value().summary.succeeded == 2);
        CHECK(per_scan.value().files_extracted == 2);
        const auto session_dir = per_scan.value().plan.session_dir;
        CHECK(file_set(session_dir) == expected);
        CHECK(read_file(session_dir / "scans/2/resources/DICOM/files/b.dcm") == "bravo");

        fs::remove_all(session_dir);
        auto combined = coordinator.download_session("XNAT_E00001", fx.options(1));
        REQUIRE(combined.is_ok());
        CHECK(combined.value().summary.total == 1);
        CHECK(combined.value().summary.succeeded == 1);
        CHECK(file_set(session_dir) == expected);
    }

    SECTION("A second run converges on the same file set") {
        auto first = coordinator.download_session("XNAT_E00001", fx.options(4));
        REQUIRE(first.is_ok());
        auto second = coordinator.download_session("XNAT_E00001", fx.options(4));
        REQUIRE(second.is_ok());
        CHECK(second.value().summary.all_succeeded());
        CHECK(file_set(second.value().plan.session_dir) == expected);
    }

    SECTION("A rerun after an interrupted transfer restores the full file set") {
        const auto scan2_path = std::string(experiment) + "/scans/2/files";
        const auto truncated = fx.scan2_zip.substr(0, fx.scan2_zip.size() / 2);
        fx.server->on(http_method::get, scan2_path, [truncated](const recorded_request&) {
            return mock_server::respond(200, truncated);
        });

        auto first = coordinator.download_session("XNAT_E00001", fx.options(4));
        REQUIRE(first.is_ok());
        CHECK(first.value().summary.succeeded == 1);
        REQUIRE(first.value().summary.errors.size() == 1);
        CHECK(first.value().summary.errors[0].unit_id == "scan_2");

        // Leftovers of a killed process
        const auto session_dir = first.value().plan.session_dir;
        const auto partial = session_dir / "scans/2/resources/DICOM/files/b.dcm";
        fs::create_directories(partial.parent_path());
        std::ofstream(partial, std::ios::binary) << "br";
        std::ofstream(session_dir / "scan_2.zip.part", std::ios::binary) << "stale";

        fx.serve_zip(scan2_path, fx.scan2_zip);
        auto second = coordinator.download_session("XNAT_E00001", fx.options(4));
        REQUIRE(second.is_ok());
        CHECK(second.value().summary.all_succeeded());
        CHECK(file_set(session_dir) == expected);
        CHECK(read_file(partial) == "bravo");
        CHECK_FALSE(fs::exists(session_dir / "scan_2.zip.part"));
        CHECK(read_file(session_dir / "scans/1/resources/DICOM/files/a.dcm") == "alpha");
    }

    SECTION("Workers share one forked client each") {
        auto opts = fx.options(2);
        opts.include_resources = true;
        auto result = coordinator.download_session("XNAT_E00001", opts);
        REQUIRE(result.is_ok());
        CHECK(result.value().summary.succeeded == 3);
        // Main client plus one fork per worker
        CHECK(fx.server->transports_created() == 3);
    }

    SECTION("Missing inputs fail before any request") {
        auto opts = fx.options(4);
        opts.output_dir.clear();
        auto result = coordinator.download_session("XNAT_E00001", opts);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::validation_failed);

        auto unnamed = coordinator.download_session("", fx.options(4));
        REQUIRE(unnamed.is_err());
        CHECK(unnamed.error().code == error_codes::validation_failed);
        CHECK(fx.server->requests().empty());
    }

    SECTION("Archives are kept when cleanup is off") {
        auto opts = fx.options(4);
        opts.cleanup = false;
        auto result = coordinator.download_session("XNAT_E00001", opts);
        REQUIRE(result.is_ok());
        const auto dir = result.value().plan.session_dir;
        CHECK(fs::exists(dir / "scan_1.zip"));
        CHECK_FALSE(fs::exists(dir / "scan_1.zip.part"));
    }

    SECTION("Without extraction only the archives are written") {
        auto opts = fx.options(4);
        opts.extract = false;
        opts.verify = true;
        auto result = coordinator.download_session("XNAT_E00001", opts);
        REQUIRE(result.is_ok());
        CHECK(result.value().files_extracted == 0);
        CHECK(file_set(result.value().plan.session_dir) ==
              std::set<std::string>{"scan_1.zip", "scan_2.zip"});
        CHECK(fx.server->count(http_method::get, std::string(experiment) + "/files") == 0);
    }

    SECTION("Session resources are extracted under resources/") {
        auto opts = fx.options(4);
        opts.include_resources = true;
        auto result = coordinator.download_session("XNAT_E00001", opts);
        REQUIRE(result.is_ok());
        CHECK(result.value().summary.succeeded == 3);
        CHECK(read_file(result.value().plan.session_dir / "resources/NOTES/files/n.txt") ==
              "notes");
    }

    SECTION("A failed archive does not stop the others") {
        fx.server->on(http_method::get, std::string(experiment) + "/scans/2/files",
                      [](const recorded_request&) {
                          return mock_server::respond(500, "Internal error");
                      });
        auto result = coordinator.download_session("XNAT_E00001", fx.options(4));
        REQUIRE(result.is_ok());
        CHECK(result.value().summary.succeeded == 1);
        REQUIRE(result.value().summary.errors.size() == 1);
        CHECK(result.value().summary.errors[0].unit_id == "scan_2");
        CHECK(file_set(result.value().plan.session_dir) ==
              std::set<std::string>{"scans/1/resources/DICOM/files/a.dcm"});
    }

    SECTION("Checksum mismatches are reported and files kept") {
        auto alpha = md5_hex("alpha");
        REQUIRE(alpha.is_ok());
        fx.server->on(http_method::get, std::string(experiment) + "/files",
                      [digest = alpha.value()](const recorded_request&) {
                          return mock_server::respond_records(nlohmann::json::array({
                              {{"Name", "a.dcm"}, {"digest", digest}},
                              {{"Name", "b.dcm"}, {"digest", "00000000000000000000000000000000"}},
                          }));
                      });

        auto opts = fx.options(4);
        opts.verify = true;
        auto result = coordinator.download_session("XNAT_E00001", opts);
        REQUIRE(result.is_ok());
        CHECK(result.value().summary.succeeded == 1);
        REQUIRE(result.value().summary.errors.size() == 1);
        CHECK(result.value().summary.errors[0].code == error_codes::verification_failed);
        CHECK(result.value().verification_failures ==
              std::vector<std::string>{"scans/2/resources/DICOM/files/b.dcm"});
        CHECK(file_set(result.value().plan.session_dir) == expected);
    }

    SECTION("Dry run plans without fetching archives") {
        fx.server->on(http_method::get, std::string(experiment) + "/scans/1/resources",
                      [](const recorded_request&) {
                          return mock_server::respond_records(nlohmann::json::array(
                              {{{"label", "DICOM"}, {"file_count", "176"}, {"file_size", 1000}}}));
                      });
        fx.server->on(http_method::get, std::string(experiment) + "/scans/2/resources",
                      [](const recorded_request&) {
                          return mock_server::respond_records(nlohmann::json::array(
                              {{{"label", "DICOM"}, {"file_count", 24}, {"file_size", 500}}}));
                      });

        auto opts = fx.options(4);
        opts.dry_run = true;
        auto result = coordinator.download_session("XNAT_E00001", opts);
        REQUIRE(result.is_ok());
        CHECK(result.value().dry_run);
        CHECK(result.value().plan.total_files() == 200);
        CHECK(result.value().plan.total_bytes() == 1500);
        CHECK(fx.server->count(http_method::get, std::string(experiment) + "/scans/1/files") == 0);
        CHECK_FALSE(fs::exists(result.value().plan.session_dir));
    }
}
