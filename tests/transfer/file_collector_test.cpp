/**
 * @file file_collector_test.cpp
 * @brief Unit tests for upload source collection and partitioning
 */

#include <xnat/transfer/file_collector.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace xnat;
using namespace xnat::transfer;
namespace fs = std::filesystem;

namespace {

void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

auto names_relative_to(const std::vector<fs::path>& files, const fs::path& root)
    -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto& file : files) {
        names.push_back(file.lexically_relative(root).generic_string());
    }
    return names;
}

}  // namespace

TEST_CASE("is_dicom_candidate", "[file_collector]") {
    CHECK(is_dicom_candidate("scan/1.dcm"));
    CHECK(is_dicom_candidate("scan/1.DCM"));
    CHECK(is_dicom_candidate("scan/1.IMA"));
    CHECK(is_dicom_candidate("scan/1.dicom"));
    CHECK(is_dicom_candidate("scan/IM0001"));
    CHECK_FALSE(is_dicom_candidate("scan/IM0001", false));
    CHECK_FALSE(is_dicom_candidate("scan/notes.txt"));
    CHECK_FALSE(is_dicom_candidate("scan/report.pdf"));
}

TEST_CASE("collect_files walks a tree", "[file_collector]") {
    auto dir = scoped_temp_directory::create("xnat_collect_test_");
    REQUIRE(dir.is_ok());
    const auto root = dir.value()->path();

    write_file(root / "b" / "2.dcm", "two");
    write_file(root / "a" / "1.dcm", "one");
    write_file(root / "a" / "IM0003", "three");
    write_file(root / "a" / "notes.txt", "skip");
    write_file(root / ".hidden.dcm", "skip");

    SECTION("DICOM filter keeps candidates in sorted order") {
        auto files = collect_files(root);
        REQUIRE(files.is_ok());
        CHECK(names_relative_to(files.value(), root) ==
              std::vector<std::string>{"a/1.dcm", "a/IM0003", "b/2.dcm"});
    }

    SECTION("Without the filter every visible file is kept") {
        collect_options options;
        options.dicom_only = false;
        auto files = collect_files(root, options);
        REQUIRE(files.is_ok());
        CHECK(files.value().size() == 4);
    }

    SECTION("A file is not a directory") {
        auto files = collect_files(root / "a" / "1.dcm");
        REQUIRE(files.is_err());
        CHECK(files.error().code == error_codes::validation_failed);
    }

    SECTION("total_size sums file sizes") {
        auto files = collect_files(root);
        REQUIRE(files.is_ok());
        CHECK(total_size(files.value()) == 3 + 5 + 3);
    }
}

TEST_CASE("partition_contiguous", "[file_collector][partition]") {
    std::vector<int> items{1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12};

    SECTION("Even split") {
        auto slices = partition_contiguous(items, 3);
        REQUIRE(slices.size() == 3);
        CHECK(slices[0] == std::vector<int>{1, 2, 3, 4});
        CHECK(slices[2] == std::vector<int>{9, 10, 11, 12});
    }

    SECTION("Uneven split keeps order and drops empty tails") {
        auto slices = partition_contiguous(std::vector<int>{1, 2, 3, 4, 5}, 4);
        REQUIRE(slices.size() == 3);
        CHECK(slices[0] == std::vector<int>{1, 2});
        CHECK(slices[1] == std::vector<int>{3, 4});
        CHECK(slices[2] == std::vector<int>{5});
    }

    SECTION("More parts than items") {
        auto slices = partition_contiguous(std::vector<int>{1, 2}, 8);
        CHECK(slices.size() == 2);
    }

    SECTION("Zero parts means one slice") {
        auto slices = partition_contiguous(items, 0);
        REQUIRE(slices.size() == 1);
        CHECK(slices[0].size() == items.size());
    }

    SECTION("Empty input") {
        CHECK(partition_contiguous(std::vector<int>{}, 3).empty());
    }
}

TEST_CASE("scoped_temp_directory removes its tree", "[file_collector][temp]") {
    fs::path kept;
    {
        auto dir = scoped_temp_directory::create("xnat_scoped_test_");
        REQUIRE(dir.is_ok());
        kept = dir.value()->path();
        write_file(kept / "nested" / "file.bin", "data");
        REQUIRE(fs::exists(kept / "nested" / "file.bin"));
    }
    CHECK_FALSE(fs::exists(kept));
}

TEST_CASE("canonical_key resolves equivalent spellings", "[file_collector]") {
    auto dir = scoped_temp_directory::create("xnat_key_test_");
    REQUIRE(dir.is_ok());
    const auto root = dir.value()->path();
    write_file(root / "a" / "1.dcm", "x");

    CHECK(canonical_key(root / "a" / "1.dcm") == canonical_key(root / "a" / ".." / "a" / "1.dcm"));
}
