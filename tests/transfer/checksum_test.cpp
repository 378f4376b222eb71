/**
 * @file checksum_test.cpp
 * @brief Unit tests for MD5 helpers
 */

#include <xnat/transfer/checksum.hpp>
#include <xnat/transfer/file_collector.hpp>

#include <catch2/catch_test_macros.hpp>

#include <fstream>
#include <string>

using namespace xnat;
using namespace xnat::transfer;

TEST_CASE("md5_hex known vectors", "[checksum]") {
    auto empty = md5_hex("");
    REQUIRE(empty.is_ok());
    CHECK(empty.value() == "d41d8cd98f00b204e9800998ecf8427e");

    auto abc = md5_hex("abc");
    REQUIRE(abc.is_ok());
    CHECK(abc.value() == "900150983cd24fb0d6963f7d28e17f72");
}

TEST_CASE("md5_file matches md5_hex", "[checksum]") {
    auto dir = scoped_temp_directory::create("xnat_md5_test_");
    REQUIRE(dir.is_ok());
    const auto path = dir.value()->path() / "payload.bin";

    // Larger than one read buffer
    std::string content(200 * 1024, '\0');
    for (std::size_t i = 0; i < content.size(); ++i) {
        content[i] = static_cast<char>(i % 251);
    }
    {
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    auto from_file = md5_file(path);
    auto from_memory = md5_hex(content);
    REQUIRE(from_file.is_ok());
    REQUIRE(from_memory.is_ok());
    CHECK(from_file.value() == from_memory.value());
}

TEST_CASE("md5_file on a missing file", "[checksum]") {
    auto result = md5_file("/nonexistent/xnat/file.dcm");
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::file_io_error);
}

TEST_CASE("digest_equals ignores hex case", "[checksum]") {
    CHECK(digest_equals("900150983CD24FB0D6963F7D28E17F72", "900150983cd24fb0d6963f7d28e17f72"));
    CHECK_FALSE(digest_equals("900150983cd24fb0", "900150983cd24fb0d6963f7d28e17f72"));
    CHECK_FALSE(digest_equals("900150983cd24fb0d6963f7d28e17f73",
                              "900150983cd24fb0d6963f7d28e17f72"));
}
