/**
 * @file checksum.hpp
 * @brief File digests for download verification
 */

#pragma once

#include <xnat/core/result.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace xnat::transfer {

/**
 * @brief Lowercase hex MD5 of a file, streamed in 64 KiB blocks
 */
[[nodiscard]] auto md5_file(const std::filesystem::path& path) -> Result<std::string>;

/**
 * @brief Lowercase hex MD5 of an in-memory buffer
 */
[[nodiscard]] auto md5_hex(std::string_view data) -> Result<std::string>;

/**
 * @brief Case-insensitive hex digest comparison
 */
[[nodiscard]] bool digest_equals(std::string_view a, std::string_view b) noexcept;

}  // namespace xnat::transfer
