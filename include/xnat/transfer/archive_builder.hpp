/**
 * @file archive_builder.hpp
 * @brief Local tar/zip containers for batch uploads and ZIP extraction
 */

#pragma once

#include <xnat/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xnat::transfer {

// =============================================================================
// Archive Format
// =============================================================================

enum class archive_format {
    tar,  ///< Uncompressed POSIX ustar
    zip   ///< Deflate-compressed ZIP (zip64 when needed)
};

[[nodiscard]] constexpr const char* to_string(archive_format format) noexcept {
    switch (format) {
        case archive_format::tar: return "tar";
        case archive_format::zip: return "zip";
        default: return "tar";
    }
}

[[nodiscard]] inline archive_format archive_format_from_string(std::string_view str) noexcept {
    if (str == "zip") return archive_format::zip;
    return archive_format::tar;
}

/**
 * @brief MIME type sent with an upload of this format
 */
[[nodiscard]] constexpr const char* content_type(archive_format format) noexcept {
    return format == archive_format::zip ? "application/zip" : "application/x-tar";
}

[[nodiscard]] constexpr const char* file_extension(archive_format format) noexcept {
    return format == archive_format::zip ? ".zip" : ".tar";
}

// =============================================================================
// Archive Creation
// =============================================================================

/**
 * @brief Write @p files into a new archive at @p destination
 *
 * Entry names are the paths relative to @p base_dir (generic '/' form).
 * An existing destination is replaced. On failure the partial archive is
 * removed and archive_error (or file_io_error) is returned.
 *
 * @return Number of bytes written to @p destination
 */
[[nodiscard]] auto build_archive(const std::vector<std::filesystem::path>& files,
                                 const std::filesystem::path& base_dir,
                                 const std::filesystem::path& destination,
                                 archive_format format) -> Result<std::uint64_t>;

// =============================================================================
// ZIP Extraction
// =============================================================================

/**
 * @brief Maps an entry name to a path relative to the extraction root
 *
 * Returning std::nullopt skips the entry.
 */
using entry_mapper = std::function<std::optional<std::filesystem::path>(const std::string&)>;

struct extraction_result {
    std::vector<std::filesystem::path> written;  ///< Absolute paths, in archive order
    std::size_t skipped{0};                      ///< Unmapped or unsafe entries
};

/**
 * @brief Extract every file entry of @p archive below @p destination
 *
 * Existing files are overwritten. Entries whose mapped path is absolute
 * or climbs out of @p destination are skipped.
 */
[[nodiscard]] auto extract_zip(const std::filesystem::path& archive,
                               const std::filesystem::path& destination,
                               const entry_mapper& mapper = {}) -> Result<extraction_result>;

/**
 * @brief List the entry names of a ZIP archive
 */
[[nodiscard]] auto list_zip_entries(const std::filesystem::path& archive)
    -> Result<std::vector<std::string>>;

}  // namespace xnat::transfer
