/**
 * @file file_collector.hpp
 * @brief Input enumeration and contiguous batch partitioning
 */

#pragma once

#include <xnat/core/result.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace xnat::transfer {

/**
 * @brief Filters applied while walking a source directory
 */
struct collect_options {
    /// Keep only .dcm/.ima/.img/.dicom (any case) and extensionless files
    bool dicom_only{true};

    /// Include extensionless files when dicom_only is set
    bool include_extensionless{true};
};

/**
 * @brief True for DICOM extensions and, if allowed, extensionless names
 */
[[nodiscard]] bool is_dicom_candidate(const std::filesystem::path& path,
                                      bool include_extensionless = true);

/**
 * @brief Recursively list regular files under @p root, sorted by path
 *
 * Files whose name starts with '.' and dangling symlinks are skipped.
 * Fails with validation_failed if @p root is not a directory.
 */
[[nodiscard]] auto collect_files(const std::filesystem::path& root,
                                 const collect_options& options = {})
    -> Result<std::vector<std::filesystem::path>>;

/**
 * @brief Split @p items into at most @p parts contiguous slices
 *
 * Slice i holds [i*ceil(n/parts), (i+1)*ceil(n/parts)); empty trailing
 * slices are dropped, so the result is a disjoint, ordered cover of the
 * input.
 */
template <typename T>
[[nodiscard]] auto partition_contiguous(const std::vector<T>& items, std::size_t parts)
    -> std::vector<std::vector<T>> {
    std::vector<std::vector<T>> slices;
    if (items.empty()) {
        return slices;
    }
    if (parts == 0) {
        parts = 1;
    }
    const std::size_t chunk = (items.size() + parts - 1) / parts;
    for (std::size_t i = 0; i < parts; ++i) {
        const std::size_t begin = i * chunk;
        if (begin >= items.size()) {
            break;
        }
        const std::size_t end = std::min(begin + chunk, items.size());
        slices.emplace_back(items.begin() + static_cast<std::ptrdiff_t>(begin),
                            items.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return slices;
}

/**
 * @brief Canonical absolute form of @p path used for duplicate and
 *        resume detection
 */
[[nodiscard]] auto canonical_key(const std::filesystem::path& path) -> std::string;

/**
 * @brief Sum of file sizes, ignoring files that cannot be stat'ed
 */
[[nodiscard]] auto total_size(const std::vector<std::filesystem::path>& files)
    -> std::uint64_t;

/**
 * @brief Uniquely named directory under the system temp path, removed
 *        recursively on destruction
 */
class scoped_temp_directory {
public:
    /**
     * @brief Create "<temp>/<prefix><random>"
     */
    [[nodiscard]] static auto create(const std::string& prefix)
        -> Result<std::unique_ptr<scoped_temp_directory>>;

    ~scoped_temp_directory();

    scoped_temp_directory(const scoped_temp_directory&) = delete;
    scoped_temp_directory& operator=(const scoped_temp_directory&) = delete;

    [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& { return path_; }

private:
    explicit scoped_temp_directory(std::filesystem::path path) : path_(std::move(path)) {}

    std::filesystem::path path_;
};

}  // namespace xnat::transfer
