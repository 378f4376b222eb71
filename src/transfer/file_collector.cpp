/**
 * @file file_collector.cpp
 * @brief Directory walking for upload sources
 */

#include <xnat/transfer/file_collector.hpp>

#include <algorithm>
#include <array>
#include <cstdio>
#include <cctype>
#include <random>
#include <system_error>

namespace fs = std::filesystem;

namespace xnat::transfer {

namespace {

constexpr std::array<std::string_view, 4> dicom_extensions = {".dcm", ".ima", ".img", ".dicom"};

}  // namespace

bool is_dicom_candidate(const fs::path& path, bool include_extensionless) {
    auto ext = path.extension().string();
    if (ext.empty()) {
        return include_extensionless;
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::find(dicom_extensions.begin(), dicom_extensions.end(), ext) !=
           dicom_extensions.end();
}

auto collect_files(const fs::path& root, const collect_options& options)
    -> Result<std::vector<fs::path>> {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return xnat_error<std::vector<fs::path>>(error_codes::validation_failed,
                                                 "Not a directory", root.string());
    }

    std::vector<fs::path> files;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return xnat_error<std::vector<fs::path>>(error_codes::file_io_error,
                                                 "Cannot read directory",
                                                 root.string() + ": " + ec.message());
    }

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return xnat_error<std::vector<fs::path>>(error_codes::file_io_error,
                                                     "Failed walking directory",
                                                     ec.message());
        }
        const auto& entry = *it;
        std::error_code stat_ec;
        // is_regular_file follows symlinks; dangling links report false
        if (!entry.is_regular_file(stat_ec) || stat_ec) {
            continue;
        }
        const auto name = entry.path().filename().string();
        if (!name.empty() && name.front() == '.') {
            continue;
        }
        if (options.dicom_only &&
            !is_dicom_candidate(entry.path(), options.include_extensionless)) {
            continue;
        }
        files.push_back(entry.path());
    }

    std::sort(files.begin(), files.end());
    return ok(std::move(files));
}

auto canonical_key(const fs::path& path) -> std::string {
    std::error_code ec;
    auto absolute = fs::absolute(path, ec);
    if (ec) {
        return path.lexically_normal().string();
    }
    auto canonical = fs::weakly_canonical(absolute, ec);
    if (ec) {
        return absolute.lexically_normal().string();
    }
    return canonical.string();
}

auto total_size(const std::vector<fs::path>& files) -> std::uint64_t {
    std::uint64_t total = 0;
    for (const auto& file : files) {
        std::error_code ec;
        auto size = fs::file_size(file, ec);
        if (!ec) {
            total += size;
        }
    }
    return total;
}

// =============================================================================
// scoped_temp_directory
// =============================================================================

auto scoped_temp_directory::create(const std::string& prefix)
    -> Result<std::unique_ptr<scoped_temp_directory>> {
    using dir_ptr = std::unique_ptr<scoped_temp_directory>;

    std::error_code ec;
    const auto base = fs::temp_directory_path(ec);
    if (ec) {
        return xnat_error<dir_ptr>(error_codes::file_io_error,
                                   "No temporary directory available", ec.message());
    }

    std::random_device device;
    std::mt19937_64 engine(device());
    for (int attempt = 0; attempt < 16; ++attempt) {
        char suffix[17];
        std::snprintf(suffix, sizeof(suffix), "%016llx",
                      static_cast<unsigned long long>(engine()));
        auto candidate = base / (prefix + suffix);
        if (fs::create_directory(candidate, ec)) {
            return Result<dir_ptr>::ok(dir_ptr(new scoped_temp_directory(candidate)));
        }
        if (ec) {
            return xnat_error<dir_ptr>(error_codes::file_io_error,
                                       "Cannot create temporary directory",
                                       candidate.string() + ": " + ec.message());
        }
    }
    return xnat_error<dir_ptr>(error_codes::file_io_error,
                               "Cannot create a unique temporary directory",
                               base.string());
}

scoped_temp_directory::~scoped_temp_directory() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

}  // namespace xnat::transfer
