/**
 * @file batch_upload_coordinator.hpp
 * @brief Parallel upload of contiguous file batches as archives
 *
 * The input is split into at most `workers` contiguous batches. Each batch
 * is packed into one local tar or zip and posted to the import service as
 * a single request; batches run concurrently and fail independently.
 *
 * @code
 * batch_upload_options options;
 * options.destination = {"PROJ", "SUBJ01", "SESS01"};
 * options.workers = 4;
 *
 * batch_upload_coordinator coordinator(client);
 * auto result = coordinator.upload_directory("/data/dicom", options);
 * @endcode
 */

#pragma once

#include <xnat/client/session_client.hpp>
#include <xnat/core/result.hpp>
#include <xnat/di/ilogger.hpp>
#include <xnat/http/http_types.hpp>
#include <xnat/integration/thread_pool_interface.hpp>
#include <xnat/transfer/archive_builder.hpp>
#include <xnat/transfer/file_collector.hpp>
#include <xnat/transfer/transfer_types.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace xnat::transfer {

// =============================================================================
// Import Parameters
// =============================================================================

/**
 * @brief How the import service treats an existing session
 */
enum class overwrite_mode {
    none,    ///< Reject uploads into an existing session
    append,  ///< Add files to the existing session
    delete_  ///< Replace the existing session
};

[[nodiscard]] constexpr const char* to_string(overwrite_mode mode) noexcept {
    switch (mode) {
        case overwrite_mode::none: return "none";
        case overwrite_mode::append: return "append";
        case overwrite_mode::delete_: return "delete";
        default: return "delete";
    }
}

[[nodiscard]] inline overwrite_mode overwrite_mode_from_string(std::string_view str) noexcept {
    if (str == "none") return overwrite_mode::none;
    if (str == "append") return overwrite_mode::append;
    return overwrite_mode::delete_;
}

/**
 * @brief Where uploaded data lands on the server
 */
struct import_destination {
    std::string project;
    std::string subject;
    std::string session;
};

/**
 * @brief Options for one batch upload run
 */
struct batch_upload_options {
    import_destination destination;

    /// Number of batches and concurrent uploads
    std::size_t workers{4};

    archive_format format{archive_format::tar};

    std::string import_handler{"DICOM-zip"};

    /// true: straight to the archive; false: stage in the prearchive
    bool direct_archive{false};

    overwrite_mode overwrite{overwrite_mode::delete_};

    bool ignore_unparsable{true};

    /// Applied by upload_directory only
    collect_options filter;

    progress_sink on_progress;

    cancellation_token cancel;
};

// =============================================================================
// Coordinator
// =============================================================================

/**
 * @brief Archive-per-batch parallel uploader
 *
 * Each batch uses its own fork() of the client. A batch whose archive
 * cannot be built or whose upload ultimately fails is recorded in the
 * summary; sibling batches are not affected and failed batches are not
 * re-attempted. Temporary archives live under one run directory removed
 * when the run returns.
 */
class batch_upload_coordinator {
public:
    explicit batch_upload_coordinator(
        client::session_client& client,
        std::shared_ptr<integration::thread_pool_interface> pool = nullptr,
        std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Collect files under @p source and upload them
     *
     * Fails with validation_failed if @p source is not a directory or
     * holds no eligible files.
     */
    [[nodiscard]] auto upload_directory(const std::filesystem::path& source,
                                        const batch_upload_options& options)
        -> Result<transfer_summary>;

    /**
     * @brief Upload an explicit file list; entry names are relative to
     *        @p base_dir
     */
    [[nodiscard]] auto upload_files(const std::vector<std::filesystem::path>& files,
                                    const std::filesystem::path& base_dir,
                                    const batch_upload_options& options)
        -> Result<transfer_summary>;

    /**
     * @brief Batches the run would schedule for @p files
     */
    [[nodiscard]] static auto plan_batches(const std::vector<std::filesystem::path>& files,
                                           std::size_t workers) -> std::vector<transfer_unit>;

    /**
     * @brief Query parameters of one import request
     */
    [[nodiscard]] static auto import_params(const batch_upload_options& options)
        -> http::query_params;

private:
    client::session_client* client_;
    std::shared_ptr<integration::thread_pool_interface> pool_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace xnat::transfer
