/**
 * @file gradual_upload_coordinator.hpp
 * @brief Per-file parallel upload through the gradual-DICOM import handler
 *
 * Run order:
 * 1. the first `warmup_files` files go up one at a time, so the server
 *    creates the staging session before workers race on it;
 * 2. `workers` tasks, each with its own fork() of the client, pull the
 *    remaining files from a shared queue;
 * 3. files that still failed are retried once, sequentially, in path order.
 *
 * Files named in `already_done` (canonical path strings, as returned in
 * transfer_summary::succeeded_ids) are skipped, which makes an
 * interrupted run resumable.
 */

#pragma once

#include <xnat/client/session_client.hpp>
#include <xnat/core/result.hpp>
#include <xnat/di/ilogger.hpp>
#include <xnat/http/http_types.hpp>
#include <xnat/integration/thread_pool_interface.hpp>
#include <xnat/transfer/batch_upload_coordinator.hpp>
#include <xnat/transfer/transfer_types.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace xnat::transfer {

struct gradual_upload_options {
    import_destination destination;

    std::size_t workers{8};

    /// Files uploaded sequentially before the parallel pass
    std::size_t warmup_files{5};

    /// Emit a transferring event every this many completed files
    std::size_t progress_interval{100};

    /// Run the sequential retry pass over failed files
    bool retry_failed{true};

    /// Unit ids already uploaded by a previous run: canonical paths, or
    /// "<canonical zip path>!<entry path>" for files of a ZIP source
    std::set<std::string> already_done;

    progress_sink on_progress;

    cancellation_token cancel;
};

class gradual_upload_coordinator {
public:
    explicit gradual_upload_coordinator(
        client::session_client& client,
        std::shared_ptr<integration::thread_pool_interface> pool = nullptr,
        std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Upload every non-hidden file of a directory, or of a ZIP
     *        archive extracted to a temporary directory first
     *
     * Fails with validation_failed for any other kind of source and when
     * the source holds no files.
     */
    [[nodiscard]] auto upload(const std::filesystem::path& source,
                              const gradual_upload_options& options)
        -> Result<transfer_summary>;

    /**
     * @brief Upload an explicit file list
     *
     * Messages name files relative to @p display_root. The same canonical
     * path listed twice fails with validation_failed before any transfer.
     */
    [[nodiscard]] auto upload_files(const std::vector<std::filesystem::path>& files,
                                    const std::filesystem::path& display_root,
                                    const gradual_upload_options& options)
        -> Result<transfer_summary>;

    [[nodiscard]] static auto import_params(const import_destination& destination)
        -> http::query_params;

private:
    using unit_key_fn = std::function<std::string(const std::filesystem::path&)>;

    auto upload_keyed(const std::vector<std::filesystem::path>& files,
                      const std::filesystem::path& display_root, const unit_key_fn& key_of,
                      const gradual_upload_options& options) -> Result<transfer_summary>;

    client::session_client* client_;
    std::shared_ptr<integration::thread_pool_interface> pool_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace xnat::transfer
