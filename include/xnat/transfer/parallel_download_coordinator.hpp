/**
 * @file parallel_download_coordinator.hpp
 * @brief Concurrent retrieval of the scans and resources of one session
 *
 * With one worker the whole session comes down as a single combined
 * archive; with more, every scan is its own archive fetched concurrently.
 * Archives are extracted into
 *
 *   {output}/{session}/scans/{scan_id}/resources/{label}/files/...
 *   {output}/{session}/resources/{label}/files/...
 *
 * and existing files are overwritten, so a re-run after an interruption
 * converges on the same file set.
 */

#pragma once

#include <xnat/client/session_client.hpp>
#include <xnat/core/result.hpp>
#include <xnat/di/ilogger.hpp>
#include <xnat/integration/thread_pool_interface.hpp>
#include <xnat/transfer/transfer_types.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xnat::transfer {

// =============================================================================
// Options & Plan
// =============================================================================

struct download_options {
    std::filesystem::path output_dir;

    /// Resolves a session label to its experiment id when set
    std::optional<std::string> project;

    /// Directory name under output_dir; defaults to the session identifier
    std::optional<std::string> session_dir_name;

    /// 1 selects the combined-archive request
    std::size_t workers{4};

    /// Restrict to these scan ids; empty means every scan
    std::vector<std::string> scan_ids;

    /// Also fetch session-level resources
    bool include_resources{false};

    bool extract{true};

    /// Delete each archive after it was extracted successfully
    bool cleanup{true};

    /// Compare extracted files against server MD5 digests
    bool verify{false};

    /// Report what would be fetched without transfer requests
    bool dry_run{false};

    progress_sink on_progress;

    cancellation_token cancel;
};

enum class download_kind {
    combined,  ///< All selected scans in one archive
    scan,      ///< One scan
    resource   ///< One session-level resource
};

[[nodiscard]] constexpr const char* to_string(download_kind kind) noexcept {
    switch (kind) {
        case download_kind::combined: return "combined";
        case download_kind::scan: return "scan";
        case download_kind::resource: return "resource";
        default: return "unknown";
    }
}

/**
 * @brief One archive the run would fetch
 */
struct planned_download {
    std::string unit_id;
    download_kind kind{download_kind::scan};
    std::string label;          ///< Scan id(s) or resource label
    std::string remote_path;
    std::size_t file_count{0};  ///< From the resource listing, dry-run only
    std::uint64_t size_bytes{0};
};

struct download_plan {
    std::string session;        ///< Identifier as given by the caller
    std::string experiment_id;  ///< Resolved internal id
    std::filesystem::path session_dir;
    std::vector<planned_download> items;

    [[nodiscard]] auto total_files() const noexcept -> std::size_t;
    [[nodiscard]] auto total_bytes() const noexcept -> std::uint64_t;
};

struct download_result {
    transfer_summary summary;
    download_plan plan;
    bool dry_run{false};
    std::size_t files_extracted{0};
    std::vector<std::string> verification_failures;  ///< Paths relative to the session dir
};

// =============================================================================
// Coordinator
// =============================================================================

class parallel_download_coordinator {
public:
    explicit parallel_download_coordinator(
        client::session_client& client,
        std::shared_ptr<integration::thread_pool_interface> pool = nullptr,
        std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Fetch a session, or only plan it when options.dry_run is set
     *
     * Listing, label resolution and validation errors abort the run.
     * Per-archive failures (transfer, extraction, checksum mismatch) are
     * recorded in the summary; a checksum mismatch does not remove the
     * extracted files.
     */
    [[nodiscard]] auto download_session(const std::string& session,
                                        const download_options& options)
        -> Result<download_result>;

    /**
     * @brief List the archives a run with @p options would fetch
     */
    [[nodiscard]] auto plan(const std::string& session, const download_options& options)
        -> Result<download_plan>;

    /**
     * @brief Experiment id of @p session; labels are looked up in @p project
     *
     * Identifiers starting with XNAT_E, or any identifier without a
     * project, are returned as is.
     */
    [[nodiscard]] auto resolve_experiment_id(const std::string& session,
                                             const std::optional<std::string>& project)
        -> Result<std::string>;

    /**
     * @brief Destination of a scan archive entry, relative to the session dir
     *
     * Locates the "scans/<folder>" and "resources/<label>/files" segments.
     * The scan id is @p scan_id when given, otherwise the folder name up
     * to its first '-'. Directory entries map to std::nullopt.
     */
    [[nodiscard]] static auto map_scan_entry(const std::string& entry,
                                             std::string_view scan_id = {})
        -> std::optional<std::filesystem::path>;

    /**
     * @brief Destination of a session resource entry, relative to the
     *        session dir
     */
    [[nodiscard]] static auto map_resource_entry(const std::string& entry,
                                                 const std::string& label)
        -> std::optional<std::filesystem::path>;

private:
    client::session_client* client_;
    std::shared_ptr<integration::thread_pool_interface> pool_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace xnat::transfer
