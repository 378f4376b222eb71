/**
 * @file transfer_types.hpp
 * @brief Units of work, progress events and summaries shared by coordinators
 */

#pragma once

#include <xnat/core/result.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xnat::transfer {

// =============================================================================
// Progress
// =============================================================================

/**
 * @brief Stage a progress event refers to
 */
enum class transfer_phase {
    preparing,     ///< Enumerating or partitioning input
    archiving,     ///< Building a local container
    transferring,  ///< Bytes on the wire
    verifying,     ///< Extraction and checksum checks
    complete,      ///< Unit or run finished successfully
    error          ///< Unit or run failed
};

[[nodiscard]] constexpr const char* to_string(transfer_phase phase) noexcept {
    switch (phase) {
        case transfer_phase::preparing: return "preparing";
        case transfer_phase::archiving: return "archiving";
        case transfer_phase::transferring: return "transferring";
        case transfer_phase::verifying: return "verifying";
        case transfer_phase::complete: return "complete";
        case transfer_phase::error: return "error";
        default: return "unknown";
    }
}

/**
 * @brief Immutable progress notification
 */
struct progress_event {
    transfer_phase phase{transfer_phase::preparing};
    std::size_t current{0};             ///< Units finished so far
    std::size_t total{0};               ///< Units scheduled
    std::string message;
    std::string unit_id;                ///< Empty for run-level events
    bool success{true};
    std::vector<std::string> errors;    ///< Errors accumulated so far
};

/// Callback receiving progress events; invocations are serialized
using progress_sink = std::function<void(const progress_event&)>;

/**
 * @brief Serializes sink invocations coming from many workers
 */
class progress_reporter {
public:
    explicit progress_reporter(progress_sink sink) : sink_(std::move(sink)) {}

    void emit(const progress_event& event) {
        if (!sink_) {
            return;
        }
        std::lock_guard lock(mutex_);
        sink_(event);
    }

    [[nodiscard]] bool enabled() const noexcept { return static_cast<bool>(sink_); }

private:
    progress_sink sink_;
    std::mutex mutex_;
};

// =============================================================================
// Cancellation
// =============================================================================

/**
 * @brief Caller-owned flag that stops scheduling of new units
 *
 * In-flight units run to completion.
 */
class cancellation_token {
public:
    void cancel() noexcept { cancelled_->store(true); }

    [[nodiscard]] bool is_cancelled() const noexcept { return cancelled_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_{std::make_shared<std::atomic<bool>>(false)};
};

// =============================================================================
// Transfer Units
// =============================================================================

enum class unit_status {
    pending,
    in_flight,
    succeeded,
    failed
};

[[nodiscard]] constexpr const char* to_string(unit_status status) noexcept {
    switch (status) {
        case unit_status::pending: return "pending";
        case unit_status::in_flight: return "in_flight";
        case unit_status::succeeded: return "succeeded";
        case unit_status::failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Smallest schedulable piece of work: a file, a batch or a scan
 */
struct transfer_unit {
    std::string id;
    std::vector<std::filesystem::path> sources;   ///< Upload inputs, in order
    std::filesystem::path target;                 ///< Download destination
    std::uint64_t size_bytes{0};                  ///< Best effort
    unit_status status{unit_status::pending};
    std::optional<error_info> last_error;

    void mark_succeeded() {
        status = unit_status::succeeded;
        last_error.reset();
    }

    void mark_failed(error_info err) {
        status = unit_status::failed;
        last_error = std::move(err);
    }
};

// =============================================================================
// Summary
// =============================================================================

/**
 * @brief One failed unit
 */
struct unit_error {
    std::string unit_id;
    std::string message;
    int code{0};
};

/**
 * @brief Final accounting of one coordinator run
 *
 * Invariant: succeeded + failed == total. Units excluded by a resume set
 * are counted in skipped, not in total.
 */
struct transfer_summary {
    std::size_t total{0};
    std::size_t succeeded{0};
    std::size_t failed{0};
    std::size_t skipped{0};
    std::uint64_t bytes_transferred{0};
    std::chrono::milliseconds elapsed{0};
    std::vector<unit_error> errors;
    std::vector<std::string> succeeded_ids;

    [[nodiscard]] bool all_succeeded() const noexcept { return failed == 0; }

    /**
     * @brief Build the summary from final unit states
     */
    [[nodiscard]] static auto from_units(const std::vector<transfer_unit>& units,
                                         std::chrono::milliseconds elapsed)
        -> transfer_summary;
};

/**
 * @brief "message: details" for logs and summaries
 */
[[nodiscard]] auto describe(const error_info& err) -> std::string;

}  // namespace xnat::transfer
