/**
 * @file prearchive_types.hpp
 * @brief Staged sessions awaiting archival and their lifecycle states
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace xnat::prearchive {

// =============================================================================
// Status
// =============================================================================

/**
 * @brief Lifecycle state of a staged session
 *
 *   receiving -> ready -> archiving -> archived
 *   receiving | ready | error -> deleted
 */
enum class prearchive_status {
    receiving,  ///< Files still arriving or being rebuilt
    ready,      ///< Complete; may be archived, moved or deleted
    archiving,  ///< Commit in progress on the server
    archived,   ///< Terminal: moved into the archive
    deleted,    ///< Terminal: removed from the prearchive
    error       ///< Server reported ERROR or CONFLICT
};

[[nodiscard]] constexpr const char* to_string(prearchive_status status) noexcept {
    switch (status) {
        case prearchive_status::receiving: return "receiving";
        case prearchive_status::ready: return "ready";
        case prearchive_status::archiving: return "archiving";
        case prearchive_status::archived: return "archived";
        case prearchive_status::deleted: return "deleted";
        case prearchive_status::error: return "error";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr bool is_terminal(prearchive_status status) noexcept {
    return status == prearchive_status::archived || status == prearchive_status::deleted;
}

/**
 * @brief Map a server status (READY, RECEIVING, BUILDING, QUEUED_*,
 *        ARCHIVING, ERROR, CONFLICT, ...) to a lifecycle state
 *
 * Unknown values map to receiving, which allows neither archive nor move.
 */
[[nodiscard]] auto prearchive_status_from_server(std::string_view status) -> prearchive_status;

// =============================================================================
// Actions
// =============================================================================

enum class prearchive_action {
    archive,
    remove,
    move,
    refresh,
    rebuild
};

[[nodiscard]] constexpr const char* to_string(prearchive_action action) noexcept {
    switch (action) {
        case prearchive_action::archive: return "archive";
        case prearchive_action::remove: return "delete";
        case prearchive_action::move: return "move";
        case prearchive_action::refresh: return "refresh";
        case prearchive_action::rebuild: return "rebuild";
        default: return "unknown";
    }
}

/**
 * @brief Whether @p action may be requested for an entry in @p status
 */
[[nodiscard]] constexpr bool is_allowed(prearchive_action action,
                                        prearchive_status status) noexcept {
    switch (action) {
        case prearchive_action::archive:
        case prearchive_action::move:
            return status == prearchive_status::ready;
        case prearchive_action::remove:
            return status == prearchive_status::ready ||
                   status == prearchive_status::receiving ||
                   status == prearchive_status::error;
        case prearchive_action::rebuild:
            return status == prearchive_status::ready || status == prearchive_status::error;
        case prearchive_action::refresh:
            return !is_terminal(status);
        default:
            return false;
    }
}

// =============================================================================
// Entry
// =============================================================================

/**
 * @brief One staged session, identified by (project, timestamp, name)
 */
struct prearchive_entry {
    std::string project;
    std::string timestamp;
    std::string name;
    prearchive_status status{prearchive_status::receiving};

    std::string subject;
    std::string folder_name;
    std::string uploaded;
    std::size_t scan_count{0};
    std::string url;

    /**
     * @brief "project/timestamp/name"
     */
    [[nodiscard]] auto key() const -> std::string {
        return project + "/" + timestamp + "/" + name;
    }

    /**
     * @brief Parse one record of a prearchive listing
     */
    [[nodiscard]] static auto from_json(const nlohmann::json& record) -> prearchive_entry;
};

}  // namespace xnat::prearchive
