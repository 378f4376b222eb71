/**
 * @file prearchive_reconciler.hpp
 * @brief Client-side state machine over staged prearchive sessions
 *
 * Every transition is checked locally first; an action not allowed in the
 * entry's current state fails with invalid_state_transition and no
 * request is sent. Allowed actions are confirmed by the server before the
 * new state is returned. No entry state is cached between calls.
 */

#pragma once

#include <xnat/client/session_client.hpp>
#include <xnat/core/result.hpp>
#include <xnat/di/ilogger.hpp>
#include <xnat/prearchive/prearchive_types.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace xnat::prearchive {

/**
 * @brief Optional parameters of a commit into the archive
 */
struct archive_request {
    std::optional<std::string> subject;
    std::optional<std::string> label;
    bool overwrite{false};  ///< Sends overwrite=delete
};

class prearchive_reconciler {
public:
    explicit prearchive_reconciler(client::session_client& client,
                                   std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Commit a ready entry into the archive
     * @return The entry in state archived
     */
    [[nodiscard]] auto archive(const prearchive_entry& entry,
                               const archive_request& request = {})
        -> Result<prearchive_entry>;

    /**
     * @brief Delete a ready, receiving or errored entry
     * @return The entry in state deleted
     */
    [[nodiscard]] auto remove(const prearchive_entry& entry) -> Result<prearchive_entry>;

    /**
     * @brief Move a ready entry to @p target_project
     * @return The entry under its new project, same timestamp and name
     */
    [[nodiscard]] auto move(const prearchive_entry& entry, const std::string& target_project)
        -> Result<prearchive_entry>;

    /**
     * @brief Re-read a non-terminal entry from the server
     */
    [[nodiscard]] auto refresh(const prearchive_entry& entry) -> Result<prearchive_entry>;

    /**
     * @brief Ask the server to rebuild a ready or errored entry
     * @return The entry in state receiving
     */
    [[nodiscard]] auto rebuild(const prearchive_entry& entry) -> Result<prearchive_entry>;

    /**
     * @brief Staged entries of @p project, or of every project
     */
    [[nodiscard]] auto list(const std::optional<std::string>& project = std::nullopt)
        -> Result<std::vector<prearchive_entry>>;

    /**
     * @brief Scan records of a non-terminal entry
     */
    [[nodiscard]] auto scans(const prearchive_entry& entry)
        -> Result<std::vector<nlohmann::json>>;

    [[nodiscard]] static auto entry_path(const prearchive_entry& entry) -> std::string;

private:
    client::session_client* client_;
    std::shared_ptr<di::ILogger> logger_;

    [[nodiscard]] auto check(prearchive_action action, const prearchive_entry& entry) const
        -> VoidResult;
};

}  // namespace xnat::prearchive
