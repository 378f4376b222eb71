/**
 * @file prearchive_reconciler.cpp
 * @brief Implementation of the prearchive state machine
 */

#include <xnat/prearchive/prearchive_reconciler.hpp>
#include <xnat/client/pagination.hpp>
#include <xnat/compat/format.hpp>

#include <utility>

namespace xnat::prearchive {

namespace {

constexpr const char* prearchive_root = "/data/prearchive/projects";

}  // namespace

prearchive_reconciler::prearchive_reconciler(client::session_client& client,
                                             std::shared_ptr<di::ILogger> logger)
    : client_(&client), logger_(logger ? std::move(logger) : client.logger()) {}

auto prearchive_reconciler::entry_path(const prearchive_entry& entry) -> std::string {
    return std::string(prearchive_root) + "/" + http::url_encode(entry.project) + "/" +
           http::url_encode(entry.timestamp) + "/" + http::url_encode(entry.name);
}

auto prearchive_reconciler::check(prearchive_action action,
                                  const prearchive_entry& entry) const -> VoidResult {
    if (entry.project.empty() || entry.timestamp.empty() || entry.name.empty()) {
        return xnat_void_error(error_codes::validation_failed,
                               "Prearchive entry needs project, timestamp and name",
                               entry.key());
    }
    if (!is_allowed(action, entry.status)) {
        return xnat_void_error(
            error_codes::invalid_state_transition,
            compat::format("Cannot {} prearchive entry in state {}", to_string(action),
                           to_string(entry.status)),
            entry.key());
    }
    return ok();
}

// =============================================================================
// Transitions
// =============================================================================

auto prearchive_reconciler::archive(const prearchive_entry& entry,
                                    const archive_request& request)
    -> Result<prearchive_entry> {
    auto allowed = check(prearchive_action::archive, entry);
    if (allowed.is_err()) {
        return forward_error<prearchive_entry>(allowed.error());
    }

    http::query_params params{{"action", "commit"}, {"SOURCE", "prearchive"}};
    if (request.subject) {
        params.emplace_back("subject", *request.subject);
    }
    if (request.label) {
        params.emplace_back("label", *request.label);
    }
    if (request.overwrite) {
        params.emplace_back("overwrite", "delete");
    }

    logger_->info_fmt("Archiving prearchive entry {}", entry.key());
    auto response = client_->post(entry_path(entry), std::move(params));
    if (response.is_err()) {
        logger_->error_fmt("Archive of {} failed: {}", entry.key(), response.error().message);
        return forward_error<prearchive_entry>(response.error());
    }

    prearchive_entry archived = entry;
    archived.status = prearchive_status::archived;
    if (request.subject) {
        archived.subject = *request.subject;
    }
    return ok(std::move(archived));
}

auto prearchive_reconciler::remove(const prearchive_entry& entry) -> Result<prearchive_entry> {
    auto allowed = check(prearchive_action::remove, entry);
    if (allowed.is_err()) {
        return forward_error<prearchive_entry>(allowed.error());
    }

    logger_->info_fmt("Deleting prearchive entry {}", entry.key());
    auto response = client_->del(entry_path(entry));
    if (response.is_err()) {
        return forward_error<prearchive_entry>(response.error());
    }

    prearchive_entry deleted = entry;
    deleted.status = prearchive_status::deleted;
    return ok(std::move(deleted));
}

auto prearchive_reconciler::move(const prearchive_entry& entry,
                                 const std::string& target_project)
    -> Result<prearchive_entry> {
    auto allowed = check(prearchive_action::move, entry);
    if (allowed.is_err()) {
        return forward_error<prearchive_entry>(allowed.error());
    }
    if (target_project.empty()) {
        return xnat_error<prearchive_entry>(error_codes::validation_failed,
                                            "Move requires a target project", entry.key());
    }
    if (target_project == entry.project) {
        return xnat_error<prearchive_entry>(error_codes::validation_failed,
                                            "Entry already belongs to project " +
                                                target_project,
                                            entry.key());
    }

    logger_->info_fmt("Moving prearchive entry {} to {}", entry.key(), target_project);
    auto response = client_->post(entry_path(entry),
                                  {{"action", "move"}, {"newProject", target_project}});
    if (response.is_err()) {
        return forward_error<prearchive_entry>(response.error());
    }

    prearchive_entry moved = entry;
    moved.project = target_project;
    moved.url.clear();
    return ok(std::move(moved));
}

auto prearchive_reconciler::rebuild(const prearchive_entry& entry) -> Result<prearchive_entry> {
    auto allowed = check(prearchive_action::rebuild, entry);
    if (allowed.is_err()) {
        return forward_error<prearchive_entry>(allowed.error());
    }

    logger_->info_fmt("Rebuilding prearchive entry {}", entry.key());
    auto response = client_->post(entry_path(entry), {{"action", "rebuild"}});
    if (response.is_err()) {
        return forward_error<prearchive_entry>(response.error());
    }

    prearchive_entry rebuilding = entry;
    rebuilding.status = prearchive_status::receiving;
    return ok(std::move(rebuilding));
}

// =============================================================================
// Queries
// =============================================================================

auto prearchive_reconciler::refresh(const prearchive_entry& entry) -> Result<prearchive_entry> {
    auto allowed = check(prearchive_action::refresh, entry);
    if (allowed.is_err()) {
        return forward_error<prearchive_entry>(allowed.error());
    }

    auto body = client_->get_json(entry_path(entry));
    if (body.is_err()) {
        return forward_error<prearchive_entry>(body.error());
    }

    const auto records = client::extract_records(body.value(), "ResultSet.Result");
    const nlohmann::json* record = nullptr;
    if (!records.empty() && records[0].is_object()) {
        record = &records[0];
    } else if (body.value().is_object() && body.value().contains("status")) {
        record = &body.value();
    }
    if (record == nullptr) {
        return xnat_error<prearchive_entry>(error_codes::request_failed,
                                            "Prearchive entry response has no record",
                                            entry.key());
    }

    auto fresh = prearchive_entry::from_json(*record);
    // Identity is the one asked for, whatever the record repeats
    fresh.project = entry.project;
    fresh.timestamp = entry.timestamp;
    fresh.name = entry.name;
    logger_->debug_fmt("Prearchive entry {} is {}", entry.key(), to_string(fresh.status));
    return ok(std::move(fresh));
}

auto prearchive_reconciler::list(const std::optional<std::string>& project)
    -> Result<std::vector<prearchive_entry>> {
    std::string path = prearchive_root;
    if (project && !project->empty()) {
        path += "/" + http::url_encode(*project);
    }

    auto listing = client_->paginate(path);
    auto records = listing.collect_all();
    if (records.is_err()) {
        return forward_error<std::vector<prearchive_entry>>(records.error());
    }

    std::vector<prearchive_entry> entries;
    entries.reserve(records.value().size());
    for (const auto& record : records.value()) {
        if (record.is_object()) {
            entries.push_back(prearchive_entry::from_json(record));
        }
    }
    return ok(std::move(entries));
}

auto prearchive_reconciler::scans(const prearchive_entry& entry)
    -> Result<std::vector<nlohmann::json>> {
    auto allowed = check(prearchive_action::refresh, entry);
    if (allowed.is_err()) {
        return forward_error<std::vector<nlohmann::json>>(allowed.error());
    }

    auto body = client_->get_json(entry_path(entry) + "/scans");
    if (body.is_err()) {
        return forward_error<std::vector<nlohmann::json>>(body.error());
    }
    auto records = client::extract_records(body.value(), "ResultSet.Result");
    return ok(records.get<std::vector<nlohmann::json>>());
}

}  // namespace xnat::prearchive
