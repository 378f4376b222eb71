/**
 * @file parallel_download_coordinator.cpp
 * @brief Implementation of the session download coordinator
 */

#include <xnat/transfer/parallel_download_coordinator.hpp>
#include <xnat/client/pagination.hpp>
#include <xnat/transfer/archive_builder.hpp>
#include <xnat/transfer/checksum.hpp>
#include <xnat/transfer/task_runner.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace xnat::transfer {

namespace {

auto experiment_path(const std::string& experiment_id) -> std::string {
    return "/data/experiments/" + http::url_encode(experiment_id);
}

/**
 * @brief String form of a listing field that may be a string or a number
 */
auto json_text(const json& record, const char* key) -> std::string {
    auto it = record.find(key);
    if (it == record.end() || it->is_null()) {
        return {};
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number_integer()) {
        return std::to_string(it->get<long long>());
    }
    return it->dump();
}

auto json_count(const json& record, const char* key) -> std::uint64_t {
    auto it = record.find(key);
    if (it == record.end()) {
        return 0;
    }
    if (it->is_number_unsigned() || it->is_number_integer()) {
        auto value = it->get<long long>();
        return value > 0 ? static_cast<std::uint64_t>(value) : 0;
    }
    if (it->is_number_float()) {
        auto value = it->get<double>();
        return value > 0 ? static_cast<std::uint64_t>(value) : 0;
    }
    if (it->is_string()) {
        const auto text = it->get<std::string>();
        std::uint64_t value = 0;
        for (char c : text) {
            if (c < '0' || c > '9') {
                break;
            }
            value = value * 10 + static_cast<std::uint64_t>(c - '0');
        }
        return value;
    }
    return 0;
}

auto split_segments(const std::string& entry) -> std::vector<std::string> {
    std::vector<std::string> parts;
    std::string current;
    for (char c : entry) {
        if (c == '/' || c == '\\') {
            if (!current.empty()) {
                parts.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty()) {
        parts.push_back(std::move(current));
    }
    return parts;
}

bool is_directory_entry(const std::string& entry) {
    return entry.empty() || entry.back() == '/';
}

/**
 * @brief Append "resources/<label>/files/<rest>" found at or after @p from
 *
 * Without a resources segment the file keeps its path below @p from.
 */
auto append_resource_tail(fs::path out, const std::vector<std::string>& parts,
                          std::size_t from, const std::string& fallback_label) -> fs::path {
    std::size_t res = parts.size();
    for (std::size_t i = from; i + 2 < parts.size(); ++i) {
        if (parts[i] == "resources") {
            res = i;
            break;
        }
    }

    std::size_t rest = from;
    std::string label = fallback_label;
    if (res < parts.size()) {
        label = parts[res + 1];
        rest = res + 2;
        if (rest < parts.size() && parts[rest] == "files") {
            ++rest;
        }
    }
    if (!label.empty()) {
        out /= "resources";
        out /= label;
        out /= "files";
    }
    for (std::size_t i = rest; i < parts.size(); ++i) {
        out /= parts[i];
    }
    return out;
}

/**
 * @brief Preconditions checked before any network call
 */
auto check_request(const std::string& session, const download_options& options) -> VoidResult {
    if (session.empty()) {
        return xnat_void_error(error_codes::validation_failed, "Session identifier is required");
    }
    if (options.output_dir.empty()) {
        return xnat_void_error(error_codes::validation_failed, "Output directory is required");
    }
    return ok();
}

/**
 * @brief Server digests keyed by file name
 */
using digest_map = std::map<std::string, std::string>;

/**
 * @brief Counters shared by the download tasks of one run
 */
struct download_tracker {
    download_tracker(progress_sink sink, std::size_t total)
        : reporter(std::move(sink)), total(total) {}

    progress_reporter reporter;
    std::size_t total;
    std::mutex mutex;
    std::size_t completed{0};
    std::size_t files_extracted{0};
    std::vector<std::string> errors;
    std::vector<std::string> verification_failures;

    void report(transfer_phase phase, const std::string& unit_id, std::string message) {
        if (!reporter.enabled()) {
            return;
        }
        progress_event event;
        {
            std::lock_guard lock(mutex);
            event.current = completed;
            event.errors = errors;
        }
        event.phase = phase;
        event.total = total;
        event.unit_id = unit_id;
        event.message = std::move(message);
        reporter.emit(event);
    }

    void finish(const transfer_unit& unit) {
        progress_event event;
        {
            std::lock_guard lock(mutex);
            ++completed;
            if (unit.last_error) {
                errors.push_back(unit.id + ": " + describe(*unit.last_error));
            }
            event.current = completed;
            event.errors = errors;
        }
        if (!reporter.enabled()) {
            return;
        }
        const bool ok = unit.status == unit_status::succeeded;
        event.phase = ok ? transfer_phase::complete : transfer_phase::error;
        event.total = total;
        event.unit_id = unit.id;
        event.success = ok;
        event.message = ok ? unit.id + " downloaded" : describe(*unit.last_error);
        reporter.emit(event);
    }
};

}  // namespace

// =============================================================================
// download_plan
// =============================================================================

auto download_plan::total_files() const noexcept -> std::size_t {
    std::size_t total = 0;
    for (const auto& item : items) {
        total += item.file_count;
    }
    return total;
}

auto download_plan::total_bytes() const noexcept -> std::uint64_t {
    std::uint64_t total = 0;
    for (const auto& item : items) {
        total += item.size_bytes;
    }
    return total;
}

// =============================================================================
// Construction & Entry Mapping
// =============================================================================

parallel_download_coordinator::parallel_download_coordinator(
    client::session_client& client,
    std::shared_ptr<integration::thread_pool_interface> pool,
    std::shared_ptr<di::ILogger> logger)
    : client_(&client),
      pool_(std::move(pool)),
      logger_(logger ? std::move(logger) : client.logger()) {}

auto parallel_download_coordinator::map_scan_entry(const std::string& entry,
                                                   std::string_view scan_id)
    -> std::optional<fs::path> {
    if (is_directory_entry(entry)) {
        return std::nullopt;
    }
    auto parts = split_segments(entry);
    if (parts.empty()) {
        return std::nullopt;
    }

    for (std::size_t i = 0; i + 2 < parts.size(); ++i) {
        if (parts[i] != "scans") {
            continue;
        }
        const auto& folder = parts[i + 1];
        std::string id(scan_id);
        if (id.empty()) {
            id = folder.substr(0, folder.find('-'));
        }
        if (id.empty()) {
            id = folder;
        }
        return append_resource_tail(fs::path("scans") / id, parts, i + 2, {});
    }

    if (!scan_id.empty()) {
        return append_resource_tail(fs::path("scans") / std::string(scan_id), parts, 0, {});
    }
    fs::path out;
    for (const auto& part : parts) {
        out /= part;
    }
    return out;
}

auto parallel_download_coordinator::map_resource_entry(const std::string& entry,
                                                       const std::string& label)
    -> std::optional<fs::path> {
    if (is_directory_entry(entry)) {
        return std::nullopt;
    }
    auto parts = split_segments(entry);
    if (parts.empty()) {
        return std::nullopt;
    }

    for (std::size_t i = 0; i + 2 < parts.size(); ++i) {
        if (parts[i] == "resources") {
            return append_resource_tail(fs::path{}, parts, i, label);
        }
    }
    // Flat archive: keep only the file name
    return fs::path("resources") / label / "files" / parts.back();
}

// =============================================================================
// Resolution & Planning
// =============================================================================

auto parallel_download_coordinator::resolve_experiment_id(
    const std::string& session, const std::optional<std::string>& project)
    -> Result<std::string> {
    if (session.empty()) {
        return xnat_error<std::string>(error_codes::validation_failed,
                                       "Session identifier is required");
    }
    if (!project || project->empty() || session.rfind("XNAT_E", 0) == 0) {
        return ok(session);
    }

    const auto path = "/data/projects/" + http::url_encode(*project) + "/experiments/" +
                      http::url_encode(session);
    auto body = client_->get_json(path);
    if (body.is_err()) {
        if (body.error().code == error_codes::request_failed &&
            body.error().message.rfind("HTTP 404", 0) == 0) {
            return xnat_error<std::string>(
                error_codes::validation_failed,
                "Session '" + session + "' not found in project '" + *project + "'");
        }
        return forward_error<std::string>(body.error());
    }

    const auto& data = body.value();
    std::string id;
    if (data.contains("items") && data["items"].is_array() && !data["items"].empty()) {
        const auto& first = data["items"][0];
        if (first.contains("data_fields") && first["data_fields"].is_object()) {
            id = json_text(first["data_fields"], "ID");
        }
    }
    if (id.empty()) {
        auto records = client::extract_records(data, "ResultSet.Result");
        if (!records.empty() && records[0].is_object()) {
            id = json_text(records[0], "ID");
        }
    }
    if (id.empty()) {
        return xnat_error<std::string>(
            error_codes::validation_failed,
            "Session '" + session + "' not found in project '" + *project + "'");
    }
    logger_->debug_fmt("Resolved session {} to {}", session, id);
    return ok(std::move(id));
}

auto parallel_download_coordinator::plan(const std::string& session,
                                         const download_options& options)
    -> Result<download_plan> {
    auto checked = check_request(session, options);
    if (checked.is_err()) {
        return forward_error<download_plan>(checked.error());
    }

    auto resolved = resolve_experiment_id(session, options.project);
    if (resolved.is_err()) {
        return forward_error<download_plan>(resolved.error());
    }

    download_plan result;
    result.session = session;
    result.experiment_id = resolved.value();
    result.session_dir = options.output_dir / options.session_dir_name.value_or(session);

    const auto base = experiment_path(result.experiment_id);

    // Scans
    auto listing = client_->paginate(base + "/scans");
    auto records = listing.collect_all();
    if (records.is_err()) {
        return forward_error<download_plan>(records.error());
    }

    std::vector<std::string> available;
    for (const auto& record : records.value()) {
        auto id = json_text(record, "ID");
        if (!id.empty()) {
            available.push_back(std::move(id));
        }
    }

    std::vector<std::string> selected;
    if (options.scan_ids.empty()) {
        selected = available;
    } else {
        for (const auto& wanted : options.scan_ids) {
            if (std::find(available.begin(), available.end(), wanted) == available.end()) {
                return xnat_error<download_plan>(error_codes::validation_failed,
                                                 "Unknown scan in session " + session, wanted);
            }
            selected.push_back(wanted);
        }
    }

    std::vector<planned_download> scan_items;
    for (const auto& id : selected) {
        planned_download item;
        item.unit_id = "scan_" + id;
        item.kind = download_kind::scan;
        item.label = id;
        item.remote_path = base + "/scans/" + http::url_encode(id) + "/files";
        if (options.dry_run) {
            auto resources = client_->get_json(base + "/scans/" + http::url_encode(id) +
                                               "/resources");
            if (resources.is_err()) {
                return forward_error<download_plan>(resources.error());
            }
            for (const auto& res : client::extract_records(resources.value(),
                                                           "ResultSet.Result")) {
                item.file_count += json_count(res, "file_count");
                item.size_bytes += json_count(res, "file_size");
            }
        }
        scan_items.push_back(std::move(item));
    }

    if (options.workers <= 1 && !scan_items.empty()) {
        planned_download combined;
        combined.unit_id = "scans";
        combined.kind = download_kind::combined;
        std::string scan_list;
        if (options.scan_ids.empty()) {
            combined.label = "ALL";
            scan_list = "ALL";
        } else {
            for (const auto& id : selected) {
                combined.label += (combined.label.empty() ? "" : ",") + id;
                scan_list += (scan_list.empty() ? "" : ",") + http::url_encode(id);
            }
        }
        combined.remote_path = base + "/scans/" + scan_list + "/files";
        for (const auto& item : scan_items) {
            combined.file_count += item.file_count;
            combined.size_bytes += item.size_bytes;
        }
        result.items.push_back(std::move(combined));
    } else {
        for (auto& item : scan_items) {
            result.items.push_back(std::move(item));
        }
    }

    // Session resources
    if (options.include_resources) {
        auto resources = client_->get_json(base + "/resources");
        if (resources.is_err()) {
            return forward_error<download_plan>(resources.error());
        }
        for (const auto& res : client::extract_records(resources.value(), "ResultSet.Result")) {
            auto label = json_text(res, "label");
            if (label.empty()) {
                continue;
            }
            planned_download item;
            item.unit_id = "resource_" + label;
            item.kind = download_kind::resource;
            item.label = label;
            item.remote_path = base + "/resources/" + http::url_encode(label) + "/files";
            item.file_count = json_count(res, "file_count");
            item.size_bytes = json_count(res, "file_size");
            result.items.push_back(std::move(item));
        }
    }

    return ok(std::move(result));
}

// =============================================================================
// Download
// =============================================================================

auto parallel_download_coordinator::download_session(const std::string& session,
                                                     const download_options& options)
    -> Result<download_result> {
    auto checked = check_request(session, options);
    if (checked.is_err()) {
        return forward_error<download_result>(checked.error());
    }

    if (!client_->is_authenticated()) {
        auto auth = client_->authenticate();
        if (auth.is_err()) {
            return forward_error<download_result>(auth.error());
        }
    }

    auto planned = plan(session, options);
    if (planned.is_err()) {
        return forward_error<download_result>(planned.error());
    }

    download_result result;
    result.plan = std::move(planned.value());
    result.dry_run = options.dry_run;
    const auto& items = result.plan.items;
    const auto session_dir = result.plan.session_dir;

    if (options.dry_run) {
        logger_->info_fmt("Dry run for {}: {} archives, ~{} files, ~{} bytes", session,
                          items.size(), result.plan.total_files(), result.plan.total_bytes());
        return ok(std::move(result));
    }

    std::error_code ec;
    fs::create_directories(session_dir, ec);
    if (ec) {
        return xnat_error<download_result>(error_codes::file_io_error,
                                           "Cannot create output directory",
                                           session_dir.string() + ": " + ec.message());
    }

    digest_map digests;
    if (options.verify) {
        if (!options.extract) {
            logger_->warn("Checksum verification needs extraction; skipping verification");
        } else {
            auto listing = client_->get_json(experiment_path(result.plan.experiment_id) +
                                             "/files");
            if (listing.is_err()) {
                return forward_error<download_result>(listing.error());
            }
            for (const auto& rec : client::extract_records(listing.value(), "ResultSet.Result")) {
                auto name = json_text(rec, "Name");
                auto digest = json_text(rec, "digest");
                if (!name.empty() && !digest.empty()) {
                    digests[name] = digest;
                }
            }
        }
    }
    const bool verify = options.verify && options.extract;

    const auto started = std::chrono::steady_clock::now();
    std::vector<transfer_unit> units(items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
        units[i].id = items[i].unit_id;
        units[i].target = session_dir / (items[i].unit_id + ".zip");
    }

    download_tracker tracker(options.on_progress, units.size());
    tracker.report(transfer_phase::preparing, {},
                   "Preparing download of " + std::to_string(units.size()) +
                       " archives for " + session);

    auto fetch = [&](client::session_client& handle, std::size_t index) {
        auto& unit = units[index];
        const auto& item = items[index];

        if (options.cancel.is_cancelled()) {
            unit.mark_failed(error_info{error_codes::operation_cancelled, "cancelled", "xnat"});
            tracker.finish(unit);
            return;
        }
        unit.status = unit_status::in_flight;
        tracker.report(transfer_phase::transferring, unit.id, "Downloading " + item.label);

        auto part = unit.target;
        part += ".part";

        client::request_options request;
        request.path = item.remote_path;
        request.params = {{"format", "zip"}};
        request.download_to = part;
        auto response = handle.request(request);

        std::error_code fs_ec;
        if (response.is_err()) {
            fs::remove(part, fs_ec);
            unit.mark_failed(response.error());
            tracker.finish(unit);
            return;
        }
        fs::rename(part, unit.target, fs_ec);
        if (fs_ec) {
            fs::remove(part, fs_ec);
            unit.mark_failed(error_info{error_codes::file_io_error,
                                        "Cannot move archive into place", "xnat",
                                        unit.target.string()});
            tracker.finish(unit);
            return;
        }
        unit.size_bytes = fs::file_size(unit.target, fs_ec);
        if (fs_ec) {
            unit.size_bytes = 0;
        }

        if (!options.extract) {
            unit.mark_succeeded();
            tracker.finish(unit);
            return;
        }

        tracker.report(transfer_phase::verifying, unit.id, "Extracting " + item.label);
        entry_mapper mapper;
        switch (item.kind) {
            case download_kind::resource:
                mapper = [label = item.label](const std::string& entry) {
                    return map_resource_entry(entry, label);
                };
                break;
            case download_kind::scan:
                mapper = [id = item.label](const std::string& entry) {
                    return map_scan_entry(entry, id);
                };
                break;
            case download_kind::combined:
            default:
                mapper = [](const std::string& entry) { return map_scan_entry(entry); };
                break;
        }

        auto extracted = extract_zip(unit.target, session_dir, mapper);
        if (extracted.is_err()) {
            unit.mark_failed(extracted.error());
            tracker.finish(unit);
            return;
        }
        {
            std::lock_guard lock(tracker.mutex);
            tracker.files_extracted += extracted.value().written.size();
        }
        if (options.cleanup) {
            fs::remove(unit.target, fs_ec);
        }

        if (verify) {
            std::vector<std::string> mismatched;
            for (const auto& file : extracted.value().written) {
                auto it = digests.find(file.filename().string());
                if (it == digests.end()) {
                    continue;
                }
                auto local = md5_file(file);
                if (local.is_err() || !digest_equals(local.value(), it->second)) {
                    mismatched.push_back(file.lexically_relative(session_dir).generic_string());
                }
            }
            if (!mismatched.empty()) {
                std::string details;
                for (const auto& name : mismatched) {
                    details += (details.empty() ? "" : ", ") + name;
                }
                {
                    std::lock_guard lock(tracker.mutex);
                    tracker.verification_failures.insert(tracker.verification_failures.end(),
                                                         mismatched.begin(), mismatched.end());
                }
                logger_->error_fmt("{}: {} file(s) failed checksum verification", unit.id,
                                   mismatched.size());
                unit.mark_failed(error_info{error_codes::verification_failed,
                                            std::to_string(mismatched.size()) +
                                                " file(s) failed checksum verification",
                                            "xnat", details});
                tracker.finish(unit);
                return;
            }
        }

        unit.mark_succeeded();
        tracker.finish(unit);
    };

    if (!units.empty()) {
        const std::size_t workers =
            std::max<std::size_t>(1, std::min(options.workers, units.size()));
        std::atomic<std::size_t> next{0};
        std::vector<client::session_client> handles;
        handles.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w) {
            handles.push_back(client_->fork());
        }

        std::vector<std::function<void()>> tasks;
        tasks.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w) {
            tasks.emplace_back([&, w]() {
                auto& handle = handles[w];
                for (auto current = next.fetch_add(1); current < units.size();
                     current = next.fetch_add(1)) {
                    fetch(handle, current);
                }
                handle.close();
            });
        }

        pool_lease lease(pool_, workers, "xnat_download");
        std::string aborted;
        for (const auto& failure : run_tasks(lease.pool(), std::move(tasks))) {
            logger_->error_fmt("Download worker {} aborted: {}", failure.index, failure.message);
            aborted = failure.message;
        }
        // Units a dead worker left behind
        for (auto& unit : units) {
            if (unit.status == unit_status::pending || unit.status == unit_status::in_flight) {
                unit.mark_failed(error_info{error_codes::transport_error,
                                            "Download task aborted", "xnat", aborted});
            }
        }
    }

    result.summary = transfer_summary::from_units(
        units, std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now() - started));
    result.files_extracted = tracker.files_extracted;
    result.verification_failures = std::move(tracker.verification_failures);
    std::sort(result.verification_failures.begin(), result.verification_failures.end());

    logger_->info_fmt("Download of {} finished: {}/{} archives, {} files extracted", session,
                      result.summary.succeeded, result.summary.total, result.files_extracted);

    progress_event done;
    done.phase = result.summary.all_succeeded() ? transfer_phase::complete
                                                : transfer_phase::error;
    done.current = result.summary.total;
    done.total = result.summary.total;
    done.success = result.summary.all_succeeded();
    done.message = "Download complete: " + std::to_string(result.files_extracted) + " files";
    for (const auto& err : result.summary.errors) {
        done.errors.push_back(err.unit_id + ": " + err.message);
    }
    tracker.reporter.emit(done);

    return ok(std::move(result));
}

}  // namespace xnat::transfer
