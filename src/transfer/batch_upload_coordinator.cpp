/**
 * @file batch_upload_coordinator.cpp
 * @brief Implementation of the archive-per-batch uploader
 */

#include <xnat/transfer/batch_upload_coordinator.hpp>
#include <xnat/transfer/task_runner.hpp>

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <mutex>
#include <system_error>

namespace fs = std::filesystem;

namespace xnat::transfer {

namespace {

constexpr const char* import_path = "/data/services/import";

auto bool_param(bool value) -> std::string {
    return value ? "true" : "false";
}

/**
 * @brief Counters shared by all batch tasks of one run
 */
struct run_tracker {
    explicit run_tracker(progress_sink sink, std::size_t total)
        : reporter(std::move(sink)), total(total) {}

    progress_reporter reporter;
    std::size_t total;
    std::mutex mutex;
    std::size_t completed{0};
    std::vector<std::string> errors;

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

    void finish(const std::string& unit_id, const std::optional<error_info>& failure) {
        progress_event event;
        {
            std::lock_guard lock(mutex);
            ++completed;
            if (failure) {
                errors.push_back(unit_id + ": " + describe(*failure));
            }
            event.current = completed;
            event.errors = errors;
        }
        if (!reporter.enabled()) {
            return;
        }
        event.phase = failure ? transfer_phase::error : transfer_phase::complete;
        event.total = total;
        event.unit_id = unit_id;
        event.success = !failure;
        event.message = failure ? describe(*failure) : unit_id + " uploaded";
        reporter.emit(event);
    }
};

}  // namespace

batch_upload_coordinator::batch_upload_coordinator(
    client::session_client& client,
    std::shared_ptr<integration::thread_pool_interface> pool,
    std::shared_ptr<di::ILogger> logger)
    : client_(&client),
      pool_(std::move(pool)),
      logger_(logger ? std::move(logger) : client.logger()) {}

// =============================================================================
// Planning
// =============================================================================

auto batch_upload_coordinator::plan_batches(const std::vector<fs::path>& files,
                                            std::size_t workers)
    -> std::vector<transfer_unit> {
    std::vector<transfer_unit> units;
    auto slices = partition_contiguous(files, workers);
    units.reserve(slices.size());
    for (std::size_t i = 0; i < slices.size(); ++i) {
        transfer_unit unit;
        unit.id = "batch_" + std::to_string(i + 1);
        unit.size_bytes = total_size(slices[i]);
        unit.sources = std::move(slices[i]);
        units.push_back(std::move(unit));
    }
    return units;
}

auto batch_upload_coordinator::import_params(const batch_upload_options& options)
    -> http::query_params {
    const auto& dest = options.destination;
    return {
        {"import-handler", options.import_handler},
        {"Ignore-Unparsable", bool_param(options.ignore_unparsable)},
        {"project", dest.project},
        {"subject", dest.subject},
        {"session", dest.session},
        {"overwrite", to_string(options.overwrite)},
        {"overwrite_files", "true"},
        {"quarantine", "false"},
        {"triggerPipelines", "true"},
        {"rename", "false"},
        {"Direct-Archive", bool_param(options.direct_archive)},
        {"inbody", "true"},
    };
}

// =============================================================================
// Entry Points
// =============================================================================

auto batch_upload_coordinator::upload_directory(const fs::path& source,
                                                const batch_upload_options& options)
    -> Result<transfer_summary> {
    auto files = collect_files(source, options.filter);
    if (files.is_err()) {
        return forward_error<transfer_summary>(files.error());
    }
    if (files.value().empty()) {
        return xnat_error<transfer_summary>(error_codes::validation_failed,
                                            "No files to upload", source.string());
    }
    logger_->info_fmt("Found {} files under {}", files.value().size(), source.string());
    return upload_files(files.value(), source, options);
}

auto batch_upload_coordinator::upload_files(const std::vector<fs::path>& files,
                                            const fs::path& base_dir,
                                            const batch_upload_options& options)
    -> Result<transfer_summary> {
    if (files.empty()) {
        return xnat_error<transfer_summary>(error_codes::validation_failed,
                                            "No files to upload");
    }
    if (options.destination.project.empty()) {
        return xnat_error<transfer_summary>(error_codes::validation_failed,
                                            "Upload requires a project");
    }

    if (!client_->is_authenticated()) {
        auto auth = client_->authenticate();
        if (auth.is_err()) {
            return forward_error<transfer_summary>(auth.error());
        }
    }

    auto workspace = scoped_temp_directory::create("xnat_upload_");
    if (workspace.is_err()) {
        return forward_error<transfer_summary>(workspace.error());
    }
    const fs::path archive_dir = workspace.value()->path();

    const auto started = std::chrono::steady_clock::now();
    auto units = plan_batches(files, options.workers);
    const auto params = import_params(options);

    logger_->info_fmt("Uploading {} files in {} {} batches to {}/{}/{}",
                      files.size(), units.size(), to_string(options.format),
                      options.destination.project, options.destination.subject,
                      options.destination.session);

    run_tracker tracker(options.on_progress, units.size());
    tracker.report(transfer_phase::preparing, {},
                   "Prepared " + std::to_string(units.size()) + " batches");

    std::vector<client::session_client> handles;
    handles.reserve(units.size());
    for (std::size_t i = 0; i < units.size(); ++i) {
        handles.push_back(client_->fork());
    }

    std::vector<std::function<void()>> tasks;
    tasks.reserve(units.size());
    for (std::size_t i = 0; i < units.size(); ++i) {
        tasks.emplace_back([&, i]() {
            auto& unit = units[i];
            auto& handle = handles[i];

            if (options.cancel.is_cancelled()) {
                unit.mark_failed(error_info{error_codes::operation_cancelled,
                                            "cancelled", "xnat"});
                tracker.finish(unit.id, unit.last_error);
                return;
            }
            unit.status = unit_status::in_flight;

            const auto archive_path =
                archive_dir / (unit.id + file_extension(options.format));

            tracker.report(transfer_phase::archiving, unit.id,
                           "Archiving " + std::to_string(unit.sources.size()) + " files");
            auto built = build_archive(unit.sources, base_dir, archive_path, options.format);
            if (built.is_err()) {
                logger_->error_fmt("{} archive failed: {}", unit.id, describe(built.error()));
                unit.mark_failed(built.error());
                tracker.finish(unit.id, unit.last_error);
                return;
            }

            tracker.report(transfer_phase::transferring, unit.id,
                           "Uploading " + std::to_string(built.value()) + " bytes");

            client::request_options request;
            request.method = http::http_method::post;
            request.path = import_path;
            request.params = params;
            request.body_file = archive_path;
            request.content_type = content_type(options.format);
            auto response = handle.request(request);

            std::error_code ec;
            fs::remove(archive_path, ec);
            handle.close();

            if (response.is_err()) {
                logger_->error_fmt("{} upload failed: {}", unit.id, describe(response.error()));
                unit.mark_failed(response.error());
            } else {
                logger_->debug_fmt("{} uploaded ({} files)", unit.id, unit.sources.size());
                unit.mark_succeeded();
            }
            tracker.finish(unit.id, unit.last_error);
        });
    }

    {
        pool_lease lease(pool_, options.workers, "xnat_batch_upload");
        auto failures = run_tasks(lease.pool(), std::move(tasks));
        for (const auto& failure : failures) {
            auto& unit = units[failure.index];
            if (unit.status != unit_status::succeeded) {
                unit.mark_failed(error_info{error_codes::transport_error,
                                            "Batch task aborted", "xnat", failure.message});
            }
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    auto summary = transfer_summary::from_units(units, elapsed);

    logger_->info_fmt("Batch upload finished: {}/{} succeeded, {} failed",
                      summary.succeeded, summary.total, summary.failed);

    progress_event done;
    done.phase = summary.all_succeeded() ? transfer_phase::complete : transfer_phase::error;
    done.current = summary.succeeded + summary.failed;
    done.total = summary.total;
    done.success = summary.all_succeeded();
    done.message = "Uploaded " + std::to_string(summary.succeeded) + "/" +
                   std::to_string(summary.total) + " batches";
    for (const auto& err : summary.errors) {
        done.errors.push_back(err.unit_id + ": " + err.message);
    }
    tracker.reporter.emit(done);

    return ok(std::move(summary));
}

}  // namespace xnat::transfer
