/**
 * @file gradual_upload_coordinator.cpp
 * @brief Implementation of the per-file gradual-DICOM uploader
 */

#include <xnat/transfer/gradual_upload_coordinator.hpp>
#include <xnat/transfer/archive_builder.hpp>
#include <xnat/transfer/file_collector.hpp>
#include <xnat/transfer/task_runner.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <functional>
#include <mutex>
#include <utility>

namespace fs = std::filesystem;

namespace xnat::transfer {

namespace {

constexpr const char* import_path = "/data/services/import";
constexpr std::size_t error_snippet_length = 200;

bool is_zip_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".zip";
}

auto display_name(const fs::path& file, const fs::path& root) -> std::string {
    if (!root.empty()) {
        auto relative = file.lexically_relative(root);
        if (!relative.empty() && *relative.begin() != "..") {
            return relative.generic_string();
        }
    }
    return file.filename().string();
}

/**
 * @brief Single-line response excerpt for error messages
 */
auto response_snippet(const std::string& body) -> std::string {
    std::string flat = body;
    std::replace(flat.begin(), flat.end(), '\n', ' ');
    std::replace(flat.begin(), flat.end(), '\r', ' ');
    auto begin = flat.find_first_not_of(' ');
    if (begin == std::string::npos) {
        return {};
    }
    auto end = flat.find_last_not_of(' ');
    flat = flat.substr(begin, end - begin + 1);
    if (flat.size() > error_snippet_length) {
        flat.resize(error_snippet_length);
    }
    return flat;
}

/**
 * @brief "relpath: HTTP 400" with the response excerpt as details
 */
auto file_error(const std::string& display, const error_info& err) -> error_info {
    error_info out = err;
    if (err.code == error_codes::request_failed) {
        out.message = display + ": " + err.message.substr(0, err.message.find(':'));
        out.details = response_snippet(err.details);
    } else {
        out.message = display + ": " + err.message;
    }
    return out;
}

/**
 * @brief Completion counters and throttled progress for one run
 */
class gradual_progress {
public:
    gradual_progress(progress_sink sink, std::size_t total, std::size_t interval)
        : reporter_(std::move(sink)), total_(total), interval_(interval) {}

    void notice(const std::string& message) {
        progress_event event;
        event.phase = transfer_phase::preparing;
        event.total = total_;
        event.message = message;
        reporter_.emit(event);
    }

    void record(const transfer_unit& unit, const std::string& display) {
        progress_event event;
        bool due = false;
        {
            std::lock_guard lock(mutex_);
            ++completed_;
            if (unit.status != unit_status::succeeded) {
                ++failed_;
            }
            due = interval_ > 0 && completed_ % interval_ == 0;
            event.current = completed_;
            event.message = "Uploaded " + std::to_string(completed_) + "/" +
                            std::to_string(total_) + " (" +
                            std::to_string(completed_ - failed_) + " ok, " +
                            std::to_string(failed_) + " failed)";
        }
        if (!due) {
            return;
        }
        event.phase = transfer_phase::transferring;
        event.total = total_;
        event.unit_id = display;
        event.success = unit.status == unit_status::succeeded;
        reporter_.emit(event);
    }

    void emit(const progress_event& event) { reporter_.emit(event); }

private:
    progress_reporter reporter_;
    std::size_t total_;
    std::size_t interval_;
    std::mutex mutex_;
    std::size_t completed_{0};
    std::size_t failed_{0};
};

}  // namespace

gradual_upload_coordinator::gradual_upload_coordinator(
    client::session_client& client,
    std::shared_ptr<integration::thread_pool_interface> pool,
    std::shared_ptr<di::ILogger> logger)
    : client_(&client),
      pool_(std::move(pool)),
      logger_(logger ? std::move(logger) : client.logger()) {}

auto gradual_upload_coordinator::import_params(const import_destination& destination)
    -> http::query_params {
    return {
        {"inbody", "true"},
        {"import-handler", "gradual-DICOM"},
        {"PROJECT_ID", destination.project},
        {"SUBJECT_ID", destination.subject},
        {"EXPT_LABEL", destination.session},
    };
}

// =============================================================================
// Source Resolution
// =============================================================================

auto gradual_upload_coordinator::upload(const fs::path& source,
                                        const gradual_upload_options& options)
    -> Result<transfer_summary> {
    collect_options all_files;
    all_files.dicom_only = false;

    std::error_code ec;
    if (fs::is_directory(source, ec)) {
        auto files = collect_files(source, all_files);
        if (files.is_err()) {
            return forward_error<transfer_summary>(files.error());
        }
        if (files.value().empty()) {
            return xnat_error<transfer_summary>(error_codes::validation_failed,
                                                "No files found to upload", source.string());
        }
        return upload_files(files.value(), source, options);
    }

    if (!is_zip_file(source)) {
        return xnat_error<transfer_summary>(error_codes::validation_failed,
                                            "Gradual upload requires a directory or ZIP file",
                                            source.string());
    }

    auto workspace = scoped_temp_directory::create("xnat_gradual_");
    if (workspace.is_err()) {
        return forward_error<transfer_summary>(workspace.error());
    }
    const auto& root = workspace.value()->path();

    auto extracted = extract_zip(source, root);
    if (extracted.is_err()) {
        return forward_error<transfer_summary>(extracted.error());
    }
    if (extracted.value().skipped > 0) {
        logger_->warn_fmt("Ignored {} unsafe entries in {}", extracted.value().skipped,
                          source.string());
    }

    auto files = collect_files(root, all_files);
    if (files.is_err()) {
        return forward_error<transfer_summary>(files.error());
    }
    if (files.value().empty()) {
        return xnat_error<transfer_summary>(error_codes::validation_failed,
                                            "No files found to upload", source.string());
    }
    // Entry paths keep unit ids stable across extractions
    const auto archive_key = canonical_key(source) + "!";
    return upload_keyed(files.value(), root,
                        [&](const fs::path& file) {
                            return archive_key + file.lexically_relative(root).generic_string();
                        },
                        options);
}

// =============================================================================
// Upload
// =============================================================================

auto gradual_upload_coordinator::upload_files(const std::vector<fs::path>& files,
                                              const fs::path& display_root,
                                              const gradual_upload_options& options)
    -> Result<transfer_summary> {
    return upload_keyed(files, display_root, canonical_key, options);
}

auto gradual_upload_coordinator::upload_keyed(const std::vector<fs::path>& files,
                                              const fs::path& display_root,
                                              const unit_key_fn& key_of,
                                              const gradual_upload_options& options)
    -> Result<transfer_summary> {
    if (files.empty()) {
        return xnat_error<transfer_summary>(error_codes::validation_failed,
                                            "No files found to upload");
    }
    if (options.destination.project.empty()) {
        return xnat_error<transfer_summary>(error_codes::validation_failed,
                                            "Upload requires a project");
    }

    std::vector<transfer_unit> units;
    std::vector<std::string> displays;
    std::set<std::string> seen;
    std::size_t skipped = 0;

    for (const auto& file : files) {
        auto key = key_of(file);
        if (!seen.insert(key).second) {
            return xnat_error<transfer_summary>(error_codes::validation_failed,
                                                "Duplicate source file", key);
        }
        if (options.already_done.count(key) != 0) {
            ++skipped;
            continue;
        }
        transfer_unit unit;
        unit.id = std::move(key);
        unit.sources.push_back(file);
        std::error_code ec;
        auto size = fs::file_size(file, ec);
        unit.size_bytes = ec ? 0 : size;
        units.push_back(std::move(unit));
        displays.push_back(display_name(file, display_root));
    }

    const auto started = std::chrono::steady_clock::now();
    auto finish = [&]() {
        auto summary = transfer_summary::from_units(
            units, std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - started));
        summary.skipped = skipped;
        return summary;
    };

    if (units.empty()) {
        logger_->info_fmt("All {} files already uploaded", skipped);
        return ok(finish());
    }

    if (!client_->is_authenticated()) {
        auto auth = client_->authenticate();
        if (auth.is_err()) {
            return forward_error<transfer_summary>(auth.error());
        }
    }

    const auto params = import_params(options.destination);
    gradual_progress progress(options.on_progress, units.size(), options.progress_interval);

    auto upload_one = [&](client::session_client& handle, std::size_t index) {
        auto& unit = units[index];
        unit.status = unit_status::in_flight;

        client::request_options request;
        request.method = http::http_method::post;
        request.path = import_path;
        request.params = params;
        request.body_file = unit.sources.front();
        request.content_type = "application/dicom";

        auto response = handle.request(request);
        if (response.is_err()) {
            unit.mark_failed(file_error(displays[index], response.error()));
            logger_->debug_fmt("{}", describe(*unit.last_error));
        } else {
            unit.mark_succeeded();
        }
    };

    logger_->info_fmt("Uploading {} files via gradual-DICOM ({} skipped)", units.size(),
                      skipped);
    progress.notice("Found " + std::to_string(units.size()) +
                    " files for gradual-DICOM upload");

    // Warm-up
    const std::size_t warmup = std::min(options.warmup_files, units.size());
    if (warmup > 0) {
        progress.notice("Warming up gradual-DICOM upload with " + std::to_string(warmup) +
                        " file(s)");
    }
    std::size_t index = 0;
    for (; index < warmup && !options.cancel.is_cancelled(); ++index) {
        upload_one(*client_, index);
        progress.record(units[index], displays[index]);
    }

    // Parallel pass
    if (index < units.size() && !options.cancel.is_cancelled()) {
        const std::size_t remaining = units.size() - index;
        const std::size_t workers =
            std::max<std::size_t>(1, std::min(options.workers, remaining));
        std::atomic<std::size_t> next{index};

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
                while (!options.cancel.is_cancelled()) {
                    const std::size_t current = next.fetch_add(1);
                    if (current >= units.size()) {
                        break;
                    }
                    upload_one(handle, current);
                    progress.record(units[current], displays[current]);
                }
                handle.close();
            });
        }

        pool_lease lease(pool_, workers, "xnat_gradual_upload");
        for (const auto& failure : run_tasks(lease.pool(), std::move(tasks))) {
            logger_->error_fmt("Upload worker {} aborted: {}", failure.index, failure.message);
        }
    }

    // Units a dead worker left behind, or never started after cancellation
    for (std::size_t i = 0; i < units.size(); ++i) {
        auto& unit = units[i];
        if (unit.status == unit_status::in_flight) {
            unit.mark_failed(error_info{error_codes::transport_error,
                                        displays[i] + ": upload aborted", "xnat"});
        } else if (unit.status == unit_status::pending) {
            unit.mark_failed(error_info{error_codes::operation_cancelled,
                                        displays[i] + ": cancelled", "xnat"});
        }
    }

    // Sequential retry pass
    std::vector<std::size_t> failed;
    for (std::size_t i = 0; i < units.size(); ++i) {
        if (units[i].status == unit_status::failed &&
            units[i].last_error->code != error_codes::operation_cancelled) {
            failed.push_back(i);
        }
    }
    if (options.retry_failed && !failed.empty() && !options.cancel.is_cancelled()) {
        std::sort(failed.begin(), failed.end(),
                  [&](std::size_t a, std::size_t b) { return displays[a] < displays[b]; });
        logger_->info_fmt("Retrying {} failed file(s) sequentially", failed.size());
        progress.notice("Retrying " + std::to_string(failed.size()) +
                        " failed file(s) sequentially");
        for (auto i : failed) {
            if (options.cancel.is_cancelled()) {
                break;
            }
            upload_one(*client_, i);
        }
    }

    auto summary = finish();
    logger_->info_fmt("Gradual upload finished: {}/{} succeeded, {} failed",
                      summary.succeeded, summary.total, summary.failed);

    progress_event done;
    done.phase = summary.all_succeeded() ? transfer_phase::complete : transfer_phase::error;
    done.current = summary.total;
    done.total = summary.total;
    done.success = summary.all_succeeded();
    done.message = summary.all_succeeded()
                       ? "Uploaded " + std::to_string(summary.succeeded) +
                             " files via gradual-DICOM"
                       : "Uploaded " + std::to_string(summary.succeeded) + "/" +
                             std::to_string(summary.total) + " files (" +
                             std::to_string(summary.failed) + " failed)";
    for (const auto& err : summary.errors) {
        done.errors.push_back(err.message);
    }
    progress.emit(done);

    return ok(std::move(summary));
}

}  // namespace xnat::transfer
