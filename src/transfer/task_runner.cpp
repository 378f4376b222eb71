/**
 * @file task_runner.cpp
 * @brief Worker pool fan-out and join
 */

#include <xnat/transfer/task_runner.hpp>
#include <xnat/integration/thread_pool_adapter.hpp>

#include <exception>
#include <future>
#include <optional>
#include <utility>

namespace xnat::transfer {

pool_lease::pool_lease(std::shared_ptr<integration::thread_pool_interface> supplied,
                       std::size_t workers,
                       const std::string& name)
    : pool_(std::move(supplied)) {
    if (!pool_) {
        pool_ = integration::make_worker_pool(workers == 0 ? 1 : workers, name);
        owned_ = true;
    }
    if (!pool_->is_running()) {
        (void)pool_->start();
    }
}

pool_lease::~pool_lease() {
    if (owned_ && pool_) {
        pool_->shutdown(true);
    }
}

auto run_tasks(integration::thread_pool_interface& pool,
               std::vector<std::function<void()>> tasks) -> std::vector<task_failure> {
    std::vector<task_failure> failures;
    std::vector<std::optional<std::future<void>>> futures(tasks.size());

    for (std::size_t i = 0; i < tasks.size(); ++i) {
        try {
            futures[i] = pool.submit(std::move(tasks[i]));
        } catch (const std::exception& e) {
            failures.push_back({i, std::string("Task submission failed: ") + e.what()});
        }
    }

    for (std::size_t i = 0; i < futures.size(); ++i) {
        if (!futures[i] || !futures[i]->valid()) {
            continue;
        }
        try {
            futures[i]->get();
        } catch (const std::exception& e) {
            failures.push_back({i, e.what()});
        }
    }
    return failures;
}

}  // namespace xnat::transfer
