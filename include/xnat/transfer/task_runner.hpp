/**
 * @file task_runner.hpp
 * @brief Fan-out of coordinator tasks onto a worker pool and the final join
 */

#pragma once

#include <xnat/integration/thread_pool_interface.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace xnat::transfer {

/**
 * @brief Pool borrowed from the caller or created for one run
 *
 * A pool created here is shut down (draining queued tasks) when the
 * lease is destroyed; a caller-supplied pool is left running.
 */
class pool_lease {
public:
    pool_lease(std::shared_ptr<integration::thread_pool_interface> supplied,
               std::size_t workers,
               const std::string& name);

    ~pool_lease();

    pool_lease(const pool_lease&) = delete;
    pool_lease& operator=(const pool_lease&) = delete;

    [[nodiscard]] auto pool() const noexcept -> integration::thread_pool_interface& {
        return *pool_;
    }

    [[nodiscard]] bool owned() const noexcept { return owned_; }

private:
    std::shared_ptr<integration::thread_pool_interface> pool_;
    bool owned_{false};
};

/**
 * @brief A task that could not be submitted or that threw
 */
struct task_failure {
    std::size_t index{0};
    std::string message;
};

/**
 * @brief Submit every task, then wait for all of them
 *
 * Tasks are expected to record their own outcome. A submission error or
 * an exception escaping a task is reported by index; the remaining tasks
 * still run.
 */
[[nodiscard]] auto run_tasks(integration::thread_pool_interface& pool,
                             std::vector<std::function<void()>> tasks)
    -> std::vector<task_failure>;

}  // namespace xnat::transfer
