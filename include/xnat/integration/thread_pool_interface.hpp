/**
 * @file thread_pool_interface.hpp
 * @brief Abstract worker pool used by the transfer coordinators
 *
 * Coordinators depend on this interface rather than on thread_system so
 * tests can substitute a deterministic pool.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <string>

namespace xnat::integration {

/**
 * @struct thread_pool_config
 * @brief Configuration options for the worker pool
 */
struct thread_pool_config {
    /// Number of worker threads started with the pool
    std::size_t worker_count = 4;

    /// Pool name used in thread_system diagnostics
    std::string pool_name = "xnat_transfer_pool";
};

/**
 * @brief Bounded pool of OS worker threads
 *
 * Thread Safety: all methods are thread-safe.
 */
class thread_pool_interface {
public:
    virtual ~thread_pool_interface() = default;

    // =========================================================================
    // Lifecycle Management
    // =========================================================================

    /**
     * @brief Start the worker threads
     * @return true if the pool is running after the call
     */
    [[nodiscard]] virtual auto start() -> bool = 0;

    [[nodiscard]] virtual auto is_running() const noexcept -> bool = 0;

    /**
     * @brief Stop the pool
     * @param wait_for_completion Drain queued tasks before returning
     */
    virtual void shutdown(bool wait_for_completion = true) = 0;

    // =========================================================================
    // Task Submission
    // =========================================================================

    /**
     * @brief Submit a task
     * @return Future that becomes ready when the task has run; exceptions
     *         thrown by the task are stored in it
     */
    [[nodiscard]] virtual auto submit(std::function<void()> task)
        -> std::future<void> = 0;

protected:
    thread_pool_interface() = default;

    thread_pool_interface(const thread_pool_interface&) = delete;
    thread_pool_interface& operator=(const thread_pool_interface&) = delete;

    thread_pool_interface(thread_pool_interface&&) = default;
    thread_pool_interface& operator=(thread_pool_interface&&) = default;
};

}  // namespace xnat::integration
