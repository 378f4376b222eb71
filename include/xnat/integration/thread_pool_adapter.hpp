/**
 * @file thread_pool_adapter.hpp
 * @brief thread_system implementation of thread_pool_interface
 */

#pragma once

#include <xnat/integration/thread_pool_interface.hpp>

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace kcenon::thread {
class thread_pool;
}  // namespace kcenon::thread

namespace xnat::integration {

/**
 * @brief Worker pool backed by kcenon::thread::thread_pool
 *
 * The pool starts lazily on the first submission. Destruction waits for
 * queued tasks, so a coordinator that owns one can simply let it go out
 * of scope after joining its futures.
 */
class thread_pool_adapter final : public thread_pool_interface {
public:
    explicit thread_pool_adapter(const thread_pool_config& config);

    /**
     * @brief Wrap an existing pool
     * @throws std::invalid_argument if pool is null
     */
    explicit thread_pool_adapter(std::shared_ptr<kcenon::thread::thread_pool> pool);

    ~thread_pool_adapter() override;

    thread_pool_adapter(const thread_pool_adapter&) = delete;
    thread_pool_adapter& operator=(const thread_pool_adapter&) = delete;
    thread_pool_adapter(thread_pool_adapter&&) = delete;
    thread_pool_adapter& operator=(thread_pool_adapter&&) = delete;

    [[nodiscard]] auto start() -> bool override;
    [[nodiscard]] auto is_running() const noexcept -> bool override;
    void shutdown(bool wait_for_completion = true) override;

    [[nodiscard]] auto submit(std::function<void()> task)
        -> std::future<void> override;

private:
    std::shared_ptr<kcenon::thread::thread_pool> pool_;
    thread_pool_config config_;
    mutable std::mutex mutex_;
    bool initialized_{false};

    [[nodiscard]] auto start_locked() -> bool;
};

/**
 * @brief Create a started pool with exactly @p workers threads
 */
[[nodiscard]] auto make_worker_pool(std::size_t workers, const std::string& name)
    -> std::shared_ptr<thread_pool_interface>;

}  // namespace xnat::integration
