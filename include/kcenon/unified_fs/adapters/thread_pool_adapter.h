// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool used by the operation queue
 *
 * Requests run on a bounded set of workers. With thread_system available
 * the workers are a kcenon::thread::thread_pool; otherwise a fixed pool of
 * std::thread workers is used.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::unified_fs::adapters {

/**
 * @brief Interface of the worker pool
 */
class task_pool_interface {
public:
    virtual ~task_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @return Future that becomes ready when the task finished; an exception
     *         thrown by the task is stored in it
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Number of tasks submitted but not finished
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that wraps thread_system::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_pool_adapter : public task_pool_interface {
public:
    explicit thread_system_pool_adapter(std::shared_ptr<kcenon::thread::thread_pool> pool,
                                        size_t worker_count);
    ~thread_system_pool_adapter() override;

    thread_system_pool_adapter(const thread_system_pool_adapter&) = delete;
    thread_system_pool_adapter& operator=(const thread_system_pool_adapter&) = delete;

    /**
     * @brief Create a started pool with @p worker_count workers
     */
    [[nodiscard]] static std::shared_ptr<thread_system_pool_adapter> create(
        size_t worker_count, const std::string& pool_name = "unified_fs_pool");

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback pool of N std::thread workers sharing one FIFO queue
 *
 * The destructor runs the tasks still queued, then joins the workers.
 */
class fixed_worker_pool : public task_pool_interface {
public:
    explicit fixed_worker_pool(size_t worker_count);
    ~fixed_worker_pool() override;

    fixed_worker_pool(const fixed_worker_pool&) = delete;
    fixed_worker_pool& operator=(const fixed_worker_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

private:
    void run();

    std::vector<std::thread> workers_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::packaged_task<void()>> queue_;
    std::atomic<size_t> pending_{0};
    bool stopping_ = false;
};

/**
 * @brief Selects the pool implementation
 *
 * 1. thread_system_pool_adapter (when KCENON_WITH_THREAD_SYSTEM)
 * 2. fixed_worker_pool
 */
class task_pool_factory {
public:
    /**
     * @param worker_count Number of workers (0 = hardware concurrency)
     */
    [[nodiscard]] static std::shared_ptr<task_pool_interface> create(
        size_t worker_count = 0, const std::string& pool_name = "unified_fs_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::unified_fs::adapters
