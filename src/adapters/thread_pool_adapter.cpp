// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool implementations
 */

#include "kcenon/unified_fs/adapters/thread_pool_adapter.h"

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::unified_fs::adapters {

namespace {

size_t resolve_worker_count(size_t requested) {
    if (requested > 0) {
        return requested;
    }
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

}  // namespace

// ============================================================================
// thread_system_pool_adapter implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job that runs a std::function on a thread_system worker
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "function_job")
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_pool_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    size_t worker_count{0};
    std::shared_ptr<std::atomic<size_t>> pending = std::make_shared<std::atomic<size_t>>(0);
};

thread_system_pool_adapter::thread_system_pool_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool, size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->worker_count = worker_count;
}

thread_system_pool_adapter::~thread_system_pool_adapter() = default;

std::shared_ptr<thread_system_pool_adapter> thread_system_pool_adapter::create(
    size_t worker_count, const std::string& pool_name) {
    worker_count = resolve_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_pool_adapter>(std::move(pool), worker_count);
}

std::future<void> thread_system_pool_adapter::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    auto pending = pimpl_->pending;
    pending->fetch_add(1);

    auto wrapped_task = [task = std::move(task), promise, pending]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
        pending->fetch_sub(1);
    };

    auto job = std::make_unique<function_job>(std::move(wrapped_task), "unified_fs_request");
    pimpl_->pool->enqueue(std::move(job));

    return future;
}

size_t thread_system_pool_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_pool_adapter::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_pool_adapter::pending_tasks() const {
    return pimpl_->pending->load();
}

std::shared_ptr<kcenon::thread::thread_pool> thread_system_pool_adapter::underlying_pool() const {
    return pimpl_->pool;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// fixed_worker_pool implementation
// ============================================================================

fixed_worker_pool::fixed_worker_pool(size_t worker_count) {
    worker_count = resolve_worker_count(worker_count);
    workers_.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back([this] { run(); });
    }
}

fixed_worker_pool::~fixed_worker_pool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::future<void> fixed_worker_pool::submit(std::function<void()> task) {
    std::packaged_task<void()> packaged(std::move(task));
    auto future = packaged.get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(packaged));
        pending_.fetch_add(1);
    }
    cv_.notify_one();
    return future;
}

void fixed_worker_pool::run() {
    while (true) {
        std::packaged_task<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        // packaged_task stores an exception in the future
        task();
        pending_.fetch_sub(1);
    }
}

size_t fixed_worker_pool::worker_count() const {
    return workers_.size();
}

bool fixed_worker_pool::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !stopping_;
}

size_t fixed_worker_pool::pending_tasks() const {
    return pending_.load();
}

// ============================================================================
// task_pool_factory implementation
// ============================================================================

std::shared_ptr<task_pool_interface> task_pool_factory::create(size_t worker_count,
                                                               const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_pool_adapter::create(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<fixed_worker_pool>(worker_count);
#endif
}

}  // namespace kcenon::unified_fs::adapters
