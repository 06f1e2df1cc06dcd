// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool implementations for file_organizer_system
 */

#include "kcenon/file_organizer/adapters/thread_pool_adapter.h"

#include "kcenon/file_organizer/core/logging.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::file_organizer::adapters {

size_t resolve_worker_count(size_t requested) noexcept {
    if (requested != 0) {
        return requested;
    }
    auto detected = static_cast<size_t>(std::thread::hardware_concurrency());
    return detected == 0 ? 4 : detected;
}

// ============================================================================
// thread_system_pool_adapter implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job that runs a transfer unit on a thread_system worker
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "transfer_unit")
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
    std::string pool_name;
    size_t worker_count{0};
};

thread_system_pool_adapter::thread_system_pool_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_pool_adapter::~thread_system_pool_adapter() {
    if (pimpl_ && pimpl_->pool) {
        auto stopped = pimpl_->pool->stop(false);
        if (stopped.is_err()) {
            FO_LOG_WARN(log_category::pool, "Failed to stop pool " + pimpl_->pool_name);
        }
    }
}

std::shared_ptr<thread_system_pool_adapter>
thread_system_pool_adapter::create_default(size_t worker_count,
                                           const std::string& pool_name) {
    worker_count = resolve_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    auto started = pool->start();
    if (started.is_err()) {
        FO_LOG_ERROR(log_category::pool, "Failed to start pool " + pool_name);
    }

    return std::make_shared<thread_system_pool_adapter>(std::move(pool), pool_name,
                                                        worker_count);
}

std::future<void> thread_system_pool_adapter::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto wrapped_task = [task = std::move(task), promise]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    };

    auto job = std::make_unique<function_job>(std::move(wrapped_task));
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
    if (pimpl_->pool) {
        auto queue = pimpl_->pool->get_job_queue();
        return queue ? queue->size() : 0;
    }
    return 0;
}

std::string thread_system_pool_adapter::pool_name() const {
    return pimpl_->pool_name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// fixed_worker_pool implementation
// ============================================================================

struct fixed_worker_pool::impl {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::packaged_task<void()>> queue;
    std::vector<std::thread> workers;
    bool stopping{false};

    void run() {
        for (;;) {
            std::packaged_task<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait(lock, [this] { return stopping || !queue.empty(); });
                if (queue.empty()) {
                    return;
                }
                task = std::move(queue.front());
                queue.pop_front();
            }
            // Exceptions are stored in the task's shared state.
            task();
        }
    }
};

fixed_worker_pool::fixed_worker_pool(size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    auto count = resolve_worker_count(worker_count);
    pimpl_->workers.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        pimpl_->workers.emplace_back([state = pimpl_.get()] { state->run(); });
    }
}

fixed_worker_pool::~fixed_worker_pool() {
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        pimpl_->stopping = true;
    }
    pimpl_->cv.notify_all();
    for (auto& worker : pimpl_->workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::future<void> fixed_worker_pool::submit(std::function<void()> task) {
    std::packaged_task<void()> packaged(std::move(task));
    auto future = packaged.get_future();
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        pimpl_->queue.push_back(std::move(packaged));
    }
    pimpl_->cv.notify_one();
    return future;
}

size_t fixed_worker_pool::worker_count() const {
    return pimpl_->workers.size();
}

bool fixed_worker_pool::is_running() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return !pimpl_->stopping;
}

size_t fixed_worker_pool::pending_tasks() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return pimpl_->queue.size();
}

// ============================================================================
// worker_pool_factory implementation
// ============================================================================

std::shared_ptr<worker_pool_interface> worker_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_pool_adapter::create_default(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<fixed_worker_pool>(worker_count);
#endif
}

}  // namespace kcenon::file_organizer::adapters
