// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Bounded worker pool for transfer units
 *
 * Provides a worker pool interface for the transfer engine, backed by
 * thread_system when available and by a fixed set of std::thread workers
 * otherwise. Both implementations bound concurrency to the configured
 * worker count.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::file_organizer::adapters {

/**
 * @brief Interface for the pool executing transfer units
 *
 * An exception thrown by a task is delivered through its future.
 */
class worker_pool_interface {
public:
    virtual ~worker_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @return Future for the task completion
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Get the number of worker threads
     */
    [[nodiscard]] virtual size_t worker_count() const = 0;

    /**
     * @brief Check if the pool accepts tasks
     */
    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Get the number of queued tasks not yet picked up by a worker
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;
};

/**
 * @brief Resolve a requested worker count (0 = hardware concurrency)
 */
[[nodiscard]] size_t resolve_worker_count(size_t requested) noexcept;

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that wraps thread_system::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_pool_adapter : public worker_pool_interface {
public:
    /**
     * @brief Construct with an existing thread_pool
     * @param pool Shared pointer to thread_system's thread_pool
     * @param pool_name Name for identification in logs
     * @param worker_count Number of workers in the pool (for reporting)
     */
    explicit thread_system_pool_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "file_organizer_pool",
        size_t worker_count = 0);

    ~thread_system_pool_adapter() override;

    thread_system_pool_adapter(const thread_system_pool_adapter&) = delete;
    thread_system_pool_adapter& operator=(const thread_system_pool_adapter&) = delete;

    /**
     * @brief Create a started pool with the given number of workers
     * @param worker_count Number of worker threads (0 = auto-detect from hardware)
     */
    [[nodiscard]] static std::shared_ptr<thread_system_pool_adapter> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "file_organizer_pool");

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fixed-size pool of std::thread workers
 *
 * Used when thread_system is unavailable. Tasks are queued and picked up
 * in submission order. The destructor drains the queue and joins all
 * workers.
 */
class fixed_worker_pool : public worker_pool_interface {
public:
    /**
     * @param worker_count Number of worker threads (0 = auto-detect from hardware)
     */
    explicit fixed_worker_pool(size_t worker_count = 0);
    ~fixed_worker_pool() override;

    fixed_worker_pool(const fixed_worker_pool&) = delete;
    fixed_worker_pool& operator=(const fixed_worker_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Factory for creating the best available worker pool
 *
 * 1. thread_system_pool_adapter (when KCENON_WITH_THREAD_SYSTEM)
 * 2. fixed_worker_pool (fallback)
 */
class worker_pool_factory {
public:
    /**
     * @brief Create a worker pool
     * @param worker_count Number of worker threads (0 = auto-detect)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<worker_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "file_organizer_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::file_organizer::adapters
