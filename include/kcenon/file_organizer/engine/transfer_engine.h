/**
 * @file transfer_engine.h
 * @brief Parallel move/copy of a file batch into a destination directory
 */

#ifndef KCENON_FILE_ORGANIZER_ENGINE_TRANSFER_ENGINE_H
#define KCENON_FILE_ORGANIZER_ENGINE_TRANSFER_ENGINE_H

#include <kcenon/file_organizer/adapters/thread_pool_adapter.h>
#include <kcenon/file_organizer/core/duplicate_resolver.h>
#include <kcenon/file_organizer/core/progress_ledger.h>
#include <kcenon/file_organizer/core/transfer_types.h>
#include <kcenon/file_organizer/core/types.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <vector>

namespace kcenon::file_organizer {

/**
 * @brief Engine configuration collected by the builder
 */
struct engine_config {
    std::size_t max_workers = 0;                              ///< 0 = hardware concurrency
    content_comparator comparator;                            ///< empty = SHA-256 comparison
    std::shared_ptr<adapters::worker_pool_interface> pool;    ///< empty = created from max_workers
};

/**
 * @brief Moves or copies a flat list of files into a destination directory
 *
 * A transfer run:
 * 1. admits every source into the ledger as pending
 * 2. resolves each proposed destination (skip identical, rename on conflict)
 * 3. dispatches the remaining units to a bounded worker pool
 * 4. waits for every unit, then sweeps emptied source directories
 *
 * @code
 * auto engine = transfer_engine::builder()
 *     .with_max_workers(4)
 *     .build();
 *
 * progress_ledger ledger;
 * transfer_options options;
 * options.source_root = "/inbox";
 *
 * auto r = engine.value().transfer(files, "/photos", ledger, options);
 * @endcode
 */
class transfer_engine {
public:
    /**
     * @brief Builder for transfer_engine
     */
    class builder {
    public:
        builder();

        /**
         * @brief Bound the number of concurrently running units
         * @param count Worker count (0 = hardware concurrency)
         * @return Reference to builder for chaining
         */
        auto with_max_workers(std::size_t count) -> builder&;

        /**
         * @brief Replace the content comparison used for duplicate detection
         * @return Reference to builder for chaining
         */
        auto with_comparator(content_comparator comparator) -> builder&;

        /**
         * @brief Run units on an externally owned pool
         *
         * max_workers is ignored when a pool is supplied.
         * @return Reference to builder for chaining
         */
        auto with_thread_pool(std::shared_ptr<adapters::worker_pool_interface> pool)
            -> builder&;

        /**
         * @brief Build the engine
         * @return Engine, or invalid_configuration
         */
        [[nodiscard]] auto build() -> result<transfer_engine>;

    private:
        engine_config config_;
    };

    ~transfer_engine();

    transfer_engine(const transfer_engine&) = delete;
    auto operator=(const transfer_engine&) -> transfer_engine& = delete;
    transfer_engine(transfer_engine&&) noexcept;
    auto operator=(transfer_engine&&) noexcept -> transfer_engine&;

    /**
     * @brief Transfer sources into destination_dir
     *
     * Every source ends up in the ledger. Files whose resolution fails are
     * recorded as errors without failing the call. The call fails with the
     * first error raised by a dispatched unit, and only after every unit
     * has reached a terminal status. Sweep failures never fail the call.
     *
     * @param sources Source file paths
     * @param destination_dir Directory receiving the files by file name
     * @param ledger Progress table updated while the run proceeds
     * @param options Run options
     * @return Success, invalid_destination, or the first unit error
     */
    [[nodiscard]] auto transfer(const std::vector<std::filesystem::path>& sources,
                                const std::filesystem::path& destination_dir,
                                progress_ledger& ledger,
                                const transfer_options& options = {}) -> result<void>;

    /**
     * @brief Directories swept after a run over sources
     *
     * Distinct parent directories of the sources, with every directory
     * inside options.source_root replaced by source_root. Ordered so that
     * deeper paths come first. A source given as a bare file name
     * contributes no root.
     */
    [[nodiscard]] static auto sweep_roots(const std::vector<std::filesystem::path>& sources,
                                          const transfer_options& options)
        -> std::vector<std::filesystem::path>;

    [[nodiscard]] auto worker_count() const -> std::size_t;

private:
    explicit transfer_engine(engine_config config);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::file_organizer

#endif  // KCENON_FILE_ORGANIZER_ENGINE_TRANSFER_ENGINE_H
