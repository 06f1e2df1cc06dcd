/**
 * @file progress_ledger.h
 * @brief Shared per-file and aggregate progress of a transfer run
 */

#ifndef KCENON_FILE_ORGANIZER_CORE_PROGRESS_LEDGER_H
#define KCENON_FILE_ORGANIZER_CORE_PROGRESS_LEDGER_H

#include <kcenon/file_organizer/core/transfer_types.h>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::file_organizer {

/**
 * @brief Progress record of one source path
 */
struct ledger_entry {
    int progress = 0;
    transfer_status status = transfer_status::pending;
    std::optional<std::string> error;
};

/**
 * @brief Aggregate counters of a transfer run
 */
struct ledger_summary {
    uint64_t total_files = 0;
    uint64_t completed = 0;
    uint64_t in_progress = 0;
    uint64_t skipped = 0;
    uint64_t errors = 0;
    uint64_t total_bytes = 0;
    uint64_t processed_bytes = 0;
    uint64_t empty_dirs_found = 0;
    uint64_t empty_dirs_removed = 0;
    uint64_t cleanup_errors = 0;

    /**
     * @brief Processed share of total bytes in percent
     *
     * Rounded to two decimals, 0 when nothing is to be transferred and
     * never outside [0, 100].
     */
    [[nodiscard]] auto percent_complete() const -> double;

    /**
     * @brief Render as a JSON object for a presentation layer
     */
    [[nodiscard]] auto to_json() const -> std::string;
};

/**
 * @brief Thread-safe progress table shared by the engine and its workers
 *
 * Every call is a single critical section over both the per-path table
 * and the summary, so concurrent pollers always observe a state that some
 * serial order of updates produced. Snapshots are returned by value.
 *
 * Summary counters are keyed by the new status of an update only; a
 * transition never decrements the count of the status it leaves.
 */
class progress_ledger {
public:
    progress_ledger();
    ~progress_ledger();

    progress_ledger(const progress_ledger&) = delete;
    progress_ledger& operator=(const progress_ledger&) = delete;

    /**
     * @brief Admit a path as pending with progress 0
     *
     * The first admission of a path adds it to total_files and its size to
     * total_bytes; re-admission only resets the entry.
     */
    void initialize(const std::filesystem::path& path, uint64_t size = 0);

    /**
     * @brief Set the entry of a path and fold the update into the summary
     *
     * | status      | summary effect                                    |
     * |-------------|---------------------------------------------------|
     * | in_progress | in_progress += 1, processed_bytes += bytes        |
     * | completed   | completed += 1, processed_bytes += bytes          |
     * | error       | errors += 1                                       |
     * | skipped     | skipped += 1, progress forced to 100              |
     *
     * Progress is clamped to [0, 100].
     */
    void update(const std::filesystem::path& path,
                transfer_status status,
                int progress = 0,
                std::optional<std::string> error = std::nullopt,
                uint64_t bytes = 0);

    /**
     * @brief Accumulate the statistics of one directory sweep
     */
    void record_cleanup(uint64_t found, uint64_t removed, uint64_t errors);

    [[nodiscard]] auto summary() const -> ledger_summary;

    [[nodiscard]] auto find(const std::filesystem::path& path) const
        -> std::optional<ledger_entry>;

    [[nodiscard]] auto entries() const
        -> std::map<std::filesystem::path, ledger_entry>;

    [[nodiscard]] auto size() const -> std::size_t;

    /**
     * @brief Drop all entries and zero the summary
     */
    void reset();

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::file_organizer

#endif  // KCENON_FILE_ORGANIZER_CORE_PROGRESS_LEDGER_H
