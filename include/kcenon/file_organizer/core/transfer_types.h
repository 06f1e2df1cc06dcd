/**
 * @file transfer_types.h
 * @brief Transfer-related data structures for file_organizer_system
 *
 * Defines the per-file transfer operation, its status lifecycle and the
 * options that drive a transfer run.
 */

#ifndef KCENON_FILE_ORGANIZER_CORE_TRANSFER_TYPES_H
#define KCENON_FILE_ORGANIZER_CORE_TRANSFER_TYPES_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>

#include "types.h"

namespace kcenon::file_organizer {

/**
 * @brief Status of a single transfer operation
 *
 * pending -> in_progress -> {completed | error}. skipped is entered
 * directly from pending when the destination already holds identical
 * content; error is also entered directly from pending when resolution
 * fails.
 */
enum class transfer_status {
    pending,
    in_progress,
    completed,
    error,
    skipped,
};

[[nodiscard]] constexpr auto to_string(transfer_status status) noexcept
    -> std::string_view {
    switch (status) {
        case transfer_status::pending:
            return "pending";
        case transfer_status::in_progress:
            return "in_progress";
        case transfer_status::completed:
            return "completed";
        case transfer_status::error:
            return "error";
        case transfer_status::skipped:
            return "skipped";
        default:
            return "unknown";
    }
}

/**
 * @brief Check if transfer status is terminal (final)
 */
[[nodiscard]] constexpr auto is_terminal_status(transfer_status status) noexcept
    -> bool {
    return status == transfer_status::completed ||
           status == transfer_status::error ||
           status == transfer_status::skipped;
}

/**
 * @brief One unit of work: a source file and where it goes
 *
 * Status and progress of a unit live in the progress_ledger.
 */
struct transfer_operation {
    std::filesystem::path source;         // Source file path
    std::filesystem::path destination;    // Resolved destination path
    uint64_t size;                        // Source size in bytes

    transfer_operation() : size(0) {}

    transfer_operation(std::filesystem::path src,
                       std::filesystem::path dest,
                       uint64_t bytes)
        : source(std::move(src))
        , destination(std::move(dest))
        , size(bytes) {}
};

/**
 * @brief Directory names skipped by the empty-directory sweep
 */
[[nodiscard]] inline auto default_ignore_names() -> std::set<std::string> {
    return {".git", "__pycache__", ".pytest_cache", ".mypy_cache",
            "node_modules", "venv", ".venv"};
}

/**
 * @brief Configuration of the post-transfer empty-directory sweep
 */
struct cleanup_config {
    bool enabled = true;                  ///< Sweep source directories after a move
    bool recursive = true;                ///< Remove nested empty directories too
    std::set<std::string> ignore_names = default_ignore_names();  ///< Never descended or removed
};

/**
 * @brief Options for a single transfer run
 */
struct transfer_options {
    bool delete_source = true;            ///< Move (true) or copy (false)
    bool dry_run = false;                 ///< Resolve and record only
    cleanup_config cleanup;               ///< Empty-directory sweep settings

    /// Source tree root; source directories below it are swept through it,
    /// which makes its direct children removable.
    std::optional<std::filesystem::path> source_root;
};

/**
 * @brief Exception raised by a failing transfer unit inside the worker pool
 *
 * Carries the error so the engine can hand it back as a result.
 */
class transfer_exception : public std::runtime_error {
public:
    explicit transfer_exception(struct error err)
        : std::runtime_error(err.message), error_(std::move(err)) {}

    [[nodiscard]] auto error() const noexcept -> const struct error& { return error_; }

private:
    struct error error_;
};

}  // namespace kcenon::file_organizer

#endif  // KCENON_FILE_ORGANIZER_CORE_TRANSFER_TYPES_H
