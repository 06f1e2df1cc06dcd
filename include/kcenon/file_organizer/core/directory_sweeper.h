/**
 * @file directory_sweeper.h
 * @brief Bottom-up removal of empty directories
 */

#ifndef KCENON_FILE_ORGANIZER_CORE_DIRECTORY_SWEEPER_H
#define KCENON_FILE_ORGANIZER_CORE_DIRECTORY_SWEEPER_H

#include <kcenon/file_organizer/core/types.h>

#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace kcenon::file_organizer {

/**
 * @brief Outcome of one sweep
 */
struct sweep_result {
    std::vector<std::filesystem::path> removed;  ///< Deepest first
    uint64_t found = 0;                          ///< Empty directories seen
    uint64_t failed = 0;                         ///< Removals or listings that failed
};

/**
 * @brief Removes directories that became empty below a root
 *
 * Traversal is post-order, so a directory whose only children were empty
 * directories is removed after them. The root itself is never removed.
 * Entries named in the ignore set are neither descended into nor removed
 * and do not count toward emptiness; a directory holding nothing but
 * ignored entries is still left in place. Symbolic links are treated as
 * plain entries.
 */
class directory_sweeper {
public:
    /**
     * @brief Sweep below a root
     * @param root Directory to sweep; must exist
     * @param recursive true to consider the whole tree, false for direct
     *        children of root only
     * @param ignore_names Directory or file names to skip
     * @return Removed paths and counters, or error if root cannot be listed
     */
    [[nodiscard]] static auto sweep(const std::filesystem::path& root,
                                    bool recursive,
                                    const std::set<std::string>& ignore_names)
        -> result<sweep_result>;
};

}  // namespace kcenon::file_organizer

#endif  // KCENON_FILE_ORGANIZER_CORE_DIRECTORY_SWEEPER_H
