/**
 * @file directory_sweeper.cpp
 * @brief Implementation of the empty-directory sweep
 */

#include <kcenon/file_organizer/core/directory_sweeper.h>

#include <kcenon/file_organizer/core/logging.h>

#include <system_error>

namespace kcenon::file_organizer {

namespace {

struct sweep_state {
    bool recursive;
    const std::set<std::string>& ignore_names;
    sweep_result outcome;
};

auto is_ignored(const std::filesystem::path& entry,
                const std::set<std::string>& ignore_names) -> bool {
    return ignore_names.count(entry.filename().string()) != 0;
}

// Lists the children of dir; an ignored entry is never returned.
auto list_children(const std::filesystem::path& dir,
                   const std::set<std::string>& ignore_names,
                   std::vector<std::filesystem::path>& children) -> std::error_code {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return ec;
    }
    for (std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        if (!is_ignored(it->path(), ignore_names)) {
            children.push_back(it->path());
        }
    }
    return ec;
}

void remove_if_empty(const std::filesystem::path& dir, sweep_state& state) {
    std::error_code ec;
    // Ignored entries still occupy the directory.
    if (!std::filesystem::is_empty(dir, ec) || ec) {
        return;
    }

    std::filesystem::remove(dir, ec);
    if (ec) {
        ++state.outcome.failed;
        FO_LOG_WARN(log_category::sweeper,
                    "Failed to remove empty directory " + dir.string() + ": " +
                        ec.message());
        return;
    }

    state.outcome.removed.push_back(dir);
    FO_LOG_DEBUG(log_category::sweeper, "Removed empty directory " + dir.string());
}

// Returns true if dir was removed.
auto sweep_directory(const std::filesystem::path& dir, int depth, sweep_state& state)
    -> bool {
    std::vector<std::filesystem::path> children;
    if (auto ec = list_children(dir, state.ignore_names, children)) {
        ++state.outcome.failed;
        FO_LOG_WARN(log_category::sweeper,
                    "Failed to list " + dir.string() + ": " + ec.message());
        return false;
    }

    std::size_t remaining = children.size();
    if (state.recursive || depth == 0) {
        for (const auto& child : children) {
            std::error_code ec;
            auto status = std::filesystem::symlink_status(child, ec);
            if (ec || !std::filesystem::is_directory(status)) {
                continue;
            }
            if (sweep_directory(child, depth + 1, state)) {
                --remaining;
            }
        }
    }

    if (depth == 0 || remaining != 0) {
        return false;
    }

    ++state.outcome.found;
    auto before = state.outcome.removed.size();
    remove_if_empty(dir, state);
    return state.outcome.removed.size() != before;
}

}  // namespace

auto directory_sweeper::sweep(const std::filesystem::path& root,
                              bool recursive,
                              const std::set<std::string>& ignore_names)
    -> result<sweep_result> {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return unexpected{error{error_code::cleanup_failed,
                                "sweep root is not a directory: " + root.string()}};
    }

    std::vector<std::filesystem::path> probe;
    if (auto list_ec = list_children(root, ignore_names, probe)) {
        return unexpected{error{error_code::cleanup_failed,
                                "cannot list " + root.string() + ": " +
                                    list_ec.message()}};
    }

    sweep_state state{recursive, ignore_names, {}};
    sweep_directory(root, 0, state);

    FO_LOG_DEBUG(log_category::sweeper,
                 "Swept " + root.string() + ": " +
                     std::to_string(state.outcome.removed.size()) + " of " +
                     std::to_string(state.outcome.found) + " empty directories removed");
    return std::move(state.outcome);
}

}  // namespace kcenon::file_organizer
