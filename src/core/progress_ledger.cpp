/**
 * @file progress_ledger.cpp
 * @brief Implementation of the progress ledger
 */

#include <kcenon/file_organizer/core/progress_ledger.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace kcenon::file_organizer {

auto ledger_summary::percent_complete() const -> double {
    if (total_bytes == 0) {
        return 0.0;
    }
    double percent = static_cast<double>(processed_bytes) /
                     static_cast<double>(total_bytes) * 100.0;
    percent = std::round(percent * 100.0) / 100.0;
    return std::clamp(percent, 0.0, 100.0);
}

auto ledger_summary::to_json() const -> std::string {
    std::ostringstream oss;
    oss << "{\"total_files\":" << total_files
        << ",\"completed\":" << completed
        << ",\"in_progress\":" << in_progress
        << ",\"skipped\":" << skipped
        << ",\"errors\":" << errors
        << ",\"total_bytes\":" << total_bytes
        << ",\"processed_bytes\":" << processed_bytes
        << ",\"percent_complete\":" << std::fixed << std::setprecision(2)
        << percent_complete()
        << ",\"empty_dirs_found\":" << empty_dirs_found
        << ",\"empty_dirs_removed\":" << empty_dirs_removed
        << ",\"cleanup_errors\":" << cleanup_errors << "}";
    return oss.str();
}

struct progress_ledger::impl {
    mutable std::mutex mutex;
    std::map<std::filesystem::path, ledger_entry> entries;
    ledger_summary summary;
};

progress_ledger::progress_ledger() : impl_(std::make_unique<impl>()) {}

progress_ledger::~progress_ledger() = default;

void progress_ledger::initialize(const std::filesystem::path& path, uint64_t size) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto [it, inserted] = impl_->entries.insert_or_assign(path, ledger_entry{});
    (void)it;
    if (inserted) {
        ++impl_->summary.total_files;
        impl_->summary.total_bytes += size;
    }
}

void progress_ledger::update(const std::filesystem::path& path,
                             transfer_status status,
                             int progress,
                             std::optional<std::string> error,
                             uint64_t bytes) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto& entry = impl_->entries[path];
    auto& summary = impl_->summary;

    entry.status = status;
    entry.progress = std::clamp(progress, 0, 100);
    entry.error = std::move(error);

    switch (status) {
        case transfer_status::in_progress:
            ++summary.in_progress;
            summary.processed_bytes += bytes;
            break;
        case transfer_status::completed:
            ++summary.completed;
            summary.processed_bytes += bytes;
            break;
        case transfer_status::error:
            ++summary.errors;
            break;
        case transfer_status::skipped:
            ++summary.skipped;
            entry.progress = 100;
            break;
        case transfer_status::pending:
            break;
    }
}

void progress_ledger::record_cleanup(uint64_t found, uint64_t removed, uint64_t errors) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->summary.empty_dirs_found += found;
    impl_->summary.empty_dirs_removed += removed;
    impl_->summary.cleanup_errors += errors;
}

auto progress_ledger::summary() const -> ledger_summary {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->summary;
}

auto progress_ledger::find(const std::filesystem::path& path) const
    -> std::optional<ledger_entry> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->entries.find(path);
    if (it == impl_->entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto progress_ledger::entries() const
    -> std::map<std::filesystem::path, ledger_entry> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->entries;
}

auto progress_ledger::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->entries.size();
}

void progress_ledger::reset() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->entries.clear();
    impl_->summary = ledger_summary{};
}

}  // namespace kcenon::file_organizer
