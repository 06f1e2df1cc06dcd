/**
 * @file transfer_engine.cpp
 * @brief Implementation of the transfer engine
 */

#include <kcenon/file_organizer/engine/transfer_engine.h>

#include <kcenon/file_organizer/core/directory_sweeper.h>
#include <kcenon/file_organizer/core/logging.h>

#include <chrono>
#include <exception>
#include <future>
#include <optional>
#include <set>
#include <system_error>

namespace kcenon::file_organizer {

namespace {

constexpr std::size_t max_worker_limit = 1024;

auto normalize_dir(const std::filesystem::path& dir) -> std::filesystem::path {
    auto normal = dir.lexically_normal();
    if (normal.filename().empty() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

auto is_within(const std::filesystem::path& dir, const std::filesystem::path& root) -> bool {
    auto relative = dir.lexically_relative(root);
    return !relative.empty() && *relative.begin() != "..";
}

auto elapsed_ms(std::chrono::steady_clock::time_point start) -> uint64_t {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now() - start)
                                     .count());
}

void preserve_metadata(const std::filesystem::path& source,
                       const std::filesystem::path& destination) {
    std::error_code ec;
    auto mtime = std::filesystem::last_write_time(source, ec);
    if (!ec) {
        std::filesystem::last_write_time(destination, mtime, ec);
    }
    if (ec) {
        FO_LOG_WARN(log_category::engine,
                    "Could not preserve modification time of " + destination.string() +
                        ": " + ec.message());
    }

    auto status = std::filesystem::status(source, ec);
    if (!ec) {
        std::filesystem::permissions(destination, status.permissions(),
                                     std::filesystem::perm_options::replace, ec);
    }
    if (ec) {
        FO_LOG_WARN(log_category::engine,
                    "Could not preserve permissions of " + destination.string() + ": " +
                        ec.message());
    }
}

auto copy_with_metadata(const std::filesystem::path& source,
                        const std::filesystem::path& destination) -> result<void> {
    std::error_code ec;
    std::filesystem::copy_file(source, destination, std::filesystem::copy_options::none, ec);
    if (ec) {
        return unexpected{error{error_code::copy_failed,
                                "cannot copy " + source.string() + " to " +
                                    destination.string() + ": " + ec.message()}};
    }
    preserve_metadata(source, destination);
    return {};
}

auto move_file(const std::filesystem::path& source,
               const std::filesystem::path& destination) -> result<void> {
    std::error_code ec;
    // rename() replaces an existing target; refuse like copy_file does.
    if (std::filesystem::exists(std::filesystem::symlink_status(destination, ec))) {
        return unexpected{error{error_code::move_failed,
                                "cannot move " + source.string() + " to " +
                                    destination.string() + ": destination already exists"}};
    }
    std::filesystem::rename(source, destination, ec);
    if (!ec) {
        return {};
    }
    if (ec != std::errc::cross_device_link) {
        return unexpected{error{error_code::move_failed,
                                "cannot move " + source.string() + " to " +
                                    destination.string() + ": " + ec.message()}};
    }

    // Different filesystem: copy, then drop the source.
    auto copied = copy_with_metadata(source, destination);
    if (!copied) {
        return unexpected{error{error_code::move_failed, copied.error().message}};
    }
    std::filesystem::remove(source, ec);
    if (ec) {
        return unexpected{error{error_code::move_failed,
                                "copied " + source.string() +
                                    " but cannot remove it: " + ec.message()}};
    }
    return {};
}

auto place_file(const transfer_operation& op, bool delete_source) -> result<void> {
    auto parent = op.destination.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        // Another unit may have created it concurrently.
        if (ec && !std::filesystem::is_directory(parent)) {
            return unexpected{error{error_code::directory_create_failed,
                                    "cannot create " + parent.string() + ": " +
                                        ec.message()}};
        }
    }
    return delete_source ? move_file(op.source, op.destination)
                         : copy_with_metadata(op.source, op.destination);
}

/**
 * @brief Body of one transfer unit, run on a pool worker
 *
 * Throws transfer_exception after recording the failure in the ledger.
 */
void execute_unit(const transfer_operation& op, progress_ledger& ledger, bool delete_source) {
    auto start = std::chrono::steady_clock::now();
    ledger.update(op.source, transfer_status::in_progress, 0);

    transfer_log_context ctx;
    ctx.source = op.source.string();
    ctx.destination = op.destination.string();
    ctx.file_size = op.size;

    auto placed = place_file(op, delete_source);
    if (!placed) {
        ledger.update(op.source, transfer_status::error, 0, placed.error().message);
        ctx.error_message = placed.error().message;
        FO_LOG_ERROR_CTX(log_category::engine, "Transfer unit failed", ctx);
        throw transfer_exception(placed.error());
    }

    ledger.update(op.source, transfer_status::completed, 100, std::nullopt, op.size);
    ctx.progress = 100;
    ctx.duration_ms = elapsed_ms(start);
    FO_LOG_DEBUG_CTX(log_category::engine,
                     delete_source ? "File moved" : "File copied", ctx);
}

}  // namespace

// ============================================================================
// builder
// ============================================================================

transfer_engine::builder::builder() = default;

auto transfer_engine::builder::with_max_workers(std::size_t count) -> builder& {
    config_.max_workers = count;
    return *this;
}

auto transfer_engine::builder::with_comparator(content_comparator comparator) -> builder& {
    config_.comparator = std::move(comparator);
    return *this;
}

auto transfer_engine::builder::with_thread_pool(
    std::shared_ptr<adapters::worker_pool_interface> pool) -> builder& {
    config_.pool = std::move(pool);
    return *this;
}

auto transfer_engine::builder::build() -> result<transfer_engine> {
    if (config_.max_workers > max_worker_limit) {
        return unexpected{error{error_code::invalid_configuration,
                                "max_workers must not exceed " +
                                    std::to_string(max_worker_limit)}};
    }
    if (config_.pool && !config_.pool->is_running()) {
        return unexpected{error{error_code::invalid_configuration,
                                "supplied worker pool is not running"}};
    }

    return transfer_engine{std::move(config_)};
}

// ============================================================================
// transfer_engine
// ============================================================================

struct transfer_engine::impl {
    duplicate_resolver resolver;
    std::shared_ptr<adapters::worker_pool_interface> pool;

    explicit impl(engine_config config)
        : resolver(std::move(config.comparator)), pool(std::move(config.pool)) {
        if (!pool) {
            pool = adapters::worker_pool_factory::create(config.max_workers,
                                                         "file_organizer_engine");
        }
    }

    void sweep(const std::vector<std::filesystem::path>& sources,
               progress_ledger& ledger,
               const transfer_options& options) const {
        for (const auto& root : sweep_roots(sources, options)) {
            std::error_code ec;
            if (!std::filesystem::exists(root, ec)) {
                continue;
            }

            auto swept = directory_sweeper::sweep(root, options.cleanup.recursive,
                                                  options.cleanup.ignore_names);
            if (!swept) {
                ledger.record_cleanup(0, 0, 1);
                FO_LOG_WARN(log_category::sweeper,
                            "Cleanup of " + root.string() + " failed: " +
                                swept.error().message);
                continue;
            }

            const auto& outcome = swept.value();
            ledger.record_cleanup(outcome.found, outcome.removed.size(), outcome.failed);
        }
    }
};

transfer_engine::transfer_engine(engine_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();
}

transfer_engine::transfer_engine(transfer_engine&&) noexcept = default;
auto transfer_engine::operator=(transfer_engine&&) noexcept -> transfer_engine& = default;
transfer_engine::~transfer_engine() = default;

auto transfer_engine::worker_count() const -> std::size_t {
    return impl_->pool->worker_count();
}

auto transfer_engine::sweep_roots(const std::vector<std::filesystem::path>& sources,
                                  const transfer_options& options)
    -> std::vector<std::filesystem::path> {
    std::optional<std::filesystem::path> source_root;
    if (options.source_root && !options.source_root->empty()) {
        source_root = normalize_dir(*options.source_root);
    }

    std::set<std::filesystem::path> roots;
    for (const auto& source : sources) {
        // A bare file name has no directory of its own to sweep.
        if (source.parent_path().empty()) {
            continue;
        }
        auto dir = normalize_dir(source.parent_path());
        if (source_root && is_within(dir, *source_root)) {
            roots.insert(*source_root);
        } else {
            roots.insert(std::move(dir));
        }
    }
    return std::vector<std::filesystem::path>(roots.rbegin(), roots.rend());
}

auto transfer_engine::transfer(const std::vector<std::filesystem::path>& sources,
                               const std::filesystem::path& destination_dir,
                               progress_ledger& ledger,
                               const transfer_options& options) -> result<void> {
    if (destination_dir.empty()) {
        return unexpected{error{error_code::invalid_destination,
                                "destination directory must not be empty"}};
    }

    FO_LOG_INFO(log_category::engine,
                "Transfer of " + std::to_string(sources.size()) + " files to " +
                    destination_dir.string() + (options.dry_run ? " (dry run)" : ""));

    // Admission: every source is known to the ledger before any resolution.
    std::vector<uint64_t> sizes;
    sizes.reserve(sources.size());
    for (const auto& source : sources) {
        std::error_code ec;
        auto size = std::filesystem::file_size(source, ec);
        sizes.push_back(ec ? 0 : static_cast<uint64_t>(size));
        ledger.initialize(source, sizes.back());
    }

    // Resolution on the calling thread; reservations keep two sources of
    // the batch from claiming the same destination.
    std::vector<transfer_operation> batch;
    destination_reservations reserved;
    for (std::size_t i = 0; i < sources.size(); ++i) {
        const auto& source = sources[i];
        auto proposed = destination_dir / source.filename();

        auto decision = impl_->resolver.resolve(source, proposed, reserved);
        if (!decision) {
            ledger.update(source, transfer_status::error, 0, decision.error().message);
            transfer_log_context ctx;
            ctx.source = source.string();
            ctx.destination = proposed.string();
            ctx.error_message = decision.error().message;
            FO_LOG_ERROR_CTX(log_category::resolver, "Duplicate resolution failed", ctx);
            continue;
        }

        if (is_skip(decision.value())) {
            ledger.update(source, transfer_status::skipped, 100);
            continue;
        }

        auto destination = std::get<proceed_decision>(decision.value()).destination;
        reserved.emplace(destination, source);
        batch.emplace_back(source, std::move(destination), sizes[i]);
    }

    if (options.dry_run) {
        for (const auto& op : batch) {
            transfer_log_context ctx;
            ctx.source = op.source.string();
            ctx.destination = op.destination.string();
            ctx.file_size = op.size;
            FO_LOG_INFO_CTX(log_category::engine, "Dry run: would transfer", ctx);
        }
        return {};
    }

    std::vector<std::future<void>> pending;
    pending.reserve(batch.size());
    for (auto& op : batch) {
        pending.push_back(impl_->pool->submit(
            [op = std::move(op), &ledger, delete_source = options.delete_source]() {
                execute_unit(op, ledger, delete_source);
            }));
    }

    // Join every unit; the first failure in dispatch order is reported.
    std::optional<error> first_error;
    for (auto& unit : pending) {
        try {
            unit.get();
        } catch (const transfer_exception& e) {
            if (!first_error) {
                first_error = e.error();
            }
        } catch (const std::exception& e) {
            if (!first_error) {
                first_error = error{error_code::internal_error, e.what()};
            }
        } catch (...) {
            if (!first_error) {
                first_error = error{error_code::internal_error,
                                    "transfer unit raised a non-standard exception"};
            }
        }
    }

    if (first_error) {
        FO_LOG_ERROR(log_category::engine,
                     "Transfer finished with errors: " + first_error->message);
        return unexpected{*first_error};
    }

    if (options.cleanup.enabled && options.delete_source) {
        impl_->sweep(sources, ledger, options);
    }

    FO_LOG_INFO(log_category::engine, "Transfer finished: " + ledger.summary().to_json());
    return {};
}

}  // namespace kcenon::file_organizer
