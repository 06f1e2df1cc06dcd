/**
 * @file duplicate_resolver.cpp
 * @brief Implementation of destination collision handling
 */

#include <kcenon/file_organizer/core/duplicate_resolver.h>

#include <kcenon/file_organizer/core/checksum.h>
#include <kcenon/file_organizer/core/logging.h>

#include <system_error>

namespace kcenon::file_organizer {

namespace {

// Existence without following symlinks; a dangling link still occupies the name.
auto path_exists(const std::filesystem::path& path) -> result<bool> {
    std::error_code ec;
    auto status = std::filesystem::symlink_status(path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory ||
            status.type() == std::filesystem::file_type::not_found) {
            return false;
        }
        return unexpected{error{error_code::resolution_failed,
                                "cannot inspect " + path.string() + ": " + ec.message()}};
    }
    return std::filesystem::exists(status);
}

auto is_taken(const std::filesystem::path& path,
              const destination_reservations& reserved) -> result<bool> {
    if (reserved.count(path) != 0) {
        return true;
    }
    return path_exists(path);
}

}  // namespace

duplicate_resolver::duplicate_resolver()
    : comparator_(&checksum::files_identical) {}

duplicate_resolver::duplicate_resolver(content_comparator comparator)
    : comparator_(std::move(comparator)) {
    if (!comparator_) {
        comparator_ = &checksum::files_identical;
    }
}

auto duplicate_resolver::candidate_name(const std::filesystem::path& proposed,
                                        unsigned int index)
    -> std::filesystem::path {
    auto name = proposed.stem().string() + "_" + std::to_string(index) +
                proposed.extension().string();
    return proposed.parent_path() / name;
}

auto duplicate_resolver::resolve(const std::filesystem::path& source,
                                 const std::filesystem::path& proposed) const
    -> result<resolution> {
    static const destination_reservations none;
    return resolve(source, proposed, none);
}

auto duplicate_resolver::resolve(const std::filesystem::path& source,
                                 const std::filesystem::path& proposed,
                                 const destination_reservations& reserved) const
    -> result<resolution> {
    // The existing occupant is either a file on disk or an earlier unit's
    // source that will land there.
    std::filesystem::path occupant = proposed;
    if (auto it = reserved.find(proposed); it != reserved.end()) {
        occupant = it->second;
    } else {
        auto exists = path_exists(proposed);
        if (!exists) {
            return unexpected{exists.error()};
        }
        if (!exists.value()) {
            return resolution{proceed_decision{proposed}};
        }
    }

    auto identical = comparator_(source, occupant);
    if (!identical) {
        return unexpected{error{identical.error().code,
                                "cannot compare " + source.string() + " with " +
                                    occupant.string() + ": " +
                                    identical.error().message}};
    }

    if (identical.value()) {
        transfer_log_context ctx;
        ctx.source = source.string();
        ctx.destination = proposed.string();
        FO_LOG_DEBUG_CTX(log_category::resolver, "Identical content at destination", ctx);
        return resolution{skip_decision{}};
    }

    for (unsigned int index = 1;; ++index) {
        auto candidate = candidate_name(proposed, index);
        auto taken = is_taken(candidate, reserved);
        if (!taken) {
            return unexpected{taken.error()};
        }
        if (!taken.value()) {
            transfer_log_context ctx;
            ctx.source = source.string();
            ctx.destination = candidate.string();
            FO_LOG_DEBUG_CTX(log_category::resolver, "Destination renamed", ctx);
            return resolution{proceed_decision{std::move(candidate)}};
        }
    }
}

}  // namespace kcenon::file_organizer
