/**
 * @file duplicate_resolver.h
 * @brief Destination collision handling for transfer units
 */

#ifndef KCENON_FILE_ORGANIZER_CORE_DUPLICATE_RESOLVER_H
#define KCENON_FILE_ORGANIZER_CORE_DUPLICATE_RESOLVER_H

#include <kcenon/file_organizer/core/types.h>

#include <filesystem>
#include <functional>
#include <map>
#include <variant>

namespace kcenon::file_organizer {

/**
 * @brief Transfer the source to this destination
 */
struct proceed_decision {
    std::filesystem::path destination;
};

/**
 * @brief Destination already holds identical content
 */
struct skip_decision {};

/**
 * @brief Outcome of resolving a proposed destination
 */
using resolution = std::variant<proceed_decision, skip_decision>;

[[nodiscard]] inline auto is_skip(const resolution& r) noexcept -> bool {
    return std::holds_alternative<skip_decision>(r);
}

/**
 * @brief Content comparison used to detect duplicates
 *
 * Returns true when both files hold identical content.
 */
using content_comparator = std::function<result<bool>(
    const std::filesystem::path&, const std::filesystem::path&)>;

/**
 * @brief Destinations already claimed by earlier units of the same batch
 *
 * Maps a claimed destination to the source that claimed it.
 */
using destination_reservations =
    std::map<std::filesystem::path, std::filesystem::path>;

/**
 * @brief Decides whether a source is skipped, placed as proposed, or renamed
 *
 * Given a proposed destination:
 * - if it does not exist, the source proceeds to it unchanged
 * - if it exists with identical content, the source is skipped
 * - otherwise the first free `stem_N.ext` (N = 1, 2, ...) in the same
 *   directory is chosen
 *
 * The resolver never mutates the filesystem.
 *
 * @code
 * duplicate_resolver resolver;
 * auto r = resolver.resolve("/in/a.txt", "/out/a.txt");
 * if (r && !is_skip(r.value())) {
 *     auto dest = std::get<proceed_decision>(r.value()).destination;
 * }
 * @endcode
 */
class duplicate_resolver {
public:
    /**
     * @brief Construct with the default SHA-256 comparator
     */
    duplicate_resolver();

    explicit duplicate_resolver(content_comparator comparator);

    /**
     * @brief Resolve a proposed destination against the filesystem
     * @return Decision, or error if the filesystem could not be inspected
     */
    [[nodiscard]] auto resolve(const std::filesystem::path& source,
                               const std::filesystem::path& proposed) const
        -> result<resolution>;

    /**
     * @brief Resolve against the filesystem and destinations claimed in the
     *        current batch
     *
     * A reserved destination counts as taken; it is compared against the
     * source that reserved it.
     */
    [[nodiscard]] auto resolve(const std::filesystem::path& source,
                               const std::filesystem::path& proposed,
                               const destination_reservations& reserved) const
        -> result<resolution>;

    /**
     * @brief Build the N-th rename candidate for a path
     *
     * `photo.jpg` with index 2 becomes `photo_2.jpg`; only the final
     * extension is split off (`a.tar.gz` becomes `a.tar_2.gz`).
     */
    [[nodiscard]] static auto candidate_name(const std::filesystem::path& proposed,
                                             unsigned int index)
        -> std::filesystem::path;

private:
    content_comparator comparator_;
};

}  // namespace kcenon::file_organizer

#endif  // KCENON_FILE_ORGANIZER_CORE_DUPLICATE_RESOLVER_H
