/**
 * @file file_classifier.h
 * @brief Extension based content classification and source listing
 */

#ifndef KCENON_FILE_ORGANIZER_CORE_FILE_CLASSIFIER_H
#define KCENON_FILE_ORGANIZER_CORE_FILE_CLASSIFIER_H

#include <kcenon/file_organizer/core/types.h>

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::file_organizer {

/**
 * @brief Broad content type of a file
 */
enum class content_type {
    image,
    video,
    audio,
    other,
};

[[nodiscard]] constexpr auto to_string(content_type type) noexcept -> std::string_view {
    switch (type) {
        case content_type::image:
            return "image";
        case content_type::video:
            return "video";
        case content_type::audio:
            return "audio";
        case content_type::other:
            return "other";
        default:
            return "unknown";
    }
}

/**
 * @brief Classifies files by their extension (case-insensitive)
 */
class file_classifier {
public:
    [[nodiscard]] static auto classify(const std::filesystem::path& path) -> content_type;

    /**
     * @brief Extensions (lowercase, with leading dot) of a content type
     *
     * Empty for content_type::other.
     */
    [[nodiscard]] static auto extensions(content_type type) -> const std::set<std::string>&;
};

/**
 * @brief Options for listing source files
 */
struct scan_options {
    bool recursive = false;
    /// Only files of these types; all regular files when empty
    std::set<content_type> types;
};

/**
 * @brief Materializes the flat list of source files a transfer consumes
 *
 * Only regular files are listed. Symbolic links are neither listed nor
 * followed. Output is sorted.
 */
class source_scanner {
public:
    [[nodiscard]] static auto scan(const std::filesystem::path& root,
                                   const scan_options& options = {})
        -> result<std::vector<std::filesystem::path>>;
};

}  // namespace kcenon::file_organizer

#endif  // KCENON_FILE_ORGANIZER_CORE_FILE_CLASSIFIER_H
