/**
 * @file file_classifier.cpp
 * @brief Implementation of content classification and source listing
 */

#include <kcenon/file_organizer/core/file_classifier.h>

#include <kcenon/file_organizer/core/logging.h>

#include <algorithm>
#include <cctype>
#include <system_error>

namespace kcenon::file_organizer {

namespace {

const std::set<std::string>& image_extensions() {
    static const std::set<std::string> exts = {
        ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tiff", ".webp"};
    return exts;
}

const std::set<std::string>& video_extensions() {
    static const std::set<std::string> exts = {
        ".mp4", ".avi", ".mov", ".wmv", ".flv", ".mkv"};
    return exts;
}

const std::set<std::string>& audio_extensions() {
    static const std::set<std::string> exts = {
        ".mp3", ".wav", ".ogg", ".m4a", ".aac"};
    return exts;
}

auto lowercase_extension(const std::filesystem::path& path) -> std::string {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext;
}

auto accepts(const std::filesystem::path& path, const scan_options& options) -> bool {
    if (options.types.empty()) {
        return true;
    }
    return options.types.count(file_classifier::classify(path)) != 0;
}

}  // namespace

auto file_classifier::classify(const std::filesystem::path& path) -> content_type {
    auto ext = lowercase_extension(path);
    if (ext.empty()) {
        return content_type::other;
    }
    if (image_extensions().count(ext) != 0) {
        return content_type::image;
    }
    if (video_extensions().count(ext) != 0) {
        return content_type::video;
    }
    if (audio_extensions().count(ext) != 0) {
        return content_type::audio;
    }
    return content_type::other;
}

auto file_classifier::extensions(content_type type) -> const std::set<std::string>& {
    static const std::set<std::string> none;
    switch (type) {
        case content_type::image:
            return image_extensions();
        case content_type::video:
            return video_extensions();
        case content_type::audio:
            return audio_extensions();
        default:
            return none;
    }
}

auto source_scanner::scan(const std::filesystem::path& root, const scan_options& options)
    -> result<std::vector<std::filesystem::path>> {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return unexpected{error{error_code::invalid_file_path,
                                "source is not a directory: " + root.string()}};
    }

    std::vector<std::filesystem::path> files;
    auto collect = [&](const std::filesystem::directory_entry& entry) {
        std::error_code status_ec;
        if (entry.is_symlink(status_ec) || !entry.is_regular_file(status_ec)) {
            return;
        }
        if (accepts(entry.path(), options)) {
            files.push_back(entry.path());
        }
    };

    if (options.recursive) {
        std::filesystem::recursive_directory_iterator it(
            root, std::filesystem::directory_options::skip_permission_denied, ec);
        for (std::filesystem::recursive_directory_iterator end; !ec && it != end;
             it.increment(ec)) {
            collect(*it);
        }
    } else {
        std::filesystem::directory_iterator it(
            root, std::filesystem::directory_options::skip_permission_denied, ec);
        for (std::filesystem::directory_iterator end; !ec && it != end; it.increment(ec)) {
            collect(*it);
        }
    }

    if (ec) {
        return unexpected{error{error_code::file_read_error,
                                "cannot list " + root.string() + ": " + ec.message()}};
    }

    std::sort(files.begin(), files.end());
    FO_LOG_DEBUG(log_category::scanner,
                 "Found " + std::to_string(files.size()) + " files in " + root.string());
    return files;
}

}  // namespace kcenon::file_organizer
