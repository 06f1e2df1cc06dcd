/**
 * @file checksum.h
 * @brief Content digest utilities used for duplicate detection
 */

#ifndef KCENON_FILE_ORGANIZER_CORE_CHECKSUM_H
#define KCENON_FILE_ORGANIZER_CORE_CHECKSUM_H

#include <kcenon/file_organizer/core/types.h>

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>

namespace kcenon::file_organizer {

/**
 * @brief SHA-256 digests and content comparison
 *
 * Digests are computed with OpenSSL EVP and returned as lowercase hex.
 */
class checksum {
public:
    /**
     * @brief Calculate SHA-256 hash of a file
     * @param path Path to the file
     * @return SHA-256 hash as hex string, or error
     */
    [[nodiscard]] static auto sha256_file(const std::filesystem::path& path)
        -> result<std::string>;

    /**
     * @brief Calculate SHA-256 hash of data
     * @param data Input data span
     * @return SHA-256 hash as hex string (empty if the digest engine fails)
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> std::string;

    /**
     * @brief Verify SHA-256 hash of a file
     * @return true if hash matches, false otherwise
     */
    [[nodiscard]] static auto verify_sha256(
        const std::filesystem::path& path, const std::string& expected) -> bool;

    /**
     * @brief Check whether two files hold byte-identical content
     *
     * Sizes are compared first; digests are only computed for files of
     * equal size.
     *
     * @return true if identical, false if different, or error if either
     *         file cannot be read
     */
    [[nodiscard]] static auto files_identical(const std::filesystem::path& lhs,
                                              const std::filesystem::path& rhs)
        -> result<bool>;
};

}  // namespace kcenon::file_organizer

#endif  // KCENON_FILE_ORGANIZER_CORE_CHECKSUM_H
