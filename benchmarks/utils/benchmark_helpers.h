/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_FILE_ORGANIZER_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_FILE_ORGANIZER_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kcenon::file_organizer::benchmark {

/**
 * @brief Generate random binary data
 * @param size Size in bytes
 * @param seed Random seed (0 for random)
 */
auto generate_random_data(std::size_t size, uint32_t seed = 0) -> std::vector<std::byte>;

/**
 * @brief Scratch source and destination trees for one benchmark
 *
 * Files are spread over `dirs` subdirectories of the source tree so the
 * post-transfer sweep has work to do. Everything is removed on destruction.
 */
class source_tree {
public:
    explicit source_tree(const std::string& name);
    ~source_tree();

    source_tree(const source_tree&) = delete;
    auto operator=(const source_tree&) -> source_tree& = delete;

    /**
     * @brief Create count files of size bytes spread over dirs directories
     * @return Paths of the created files
     */
    auto populate(std::size_t count, std::size_t size, std::size_t dirs = 4)
        -> std::vector<std::filesystem::path>;

    /**
     * @brief Remove the destination tree and recreate an empty source tree
     */
    void reset();

    [[nodiscard]] auto source_dir() const -> const std::filesystem::path& { return source_dir_; }
    [[nodiscard]] auto dest_dir() const -> const std::filesystem::path& { return dest_dir_; }

private:
    std::filesystem::path base_dir_;
    std::filesystem::path source_dir_;
    std::filesystem::path dest_dir_;
};

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t tiny_file = 4 * KB;
constexpr std::size_t small_file = 100 * KB;
constexpr std::size_t medium_file = 4 * MB;
}  // namespace sizes

}  // namespace kcenon::file_organizer::benchmark

#endif  // KCENON_FILE_ORGANIZER_BENCHMARKS_BENCHMARK_HELPERS_H
