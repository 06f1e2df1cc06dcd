/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <fstream>
#include <random>

namespace kcenon::file_organizer::benchmark {

auto generate_random_data(std::size_t size, uint32_t seed) -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

source_tree::source_tree(const std::string& name)
    : base_dir_(std::filesystem::temp_directory_path() / ("file_org_bench_" + name)),
      source_dir_(base_dir_ / "source"),
      dest_dir_(base_dir_ / "dest") {
    reset();
}

source_tree::~source_tree() {
    std::error_code ec;
    std::filesystem::remove_all(base_dir_, ec);
}

auto source_tree::populate(std::size_t count, std::size_t size, std::size_t dirs)
    -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> files;
    files.reserve(count);

    auto data = generate_random_data(size, 42);
    for (std::size_t i = 0; i < count; ++i) {
        auto dir = source_dir_ / ("dir_" + std::to_string(i % (dirs == 0 ? 1 : dirs)));
        std::filesystem::create_directories(dir);

        auto path = dir / ("file_" + std::to_string(i) + ".bin");
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        files.push_back(path);
    }
    return files;
}

void source_tree::reset() {
    std::error_code ec;
    std::filesystem::remove_all(base_dir_, ec);
    std::filesystem::create_directories(source_dir_, ec);
}

}  // namespace kcenon::file_organizer::benchmark
