/**
 * @file test_fixtures.h
 * @brief Test fixtures for integration tests
 */

#ifndef KCENON_FILE_ORGANIZER_TEST_FIXTURES_H
#define KCENON_FILE_ORGANIZER_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/file_organizer/file_organizer.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace kcenon::file_organizer::test {

/**
 * @brief Test fixture for temporary directory management
 *
 * Lays out `source/` and `dest/` below a unique temporary directory.
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("file_org_test_" + std::to_string(std::random_device{}()));
        source_dir_ = test_dir_ / "source";
        dest_dir_ = test_dir_ / "dest";
        std::filesystem::create_directories(source_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_text_file(const std::filesystem::path& relative, const std::string& content)
        -> std::filesystem::path {
        auto path = source_dir_ / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path;
    }

    auto create_binary_file(const std::filesystem::path& relative, std::size_t size,
                            unsigned int seed = 42) -> std::filesystem::path {
        auto path = source_dir_ / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);

        std::mt19937 gen(seed);
        std::uniform_int_distribution<> dis(0, 255);

        for (std::size_t i = 0; i < size; ++i) {
            char byte = static_cast<char>(dis(gen));
            file.write(&byte, 1);
        }

        return path;
    }

    static auto read_file(const std::filesystem::path& path) -> std::string {
        std::ifstream file(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    }

    static auto count_files(const std::filesystem::path& dir) -> std::size_t {
        if (!std::filesystem::exists(dir)) {
            return 0;
        }
        std::size_t count = 0;
        for (const auto& entry : std::filesystem::recursive_directory_iterator(dir)) {
            if (entry.is_regular_file()) {
                ++count;
            }
        }
        return count;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path source_dir_;
    std::filesystem::path dest_dir_;
};

/**
 * @brief Test fixture owning a transfer engine and a ledger
 */
class EngineFixture : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();

        auto engine_result = transfer_engine::builder()
            .with_max_workers(4)
            .build();

        ASSERT_TRUE(engine_result.has_value()) << "Failed to create engine";
        engine_ = std::make_unique<transfer_engine>(std::move(engine_result.value()));
    }

    void TearDown() override {
        engine_.reset();
        TempDirectoryFixture::TearDown();
    }

    /**
     * @brief Options sweeping through the source directory
     */
    auto sweep_options(bool recursive) const -> transfer_options {
        transfer_options options;
        options.cleanup.recursive = recursive;
        options.source_root = source_dir_;
        return options;
    }

    std::unique_ptr<transfer_engine> engine_;
    progress_ledger ledger_;
};

}  // namespace kcenon::file_organizer::test

#endif  // KCENON_FILE_ORGANIZER_TEST_FIXTURES_H
