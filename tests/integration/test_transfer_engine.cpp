/**
 * @file test_transfer_engine.cpp
 * @brief Integration tests for the transfer engine on a real filesystem
 */

#include "test_fixtures.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <string>
#include <vector>

#include <unistd.h>

namespace kcenon::file_organizer::test {

// =============================================================================
// Builder
// =============================================================================

TEST(TransferEngineBuilderTest, RejectsExcessiveWorkerCount) {
    auto engine = transfer_engine::builder().with_max_workers(100000).build();

    ASSERT_FALSE(engine.has_value());
    EXPECT_EQ(engine.error().code, error_code::invalid_configuration);
}

TEST(TransferEngineBuilderTest, UsesSuppliedPool) {
    auto pool = std::make_shared<adapters::fixed_worker_pool>(1);
    auto engine = transfer_engine::builder()
        .with_max_workers(8)
        .with_thread_pool(pool)
        .build();

    ASSERT_TRUE(engine.has_value());
    EXPECT_EQ(engine.value().worker_count(), 1u);
}

// =============================================================================
// Sweep roots
// =============================================================================

TEST(SweepRootsTest, DistinctParentsDeepestFirst) {
    std::vector<std::filesystem::path> sources = {
        "/src/d1/a.txt", "/src/d2/b.txt", "/src/d2/nested/c.txt", "/src/d2/e.txt"};

    auto roots = transfer_engine::sweep_roots(sources, {});

    ASSERT_EQ(roots.size(), 3u);
    EXPECT_EQ(roots[0], std::filesystem::path("/src/d2/nested"));
    EXPECT_EQ(roots[1], std::filesystem::path("/src/d2"));
    EXPECT_EQ(roots[2], std::filesystem::path("/src/d1"));
}

TEST(SweepRootsTest, SourceRootCollapsesInnerDirectories) {
    std::vector<std::filesystem::path> sources = {
        "/src/d1/a.txt", "/src/d2/nested/c.txt", "/src/b.txt", "/other/x.txt"};

    transfer_options options;
    options.source_root = "/src/";

    auto roots = transfer_engine::sweep_roots(sources, options);

    ASSERT_EQ(roots.size(), 2u);
    EXPECT_EQ(roots[0], std::filesystem::path("/src"));
    EXPECT_EQ(roots[1], std::filesystem::path("/other"));
}

TEST(SweepRootsTest, SiblingWithCommonPrefixIsNotInsideRoot) {
    std::vector<std::filesystem::path> sources = {"/src2/a.txt"};

    transfer_options options;
    options.source_root = "/src";

    auto roots = transfer_engine::sweep_roots(sources, options);

    ASSERT_EQ(roots.size(), 1u);
    EXPECT_EQ(roots[0], std::filesystem::path("/src2"));
}

// =============================================================================
// Move, copy and cleanup
// =============================================================================

class TransferEngineTest : public EngineFixture {
protected:
    void create_layout() {
        a_ = create_text_file("d1/a.txt", "alpha");
        b_ = create_text_file("d2/b.txt", "bravo bravo");
        c_ = create_text_file("d2/nested/c.txt", "charlie charlie charlie");
    }

    auto layout() const -> std::vector<std::filesystem::path> { return {a_, b_, c_}; }

    std::filesystem::path a_;
    std::filesystem::path b_;
    std::filesystem::path c_;
};

TEST_F(TransferEngineTest, MoveWithRecursiveCleanupRemovesEmptiedDirectories) {
    create_layout();

    auto r = engine_->transfer(layout(), dest_dir_, ledger_, sweep_options(true));
    ASSERT_TRUE(r.has_value()) << r.error().message;

    EXPECT_FALSE(std::filesystem::exists(source_dir_ / "d1"));
    EXPECT_FALSE(std::filesystem::exists(source_dir_ / "d2" / "nested"));
    EXPECT_FALSE(std::filesystem::exists(source_dir_ / "d2"));
    EXPECT_TRUE(std::filesystem::exists(source_dir_));

    EXPECT_EQ(read_file(dest_dir_ / "a.txt"), "alpha");
    EXPECT_EQ(read_file(dest_dir_ / "b.txt"), "bravo bravo");
    EXPECT_EQ(read_file(dest_dir_ / "c.txt"), "charlie charlie charlie");

    auto summary = ledger_.summary();
    EXPECT_EQ(summary.total_files, 3u);
    EXPECT_EQ(summary.completed, 3u);
    EXPECT_EQ(summary.errors, 0u);
    EXPECT_EQ(summary.empty_dirs_removed, 3u);
    EXPECT_EQ(summary.cleanup_errors, 0u);
    EXPECT_DOUBLE_EQ(summary.percent_complete(), 100.0);

    for (const auto& source : layout()) {
        auto entry = ledger_.find(source);
        ASSERT_TRUE(entry.has_value());
        EXPECT_EQ(entry->status, transfer_status::completed);
        EXPECT_EQ(entry->progress, 100);
    }
}

TEST_F(TransferEngineTest, MoveWithNonRecursiveCleanupRemovesOnlyDirectChildren) {
    create_layout();

    auto r = engine_->transfer(layout(), dest_dir_, ledger_, sweep_options(false));
    ASSERT_TRUE(r.has_value()) << r.error().message;

    EXPECT_FALSE(std::filesystem::exists(source_dir_ / "d1"));
    EXPECT_TRUE(std::filesystem::exists(source_dir_ / "d2"));
    EXPECT_TRUE(std::filesystem::exists(source_dir_ / "d2" / "nested"));
    EXPECT_EQ(count_files(dest_dir_), 3u);
    EXPECT_EQ(ledger_.summary().empty_dirs_removed, 1u);
}

TEST_F(TransferEngineTest, CopyKeepsSourcesAndDirectories) {
    create_layout();

    auto options = sweep_options(true);
    options.delete_source = false;

    auto r = engine_->transfer(layout(), dest_dir_, ledger_, options);
    ASSERT_TRUE(r.has_value()) << r.error().message;

    for (const auto& source : layout()) {
        EXPECT_TRUE(std::filesystem::exists(source)) << source;
        EXPECT_EQ(read_file(source), read_file(dest_dir_ / source.filename()));
    }
    EXPECT_TRUE(std::filesystem::exists(source_dir_ / "d2" / "nested"));
    EXPECT_EQ(ledger_.summary().empty_dirs_found, 0u);
}

TEST_F(TransferEngineTest, CopyPreservesModificationTime) {
    auto source = create_text_file("photo.jpg", "pixels");
    auto stamp = std::filesystem::last_write_time(source) - std::chrono::hours(24);
    std::filesystem::last_write_time(source, stamp);

    transfer_options options;
    options.delete_source = false;

    auto r = engine_->transfer({source}, dest_dir_, ledger_, options);
    ASSERT_TRUE(r.has_value()) << r.error().message;

    EXPECT_EQ(std::filesystem::last_write_time(dest_dir_ / "photo.jpg"), stamp);
}

TEST_F(TransferEngineTest, CleanupDisabledKeepsEmptiedDirectories) {
    create_layout();

    auto options = sweep_options(true);
    options.cleanup.enabled = false;

    auto r = engine_->transfer(layout(), dest_dir_, ledger_, options);
    ASSERT_TRUE(r.has_value()) << r.error().message;

    EXPECT_TRUE(std::filesystem::exists(source_dir_ / "d1"));
    EXPECT_TRUE(std::filesystem::exists(source_dir_ / "d2" / "nested"));
    EXPECT_EQ(count_files(source_dir_), 0u);
}

TEST_F(TransferEngineTest, WithoutSourceRootSweepRootsThemselvesRemain) {
    create_layout();

    transfer_options options;

    auto r = engine_->transfer(layout(), dest_dir_, ledger_, options);
    ASSERT_TRUE(r.has_value()) << r.error().message;

    // Every parent directory is a sweep root; d2/nested is also a child of d2.
    EXPECT_TRUE(std::filesystem::exists(source_dir_ / "d1"));
    EXPECT_TRUE(std::filesystem::exists(source_dir_ / "d2"));
    EXPECT_FALSE(std::filesystem::exists(source_dir_ / "d2" / "nested"));
}

TEST_F(TransferEngineTest, IgnoredDirectoriesSurviveCleanup) {
    create_layout();
    std::filesystem::create_directories(source_dir_ / ".git" / "refs");
    std::filesystem::create_directories(source_dir_ / "d1" / "__pycache__");

    auto r = engine_->transfer(layout(), dest_dir_, ledger_, sweep_options(true));
    ASSERT_TRUE(r.has_value()) << r.error().message;

    EXPECT_TRUE(std::filesystem::exists(source_dir_ / ".git" / "refs"));
    EXPECT_TRUE(std::filesystem::exists(source_dir_ / "d1" / "__pycache__"));
    EXPECT_FALSE(std::filesystem::exists(source_dir_ / "d2"));
}

// =============================================================================
// Dry run
// =============================================================================

TEST_F(TransferEngineTest, DryRunLeavesFilesystemUntouched) {
    create_layout();

    auto options = sweep_options(true);
    options.dry_run = true;

    auto r = engine_->transfer(layout(), dest_dir_, ledger_, options);
    ASSERT_TRUE(r.has_value()) << r.error().message;

    EXPECT_FALSE(std::filesystem::exists(dest_dir_));
    for (const auto& source : layout()) {
        EXPECT_TRUE(std::filesystem::exists(source)) << source;
        auto entry = ledger_.find(source);
        ASSERT_TRUE(entry.has_value());
        EXPECT_EQ(entry->status, transfer_status::pending);
    }
    EXPECT_EQ(ledger_.summary().total_files, 3u);
    EXPECT_EQ(ledger_.summary().completed, 0u);
}

TEST_F(TransferEngineTest, DryRunLeavesExistingDestinationUnchanged) {
    auto source = create_text_file("a.txt", "new content");
    std::filesystem::create_directories(dest_dir_);
    {
        std::ofstream existing(dest_dir_ / "a.txt");
        existing << "old content";
    }

    transfer_options options;
    options.dry_run = true;

    auto r = engine_->transfer({source}, dest_dir_, ledger_, options);
    ASSERT_TRUE(r.has_value()) << r.error().message;

    EXPECT_EQ(read_file(dest_dir_ / "a.txt"), "old content");
    EXPECT_FALSE(std::filesystem::exists(dest_dir_ / "a_1.txt"));
    EXPECT_TRUE(std::filesystem::exists(source));
}

// =============================================================================
// Duplicates
// =============================================================================

TEST_F(TransferEngineTest, IdenticalDestinationIsSkipped) {
    auto source = create_text_file("a.txt", "same");
    std::filesystem::create_directories(dest_dir_);
    {
        std::ofstream existing(dest_dir_ / "a.txt");
        existing << "same";
    }

    auto r = engine_->transfer({source}, dest_dir_, ledger_);
    ASSERT_TRUE(r.has_value()) << r.error().message;

    EXPECT_TRUE(std::filesystem::exists(source));
    auto entry = ledger_.find(source);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->status, transfer_status::skipped);
    EXPECT_EQ(entry->progress, 100);
    EXPECT_EQ(ledger_.summary().skipped, 1u);
    EXPECT_EQ(count_files(dest_dir_), 1u);
}

TEST_F(TransferEngineTest, ConflictingDestinationIsRenamed) {
    auto source = create_text_file("a.txt", "mine");
    std::filesystem::create_directories(dest_dir_);
    {
        std::ofstream existing(dest_dir_ / "a.txt");
        existing << "theirs";
    }

    auto r = engine_->transfer({source}, dest_dir_, ledger_);
    ASSERT_TRUE(r.has_value()) << r.error().message;

    EXPECT_EQ(read_file(dest_dir_ / "a.txt"), "theirs");
    EXPECT_EQ(read_file(dest_dir_ / "a_1.txt"), "mine");
    EXPECT_FALSE(std::filesystem::exists(source));
}

TEST_F(TransferEngineTest, SameNameWithinBatchDoesNotCollide) {
    auto first = create_text_file("x/report.txt", "first");
    auto second = create_text_file("y/report.txt", "second");
    auto duplicate = create_text_file("z/report.txt", "first");

    auto r = engine_->transfer({first, second, duplicate}, dest_dir_, ledger_);
    ASSERT_TRUE(r.has_value()) << r.error().message;

    EXPECT_EQ(read_file(dest_dir_ / "report.txt"), "first");
    EXPECT_EQ(read_file(dest_dir_ / "report_1.txt"), "second");
    EXPECT_EQ(count_files(dest_dir_), 2u);
    EXPECT_EQ(ledger_.find(duplicate)->status, transfer_status::skipped);
    EXPECT_TRUE(std::filesystem::exists(duplicate));
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(TransferEngineTest, EmptyDestinationIsRejected) {
    auto source = create_text_file("a.txt", "alpha");

    auto r = engine_->transfer({source}, {}, ledger_);

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::invalid_destination);
    EXPECT_EQ(ledger_.size(), 0u);
}

TEST_F(TransferEngineTest, FailingUnitDoesNotStopSiblings) {
    create_layout();
    auto missing = source_dir_ / "d3" / "vanished.txt";
    std::vector<std::filesystem::path> sources = {a_, missing, b_, c_};

    auto r = engine_->transfer(sources, dest_dir_, ledger_, sweep_options(true));

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::move_failed);

    for (const auto& source : layout()) {
        auto entry = ledger_.find(source);
        ASSERT_TRUE(entry.has_value());
        EXPECT_EQ(entry->status, transfer_status::completed) << source;
    }
    auto failed = ledger_.find(missing);
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->status, transfer_status::error);
    EXPECT_TRUE(failed->error.has_value());

    auto summary = ledger_.summary();
    EXPECT_EQ(summary.completed, 3u);
    EXPECT_EQ(summary.errors, 1u);

    // No sweep after a failed unit.
    EXPECT_TRUE(std::filesystem::exists(source_dir_ / "d1"));
}

TEST_F(TransferEngineTest, FirstErrorInDispatchOrderIsReported) {
    auto good = create_text_file("good.txt", "fine");
    auto first_missing = source_dir_ / "first_missing.txt";
    auto second_missing = source_dir_ / "second_missing.txt";

    auto r = engine_->transfer({first_missing, good, second_missing}, dest_dir_, ledger_);

    ASSERT_FALSE(r.has_value());
    EXPECT_NE(r.error().message.find("first_missing.txt"), std::string::npos);
    EXPECT_EQ(ledger_.summary().errors, 2u);
    EXPECT_EQ(ledger_.find(good)->status, transfer_status::completed);
}

TEST_F(TransferEngineTest, ResolutionFailureMarksOnlyThatFile) {
    auto conflicted = create_text_file("a.txt", "alpha");
    auto clean = create_text_file("b.txt", "bravo");
    std::filesystem::create_directories(dest_dir_);
    {
        std::ofstream existing(dest_dir_ / "a.txt");
        existing << "occupied";
    }

    auto engine = transfer_engine::builder()
        .with_max_workers(2)
        .with_comparator([](const std::filesystem::path&,
                            const std::filesystem::path&) -> result<bool> {
            return unexpected{error{error_code::file_read_error, "cannot read"}};
        })
        .build();
    ASSERT_TRUE(engine.has_value());

    auto r = engine.value().transfer({conflicted, clean}, dest_dir_, ledger_);
    ASSERT_TRUE(r.has_value()) << r.error().message;

    auto entry = ledger_.find(conflicted);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->status, transfer_status::error);
    EXPECT_TRUE(std::filesystem::exists(conflicted));

    EXPECT_EQ(ledger_.find(clean)->status, transfer_status::completed);
    EXPECT_EQ(read_file(dest_dir_ / "b.txt"), "bravo");
    EXPECT_EQ(ledger_.summary().errors, 1u);
}

TEST_F(TransferEngineTest, BareFileNameDoesNotSweepWorkingDirectory) {
    auto work_dir = test_dir_ / "cwd";
    std::filesystem::create_directories(work_dir / "unrelated_empty" / "deep");
    {
        std::ofstream file(work_dir / "a.txt");
        file << "alpha";
    }

    auto previous = std::filesystem::current_path();
    std::filesystem::current_path(work_dir);
    auto r = engine_->transfer({"a.txt"}, dest_dir_, ledger_);
    std::filesystem::current_path(previous);

    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_EQ(read_file(dest_dir_ / "a.txt"), "alpha");
    EXPECT_FALSE(std::filesystem::exists(work_dir / "a.txt"));
    EXPECT_TRUE(std::filesystem::exists(work_dir / "unrelated_empty" / "deep"));

    auto summary = ledger_.summary();
    EXPECT_EQ(summary.empty_dirs_found, 0u);
    EXPECT_EQ(summary.empty_dirs_removed, 0u);
}

TEST_F(TransferEngineTest, CleanupFailureIsCountedWithoutFailingTransfer) {
    auto a = create_text_file("dir1/a.txt", "alpha");
    auto b = create_text_file("dir2/b.txt", "bravo");
    auto restricted = source_dir_ / "dir2" / "restricted";
    std::filesystem::create_directories(restricted);
    std::filesystem::permissions(restricted, std::filesystem::perms::none);

    auto r = engine_->transfer({a, b}, dest_dir_, ledger_, sweep_options(true));

    std::error_code ec;
    std::filesystem::permissions(restricted, std::filesystem::perms::owner_all, ec);

    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_FALSE(std::filesystem::exists(source_dir_ / "dir1"));
    EXPECT_EQ(ledger_.summary().completed, 2u);

    // Permission bits do not stop root from listing the directory.
    if (::geteuid() != 0) {
        EXPECT_GE(ledger_.summary().cleanup_errors, 1u);
        EXPECT_TRUE(std::filesystem::exists(source_dir_ / "dir2"));
    }
}

/**
 * @brief Pool that places a file at a destination just before running each unit
 */
class occupying_pool : public adapters::worker_pool_interface {
public:
    explicit occupying_pool(std::filesystem::path occupied)
        : occupied_(std::move(occupied)) {}

    std::future<void> submit(std::function<void()> task) override {
        std::filesystem::create_directories(occupied_.parent_path());
        {
            std::ofstream file(occupied_);
            file << "late arrival";
        }
        return inner_.submit(std::move(task));
    }

    [[nodiscard]] size_t worker_count() const override { return inner_.worker_count(); }
    [[nodiscard]] bool is_running() const override { return inner_.is_running(); }
    [[nodiscard]] size_t pending_tasks() const override { return inner_.pending_tasks(); }

private:
    std::filesystem::path occupied_;
    adapters::fixed_worker_pool inner_{1};
};

TEST_F(TransferEngineTest, MoveRefusesDestinationCreatedAfterResolution) {
    auto source = create_text_file("a.txt", "alpha");
    auto engine = transfer_engine::builder()
        .with_thread_pool(std::make_shared<occupying_pool>(dest_dir_ / "a.txt"))
        .build();
    ASSERT_TRUE(engine.has_value());

    auto r = engine.value().transfer({source}, dest_dir_, ledger_);

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::move_failed);
    EXPECT_EQ(read_file(dest_dir_ / "a.txt"), "late arrival");
    EXPECT_EQ(read_file(source), "alpha");
    EXPECT_EQ(ledger_.find(source)->status, transfer_status::error);
}

TEST_F(TransferEngineTest, EmptyBatchSucceeds) {
    auto r = engine_->transfer({}, dest_dir_, ledger_, sweep_options(true));

    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(ledger_.summary().total_files, 0u);
    EXPECT_DOUBLE_EQ(ledger_.summary().percent_complete(), 0.0);
}

TEST_F(TransferEngineTest, EngineIsReusableAcrossRuns) {
    auto first = create_text_file("one/a.txt", "alpha");
    ASSERT_TRUE(engine_->transfer({first}, dest_dir_, ledger_).has_value());

    auto second = create_text_file("two/b.txt", "bravo");
    ASSERT_TRUE(engine_->transfer({second}, dest_dir_, ledger_).has_value());

    EXPECT_EQ(count_files(dest_dir_), 2u);
    EXPECT_EQ(ledger_.summary().total_files, 2u);
    EXPECT_EQ(ledger_.summary().completed, 2u);
}

}  // namespace kcenon::file_organizer::test
