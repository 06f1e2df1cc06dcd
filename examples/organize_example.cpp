/**
 * @file organize_example.cpp
 * @brief Organize files from a source directory into a destination
 *
 * This example demonstrates:
 * - Listing source files with source_scanner (optionally by content type)
 * - Running a transfer on a bounded worker pool
 * - Polling the progress ledger from a separate thread
 * - Cleaning up directories emptied by a move
 */

#include <kcenon/file_organizer/file_organizer.h>
#include <kcenon/file_organizer/core/logging.h>

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

using namespace kcenon::file_organizer;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <source> <destination> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --delete-source     Move files instead of copying them\n"
              << "  --type <kind>       Only image, video or audio files\n"
              << "  --recursive         Include files in subdirectories\n"
              << "  --test              Dry run: resolve only, change nothing\n"
              << "  --no-cleanup        Keep directories emptied by a move\n"
              << "  --no-recursive-cleanup\n"
              << "                      Only remove empty direct children of source\n"
              << "  --workers <n>       Worker threads (default: hardware concurrency)\n"
              << "  --json-log          Emit log records as JSON\n"
              << "  --verbose           Enable debug logging\n"
              << "  --version           Print version and exit\n";
}

auto parse_type(const std::string& name) -> std::optional<content_type> {
    if (name == "image") return content_type::image;
    if (name == "video") return content_type::video;
    if (name == "audio") return content_type::audio;
    return std::nullopt;
}

void print_progress(const ledger_summary& summary) {
    std::cout << "\r[Progress] " << std::fixed << std::setprecision(2)
              << summary.percent_complete() << "% "
              << "(" << summary.completed << " done, " << summary.skipped << " skipped, "
              << summary.errors << " failed of " << summary.total_files << ")"
              << std::flush;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc >= 2 && std::string(argv[1]) == "--version") {
        std::cout << "file_organizer " << version::to_string() << std::endl;
        return 0;
    }
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::filesystem::path source = argv[1];
    std::filesystem::path destination = argv[2];

    transfer_options options;
    options.delete_source = false;
    options.source_root = source;

    scan_options scan;
    std::size_t workers = 0;

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--delete-source") {
            options.delete_source = true;
        } else if (arg == "--type") {
            if (++i >= argc) {
                std::cerr << "--type requires a value" << std::endl;
                return 1;
            }
            auto type = parse_type(argv[i]);
            if (!type) {
                std::cerr << "Unknown type: " << argv[i] << std::endl;
                return 1;
            }
            scan.types.insert(*type);
        } else if (arg == "--recursive") {
            scan.recursive = true;
        } else if (arg == "--test") {
            options.dry_run = true;
        } else if (arg == "--no-cleanup") {
            options.cleanup.enabled = false;
        } else if (arg == "--no-recursive-cleanup") {
            options.cleanup.recursive = false;
        } else if (arg == "--workers") {
            if (++i >= argc) {
                std::cerr << "--workers requires a value" << std::endl;
                return 1;
            }
            try {
                workers = static_cast<std::size_t>(std::stoul(argv[i]));
            } catch (const std::exception&) {
                std::cerr << "Invalid worker count: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg == "--json-log") {
            get_logger().set_output_format(log_output_format::json);
        } else if (arg == "--verbose") {
            get_logger().set_level(log_level::debug);
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    auto files = source_scanner::scan(source, scan);
    if (!files) {
        std::cerr << "Failed to list source: " << files.error().message << std::endl;
        return 1;
    }
    std::cout << "Found " << files.value().size() << " files in " << source << std::endl;

    auto engine_result = transfer_engine::builder()
        .with_max_workers(workers)
        .build();

    if (!engine_result.has_value()) {
        std::cerr << "Failed to create engine: "
                  << engine_result.error().message << std::endl;
        return 1;
    }

    auto& engine = engine_result.value();
    progress_ledger ledger;

    // Presentation layer: poll snapshots while the workers run
    std::atomic<bool> done{false};
    std::thread monitor([&ledger, &done] {
        while (!done.load()) {
            print_progress(ledger.summary());
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    });

    auto start = std::chrono::steady_clock::now();
    auto result = engine.transfer(files.value(), destination, ledger, options);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    done = true;
    monitor.join();
    print_progress(ledger.summary());
    std::cout << std::endl;

    if (options.dry_run) {
        for (const auto& [path, entry] : ledger.entries()) {
            std::cout << "  " << to_string(entry.status) << "  " << path.string() << std::endl;
        }
    }

    std::cout << "Summary: " << ledger.summary().to_json() << std::endl;
    std::cout << "Elapsed: " << elapsed.count() << " ms" << std::endl;

    get_logger().flush();

    if (!result.has_value()) {
        std::cerr << "Transfer failed: " << result.error().message << std::endl;
        return 1;
    }
    return 0;
}
