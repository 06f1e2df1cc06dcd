/**
 * @file file_organizer.h
 * @brief Main header for file_organizer_system library
 * @version 0.1.0
 *
 * Include this header to access the transfer engine and its collaborators.
 *
 * @code
 * #include <kcenon/file_organizer/file_organizer.h>
 *
 * using namespace kcenon::file_organizer;
 *
 * auto files = source_scanner::scan("/inbox", {.recursive = true});
 * auto engine = transfer_engine::builder().with_max_workers(4).build();
 *
 * progress_ledger ledger;
 * auto r = engine.value().transfer(files.value(), "/sorted", ledger);
 * @endcode
 */

#ifndef KCENON_FILE_ORGANIZER_FILE_ORGANIZER_H
#define KCENON_FILE_ORGANIZER_FILE_ORGANIZER_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/file_organizer/core/types.h"
#include "kcenon/file_organizer/core/transfer_types.h"

// Collaborators
#include "kcenon/file_organizer/core/checksum.h"
#include "kcenon/file_organizer/core/directory_sweeper.h"
#include "kcenon/file_organizer/core/duplicate_resolver.h"
#include "kcenon/file_organizer/core/file_classifier.h"
#include "kcenon/file_organizer/core/progress_ledger.h"

// Engine
#include "kcenon/file_organizer/engine/transfer_engine.h"

// Adapters
#include "kcenon/file_organizer/adapters/thread_pool_adapter.h"

namespace kcenon::file_organizer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::file_organizer

#endif  // KCENON_FILE_ORGANIZER_FILE_ORGANIZER_H
