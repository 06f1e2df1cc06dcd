// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Feature flags for file_organizer_system
 *
 * Central entry point for the integration flags of the library. The
 * KCENON_WITH_* macros are set by CMake when the corresponding kcenon
 * package is found; every flag has a default of 0 so the header can also
 * be consumed by standalone builds.
 *
 * @code
 * #include <kcenon/file_organizer/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     pool = thread_system_pool_adapter::create_default(workers);
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// System Integration Flags
//==============================================================================

// common_system integration (Result types, ILogger interface)
#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (worker pool for transfer units)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (async console logging)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Logger System Integration Helper
//==============================================================================

/**
 * @brief Unified flag for logger_system usage in file_organizer
 *
 * logger_system depends on common_system, so both have to be present.
 */
#ifndef FILE_ORG_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define FILE_ORG_USE_LOGGER_SYSTEM 1
    #else
        #define FILE_ORG_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef FILE_ORG_PRINT_FEATURE_SUMMARY

#pragma message("=== File Organizer System Feature Summary ===")

#if KCENON_WITH_COMMON_SYSTEM
    #pragma message("  common_system: Available")
#else
    #pragma message("  common_system: Not Available")
#endif

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available (fixed worker pool)")
#endif

#if FILE_ORG_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available (stderr logging)")
#endif

#pragma message("=============================================")

#endif // FILE_ORG_PRINT_FEATURE_SUMMARY
