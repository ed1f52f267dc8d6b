// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for unified_fs_system
 *
 * Central entry point for feature detection and integration flags.
 *
 * Feature categories:
 * - UNIFIED_FS_HAS_*     : Local feature availability (SFTP backend)
 * - KCENON_WITH_*        : System integration flags (inherited from common_system)
 *
 * @code
 * #include <kcenon/unified_fs/config/feature_flags.h>
 *
 * #if UNIFIED_FS_HAS_SFTP
 *     auto factory = std::make_shared<sftp::libssh2_session_factory>();
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define UNIFIED_FS_HAS_COMMON_FEATURE_FLAGS 1
#else
#define UNIFIED_FS_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// Unified FS Feature Flags
//==============================================================================

/**
 * @brief SFTP backend (libssh2)
 *
 * Set by CMake when libssh2 is found (UNIFIED_FS_ENABLE_SFTP). Without it
 * remote connections report connectivity_error unless the embedder supplies
 * its own session factory.
 */
#ifndef UNIFIED_FS_HAS_SFTP
    #if defined(UNIFIED_FS_ENABLE_SFTP)
        #define UNIFIED_FS_HAS_SFTP 1
    #else
        #define UNIFIED_FS_HAS_SFTP 0
    #endif
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (worker pool)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (structured logging)
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
 * @brief Whether log records are routed to logger_system
 *
 * logger_system depends on common_system, so both must be present.
 */
#ifndef UNIFIED_FS_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define UNIFIED_FS_USE_LOGGER_SYSTEM 1
    #else
        #define UNIFIED_FS_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef UNIFIED_FS_PRINT_FEATURE_SUMMARY

#pragma message("=== Unified FS Feature Summary ===")

#if UNIFIED_FS_HAS_SFTP
    #pragma message("  SFTP (libssh2): Enabled")
#else
    #pragma message("  SFTP (libssh2): Disabled")
#endif

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available")
#endif

#if UNIFIED_FS_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#pragma message("==================================")

#endif  // UNIFIED_FS_PRINT_FEATURE_SUMMARY
