// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Feature flags for object_batch
 *
 * Central entry point for the integration flags of the object_batch library.
 *
 * - KCENON_WITH_*               : System integration flags (set by CMake or
 *                                 inherited from common_system)
 * - OBJECT_BATCH_USE_LOGGER_SYSTEM : logger_system backs the batch logger
 *
 * @code
 * #include <kcenon/object_batch/config/feature_flags.h>
 *
 * #if OBJECT_BATCH_USE_LOGGER_SYSTEM
 *     logger_->log(level, message);
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags when that module is linked
//==============================================================================

#if defined(BUILD_WITH_COMMON_SYSTEM)
#include <kcenon/common/config/feature_flags.h>
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
 * @brief Unified flag for logger_system usage in object_batch
 *
 * logger_system depends on common_system, so both integrations must be on.
 */
#ifndef OBJECT_BATCH_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define OBJECT_BATCH_USE_LOGGER_SYSTEM 1
    #else
        #define OBJECT_BATCH_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef OBJECT_BATCH_PRINT_FEATURE_SUMMARY

#pragma message("=== Object Batch Feature Summary ===")

#if KCENON_WITH_COMMON_SYSTEM
    #pragma message("  common_system: Available")
#else
    #pragma message("  common_system: Not Available")
#endif

#if OBJECT_BATCH_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Enabled")
#else
    #pragma message("  logger_system: Disabled (stderr logging)")
#endif

#pragma message("====================================")

#endif // OBJECT_BATCH_PRINT_FEATURE_SUMMARY
