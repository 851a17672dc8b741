/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MSHC_HOMOG_CONFIG_H
#define MSHC_HOMOG_CONFIG_H

/**
 * @file HomogConfig.h
 * @brief Compile-time configuration for the homogenization library
 *
 * Feature flags are normalized to numeric macros so that they can be used in
 * `#if` expressions. Settings can be overridden from CMake.
 */

#include "Types.h"

// ============================================================================
// Build Configuration Detection
// ============================================================================

#if !defined(NDEBUG) || defined(DEBUG) || defined(_DEBUG)
    #define HOMOG_DEBUG_MODE 1
#else
    #define HOMOG_DEBUG_MODE 0
#endif

// MPI support: CMake defines HOMOG_ENABLE_MPI when an MPI implementation is found.
#ifdef HOMOG_HAS_MPI
#  undef HOMOG_HAS_MPI
#endif
#if defined(HOMOG_ENABLE_MPI)
#  define HOMOG_HAS_MPI 1
#else
#  define HOMOG_HAS_MPI 0
#endif

#ifdef _OPENMP
    #define HOMOG_HAS_OPENMP 1
#else
    #define HOMOG_HAS_OPENMP 0
#endif

// ============================================================================
// Version
// ============================================================================

#define HOMOG_VERSION_MAJOR 1
#define HOMOG_VERSION_MINOR 0
#define HOMOG_VERSION_PATCH 0

namespace mshc {
namespace Homog {
namespace config {

/**
 * @brief Largest spatial dimension of a unit cell
 */
#ifndef HOMOG_MAX_DIM
    constexpr int MAX_SPATIAL_DIM = 3;
#else
    constexpr int MAX_SPATIAL_DIM = HOMOG_MAX_DIM;
#endif

/**
 * @brief Default tolerance used when verifying tensor symmetry
 */
constexpr Real DEFAULT_SYMMETRY_TOLERANCE = 1e-10;

inline const char* version_string() noexcept {
    return "1.0.0";
}

} // namespace config

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define HOMOG_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define HOMOG_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define HOMOG_LIKELY(x)   (x)
    #define HOMOG_UNLIKELY(x) (x)
#endif

} // namespace Homog
} // namespace mshc

#endif // MSHC_HOMOG_CONFIG_H
