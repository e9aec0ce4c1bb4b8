#pragma once

/**
 * @file config.hpp
 * @brief Compile-time capability flags.
 *
 * Each capability is fixed for the whole program and can be switched off
 * independently. With every flag at 0 the core still parses correctly, it
 * only reports less.
 *
 * Macros (0 or 1, default 1):
 *   WARY_ENABLE_RETRY        - Retryable errors for incomplete input
 *   WARY_ENABLE_FULL_CONTEXT - Heap-backed context chain (otherwise the terminal failure only)
 *   WARY_ENABLE_SIMD         - SSE2 / NEON fast-scan backends
 *   WARY_ENABLE_UNICODE      - Display-width aware report columns
 *
 * Usage:
 *   cmake -DWARY_ENABLE_FULL_CONTEXT=OFF ..
 * or define the macro before the first wary include.
 */

#ifndef WARY_ENABLE_RETRY
    #define WARY_ENABLE_RETRY 1
#endif

#ifndef WARY_ENABLE_FULL_CONTEXT
    #define WARY_ENABLE_FULL_CONTEXT 1
#endif

#ifndef WARY_ENABLE_SIMD
    #define WARY_ENABLE_SIMD 1
#endif

#ifndef WARY_ENABLE_UNICODE
    #define WARY_ENABLE_UNICODE 1
#endif

// SIMD backend detection
#if WARY_ENABLE_SIMD
    #if defined(__ARM_NEON__) || defined(__ARM_NEON)
        #define WARY_SIMD_NEON 1
    #elif defined(__SSE2__) || (defined(_MSC_VER) && (defined(_M_X64) || defined(_M_IX86)))
        #define WARY_SIMD_SSE2 1
    #endif
#endif

namespace wary::config {

inline constexpr bool retry = WARY_ENABLE_RETRY != 0;
inline constexpr bool full_context = WARY_ENABLE_FULL_CONTEXT != 0;
inline constexpr bool unicode = WARY_ENABLE_UNICODE != 0;

#if defined(WARY_SIMD_NEON) || defined(WARY_SIMD_SSE2)
inline constexpr bool simd = true;
#else
inline constexpr bool simd = false;
#endif

} // namespace wary::config
