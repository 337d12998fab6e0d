/**
 * @file Platform.hpp
 * @brief Compile-time platform detection and branch-prediction hints.
 *
 * The backend factories use the OS macros to decide which source and
 * device kinds are compiled in; callers never test them directly.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef PENSTEER_CORE_PLATFORM_HPP
    #define PENSTEER_CORE_PLATFORM_HPP

// ---- Operating System ----------------------------------------------------

    #if defined(_WIN32) || defined(_WIN64)
        #define PENSTEER_OS_WINDOWS 1
    #elif defined(__linux__)
        #define PENSTEER_OS_LINUX   1
    #elif defined(__APPLE__)
        #define PENSTEER_OS_MACOS   1
    #else
        #define PENSTEER_OS_UNKNOWN 1
    #endif

// ---- Compiler ------------------------------------------------------------

    #if defined(__clang__)
        #define PENSTEER_COMPILER_CLANG 1
    #elif defined(__GNUC__)
        #define PENSTEER_COMPILER_GCC   1
    #elif defined(_MSC_VER)
        #define PENSTEER_COMPILER_MSVC  1
    #else
        #define PENSTEER_COMPILER_UNKNOWN 1
    #endif

// ---- Intrinsics ----------------------------------------------------------

    #if defined(PENSTEER_COMPILER_GCC) || defined(PENSTEER_COMPILER_CLANG)
        #define PENSTEER_LIKELY(x)   __builtin_expect(!!(x), 1)
        #define PENSTEER_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #else
        #define PENSTEER_LIKELY(x)   (x)
        #define PENSTEER_UNLIKELY(x) (x)
    #endif

#endif // PENSTEER_CORE_PLATFORM_HPP
