#pragma once

// =========================================================================================================
// Platform
// =========================================================================================================
// SC_COMPILER_MSVC or SC_COMPILER_POSIX (gcc, clang, mingw)
// SC_OS_WINDOWS, SC_OS_APPLE or SC_OS_LINUX

#if defined(_MSC_VER) && !defined(__clang__)
#define SC_COMPILER_MSVC
#elif defined(__GNUC__) || defined(__clang__)
#define SC_COMPILER_POSIX
#else
#error "unsupported compiler"
#endif

#if defined(_WIN32)
#define SC_OS_WINDOWS
#elif defined(__APPLE__)
#define SC_OS_APPLE
#elif defined(__linux__)
#define SC_OS_LINUX
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
// CMake defines one of SC_DEBUG, SC_RELWITHDEBINFO, SC_RELEASE (and optionally SC_ENABLE_ASSERT_IN_RELEASE).
// SC_ASSERT_ENABLED decides whether plain SC_ASSERT checks are compiled in.

#ifndef SC_ASSERT_ENABLED
#if defined(SC_DEBUG) || defined(SC_RELWITHDEBINFO) || defined(SC_ENABLE_ASSERT_IN_RELEASE)
#define SC_ASSERT_ENABLED 1
#else
#define SC_ASSERT_ENABLED 0
#endif
#endif

// =========================================================================================================
// Attributes
// =========================================================================================================

// SC_FORCE_INLINE - for one-line helpers like sc::move that should never show up in a debugger
// SC_COLD_FUNC - for failure paths (assertion handling)
#ifdef SC_COMPILER_MSVC
#define SC_FORCE_INLINE __forceinline
#define SC_COLD_FUNC
#else
// gcc needs the extra 'inline'
#define SC_FORCE_INLINE __attribute__((always_inline)) inline
#define SC_COLD_FUNC __attribute__((cold))
#endif

// SC_UNUSED(expr) - marks expr as used without evaluating it
#define SC_UNUSED(expr) (void)(sizeof((expr)))
