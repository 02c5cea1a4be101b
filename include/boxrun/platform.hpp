#pragma once

/// @file platform.hpp
/// @brief Platform and standard feature detection macros.

#include <version>

// Values are 0 or 1 for use in #if expressions.

#if defined(__linux__)
/// @brief True when building for Linux.
#define BOXRUN_PLATFORM_LINUX 1
#else
/// @brief True when building for Linux.
#define BOXRUN_PLATFORM_LINUX 0
#endif

#if defined(__APPLE__) && defined(__MACH__)
/// @brief True when building for macOS.
#define BOXRUN_PLATFORM_MACOS 1
#else
/// @brief True when building for macOS.
#define BOXRUN_PLATFORM_MACOS 0
#endif

#if !defined(_WIN32) && (defined(__unix__) || BOXRUN_PLATFORM_MACOS || BOXRUN_PLATFORM_LINUX)
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when building for a POSIX-like platform.
#define BOXRUN_PLATFORM_POSIX 1
#else
// NOLINTNEXTLINE(modernize-macro-to-enum)
/// @brief True when building for a POSIX-like platform.
#define BOXRUN_PLATFORM_POSIX 0
#endif

#if !BOXRUN_PLATFORM_POSIX
#error "boxrun requires a POSIX host (process groups, fork/exec, pipes)"
#endif

#if defined(_MSVC_LANG) && _MSVC_LANG > __cplusplus
/// @brief Active C++ language version (MSVC uses _MSVC_LANG).
#define BOXRUN_CPLUSPLUS _MSVC_LANG
#else
/// @brief Active C++ language version.
#define BOXRUN_CPLUSPLUS __cplusplus
#endif

#if BOXRUN_CPLUSPLUS < 202002L
#error "boxrun requires at least C++20"
#endif
