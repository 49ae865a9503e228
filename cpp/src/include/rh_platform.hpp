#pragma once
/**
 * @file rh_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * Every file that needs platform macros (RELAYHUB_PLATFORM_WIN64, RELAYHUB_IS_POSIX, etc.)
 * should include this. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_WIN64, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64)

#define RELAYHUB_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#elif defined(PLATFORM_APPLE)

#define RELAYHUB_PLATFORM_APPLE 1

#elif defined(PLATFORM_FREEBSD)

#define RELAYHUB_PLATFORM_FREEBSD 1

#elif defined(PLATFORM_LINUX)

#define RELAYHUB_PLATFORM_LINUX 1

#else
// Fallback detection
#if defined(_WIN64)
#define RELAYHUB_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#elif defined(__APPLE__)
#define RELAYHUB_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define RELAYHUB_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define RELAYHUB_PLATFORM_LINUX 1
#else
#define RELAYHUB_PLATFORM_UNKNOWN 1
#endif
#endif

// Convenience booleans for source code usage:
#if defined(RELAYHUB_PLATFORM_WIN64)
#define RELAYHUB_IS_WINDOWS 1
#undef RELAYHUB_IS_POSIX
#elif defined(RELAYHUB_PLATFORM_APPLE) || defined(RELAYHUB_PLATFORM_FREEBSD) ||                    \
    defined(RELAYHUB_PLATFORM_LINUX)
#undef RELAYHUB_IS_WINDOWS
#define RELAYHUB_IS_POSIX 1
#else
#undef RELAYHUB_IS_WINDOWS
#undef RELAYHUB_IS_POSIX
#endif

// --- Require C++20 or later --------------------------------------------------
// For GCC/Clang use __cplusplus; for MSVC use _MSVC_LANG (MSVC sets __cplusplus only when
// /Zc:__cplusplus is enabled).
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "relayhub_utils_export.h"

namespace relayhub::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
RELAYHUB_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;
/**
 * @brief Gets the process ID (PID) for the current process.
 * @return A 64-bit unsigned integer representing the process ID.
 */
RELAYHUB_UTILS_EXPORT uint64_t get_pid();

/**
 * @brief Checks if a process with the given PID is currently alive.
 * @details Uses platform-specific APIs:
 *          - Windows: OpenProcess() + GetExitCodeProcess()
 *          - POSIX: kill(pid, 0) with errno check
 * @param pid The process ID to check.
 * @return True if the process is alive, false otherwise.
 * @note PID 0 always returns false (invalid/system PID).
 * @note On POSIX, EPERM (permission denied) is treated as "alive".
 */
RELAYHUB_UTILS_EXPORT bool is_process_alive(uint64_t pid) noexcept;

} // namespace relayhub::platform
