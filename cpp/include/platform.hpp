/*******************************************************************************
 * @file include/platform.hpp
 * @brief Platform detection macros and the process-level OS queries.
 *
 * The process queries (`get_pid`, `is_process_alive`, `get_native_thread_id`)
 * are the only OS facts the lock layer needs besides plain file operations.
 * `is_process_alive` is the default liveness oracle used by `FileLock` to
 * decide whether a marker file has been abandoned by a crashed owner.
 ******************************************************************************/
#pragma once

#include <cstdint>

#include "lockstore_utils_export.h"

// Prefer the build-system provided macros (PLATFORM_WIN64, PLATFORM_APPLE, PLATFORM_FREEBSD,
// PLATFORM_LINUX, PLATFORM_UNKNOWN). If they are not defined by the build system, fall back to
// compiler predefined macros.

#if defined(PLATFORM_WIN64)
#define LOCKSTORE_PLATFORM_WIN64 1
#elif defined(PLATFORM_APPLE)
#define LOCKSTORE_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD)
#define LOCKSTORE_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX)
#define LOCKSTORE_PLATFORM_LINUX 1
#elif defined(PLATFORM_UNKNOWN)
#define LOCKSTORE_PLATFORM_UNKNOWN 1
#else
// Fallback detection
#if defined(_WIN64)
#define LOCKSTORE_PLATFORM_WIN64 1
#elif defined(__APPLE__) && defined(__MACH__)
#define LOCKSTORE_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define LOCKSTORE_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define LOCKSTORE_PLATFORM_LINUX 1
#else
#define LOCKSTORE_PLATFORM_UNKNOWN 1
#endif
#endif

// Convenience booleans for source code usage:
#if defined(LOCKSTORE_PLATFORM_WIN64)
#define LOCKSTORE_IS_WINDOWS 1
#define LOCKSTORE_IS_POSIX 0
#elif defined(LOCKSTORE_PLATFORM_APPLE) || defined(LOCKSTORE_PLATFORM_FREEBSD) ||                  \
    defined(LOCKSTORE_PLATFORM_LINUX)
#define LOCKSTORE_IS_WINDOWS 0
#define LOCKSTORE_IS_POSIX 1
#else
#define LOCKSTORE_IS_WINDOWS 0
#define LOCKSTORE_IS_POSIX 0
#endif

// Short aliases without the LOCKSTORE_ prefix, used by the implementation files.
#if defined(LOCKSTORE_PLATFORM_WIN64) && !defined(PLATFORM_WIN64)
#define PLATFORM_WIN64 1
#endif
#if defined(LOCKSTORE_PLATFORM_APPLE) && !defined(PLATFORM_APPLE)
#define PLATFORM_APPLE 1
#endif
#if defined(LOCKSTORE_PLATFORM_FREEBSD) && !defined(PLATFORM_FREEBSD)
#define PLATFORM_FREEBSD 1
#endif
#if defined(LOCKSTORE_PLATFORM_LINUX) && !defined(PLATFORM_LINUX)
#define PLATFORM_LINUX 1
#endif
#if defined(LOCKSTORE_PLATFORM_UNKNOWN) && !defined(PLATFORM_UNKNOWN)
#define PLATFORM_UNKNOWN 1
#endif

// --- Require C++20 or later --------------------------------------------------
// For GCC/Clang use __cplusplus; for MSVC use _MSVC_LANG (MSVC sets
// __cplusplus only when /Zc:__cplusplus is enabled).
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

namespace lockstore::platform
{

/**
 * @brief Gets the process ID (PID) for the current process.
 * @return A 64-bit unsigned integer representing the process ID.
 */
LOCKSTORE_UTILS_EXPORT uint64_t get_pid() noexcept;

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
LOCKSTORE_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;

/**
 * @brief Checks if a process with the given PID currently exists.
 * @details Uses platform-specific APIs:
 *          - Windows: OpenProcess() + GetExitCodeProcess()
 *          - POSIX: kill(pid, 0) with errno check
 * @param pid The process ID to check.
 * @return True if the process is alive, false otherwise.
 * @note PID 0 always returns false (invalid/system PID).
 * @note On POSIX, EPERM (permission denied) is treated as "alive".
 * @note A zombie (exited but not yet reaped) still counts as alive on POSIX.
 */
LOCKSTORE_UTILS_EXPORT bool is_process_alive(uint64_t pid) noexcept;

} // namespace lockstore::platform
