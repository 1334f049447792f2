/**
 * @file platform.cpp
 * @brief Cross-platform implementations of the process-level OS queries.
 *
 * This file contains the platform-specific logic for the functions declared in
 * the `lockstore::platform` namespace: process and thread IDs and the process
 * liveness test used to detect abandoned lock markers.
 */
#include "platform.hpp"

#include <functional>
#include <thread>

#if defined(PLATFORM_WIN64)
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <cerrno>
#include <csignal>
#include <sys/types.h>
#include <unistd.h>
#if defined(__linux__)
#include <sys/syscall.h>
#endif
#if defined(__APPLE__)
#include <pthread.h>
#endif
#endif

namespace lockstore::platform
{

uint64_t get_pid() noexcept
{
#if defined(PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

uint64_t get_native_thread_id() noexcept
{
#if defined(PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(__APPLE__)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(__linux__)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    // Fallback for other POSIX or unknown systems.
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

bool is_process_alive(uint64_t pid) noexcept
{
    if (pid == 0)
    {
        // PID 0 is the scheduler / System Idle Process, never a lock owner.
        return false;
    }

#if defined(PLATFORM_WIN64)
    if (pid > 0xFFFFFFFFull)
    {
        return false;
    }
    HANDLE process = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid));
    if (process == NULL)
    {
        // ERROR_INVALID_PARAMETER is what Windows reports for a PID with no process.
        // Anything else (e.g. access denied) means the process exists.
        return GetLastError() != ERROR_INVALID_PARAMETER;
    }

    DWORD exitCode = 0;
    BOOL result = GetExitCodeProcess(process, &exitCode);
    CloseHandle(process);

    if (!result)
    {
        return false;
    }

    return exitCode == STILL_ACTIVE;
#else
    // Reject values that do not survive the round-trip through pid_t; kill() with a
    // negative pid would address a process group instead.
    const auto native = static_cast<pid_t>(pid);
    if (native <= 0 || static_cast<uint64_t>(native) != pid)
    {
        return false;
    }

    // kill(pid, 0) performs the permission and existence checks without sending a signal.
    if (kill(native, 0) == 0)
    {
        return true;
    }

    // ESRCH: no such process -> dead
    // EPERM: exists but owned by someone else -> alive
    return errno != ESRCH;
#endif
}

} // namespace lockstore::platform
