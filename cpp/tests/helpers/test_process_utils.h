#pragma once
#include <string>
#include <vector>
#include "platform.hpp"

#if defined(PLATFORM_WIN64)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>
#else
#include <sys/types.h>
#include <sys/wait.h>
#endif

namespace test_utils
{
#if defined(PLATFORM_WIN64)
using ProcessHandle = HANDLE;
static constexpr HANDLE NULL_PROC_HANDLE = NULL;
#else
using ProcessHandle = pid_t;
static constexpr pid_t NULL_PROC_HANDLE = 0;
#endif

/**
 * @brief Spawns the current test executable as a child process in a specific worker mode.
 *
 * @param exe_path The path to this executable (from g_self_exe_path).
 * @param mode The worker mode string (e.g., "filelock.hold_and_crash").
 * @param args Additional string arguments for the worker.
 * @return A platform-specific handle to the new process, NULL_PROC_HANDLE on failure.
 */
ProcessHandle spawn_worker_process(const std::string &exe_path, const std::string &mode,
                                   const std::vector<std::string> &args);

/// Waits for a worker process (at most 60 s) and returns its exit code, or a negative value.
int wait_for_worker_and_get_exit_code(ProcessHandle handle);

/// Numeric PID of a spawned worker, as written into marker files.
uint64_t worker_pid(ProcessHandle handle);

} // namespace test_utils
