/*******************************************************************************
 * @file include/utils/FileLock.hpp
 * @brief Cross-process, PID-attested marker-file lock.
 *
 * @see tests/test_filelock.cpp
 ******************************************************************************/
#pragma once

// FileLock.hpp - cross-process mutual exclusion over a filesystem path.
// Location: include/utils/FileLock.hpp
//
// Usage:
//   FileLock lock(path, std::chrono::milliseconds(500));
//   std::error_code ec;
//   if (!lock.acquire(true, &ec)) { handle error: ec == std::errc::timed_out ... }
//   ... operate on `path` ...
//   lock.release();
//
// or, scoped:
//   ScopedFileLock guard(lock);
//   if (!guard.valid()) { handle error: guard.error_code() }
//
// Behavior:
//  - The lock state is the existence of a marker file `<path>.lock` placed
//    next to the target. Its content is the decimal PID of the holder.
//  - The marker is created with an exclusive-create primitive only. On POSIX
//    the PID is written to a private temporary file that is then hard-linked
//    to the marker, so the marker is never observed half-written. Filesystems
//    without hard links fall back to open(O_CREAT|O_EXCL). On Windows
//    CreateFileW(CREATE_NEW) with no sharing is used.
//  - A marker that does not contain a valid PID, or whose PID names a process
//    that no longer exists, is removed and the claim is retried at once.
//  - The lock is NOT re-entrant: acquiring again through the same instance,
//    another instance or another thread of the holding process contends like
//    any other caller.
//  - Markers still held when the process exits normally are removed by an
//    exit hook (`FileLock::cleanup`).
//  - Movable but non-copyable.

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <system_error>

#include "lockstore_utils_export.h"
#include "platform.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace lockstore::utils
{

/// Returns true if a process with the given PID exists.
using LivenessProbe = std::function<bool(uint64_t)>;

struct FileLockImpl;

/**
 * @class FileLock
 * @brief A named, timeout-bounded lock shared by independent processes.
 *
 * Construction never touches the filesystem. `acquire()` and `release()`
 * toggle ownership; the destructor releases a held lock.
 *
 * @warning Liveness is judged by PID. A marker left by a crashed process whose
 *          PID has since been reused is treated as held until that process
 *          exits. PIDs are only meaningful on one host: do not share a lock
 *          directory between machines.
 */
class LOCKSTORE_UTILS_EXPORT FileLock
{
  public:
    /// Polling period of a blocking acquire when none is given.
    static constexpr std::chrono::milliseconds DEFAULT_RETRY_INTERVAL{50};

    /**
     * @brief Gets the marker path used for a given target.
     *
     * The marker lives in the target's directory and is named after the
     * target with `.lock` appended. The directory part is made absolute and
     * normalized so that different spellings of the same directory contend for
     * the same marker.
     *
     * @return The marker path, or an empty path if `target` cannot be resolved.
     */
    static std::filesystem::path
    get_expected_lock_fullname_for(const std::filesystem::path &target) noexcept;

    /**
     * @brief Reads the PID currently attested by the marker of `target`.
     * @return The PID, or std::nullopt if there is no marker or it is malformed.
     */
    static std::optional<uint64_t> read_owner(const std::filesystem::path &target) noexcept;

    /**
     * @brief Releases every marker held by this process.
     *
     * Registered with std::atexit the first time a lock is acquired. Only
     * markers whose content is still this process's PID are removed.
     */
    static void cleanup() noexcept;

    /**
     * @brief Binds a lock to `target`. Does not acquire it.
     * @param target The resource being protected. It need not exist.
     * @param timeout The longest a blocking acquire waits. Zero waits indefinitely.
     * @param retry_interval Sleep between attempts of a blocking acquire.
     * @param probe Liveness oracle; defaults to platform::is_process_alive.
     */
    FileLock(const std::filesystem::path &target, std::chrono::milliseconds timeout,
             std::chrono::milliseconds retry_interval = DEFAULT_RETRY_INTERVAL,
             LivenessProbe probe = {}) noexcept;

    FileLock(FileLock &&other) noexcept;
    FileLock &operator=(FileLock &&other) noexcept;

    FileLock(const FileLock &) = delete;
    FileLock &operator=(const FileLock &) = delete;

    /// Releases the lock if this instance holds it.
    ~FileLock();

    /**
     * @brief Attempts to take the lock.
     *
     * @param blocking If false, a single claim attempt is made and contention
     *        returns false with `std::errc::resource_unavailable_try_again`.
     *        If true, the claim is retried every retry interval until it
     *        succeeds or the timeout elapses, which reports
     *        `LockStoreErrc::acquisition_timeout` (equal to `std::errc::timed_out`).
     * @param ec Optional out-parameter. Filesystem failures are reported with
     *        the OS error code.
     * @return true if this instance now holds the lock.
     */
    bool acquire(bool blocking = true, std::error_code *ec = nullptr) noexcept;

    /**
     * @brief Gives up the lock if this instance holds it; otherwise does nothing.
     * @return false only if the marker could not be removed.
     */
    bool release(std::error_code *ec = nullptr) noexcept;

    /// True while this instance holds the lock.
    bool locked() const noexcept;

    std::filesystem::path target_path() const;
    std::filesystem::path lock_path() const;
    std::chrono::milliseconds timeout() const noexcept;
    std::chrono::milliseconds retry_interval() const noexcept;

  private:
    struct FileLockImplDeleter
    {
        void operator()(FileLockImpl *p);
    };

    std::unique_ptr<FileLockImpl, FileLockImplDeleter> pImpl;
};

/**
 * @class ScopedFileLock
 * @brief Holds a FileLock for the lifetime of the guard.
 *
 * The constructor performs a blocking acquire with the lock's configured
 * timeout; the destructor releases on every exit path. The guard does not
 * throw: check `valid()` before touching the protected resource.
 */
class LOCKSTORE_UTILS_EXPORT ScopedFileLock
{
  public:
    explicit ScopedFileLock(FileLock &lock) noexcept;
    ~ScopedFileLock();

    ScopedFileLock(const ScopedFileLock &) = delete;
    ScopedFileLock &operator=(const ScopedFileLock &) = delete;
    ScopedFileLock(ScopedFileLock &&) = delete;
    ScopedFileLock &operator=(ScopedFileLock &&) = delete;

    bool valid() const noexcept { return m_valid; }
    std::error_code error_code() const noexcept { return m_ec; }

  private:
    FileLock &m_lock;
    bool m_valid = false;
    std::error_code m_ec;
};

} // namespace lockstore::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
