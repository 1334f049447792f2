/*******************************************************************************
 * @file FileLock.cpp
 * @brief Implementation of the PID-attested marker-file lock.
 *
 * @see include/utils/FileLock.hpp
 *
 * **Implementation Details**
 *
 * 1.  **Pimpl and RAII**:
 *     - `FileLockImpl` holds the resolved paths, the configuration and the
 *       `held` flag together with the mutex that serializes acquire/release on
 *       one instance.
 *     - The custom deleter (`FileLockImplDeleter`) releases a held marker, so
 *       destruction and move-assignment never leak a lock.
 *
 * 2.  **Claiming (`try_claim_once`)**:
 *     - `create_marker` performs the exclusive create. Only its success grants
 *       ownership; nothing is ever checked first and created second.
 *     - On EEXIST the marker is inspected. The checks run in a fixed order:
 *       unparseable content (malformed), then a dead owner (stale), then a live
 *       owner (held). Malformed and stale markers are removed by
 *       `remove_if_unchanged` and the create is retried without sleeping. The
 *       number of such retries per attempt is bounded so a pathological
 *       competitor cannot make one attempt spin forever.
 *
 * 3.  **Waiting (`FileLock::acquire`)**:
 *     - The instance mutex is held for one claim attempt only, never while
 *       sleeping. Between attempts the caller sleeps `retry_interval`, clamped
 *       to the time left before the timeout.
 *
 * 4.  **Exit cleanup (`g_held_markers`)**:
 *     - Every marker this process holds is recorded in a registry, keyed by
 *       path and tagged with a token unique to the claim that created it. The
 *       first successful claim registers `FileLock::cleanup` with std::atexit.
 *     - Release and cleanup both remove the registry entry first; whichever
 *       gets it deletes the marker, so the two can never both act on one
 *       marker. Release only takes an entry carrying its own token: after a
 *       cleanup, a later claim of the same path belongs to that claim alone.
 ******************************************************************************/
#include "utils/FileLock.hpp"

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#if defined(PLATFORM_WIN64)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>
#else
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#endif

#include "format_tools.hpp"
#include "scope_guard.hpp"
#include "utils/AtomicFile.hpp"
#include "utils/ErrorCodes.hpp"
#include "utils/Logger.hpp"

namespace fs = std::filesystem;

namespace lockstore::utils
{

// Upper bound on remove-and-retry cycles (malformed, stale or vanished marker)
// within one claim attempt. Exceeding it counts as contention.
static constexpr int MAX_RECLAIMS_PER_ATTEMPT = 16;

// --- Registry of markers held by this process ---
static std::mutex g_held_markers_mtx;
static std::unordered_map<std::string, uint64_t> g_held_markers; // path -> claim token
static std::atomic<uint64_t> g_next_claim_token{1};
static std::once_flag g_cleanup_registered;

static uint64_t register_held_marker(const fs::path &lock_path)
{
    const uint64_t token = g_next_claim_token.fetch_add(1, std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lg(g_held_markers_mtx);
        g_held_markers.insert_or_assign(lock_path.string(), token);
    }
    std::call_once(g_cleanup_registered,
                   []
                   {
                       // atexit handlers run in reverse order: making sure the logger
                       // exists first keeps it alive while cleanup logs.
                       Logger::instance();
                       std::atexit([] { FileLock::cleanup(); });
                   });
    return token;
}

// Returns true if the caller took the entry and is now responsible for the marker.
// An entry registered by another claim of the same path is left alone.
static bool unregister_held_marker(const fs::path &lock_path, uint64_t token)
{
    std::lock_guard<std::mutex> lg(g_held_markers_mtx);
    auto it = g_held_markers.find(lock_path.string());
    if (it == g_held_markers.end() || it->second != token)
        return false;
    g_held_markers.erase(it);
    return true;
}

// ============================================================================
// FileLock Pimpl Implementation
// ============================================================================

struct FileLockImpl
{
    fs::path target;
    fs::path lock_path;
    std::chrono::milliseconds timeout{0};
    std::chrono::milliseconds retry_interval{FileLock::DEFAULT_RETRY_INTERVAL};
    LivenessProbe probe;
    std::string pid_text; // Decimal PID of this process, the marker content we write.

    std::mutex mtx; // Serializes acquire/release on this instance.
    bool held = false;
    uint64_t claim_token = 0; // Registry tag of the current claim; valid while held.
};

namespace
{

inline void set_ec(std::error_code *ec, std::error_code value) noexcept
{
    if (ec)
        *ec = value;
}

enum class CreateResult
{
    Created,
    Exists,
    Busy, // Windows: the marker is being written or deleted by someone else.
    Error,
};

enum class ClaimResult
{
    Acquired,
    Contended,
    Error,
};

bool is_missing(const std::error_code &ec)
{
    return ec == std::errc::no_such_file_or_directory;
}

#if defined(PLATFORM_WIN64)
bool is_sharing_violation(const std::error_code &ec)
{
    return ec.category() == std::system_category() &&
           (ec.value() == ERROR_SHARING_VIOLATION || ec.value() == ERROR_ACCESS_DENIED);
}

CreateResult create_marker(const FileLockImpl &impl, std::error_code &ec)
{
    const std::wstring wpath = format_tools::win32_to_long_path(impl.lock_path);
    // No sharing: readers and deleters fail with a sharing violation until the PID
    // has been written and the handle closed.
    HANDLE h = CreateFileW(wpath.c_str(), GENERIC_WRITE, 0, nullptr, CREATE_NEW,
                           FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE)
    {
        DWORD err = GetLastError();
        if (err == ERROR_FILE_EXISTS || err == ERROR_ALREADY_EXISTS)
            return CreateResult::Exists;
        if (err == ERROR_SHARING_VIOLATION || err == ERROR_ACCESS_DENIED)
            return CreateResult::Busy;
        ec = std::error_code(static_cast<int>(err), std::system_category());
        return CreateResult::Error;
    }

    DWORD written = 0;
    BOOL ok = WriteFile(h, impl.pid_text.data(), static_cast<DWORD>(impl.pid_text.size()),
                        &written, nullptr);
    DWORD err = ok ? 0 : GetLastError();
    CloseHandle(h);
    if (!ok || written != static_cast<DWORD>(impl.pid_text.size()))
    {
        DeleteFileW(wpath.c_str());
        ec = std::error_code(static_cast<int>(err ? err : ERROR_WRITE_FAULT), std::system_category());
        return CreateResult::Error;
    }
    return CreateResult::Created;
}
#else
std::error_code errno_code(int errnum)
{
    return {errnum, std::generic_category()};
}

bool write_all(int fd, const std::string &text)
{
    size_t off = 0;
    while (off < text.size())
    {
        ssize_t w = ::write(fd, text.data() + off, text.size() - off);
        if (w < 0)
        {
            if (errno == EINTR)
                continue;
            return false;
        }
        off += static_cast<size_t>(w);
    }
    return true;
}

// open(O_CREAT|O_EXCL) then write. The marker is briefly empty; used only where
// link() is unsupported.
CreateResult create_marker_excl(const FileLockImpl &impl, std::error_code &ec)
{
    int fd = ::open(impl.lock_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd == -1)
    {
        if (errno == EEXIST)
            return CreateResult::Exists;
        ec = errno_code(errno);
        return CreateResult::Error;
    }
    const bool ok = write_all(fd, impl.pid_text);
    const int write_errno = errno;
    ::close(fd);
    if (!ok)
    {
        ::unlink(impl.lock_path.c_str());
        ec = errno_code(write_errno);
        return CreateResult::Error;
    }
    return CreateResult::Created;
}

CreateResult create_marker(const FileLockImpl &impl, std::error_code &ec)
{
    static std::atomic<uint64_t> s_tmp_counter{0};

    const std::string tmp_path = fmt::format("{}.{}.{}.tmp", impl.lock_path.string(), impl.pid_text,
                                             s_tmp_counter.fetch_add(1));

    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd == -1)
    {
        ec = errno_code(errno);
        return CreateResult::Error;
    }
    auto tmp_guard = basics::make_scope_guard([&tmp_path]() { ::unlink(tmp_path.c_str()); });

    const bool ok = write_all(fd, impl.pid_text);
    const int write_errno = errno;
    if (::close(fd) != 0 || !ok)
    {
        ec = errno_code(ok ? errno : write_errno);
        return CreateResult::Error;
    }

    // link() fails with EEXIST if the marker exists, and publishes the fully
    // written content in one step if it does not.
    if (::link(tmp_path.c_str(), impl.lock_path.c_str()) == 0)
        return CreateResult::Created;

    const int link_errno = errno;
    if (link_errno == EEXIST)
        return CreateResult::Exists;
    if (link_errno == EPERM || link_errno == ENOTSUP || link_errno == EOPNOTSUPP ||
        link_errno == ENOSYS || link_errno == EMLINK)
    {
        LOGGER_TRACE("FileLock: link() unsupported for '{}' ({}), using O_EXCL create",
                     impl.lock_path.string(), errno_code(link_errno).message());
        tmp_guard.invoke();
        return create_marker_excl(impl, ec);
    }
    ec = errno_code(link_errno);
    return CreateResult::Error;
}
#endif

bool probe_alive(const FileLockImpl &impl, uint64_t pid)
{
    if (!impl.probe)
        return platform::is_process_alive(pid);
    try
    {
        return impl.probe(pid);
    }
    catch (const std::exception &e)
    {
        // An oracle that cannot answer must not cause a live holder's marker to be deleted.
        LOGGER_ERROR("FileLock: liveness probe threw for pid {}: {}. Treating as alive.", pid,
                     e.what());
        return true;
    }
}

// Deletes the marker only if it still holds `expected`. Returns false on an I/O
// error (reported through `ec`); a marker that changed or vanished is not an error.
bool remove_if_unchanged(const FileLockImpl &impl, const std::string &expected,
                         std::error_code &ec)
{
    std::string current;
    std::error_code read_ec;
    if (!read_file_contents(impl.lock_path, current, &read_ec))
    {
        if (is_missing(read_ec))
            return true;
#if defined(PLATFORM_WIN64)
        if (is_sharing_violation(read_ec))
            return true;
#endif
        ec = read_ec;
        return false;
    }
    if (current != expected)
    {
        LOGGER_TRACE("FileLock: marker '{}' changed before removal, not removing",
                     impl.lock_path.string());
        return true;
    }

    std::error_code rm_ec;
    fs::remove(impl.lock_path, rm_ec);
    if (rm_ec)
    {
#if defined(PLATFORM_WIN64)
        if (is_sharing_violation(rm_ec))
            return true;
#endif
        ec = rm_ec;
        return false;
    }
    return true;
}

// One claim attempt: exclusive create, healing malformed or stale markers in
// between. Never sleeps.
ClaimResult try_claim_once(FileLockImpl &impl, std::error_code &ec)
{
    if (impl.held)
    {
        LOGGER_TRACE("FileLock: '{}' is already held by this instance", impl.lock_path.string());
        return ClaimResult::Contended;
    }

    std::error_code dir_ec;
    fs::create_directories(impl.lock_path.parent_path(), dir_ec);
    if (dir_ec)
    {
        ec = dir_ec;
        LOGGER_ERROR("FileLock: cannot create directory for '{}': {}", impl.lock_path.string(),
                     dir_ec.message());
        return ClaimResult::Error;
    }

    for (int reclaim = 0; reclaim < MAX_RECLAIMS_PER_ATTEMPT; ++reclaim)
    {
        switch (create_marker(impl, ec))
        {
        case CreateResult::Created:
            impl.held = true;
            impl.claim_token = register_held_marker(impl.lock_path);
            LOGGER_DEBUG("FileLock: acquired '{}'", impl.lock_path.string());
            return ClaimResult::Acquired;
        case CreateResult::Busy:
            return ClaimResult::Contended;
        case CreateResult::Error:
            LOGGER_ERROR("FileLock: cannot create marker '{}': {}", impl.lock_path.string(),
                         ec.message());
            return ClaimResult::Error;
        case CreateResult::Exists:
            break;
        }

        std::string content;
        std::error_code read_ec;
        if (!read_file_contents(impl.lock_path, content, &read_ec))
        {
            if (is_missing(read_ec))
            {
                // Released between our create and our read.
                continue;
            }
#if defined(PLATFORM_WIN64)
            if (is_sharing_violation(read_ec))
                return ClaimResult::Contended;
#endif
            ec = read_ec;
            LOGGER_ERROR("FileLock: cannot read marker '{}': {}", impl.lock_path.string(),
                         read_ec.message());
            return ClaimResult::Error;
        }

        const auto owner = format_tools::parse_pid(content);
        if (!owner)
        {
            LOGGER_WARN("FileLock: removing malformed marker '{}' (content '{}')",
                        impl.lock_path.string(), content.substr(0, 32));
        }
        else if (!probe_alive(impl, *owner))
        {
            LOGGER_INFO("FileLock: removing stale marker '{}' left by dead process {}",
                        impl.lock_path.string(), *owner);
        }
        else
        {
            LOGGER_TRACE("FileLock: '{}' is held by process {}", impl.lock_path.string(), *owner);
            return ClaimResult::Contended;
        }

        if (!remove_if_unchanged(impl, content, ec))
        {
            LOGGER_ERROR("FileLock: cannot remove marker '{}': {}", impl.lock_path.string(),
                         ec.message());
            return ClaimResult::Error;
        }
    }

    LOGGER_DEBUG("FileLock: gave up reclaiming '{}' after {} attempts", impl.lock_path.string(),
                 MAX_RECLAIMS_PER_ATTEMPT);
    return ClaimResult::Contended;
}

// Removes the marker held by `impl`. Caller holds impl.mtx and impl.held is true.
bool release_locked(FileLockImpl &impl, std::error_code &ec)
{
    impl.held = false;
    if (!unregister_held_marker(impl.lock_path, impl.claim_token))
    {
        // FileLock::cleanup() already removed it; any marker there now is another claim's.
        return true;
    }

    std::string content;
    std::error_code read_ec;
    if (read_file_contents(impl.lock_path, content, &read_ec) && content != impl.pid_text)
    {
        LOGGER_WARN("FileLock: marker '{}' now attests '{}', leaving it in place",
                    impl.lock_path.string(), content.substr(0, 32));
        return true;
    }

    std::error_code rm_ec;
    fs::remove(impl.lock_path, rm_ec);
    if (rm_ec)
    {
        ec = rm_ec;
        LOGGER_WARN("FileLock: cannot remove marker '{}': {}", impl.lock_path.string(),
                    rm_ec.message());
        return false;
    }
    LOGGER_DEBUG("FileLock: released '{}'", impl.lock_path.string());
    return true;
}

} // namespace

void FileLock::FileLockImplDeleter::operator()(FileLockImpl *p)
{
    if (!p)
        return;
    {
        std::lock_guard<std::mutex> lg(p->mtx);
        if (p->held)
        {
            std::error_code ec;
            if (!release_locked(*p, ec))
                LOGGER_WARN("FileLock: release on destruction failed for '{}': {}",
                            p->lock_path.string(), ec.message());
        }
    }
    delete p;
}

// ---------------- FileLock Public Method Implementations ----------------

fs::path FileLock::get_expected_lock_fullname_for(const fs::path &target) noexcept
{
    try
    {
        fs::path abs = fs::absolute(target).lexically_normal();
        if (!abs.has_filename())
            abs = abs.parent_path();

        std::error_code ec;
        fs::path dir = fs::weakly_canonical(abs.parent_path(), ec);
        if (ec)
            dir = abs.parent_path();

        fs::path name = abs.filename();
        name += ".lock";
        return dir / name;
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("FileLock::get_expected_lock_fullname_for failed for target '{}': {}",
                     target.string(), e.what());
        return {};
    }
}

std::optional<uint64_t> FileLock::read_owner(const fs::path &target) noexcept
{
    const fs::path lock_path = get_expected_lock_fullname_for(target);
    if (lock_path.empty())
        return std::nullopt;
    std::string content;
    if (!read_file_contents(lock_path, content))
        return std::nullopt;
    return format_tools::parse_pid(content);
}

void FileLock::cleanup() noexcept
{
    std::vector<std::string> candidates;
    {
        std::lock_guard<std::mutex> lg(g_held_markers_mtx);
        candidates.reserve(g_held_markers.size());
        for (const auto &entry : g_held_markers)
            candidates.push_back(entry.first);
        g_held_markers.clear();
    }
    if (candidates.empty())
        return;

    const std::string own_pid = std::to_string(platform::get_pid());
    size_t removed = 0;
    for (const auto &path_str : candidates)
    {
        const fs::path p(path_str);
        std::string content;
        if (!read_file_contents(p, content) || content != own_pid)
        {
            LOGGER_TRACE("FileLock::cleanup: '{}' is no longer ours, skipping", path_str);
            continue;
        }
        std::error_code ec;
        fs::remove(p, ec);
        if (ec)
        {
            LOGGER_WARN("FileLock::cleanup: remove '{}' failed: {}", path_str, ec.message());
            continue;
        }
        ++removed;
    }
    LOGGER_DEBUG("FileLock::cleanup: removed {} of {} held markers", removed, candidates.size());
}

FileLock::FileLock(const fs::path &target, std::chrono::milliseconds timeout,
                   std::chrono::milliseconds retry_interval, LivenessProbe probe) noexcept
    : pImpl(new FileLockImpl)
{
    pImpl->target = target;
    pImpl->lock_path = get_expected_lock_fullname_for(target);
    pImpl->timeout = std::max(timeout, std::chrono::milliseconds::zero());
    pImpl->retry_interval = std::max(retry_interval, std::chrono::milliseconds(1));
    pImpl->probe = std::move(probe);
    pImpl->pid_text = std::to_string(platform::get_pid());
}

FileLock::~FileLock() = default;
FileLock::FileLock(FileLock &&) noexcept = default;
FileLock &FileLock::operator=(FileLock &&) noexcept = default;

bool FileLock::acquire(bool blocking, std::error_code *ec) noexcept
{
    if (!pImpl || pImpl->lock_path.empty())
    {
        set_ec(ec, std::make_error_code(std::errc::invalid_argument));
        return false;
    }

    const auto start = std::chrono::steady_clock::now();
    for (;;)
    {
        std::error_code attempt_ec;
        ClaimResult result;
        {
            std::lock_guard<std::mutex> lg(pImpl->mtx);
            result = try_claim_once(*pImpl, attempt_ec);
        }

        if (result == ClaimResult::Acquired)
        {
            set_ec(ec, {});
            return true;
        }
        if (result == ClaimResult::Error)
        {
            set_ec(ec, attempt_ec);
            return false;
        }
        if (!blocking)
        {
            set_ec(ec, std::make_error_code(std::errc::resource_unavailable_try_again));
            return false;
        }

        auto wait = pImpl->retry_interval;
        if (pImpl->timeout.count() > 0)
        {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            if (elapsed >= pImpl->timeout)
            {
                LOGGER_DEBUG("FileLock: timed out after {} ms waiting for '{}'", elapsed.count(),
                             pImpl->lock_path.string());
                set_ec(ec, make_error_code(LockStoreErrc::acquisition_timeout));
                return false;
            }
            wait = std::min(wait, pImpl->timeout - elapsed);
        }
        std::this_thread::sleep_for(wait);
    }
}

bool FileLock::release(std::error_code *ec) noexcept
{
    set_ec(ec, {});
    if (!pImpl)
        return true;

    std::lock_guard<std::mutex> lg(pImpl->mtx);
    if (!pImpl->held)
        return true;

    std::error_code rel_ec;
    if (!release_locked(*pImpl, rel_ec))
    {
        set_ec(ec, rel_ec);
        return false;
    }
    return true;
}

bool FileLock::locked() const noexcept
{
    if (!pImpl)
        return false;
    std::lock_guard<std::mutex> lg(pImpl->mtx);
    return pImpl->held;
}

fs::path FileLock::target_path() const
{
    return pImpl ? pImpl->target : fs::path{};
}

fs::path FileLock::lock_path() const
{
    return pImpl ? pImpl->lock_path : fs::path{};
}

std::chrono::milliseconds FileLock::timeout() const noexcept
{
    return pImpl ? pImpl->timeout : std::chrono::milliseconds::zero();
}

std::chrono::milliseconds FileLock::retry_interval() const noexcept
{
    return pImpl ? pImpl->retry_interval : DEFAULT_RETRY_INTERVAL;
}

// ---------------- ScopedFileLock ----------------

ScopedFileLock::ScopedFileLock(FileLock &lock) noexcept : m_lock(lock)
{
    m_valid = m_lock.acquire(true, &m_ec);
}

ScopedFileLock::~ScopedFileLock()
{
    if (!m_valid)
        return;
    std::error_code ec;
    if (!m_lock.release(&ec))
        LOGGER_WARN("ScopedFileLock: release of '{}' failed: {}", m_lock.lock_path().string(),
                    ec.message());
}

} // namespace lockstore::utils
