/*******************************************************************************
 * @file AtomicFile.cpp
 * @brief Temp-file + fsync + rename implementation of atomic_write_file.
 *
 * On POSIX:
 *  - create a temporary file `<name>.tmp.XXXXXX` next to the target with mkstemp()
 *  - write the data, fsync, copy the permission bits of an existing target, close
 *  - rename() the temporary over the target and fsync the directory
 *
 * On Windows:
 *  - create the temporary file with CreateFileW(CREATE_NEW), write, FlushFileBuffers
 *  - MoveFileExW(MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH), retried on
 *    sharing violations caused by concurrent readers
 ******************************************************************************/
#include "utils/AtomicFile.hpp"
#include "format_tools.hpp"
#include "platform.hpp"
#include "scope_guard.hpp"
#include "utils/Logger.hpp"

#include <cerrno>
#include <cstring>
#include <vector>

#if defined(PLATFORM_WIN64)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace lockstore::utils
{

namespace
{
inline void set_ec(std::error_code *ec, std::error_code value) noexcept
{
    if (ec)
        *ec = value;
}

inline std::error_code errno_code(int errnum) noexcept
{
    return {errnum, std::generic_category()};
}
} // namespace

bool atomic_write_file(const fs::path &target, std::string_view content,
                       std::error_code *ec) noexcept
{
    set_ec(ec, {});
    try
    {
        fs::path parent = target.parent_path();
        if (parent.empty())
            parent = ".";

        std::error_code create_ec;
        fs::create_directories(parent, create_ec);
        if (create_ec)
        {
            set_ec(ec, create_ec);
            LOGGER_ERROR("atomic_write_file: create_directories failed for '{}': {}",
                         parent.string(), create_ec.message());
            return false;
        }

        std::error_code link_ec;
        if (fs::is_symlink(fs::symlink_status(target, link_ec)))
        {
            set_ec(ec, std::make_error_code(std::errc::operation_not_permitted));
            LOGGER_ERROR("atomic_write_file: target '{}' is a symbolic link, refusing to write",
                         target.string());
            return false;
        }

#if defined(PLATFORM_WIN64)
        const fs::path tmp_path =
            parent / (target.filename().wstring() + L".tmp" + format_tools::win32_make_unique_suffix());
        const std::wstring tmp_w = format_tools::win32_to_long_path(tmp_path);
        const std::wstring target_w = format_tools::win32_to_long_path(target);

        HANDLE h = CreateFileW(tmp_w.c_str(), GENERIC_WRITE, 0, nullptr, CREATE_NEW,
                               FILE_ATTRIBUTE_NORMAL, nullptr);
        if (h == INVALID_HANDLE_VALUE)
        {
            DWORD err = GetLastError();
            set_ec(ec, std::error_code(static_cast<int>(err), std::system_category()));
            LOGGER_ERROR("atomic_write_file: CreateFileW(temp) failed for '{}'. Error: {}",
                         tmp_path.string(), err);
            return false;
        }
        auto tmp_guard = basics::make_scope_guard(
            [&]()
            {
                if (h != INVALID_HANDLE_VALUE)
                    CloseHandle(h);
                DeleteFileW(tmp_w.c_str());
            });

        DWORD written = 0;
        if (!WriteFile(h, content.data(), static_cast<DWORD>(content.size()), &written, nullptr) ||
            written != static_cast<DWORD>(content.size()) || !FlushFileBuffers(h))
        {
            DWORD err = GetLastError();
            set_ec(ec, std::error_code(static_cast<int>(err), std::system_category()));
            LOGGER_ERROR("atomic_write_file: writing '{}' failed. Error: {}", tmp_path.string(), err);
            return false;
        }
        CloseHandle(h);
        h = INVALID_HANDLE_VALUE;

        constexpr int kReplaceRetries = 5;
        constexpr DWORD kReplaceDelayMs = 50;
        DWORD last_error = 0;
        for (int i = 0; i < kReplaceRetries; ++i)
        {
            if (MoveFileExW(tmp_w.c_str(), target_w.c_str(),
                            MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH))
            {
                tmp_guard.dismiss();
                return true;
            }
            last_error = GetLastError();
            if (last_error != ERROR_SHARING_VIOLATION && last_error != ERROR_ACCESS_DENIED)
                break;
            Sleep(kReplaceDelayMs);
        }
        set_ec(ec, std::error_code(static_cast<int>(last_error), std::system_category()));
        LOGGER_ERROR("atomic_write_file: MoveFileExW failed for '{}'. Error: {}", target.string(),
                     last_error);
        return false;
#else
        std::string tmpl = (parent / (target.filename().string() + ".tmp.XXXXXX")).string();
        std::vector<char> tmpl_buf(tmpl.begin(), tmpl.end());
        tmpl_buf.push_back('\0');

        int fd = ::mkstemp(tmpl_buf.data());
        if (fd == -1)
        {
            int errnum = errno;
            set_ec(ec, errno_code(errnum));
            LOGGER_ERROR("atomic_write_file: mkstemp failed for '{}'. Error: {}", tmpl,
                         std::strerror(errnum));
            return false;
        }
        const std::string tmp_path = tmpl_buf.data();

        // Until the rename succeeds the temporary belongs to us and must not outlive the call.
        auto tmp_guard = basics::make_scope_guard(
            [&]()
            {
                if (fd != -1)
                    ::close(fd);
                ::unlink(tmp_path.c_str());
            });

        size_t off = 0;
        while (off < content.size())
        {
            ssize_t w = ::write(fd, content.data() + off, content.size() - off);
            if (w < 0)
            {
                if (errno == EINTR)
                    continue;
                int errnum = errno;
                set_ec(ec, errno_code(errnum));
                LOGGER_ERROR("atomic_write_file: write failed for '{}'. Error: {}", tmp_path,
                             std::strerror(errnum));
                return false;
            }
            off += static_cast<size_t>(w);
        }

        if (::fsync(fd) != 0)
        {
            int errnum = errno;
            set_ec(ec, errno_code(errnum));
            LOGGER_ERROR("atomic_write_file: fsync(file) failed for '{}'. Error: {}", tmp_path,
                         std::strerror(errnum));
            return false;
        }

        // mkstemp creates 0600; keep the mode of the file being replaced.
        struct stat st;
        if (::stat(target.c_str(), &st) == 0 && ::fchmod(fd, st.st_mode & 07777) != 0)
        {
            int errnum = errno;
            set_ec(ec, errno_code(errnum));
            LOGGER_ERROR("atomic_write_file: fchmod failed for '{}'. Error: {}", tmp_path,
                         std::strerror(errnum));
            return false;
        }

        int close_rc = ::close(fd);
        fd = -1;
        if (close_rc != 0)
        {
            int errnum = errno;
            set_ec(ec, errno_code(errnum));
            LOGGER_ERROR("atomic_write_file: close failed for '{}'. Error: {}", tmp_path,
                         std::strerror(errnum));
            return false;
        }

        if (::rename(tmp_path.c_str(), target.c_str()) != 0)
        {
            int errnum = errno;
            set_ec(ec, errno_code(errnum));
            LOGGER_ERROR("atomic_write_file: rename to '{}' failed. Error: {}", target.string(),
                         std::strerror(errnum));
            return false;
        }
        tmp_guard.dismiss();

        // Persist the directory entry. The data is already in place, so a failure
        // here is only reported in the log.
        int dfd = ::open(parent.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
        if (dfd == -1)
        {
            LOGGER_WARN("atomic_write_file: open(dir) failed for '{}'. Error: {}", parent.string(),
                        std::strerror(errno));
            return true;
        }
        if (::fsync(dfd) != 0)
        {
            LOGGER_WARN("atomic_write_file: fsync(dir) failed for '{}'. Error: {}", parent.string(),
                        std::strerror(errno));
        }
        ::close(dfd);
        return true;
#endif
    }
    catch (const std::exception &ex)
    {
        set_ec(ec, std::make_error_code(std::errc::io_error));
        LOGGER_ERROR("atomic_write_file: exception for '{}': {}", target.string(), ex.what());
        return false;
    }
}

bool read_file_contents(const fs::path &path, std::string &out, std::error_code *ec) noexcept
{
    set_ec(ec, {});
    try
    {
#if defined(PLATFORM_WIN64)
        const std::wstring wpath = format_tools::win32_to_long_path(path);
        HANDLE h = CreateFileW(wpath.c_str(), GENERIC_READ,
                               FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                               OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (h == INVALID_HANDLE_VALUE)
        {
            DWORD err = GetLastError();
            if (err == ERROR_FILE_NOT_FOUND || err == ERROR_PATH_NOT_FOUND)
                set_ec(ec, std::make_error_code(std::errc::no_such_file_or_directory));
            else
                set_ec(ec, std::error_code(static_cast<int>(err), std::system_category()));
            return false;
        }
        auto close_guard = basics::make_scope_guard([&]() { CloseHandle(h); });

        std::string data;
        char buf[4096];
        for (;;)
        {
            DWORD got = 0;
            if (!ReadFile(h, buf, sizeof(buf), &got, nullptr))
            {
                set_ec(ec, std::error_code(static_cast<int>(GetLastError()), std::system_category()));
                return false;
            }
            if (got == 0)
                break;
            data.append(buf, got);
        }
        out = std::move(data);
        return true;
#else
        int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd == -1)
        {
            set_ec(ec, errno_code(errno));
            return false;
        }
        auto close_guard = basics::make_scope_guard([fd]() { ::close(fd); });

        std::string data;
        char buf[4096];
        for (;;)
        {
            ssize_t got = ::read(fd, buf, sizeof(buf));
            if (got < 0)
            {
                if (errno == EINTR)
                    continue;
                set_ec(ec, errno_code(errno));
                return false;
            }
            if (got == 0)
                break;
            data.append(buf, static_cast<size_t>(got));
        }
        out = std::move(data);
        return true;
#endif
    }
    catch (const std::exception &ex)
    {
        set_ec(ec, std::make_error_code(std::errc::not_enough_memory));
        LOGGER_ERROR("read_file_contents: exception for '{}': {}", path.string(), ex.what());
        return false;
    }
}

} // namespace lockstore::utils
