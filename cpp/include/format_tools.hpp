// String and time formatting helpers shared by the logger, the lock and the store.
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "lockstore_utils_export.h"

namespace lockstore::format_tools
{

/// Local wall-clock time as "YYYY-MM-DD HH:MM:SS.uuuuuu".
LOCKSTORE_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Parses a process ID written as plain decimal digits.
 *
 * Accepts only the exact form written by `FileLock`: one or more ASCII digits,
 * no sign, no whitespace, no trailing bytes. Zero and values that overflow
 * `uint64_t` are rejected.
 *
 * @return The PID, or std::nullopt if `text` is not a well-formed PID.
 */
LOCKSTORE_UTILS_EXPORT std::optional<uint64_t> parse_pid(std::string_view text) noexcept;

#if defined(_WIN32)
/// Convert a path to Win32 long-path form with the \\?\ or \\?\UNC\ prefix.
/// Returns an empty string when the path cannot be made absolute.
LOCKSTORE_UTILS_EXPORT std::wstring win32_to_long_path(const std::filesystem::path &);
/// A reasonably unique suffix for temporary file names.
LOCKSTORE_UTILS_EXPORT std::wstring win32_make_unique_suffix();
/// UTF-8 to UTF-16; empty on invalid input.
LOCKSTORE_UTILS_EXPORT std::wstring s2ws(const std::string &s);
#endif

} // namespace lockstore::format_tools
