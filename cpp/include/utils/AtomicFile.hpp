#pragma once
/*******************************************************************************
 * @file AtomicFile.hpp
 * @brief Whole-file read and crash-safe whole-file replace.
 *
 * `atomic_write_file` never leaves `target` partially written: the content goes
 * to a unique temporary file in the same directory, is flushed to stable
 * storage and then renamed over the target. Readers observe either the old or
 * the new content, never a mix. A symlinked target is refused.
 *
 * Neither function serializes concurrent writers; callers that perform
 * read-modify-write cycles hold a `FileLock` on the target around both calls.
 ******************************************************************************/

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

#include "lockstore_utils_export.h"

namespace lockstore::utils
{

/**
 * @brief Atomically replaces the content of `target`.
 *
 * Missing parent directories are created. When `target` already exists its
 * permission bits are carried over to the new file.
 *
 * @param target The file to create or replace.
 * @param content The complete new content.
 * @param ec Optional out-parameter; set to the OS error on failure, cleared on success.
 *           `std::errc::operation_not_permitted` if `target` is a symbolic link.
 * @return true on success.
 */
LOCKSTORE_UTILS_EXPORT bool atomic_write_file(const std::filesystem::path &target,
                                              std::string_view content,
                                              std::error_code *ec = nullptr) noexcept;

/**
 * @brief Reads the whole content of `path` into `out`.
 *
 * @return true on success. A missing file reports
 *         `std::errc::no_such_file_or_directory` through `ec` so callers can
 *         distinguish it from other I/O failures.
 */
LOCKSTORE_UTILS_EXPORT bool read_file_contents(const std::filesystem::path &path, std::string &out,
                                               std::error_code *ec = nullptr) noexcept;

} // namespace lockstore::utils
