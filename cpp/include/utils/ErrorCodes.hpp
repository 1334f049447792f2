#pragma once
/*******************************************************************************
 * @file ErrorCodes.hpp
 * @brief Library-specific error codes reported through `std::error_code`.
 *
 * Every public operation of the lock and the store is `noexcept` and reports
 * failure through an optional `std::error_code *ec` out-parameter. Errors that
 * come straight from the OS use `std::generic_category()`; the conditions
 * below are the ones the library itself defines.
 *
 * `acquisition_timeout` compares equal to `std::errc::timed_out`, so callers
 * may test either:
 * @code
 *   std::error_code ec;
 *   if (!lock.acquire(true, &ec) && ec == std::errc::timed_out) { ... }
 * @endcode
 ******************************************************************************/

#include <string>
#include <system_error>

#include "lockstore_utils_export.h"

namespace lockstore::utils
{

enum class LockStoreErrc
{
    /// A blocking acquire waited for its full timeout without obtaining the lock.
    acquisition_timeout = 1,
    /// The backing document exists but is not valid JSON.
    document_parse_error,
    /// The backing document is valid JSON but its top level is not an object.
    document_not_object,
    /// `remove()` was asked to delete a key that is not in the document.
    key_not_found,
    /// A store operation was invoked from inside a callback on the same store.
    reentrant_access,
};

LOCKSTORE_UTILS_EXPORT const std::error_category &lockstore_category() noexcept;

LOCKSTORE_UTILS_EXPORT std::error_code make_error_code(LockStoreErrc e) noexcept;

} // namespace lockstore::utils

namespace std
{
template <> struct is_error_code_enum<lockstore::utils::LockStoreErrc> : true_type
{
};
} // namespace std
