#pragma once

/**
 * @file JsonStore.hpp
 * @brief Persistent JSON mapping with lost-update-free read-modify-write across processes.
 *
 * Design:
 *  - JsonStore owns an in-memory `nlohmann::json` object mirroring a JSON document on disk.
 *  - Every mutating call takes the cross-process `FileLock` of the backing file, re-reads
 *    the document from disk (never the possibly stale mirror), applies the change, writes
 *    the whole document back atomically (temp file + fsync + rename) and only then updates
 *    the mirror. A writer in another process can therefore never erase a key written by a
 *    call that had already completed.
 *  - Queries (`get`, `contains`, `with_json_read`, ...) read the mirror and take no file lock.
 *    Call `load()` to refresh the mirror from disk.
 *
 * Defaults:
 *  - If the backing file does not exist at construction and the defaults are non-empty,
 *    the defaults are written to disk immediately and become the document.
 *  - If it exists, default keys the document lacks are added and written back at
 *    construction. Defaults are never consulted again: a removed default key stays removed.
 *
 * Error handling:
 *  - All public methods are noexcept and report failures through an optional
 *    `std::error_code*` out-parameter (see utils/ErrorCodes.hpp). On failure the file
 *    and the mirror are left unchanged.
 *
 * Threading & locking:
 *  - `initMutex` (std::mutex) serializes the structural operations of one instance.
 *  - `rwMutex` (std::shared_mutex) guards the mirror: shared reads, exclusive writes.
 *  - Calling a structural operation from inside a `with_json_write` callback on the same
 *    store is refused with `LockStoreErrc::reentrant_access`.
 *
 * Usage example:
 *  JsonStore store("/var/lib/myapp/settings.json", {{"theme", "dark"}});
 *  store.set("port", 1234);
 *  store.with_json_write([](nlohmann::json &j){ j["hits"] = j.value("hits", 0) + 1; });
 *  auto port = store.get_or<int>("port", 80);
 */

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include "lockstore_utils_export.h"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace lockstore::utils
{

struct JsonStoreImpl;

class LOCKSTORE_UTILS_EXPORT JsonStore
{
  public:
    static constexpr std::chrono::milliseconds DEFAULT_LOCK_TIMEOUT{500};

    /**
     * @brief Binds the store to `path` and loads (or creates) the document.
     * @param path Location of the JSON document.
     * @param defaults Top-level keys used when the document lacks them. Must be an object.
     * @param lock_timeout Timeout of the file lock taken by every disk operation.
     *        Zero waits indefinitely.
     * @param ec Optional diagnostics for the initial load. The store stays usable on
     *        failure, its mirror holding only the defaults.
     */
    explicit JsonStore(const std::filesystem::path &path,
                       nlohmann::json defaults = nlohmann::json::object(),
                       std::chrono::milliseconds lock_timeout = DEFAULT_LOCK_TIMEOUT,
                       std::error_code *ec = nullptr) noexcept;

    ~JsonStore();

    JsonStore(const JsonStore &) = delete;
    JsonStore &operator=(const JsonStore &) = delete;
    JsonStore(JsonStore &&) noexcept;
    JsonStore &operator=(JsonStore &&) noexcept;

    /**
     * @brief Re-reads the document from disk under the file lock and refreshes the mirror.
     * @return The document as stored on disk, or std::nullopt on failure.
     */
    std::optional<nlohmann::json> load(std::error_code *ec = nullptr) noexcept;

    /**
     * @brief Writes the mirror to disk as the whole document, under the file lock.
     *
     * Unlike the mutating calls this does not merge with the on-disk state: keys
     * written by other processes since the last load are overwritten.
     */
    bool save(std::error_code *ec = nullptr) noexcept;

    /// Sets `key` to `value` in the freshly loaded document and persists it.
    bool set(const std::string &key, nlohmann::json value, std::error_code *ec = nullptr) noexcept;

    /// Removes `key`. Fails with LockStoreErrc::key_not_found, writing nothing, if it is absent.
    bool remove(const std::string &key, std::error_code *ec = nullptr) noexcept;

    /// Merges the top-level keys of `mapping`. A non-object fails with std::errc::invalid_argument.
    bool update(const nlohmann::json &mapping, std::error_code *ec = nullptr) noexcept;

    /**
     * @brief Inserts `value` under `key` only if the key is absent.
     * @return The value stored under `key` after the call, or std::nullopt on failure.
     */
    std::optional<nlohmann::json> setdefault(const std::string &key, nlohmann::json value,
                                             std::error_code *ec = nullptr) noexcept;

    /**
     * @brief Locked read-modify-write of the whole document.
     * @param fn Receives the freshly loaded document; its changes are written back.
     *        If it throws, nothing is written and `ec` is std::errc::operation_canceled.
     */
    bool with_json_write_impl(std::function<void(nlohmann::json &)> fn,
                              std::error_code *ec = nullptr) noexcept;

    /// Runs `fn` on the mirror under a shared lock.
    bool with_json_read_impl(std::function<void(nlohmann::json const &)> fn,
                             std::error_code *ec = nullptr) const noexcept;

    template <typename F> bool with_json_write(F &&fn, std::error_code *ec = nullptr) noexcept
    {
        try
        {
            std::function<void(nlohmann::json &)> cb = std::forward<F>(fn);
            return with_json_write_impl(std::move(cb), ec);
        }
        catch (const std::exception &)
        {
            if (ec)
                *ec = std::make_error_code(std::errc::not_enough_memory);
            return false;
        }
    }

    template <typename F> bool with_json_read(F &&fn, std::error_code *ec = nullptr) const noexcept
    {
        try
        {
            std::function<void(nlohmann::json const &)> cb = std::forward<F>(fn);
            return with_json_read_impl(std::move(cb), ec);
        }
        catch (const std::exception &)
        {
            if (ec)
                *ec = std::make_error_code(std::errc::not_enough_memory);
            return false;
        }
    }

    // --- Queries on the mirror ---

    std::optional<nlohmann::json> get(const std::string &key) const noexcept;
    nlohmann::json get(const std::string &key, nlohmann::json fallback) const noexcept;

    /// The value under `key` converted to T, or `fallback` if absent or not convertible.
    template <typename T> T get_or(const std::string &key, T fallback) const noexcept
    {
        auto value = get(key);
        if (!value)
            return fallback;
        try
        {
            return value->template get<T>();
        }
        catch (const nlohmann::json::exception &)
        {
            return fallback;
        }
    }

    bool contains(const std::string &key) const noexcept;
    std::size_t size() const noexcept;
    bool empty() const noexcept;

    /// A copy of the mirror.
    nlohmann::json data() const;

    std::filesystem::path path() const;
    std::chrono::milliseconds lock_timeout() const noexcept;

  private:
    std::unique_ptr<JsonStoreImpl> pImpl;
};

} // namespace lockstore::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
