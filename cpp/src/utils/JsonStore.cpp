/**
 * @file JsonStore.cpp
 * @brief Implementation of the JsonStore public API.
 *
 * Detailed behavior:
 *  - Every disk operation runs under a `ScopedFileLock` on the backing path, built per
 *    call from the store's configured timeout.
 *  - `mutate` is the single read-modify-write path: it reloads the document from disk,
 *    hands it to a mutation that may veto the write by returning an error, writes the
 *    result with `atomic_write_file` and only then publishes it to the mirror.
 *  - Structural calls made from inside a `with_json_write` callback on the same store are
 *    detected with RecursionGuard; they would otherwise deadlock on `initMutex`.
 *
 * All public methods avoid throwing. Exceptions from nlohmann::json and std::filesystem
 * are caught here and converted into std::error_code.
 */
#include "utils/JsonStore.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <shared_mutex>
#include <utility>

#include "recursion_guard.hpp"
#include "utils/AtomicFile.hpp"
#include "utils/ErrorCodes.hpp"
#include "utils/FileLock.hpp"
#include "utils/Logger.hpp"

using namespace lockstore::basics;

namespace lockstore::utils
{

namespace fs = std::filesystem;

// Pretty-printed with two-space indentation; keys come out sorted because
// nlohmann::json stores objects in a std::map.
static constexpr int DOCUMENT_INDENT = 2;

struct JsonStoreImpl
{
    fs::path path;
    nlohmann::json defaults = nlohmann::json::object();
    std::chrono::milliseconds lock_timeout{JsonStore::DEFAULT_LOCK_TIMEOUT};

    nlohmann::json data = nlohmann::json::object();

    // Structural lock: one disk operation of this instance at a time.
    std::mutex initMutex;

    // Data lock: permits shared reads / exclusive writes of the mirror.
    mutable std::shared_mutex rwMutex;
};

// A mutation edits the document in place or returns an error to abort without writing.
using Mutation = std::function<std::error_code(nlohmann::json &)>;

namespace
{

inline void set_ec(std::error_code *ec, std::error_code value) noexcept
{
    if (ec)
        *ec = value;
}

bool is_blank(const std::string &s)
{
    for (unsigned char c : s)
        if (!std::isspace(c))
            return false;
    return true;
}

// Reads the backing document; a missing or blank file is an empty object. Caller holds
// the file lock.
bool read_document(const JsonStoreImpl &impl, nlohmann::json &out, std::error_code &ec)
{
    std::string content;
    std::error_code read_ec;
    if (!read_file_contents(impl.path, content, &read_ec))
    {
        if (read_ec != std::errc::no_such_file_or_directory)
        {
            ec = read_ec;
            LOGGER_ERROR("JsonStore: cannot read '{}': {}", impl.path.string(), read_ec.message());
            return false;
        }
        content.clear();
    }

    if (is_blank(content))
    {
        out = nlohmann::json::object();
        return true;
    }

    nlohmann::json parsed = nlohmann::json::parse(content, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded())
    {
        ec = make_error_code(LockStoreErrc::document_parse_error);
        LOGGER_ERROR("JsonStore: '{}' is not valid JSON; leaving it untouched", impl.path.string());
        return false;
    }
    if (!parsed.is_object())
    {
        ec = make_error_code(LockStoreErrc::document_not_object);
        LOGGER_ERROR("JsonStore: '{}' holds a JSON {}, expected an object", impl.path.string(),
                     parsed.type_name());
        return false;
    }

    out = std::move(parsed);
    return true;
}

bool write_document(const JsonStoreImpl &impl, const nlohmann::json &doc, std::error_code &ec)
{
    std::string text;
    try
    {
        text = doc.dump(DOCUMENT_INDENT);
    }
    catch (const nlohmann::json::exception &ex)
    {
        // type_error.316: a string value is not valid UTF-8.
        ec = std::make_error_code(std::errc::illegal_byte_sequence);
        LOGGER_ERROR("JsonStore: cannot serialize document for '{}': {}", impl.path.string(),
                     ex.what());
        return false;
    }
    return atomic_write_file(impl.path, text, &ec);
}

bool refuse_reentry(const void *key, const char *op, std::error_code *ec)
{
    if (!RecursionGuard::is_recursing(key))
        return false;
    set_ec(ec, make_error_code(LockStoreErrc::reentrant_access));
    LOGGER_WARN("JsonStore::{}: called from inside a write callback on the same store; refusing",
                op);
    return true;
}

// Locked read-modify-write. Caller holds impl.initMutex.
bool mutate(JsonStoreImpl &impl, const Mutation &mutation, const char *op, std::error_code *ec)
{
    FileLock lock(impl.path, impl.lock_timeout);
    ScopedFileLock guard(lock);
    if (!guard.valid())
    {
        set_ec(ec, guard.error_code());
        LOGGER_DEBUG("JsonStore::{}: cannot lock '{}': {}", op, impl.path.string(),
                     guard.error_code().message());
        return false;
    }

    std::error_code step_ec;
    nlohmann::json doc;
    if (!read_document(impl, doc, step_ec))
    {
        set_ec(ec, step_ec);
        return false;
    }

    step_ec = mutation(doc);
    if (step_ec)
    {
        set_ec(ec, step_ec);
        return false;
    }

    if (!write_document(impl, doc, step_ec))
    {
        set_ec(ec, step_ec);
        return false;
    }

    {
        std::unique_lock<std::shared_mutex> w(impl.rwMutex);
        impl.data = std::move(doc);
    }
    set_ec(ec, {});
    return true;
}

} // namespace

// ---------------- Constructors / destructor ----------------

JsonStore::JsonStore(const fs::path &path, nlohmann::json defaults,
                     std::chrono::milliseconds lock_timeout, std::error_code *ec) noexcept
    : pImpl(std::make_unique<JsonStoreImpl>())
{
    set_ec(ec, {});
    pImpl->path = path;
    pImpl->lock_timeout = std::max(lock_timeout, std::chrono::milliseconds::zero());

    if (defaults.is_object())
    {
        pImpl->defaults = std::move(defaults);
    }
    else if (!defaults.is_null())
    {
        set_ec(ec, std::make_error_code(std::errc::invalid_argument));
        LOGGER_ERROR("JsonStore: defaults for '{}' must be a JSON object, got {}", path.string(),
                     defaults.type_name());
    }
    pImpl->data = pImpl->defaults;

    try
    {
        std::lock_guard<std::mutex> g(pImpl->initMutex);
        FileLock lock(pImpl->path, pImpl->lock_timeout);
        ScopedFileLock guard(lock);
        if (!guard.valid())
        {
            set_ec(ec, guard.error_code());
            LOGGER_ERROR("JsonStore: cannot lock '{}' for initial load: {}", path.string(),
                         guard.error_code().message());
            return;
        }

        std::error_code step_ec;
        std::error_code exists_ec;
        if (!fs::exists(fs::symlink_status(pImpl->path, exists_ec)))
        {
            if (!pImpl->defaults.empty())
            {
                if (!write_document(*pImpl, pImpl->defaults, step_ec))
                {
                    set_ec(ec, step_ec);
                    return;
                }
                LOGGER_DEBUG("JsonStore: created '{}' from {} default key(s)", path.string(),
                             pImpl->defaults.size());
            }
            return;
        }

        nlohmann::json doc;
        if (!read_document(*pImpl, doc, step_ec))
        {
            set_ec(ec, step_ec);
            return;
        }

        // Defaults fill absent keys once, here. Later reads see only the disk document,
        // so a removed default stays removed.
        size_t filled = 0;
        for (auto it = pImpl->defaults.cbegin(); it != pImpl->defaults.cend(); ++it)
        {
            if (!doc.contains(it.key()))
            {
                doc[it.key()] = it.value();
                ++filled;
            }
        }
        if (filled > 0)
        {
            if (!write_document(*pImpl, doc, step_ec))
            {
                set_ec(ec, step_ec);
                return;
            }
            LOGGER_DEBUG("JsonStore: added {} default key(s) to '{}'", filled, path.string());
        }

        std::unique_lock<std::shared_mutex> w(pImpl->rwMutex);
        pImpl->data = std::move(doc);
    }
    catch (const std::exception &ex)
    {
        set_ec(ec, std::make_error_code(std::errc::io_error));
        LOGGER_ERROR("JsonStore: initial load of '{}' failed: {}", path.string(), ex.what());
    }
}

JsonStore::~JsonStore() = default;
JsonStore::JsonStore(JsonStore &&) noexcept = default;
JsonStore &JsonStore::operator=(JsonStore &&) noexcept = default;

// ---------------- load / save ----------------

std::optional<nlohmann::json> JsonStore::load(std::error_code *ec) noexcept
{
    if (!pImpl)
    {
        set_ec(ec, std::make_error_code(std::errc::not_connected));
        return std::nullopt;
    }
    if (refuse_reentry(pImpl.get(), "load", ec))
        return std::nullopt;

    try
    {
        std::lock_guard<std::mutex> g(pImpl->initMutex);
        FileLock lock(pImpl->path, pImpl->lock_timeout);
        ScopedFileLock guard(lock);
        if (!guard.valid())
        {
            set_ec(ec, guard.error_code());
            return std::nullopt;
        }

        std::error_code step_ec;
        nlohmann::json doc;
        if (!read_document(*pImpl, doc, step_ec))
        {
            set_ec(ec, step_ec);
            return std::nullopt;
        }
        {
            std::unique_lock<std::shared_mutex> w(pImpl->rwMutex);
            pImpl->data = doc;
        }
        set_ec(ec, {});
        return doc;
    }
    catch (const std::exception &ex)
    {
        set_ec(ec, std::make_error_code(std::errc::io_error));
        LOGGER_ERROR("JsonStore::load: exception: {}", ex.what());
        return std::nullopt;
    }
}

bool JsonStore::save(std::error_code *ec) noexcept
{
    if (!pImpl)
    {
        set_ec(ec, std::make_error_code(std::errc::not_connected));
        return false;
    }
    if (refuse_reentry(pImpl.get(), "save", ec))
        return false;

    try
    {
        std::lock_guard<std::mutex> g(pImpl->initMutex);
        FileLock lock(pImpl->path, pImpl->lock_timeout);
        ScopedFileLock guard(lock);
        if (!guard.valid())
        {
            set_ec(ec, guard.error_code());
            return false;
        }

        nlohmann::json snapshot;
        {
            std::shared_lock<std::shared_mutex> r(pImpl->rwMutex);
            snapshot = pImpl->data;
        }

        std::error_code step_ec;
        if (!write_document(*pImpl, snapshot, step_ec))
        {
            set_ec(ec, step_ec);
            return false;
        }
        set_ec(ec, {});
        return true;
    }
    catch (const std::exception &ex)
    {
        set_ec(ec, std::make_error_code(std::errc::io_error));
        LOGGER_ERROR("JsonStore::save: exception: {}", ex.what());
        return false;
    }
}

// ---------------- mutations ----------------

bool JsonStore::with_json_write_impl(std::function<void(nlohmann::json &)> fn,
                                     std::error_code *ec) noexcept
{
    if (!pImpl)
    {
        set_ec(ec, std::make_error_code(std::errc::not_connected));
        return false;
    }
    const void *key = pImpl.get();
    if (refuse_reentry(key, "with_json_write", ec))
        return false;

    try
    {
        RecursionGuard recursion(key);
        std::lock_guard<std::mutex> g(pImpl->initMutex);
        return mutate(
            *pImpl,
            [&fn](nlohmann::json &doc) -> std::error_code
            {
                try
                {
                    fn(doc);
                }
                catch (const std::exception &ex)
                {
                    LOGGER_ERROR("JsonStore::with_json_write: callback threw: {}", ex.what());
                    return std::make_error_code(std::errc::operation_canceled);
                }
                if (!doc.is_object())
                    return make_error_code(LockStoreErrc::document_not_object);
                return {};
            },
            "with_json_write", ec);
    }
    catch (const std::exception &ex)
    {
        set_ec(ec, std::make_error_code(std::errc::io_error));
        LOGGER_ERROR("JsonStore::with_json_write: exception: {}", ex.what());
        return false;
    }
}

bool JsonStore::set(const std::string &key, nlohmann::json value, std::error_code *ec) noexcept
{
    return with_json_write_impl([&](nlohmann::json &doc) { doc[key] = std::move(value); }, ec);
}

bool JsonStore::remove(const std::string &key, std::error_code *ec) noexcept
{
    if (!pImpl)
    {
        set_ec(ec, std::make_error_code(std::errc::not_connected));
        return false;
    }
    if (refuse_reentry(pImpl.get(), "remove", ec))
        return false;

    try
    {
        std::lock_guard<std::mutex> g(pImpl->initMutex);
        return mutate(
            *pImpl,
            [&key](nlohmann::json &doc) -> std::error_code
            {
                if (doc.erase(key) == 0)
                    return make_error_code(LockStoreErrc::key_not_found);
                return {};
            },
            "remove", ec);
    }
    catch (const std::exception &ex)
    {
        set_ec(ec, std::make_error_code(std::errc::io_error));
        LOGGER_ERROR("JsonStore::remove: exception: {}", ex.what());
        return false;
    }
}

bool JsonStore::update(const nlohmann::json &mapping, std::error_code *ec) noexcept
{
    if (!mapping.is_object())
    {
        set_ec(ec, std::make_error_code(std::errc::invalid_argument));
        LOGGER_ERROR("JsonStore::update: argument is a JSON {}, expected an object",
                     mapping.type_name());
        return false;
    }
    return with_json_write_impl([&mapping](nlohmann::json &doc) { doc.update(mapping); }, ec);
}

std::optional<nlohmann::json> JsonStore::setdefault(const std::string &key, nlohmann::json value,
                                                    std::error_code *ec) noexcept
{
    nlohmann::json stored;
    const bool ok = with_json_write_impl(
        [&](nlohmann::json &doc)
        {
            auto it = doc.find(key);
            if (it == doc.end())
                it = doc.emplace(key, std::move(value)).first;
            stored = *it;
        },
        ec);
    if (!ok)
        return std::nullopt;
    return stored;
}

// ---------------- queries ----------------

bool JsonStore::with_json_read_impl(std::function<void(nlohmann::json const &)> fn,
                                    std::error_code *ec) const noexcept
{
    if (!pImpl)
    {
        set_ec(ec, std::make_error_code(std::errc::not_connected));
        return false;
    }
    try
    {
        std::shared_lock<std::shared_mutex> r(pImpl->rwMutex);
        fn(pImpl->data);
        set_ec(ec, {});
        return true;
    }
    catch (const std::exception &ex)
    {
        set_ec(ec, std::make_error_code(std::errc::operation_canceled));
        LOGGER_ERROR("JsonStore::with_json_read: callback threw: {}", ex.what());
        return false;
    }
}

std::optional<nlohmann::json> JsonStore::get(const std::string &key) const noexcept
{
    if (!pImpl)
        return std::nullopt;
    try
    {
        std::shared_lock<std::shared_mutex> r(pImpl->rwMutex);
        auto it = pImpl->data.find(key);
        if (it == pImpl->data.end())
            return std::nullopt;
        return *it;
    }
    catch (const std::exception &ex)
    {
        LOGGER_ERROR("JsonStore::get: exception: {}", ex.what());
        return std::nullopt;
    }
}

nlohmann::json JsonStore::get(const std::string &key, nlohmann::json fallback) const noexcept
{
    auto value = get(key);
    return value ? std::move(*value) : std::move(fallback);
}

bool JsonStore::contains(const std::string &key) const noexcept
{
    if (!pImpl)
        return false;
    std::shared_lock<std::shared_mutex> r(pImpl->rwMutex);
    return pImpl->data.contains(key);
}

std::size_t JsonStore::size() const noexcept
{
    if (!pImpl)
        return 0;
    std::shared_lock<std::shared_mutex> r(pImpl->rwMutex);
    return pImpl->data.size();
}

bool JsonStore::empty() const noexcept
{
    return size() == 0;
}

nlohmann::json JsonStore::data() const
{
    if (!pImpl)
        return nlohmann::json::object();
    std::shared_lock<std::shared_mutex> r(pImpl->rwMutex);
    return pImpl->data;
}

fs::path JsonStore::path() const
{
    return pImpl ? pImpl->path : fs::path{};
}

std::chrono::milliseconds JsonStore::lock_timeout() const noexcept
{
    return pImpl ? pImpl->lock_timeout : DEFAULT_LOCK_TIMEOUT;
}

} // namespace lockstore::utils
