/*******************************************************************************
 * @file Logger.hpp
 * @brief Asynchronous, thread-safe logging utility.
 *
 * **Design: Command Queue**
 * Application threads never perform I/O. A logging call formats its message with
 * `fmt`, wraps it in a command and pushes it onto a queue. A single worker thread
 * is the sole consumer: it owns the active sink (console or file), writes the
 * messages in order and executes control commands (sink switch, flush).
 *
 * 1.  **Non-Blocking API**: `LOGGER_INFO(...)` and friends only take a short
 *     queue lock. Messages below the runtime level are dropped before
 *     formatting; messages below `LOGGER_COMPILE_LEVEL` are compiled out.
 * 2.  **Sinks**: `set_console()` (stderr, the default) and `set_logfile()`.
 *     Opening a file happens on the calling thread; a failure is reported to the
 *     write-error callback instead of throwing.
 * 3.  **Shutdown**: `shutdown()` drains the queue and joins the worker. It is
 *     idempotent and is registered with `std::atexit` when the logger is first
 *     used, so a normally exiting process never loses queued messages. Messages
 *     logged after shutdown are printed directly to stderr.
 *
 * **Usage**
 * ```cpp
 * #include "utils/Logger.hpp"
 * LOGGER_INFO("Acquired lock '{}'", path.string());
 *
 * auto &logger = lockstore::utils::Logger::instance();
 * logger.set_logfile("/tmp/lockstore.log");
 * logger.set_level(lockstore::utils::Logger::Level::L_DEBUG);
 * logger.flush();
 * ```
 ******************************************************************************/

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "lockstore_utils_export.h"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (256u)
#endif

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace lockstore::utils
{

struct LoggerImpl;

class LOCKSTORE_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    /// Process-wide instance. Created on first use and never destroyed.
    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    // --- Sinks ---
    // Sink changes are queued and take effect in order with the messages around them.

    /// Switch logging to stderr.
    void set_console();

    /**
     * @brief Switch logging to a file opened in append mode.
     * @param utf8_path Path to the log file.
     * @param use_flock If true, hold an advisory flock() around each write (POSIX).
     */
    void set_logfile(const std::string &utf8_path, bool use_flock = false);

    /// Drain the queue and stop the worker thread. Safe to call more than once.
    void shutdown();

    /// Block until every message queued before this call has been written.
    void flush();

    void set_level(Level lvl);
    Level level() const;

    /**
     * @brief Sets a callback invoked when a sink cannot be opened or written.
     * The callback runs on a dedicated dispatcher thread; it may log.
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    // --- Formatting API ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

  private:
    Logger();
    ~Logger();

    std::unique_ptr<LoggerImpl> pImpl;

    void enqueue_log(Level lvl, std::string &&body) noexcept;
    bool should_log(Level lvl) const noexcept;
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            enqueue_log(lvl, std::string(mb.data(), mb.size()));
        }
        catch (const std::exception &ex)
        {
            enqueue_log(lvl, std::string("[FORMAT ERROR] ") + ex.what());
        }
    }
}

} // namespace lockstore::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::lockstore::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::lockstore::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::lockstore::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::lockstore::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::lockstore::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::lockstore::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
