/*******************************************************************************
 * @file Logger.cpp
 * @brief Implementation of the asynchronous logger.
 *
 * @see include/utils/Logger.hpp
 *
 * **Implementation Details**
 *
 * 1.  **Commands**: `Command` is a `std::variant` of a `LogMessage` and the
 *     control requests (`SetSinkCommand`, `SinkErrorCommand`, `FlushCommand`,
 *     `SetErrorCallbackCommand`). Public API calls are the producers.
 *
 * 2.  **Worker (`worker_loop`)**: waits on a condition variable, swaps the whole
 *     queue into a local vector under the lock and processes the batch with the
 *     lock released, so producers are blocked only for the swap.
 *
 * 3.  **Error callbacks (`CallbackDispatcher`)**: a user callback that logs would
 *     re-enter the queue from the worker thread. Callbacks are therefore posted
 *     to a second thread with its own queue.
 *
 * 4.  **Lifetime**: the singleton is allocated once and intentionally leaked.
 *     `shutdown()` is registered with `std::atexit` at creation, which joins the
 *     worker before static destructors run.
 ******************************************************************************/

#include "utils/Logger.hpp"
#include "format_tools.hpp"
#include "platform.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <deque>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include <fmt/format.h>

#if defined(PLATFORM_WIN64)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>
#else
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace lockstore::utils
{

/**
 * @class CallbackDispatcher
 * @brief Runs user error callbacks on a thread separate from the logger worker.
 */
class CallbackDispatcher
{
  public:
    CallbackDispatcher() { worker_ = std::thread([this] { this->run(); }); }

    ~CallbackDispatcher() { shutdown(); }

    void post(std::function<void()> fn)
    {
        if (shutdown_requested_.load(std::memory_order_relaxed))
            return;
        {
            std::lock_guard<std::mutex> lg(mutex_);
            queue_.push_back(std::move(fn));
        }
        cv_.notify_one();
    }

    void shutdown()
    {
        if (shutdown_requested_.exchange(true))
            return;
        cv_.notify_one();
        if (worker_.joinable())
            worker_.join();
    }

  private:
    void run()
    {
        for (;;)
        {
            std::function<void()> fn;
            {
                std::unique_lock<std::mutex> ul(mutex_);
                cv_.wait(ul, [this] { return shutdown_requested_.load() || !queue_.empty(); });
                if (queue_.empty())
                    return;
                fn = std::move(queue_.front());
                queue_.pop_front();
            }
            try
            {
                fn();
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr, "[lockstore::Logger] write-error callback threw: {}\n",
                           e.what());
            }
        }
    }

    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> shutdown_requested_{false};
};

// ============================================================================
// Messages and sinks
// ============================================================================

struct LogMessage
{
    Logger::Level level;
    std::chrono::system_clock::time_point timestamp;
    uint64_t pid;
    uint64_t thread_id;
    std::string body;
};

/// All Sink methods run on the worker thread only.
class Sink
{
  public:
    virtual ~Sink() = default;
    /// Writes one message; throws std::runtime_error on an I/O failure.
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;
};

static const char *level_to_string(Logger::Level lvl)
{
    switch (lvl)
    {
    case Logger::Level::L_TRACE: return "TRACE";
    case Logger::Level::L_DEBUG: return "DEBUG";
    case Logger::Level::L_INFO: return "INFO";
    case Logger::Level::L_WARNING: return "WARN";
    case Logger::Level::L_ERROR: return "ERROR";
    case Logger::Level::L_SYSTEM: return "SYSTEM";
    }
    return "UNK";
}

// Several processes usually share one log, so the PID is part of every line.
static std::string format_message(const LogMessage &msg)
{
    return fmt::format("[{}] [{:<6}] [{}:{}] {}\n", format_tools::formatted_time(msg.timestamp),
                       level_to_string(msg.level), msg.pid, msg.thread_id, msg.body);
}

static LogMessage make_system_message(std::string body)
{
    return LogMessage{Logger::Level::L_SYSTEM, std::chrono::system_clock::now(),
                      platform::get_pid(), platform::get_native_thread_id(), std::move(body)};
}

class ConsoleSink : public Sink
{
  public:
    void write(const LogMessage &msg) override { fmt::print(stderr, "{}", format_message(msg)); }
    void flush() override { std::fflush(stderr); }
    std::string description() const override { return "Console"; }
};

class FileSink : public Sink
{
  public:
    FileSink(const std::string &path, bool use_flock) : path_(path), use_flock_(use_flock)
    {
#if defined(PLATFORM_WIN64)
        const std::wstring wpath = format_tools::s2ws(path);
        handle_ = CreateFileW(wpath.c_str(), FILE_APPEND_DATA, FILE_SHARE_READ | FILE_SHARE_WRITE,
                              nullptr, OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (handle_ == INVALID_HANDLE_VALUE)
            throw std::runtime_error("Failed to open log file: " + path);
#else
        fd_ = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ == -1)
            throw std::runtime_error(
                fmt::format("Failed to open log file '{}': {}", path, std::strerror(errno)));
#endif
    }

    ~FileSink() override
    {
#if defined(PLATFORM_WIN64)
        if (handle_ != INVALID_HANDLE_VALUE)
            CloseHandle(handle_);
#else
        if (fd_ != -1)
            ::close(fd_);
#endif
    }

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override
    {
        const std::string line = format_message(msg);
#if defined(PLATFORM_WIN64)
        DWORD bytes_written = 0;
        if (!WriteFile(handle_, line.data(), static_cast<DWORD>(line.size()), &bytes_written,
                       nullptr))
            throw std::runtime_error(
                fmt::format("WriteFile failed on '{}' (error {})", path_, GetLastError()));
#else
        if (use_flock_)
            ::flock(fd_, LOCK_EX);
        size_t off = 0;
        int err = 0;
        while (off < line.size())
        {
            ssize_t w = ::write(fd_, line.data() + off, line.size() - off);
            if (w < 0)
            {
                if (errno == EINTR)
                    continue;
                err = errno;
                break;
            }
            off += static_cast<size_t>(w);
        }
        if (use_flock_)
            ::flock(fd_, LOCK_UN);
        if (err != 0)
            throw std::runtime_error(
                fmt::format("write failed on '{}': {}", path_, std::strerror(err)));
#endif
    }

    void flush() override
    {
#if defined(PLATFORM_WIN64)
        FlushFileBuffers(handle_);
#else
        ::fsync(fd_);
#endif
    }

    std::string description() const override { return "File: " + path_; }

  private:
    std::string path_;
    bool use_flock_;
#if defined(PLATFORM_WIN64)
    HANDLE handle_ = INVALID_HANDLE_VALUE;
#else
    int fd_ = -1;
#endif
};

// --- Commands ---
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
};
struct SinkErrorCommand
{
    std::string error_message;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<void>> promise;
};
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
};

using Command =
    std::variant<LogMessage, SetSinkCommand, SinkErrorCommand, FlushCommand, SetErrorCallbackCommand>;

// ============================================================================
// Pimpl
// ============================================================================

struct LoggerImpl
{
    LoggerImpl();

    void worker_loop();
    void enqueue_command(Command &&cmd);
    void report_error(std::string message);
    void shutdown();

    std::thread worker_thread_;
    std::vector<Command> queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::atomic<bool> shutdown_requested_{false};
    std::mutex shutdown_mutex_;

    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};

    // Owned by the worker thread.
    std::unique_ptr<Sink> sink_;
    std::function<void(const std::string &)> error_callback_;
    CallbackDispatcher callback_dispatcher_;
};

LoggerImpl::LoggerImpl() : sink_(std::make_unique<ConsoleSink>())
{
    worker_thread_ = std::thread(&LoggerImpl::worker_loop, this);
}

void LoggerImpl::enqueue_command(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!shutdown_requested_.load(std::memory_order_acquire))
        {
            queue_.emplace_back(std::move(cmd));
            cv_.notify_one();
            return;
        }
    }
    // After shutdown nothing drains the queue; keep log lines visible on stderr.
    if (auto *msg = std::get_if<LogMessage>(&cmd))
        fmt::print(stderr, "[lockstore::Logger-fallback] {}", format_message(*msg));
    else if (auto *flush = std::get_if<FlushCommand>(&cmd))
        flush->promise->set_value();
}

void LoggerImpl::report_error(std::string message)
{
    if (error_callback_)
    {
        auto cb = error_callback_;
        callback_dispatcher_.post([cb, msg = std::move(message)]() { cb(msg); });
    }
    else
    {
        fmt::print(stderr, "[lockstore::Logger] {}\n", message);
    }
}

void LoggerImpl::worker_loop()
{
    std::vector<Command> local_queue;

    for (;;)
    {
        bool stop = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            stop = shutdown_requested_.load() && queue_.empty();
            local_queue.swap(queue_);
        }

        if (stop)
        {
            sink_->flush();
            return;
        }

        for (auto &cmd : local_queue)
        {
            try
            {
                std::visit(
                    [this](auto &&arg)
                    {
                        using T = std::decay_t<decltype(arg)>;
                        if constexpr (std::is_same_v<T, LogMessage>)
                        {
                            if (arg.level >= level_.load(std::memory_order_relaxed))
                                sink_->write(arg);
                        }
                        else if constexpr (std::is_same_v<T, SetSinkCommand>)
                        {
                            const std::string old_desc = sink_->description();
                            sink_->write(make_system_message("Switching log sink to: " +
                                                             arg.new_sink->description()));
                            sink_->flush();
                            sink_ = std::move(arg.new_sink);
                            sink_->write(make_system_message("Log sink switched from: " + old_desc));
                        }
                        else if constexpr (std::is_same_v<T, SinkErrorCommand>)
                        {
                            report_error(std::move(arg.error_message));
                        }
                        else if constexpr (std::is_same_v<T, FlushCommand>)
                        {
                            sink_->flush();
                            arg.promise->set_value();
                        }
                        else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
                        {
                            error_callback_ = std::move(arg.callback);
                        }
                    },
                    cmd);
            }
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger worker error: {}", e.what()));
            }
        }
        local_queue.clear();
    }
}

void LoggerImpl::shutdown()
{
    std::lock_guard<std::mutex> guard(shutdown_mutex_);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.exchange(true))
            return;
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
        worker_thread_.join();
    callback_dispatcher_.shutdown();
}

// ============================================================================
// Public API
// ============================================================================

Logger::Logger() : pImpl(std::make_unique<LoggerImpl>()) {}

Logger::~Logger() = default;

Logger &Logger::instance()
{
    // Leaked so that logging from other atexit handlers and static destructors
    // never touches a destroyed object.
    static Logger *const instance = []
    {
        auto *logger = new Logger();
        std::atexit([] { Logger::instance().shutdown(); });
        return logger;
    }();
    return *instance;
}

void Logger::set_console()
{
    pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>()});
}

void Logger::set_logfile(const std::string &utf8_path, bool use_flock)
{
    try
    {
        pImpl->enqueue_command(SetSinkCommand{std::make_unique<FileSink>(utf8_path, use_flock)});
    }
    catch (const std::exception &e)
    {
        pImpl->enqueue_command(SinkErrorCommand{e.what()});
    }
}

void Logger::shutdown()
{
    pImpl->shutdown();
}

void Logger::flush()
{
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    future.wait();
}

void Logger::set_level(Level lvl)
{
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb)});
}

bool Logger::should_log(Level lvl) const noexcept
{
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

void Logger::enqueue_log(Level lvl, std::string &&body) noexcept
{
    try
    {
        pImpl->enqueue_command(LogMessage{lvl, std::chrono::system_clock::now(),
                                          platform::get_pid(), platform::get_native_thread_id(),
                                          std::move(body)});
    }
    catch (const std::exception &e)
    {
        // Out of memory while queueing; write the failure where it can still be seen.
        fmt::print(stderr, "[lockstore::Logger] dropped message: {}\n", e.what());
    }
}

} // namespace lockstore::utils
