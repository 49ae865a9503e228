/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 *
 * @see include/utils/logger.hpp
 *
 * **Implementation Details**
 *
 * 1.  **Command Processing**: `Command` is a `std::variant` of a `LogMessage`,
 *     a `SetSinkCommand`, a `FlushCommand`, and so on. Public API functions are
 *     producers; they build a command and push it onto the queue.
 *
 * 2.  **Worker Thread**: sleeps on a condition variable until the queue is not
 *     empty or shutdown is requested, swaps the whole queue into a local vector
 *     under the lock, then processes the batch via `std::visit` without it.
 *
 * 3.  **Error Callback Handling**: a user error callback that logs would
 *     re-enter the queue from the worker. The `CallbackDispatcher` runs such
 *     callbacks on its own thread so the worker never waits on itself.
 ******************************************************************************/

#include "utils/logger.hpp"
#include "utils/format_tools.hpp"
#include "rh_platform.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#if defined(RELAYHUB_IS_POSIX)
#include <fcntl.h>
#include <sys/file.h>
#include <syslog.h>
#include <unistd.h>
#endif

namespace relayhub::utils
{

/**
 * @class CallbackDispatcher
 * @brief Executes user-provided callbacks on a separate thread.
 */
class CallbackDispatcher
{
  public:
    CallbackDispatcher() : shutdown_requested_(false)
    {
        worker_ = std::thread([this] { this->run(); });
    }

    ~CallbackDispatcher() { shutdown(); }

    CallbackDispatcher(const CallbackDispatcher &) = delete;
    CallbackDispatcher &operator=(const CallbackDispatcher &) = delete;

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
        {
            return; // Already shutting down or shut down
        }
        cv_.notify_one();
        if (worker_.joinable())
        {
            worker_.join();
        }
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
                if (shutdown_requested_.load() && queue_.empty())
                {
                    return;
                }
                fn = std::move(queue_.front());
                queue_.pop_front();
            }
            try
            {
                fn();
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr, "[relayhub::Logger] error callback threw: {}\n", e.what());
            }
        }
    }

    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> shutdown_requested_;
};

// ============================================================================
// Internal Command and Sink Definitions
// ============================================================================

/** @struct LogMessage @brief A single, formatted log entry. */
struct LogMessage
{
    Logger::Level level;
    std::chrono::system_clock::time_point timestamp;
    uint64_t thread_id;
    std::string body;
};

/**
 * @class Sink
 * @brief Abstract base class for all log destinations.
 *
 * All methods are called only from the worker thread.
 */
class Sink
{
  public:
    virtual ~Sink() = default;
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    [[nodiscard]] virtual std::string description() const = 0;
};

namespace
{

const char *level_to_string(Logger::Level lvl)
{
    switch (lvl)
    {
    case Logger::Level::L_TRACE: return "TRACE";
    case Logger::Level::L_DEBUG: return "DEBUG";
    case Logger::Level::L_INFO: return "INFO";
    case Logger::Level::L_WARNING: return "WARN";
    case Logger::Level::L_ERROR: return "ERROR";
    case Logger::Level::L_SYSTEM: return "SYSTEM";
    default: return "UNK";
    }
}

std::string format_message(const LogMessage &msg)
{
    return fmt::format("[{}] [{:<6}] [PID:{:5} TID:{:5}] {}\n",
                       format_tools::formatted_time(msg.timestamp), level_to_string(msg.level),
                       platform::get_pid(), msg.thread_id, msg.body);
}

LogMessage make_system_message(std::string body)
{
    return LogMessage{Logger::Level::L_SYSTEM, std::chrono::system_clock::now(),
                      platform::get_native_thread_id(), std::move(body)};
}

} // namespace

// ============================================================================
// Concrete Sink Implementations
// ============================================================================

/** @brief Writes log messages to the standard error console. */
class ConsoleSink : public Sink
{
  public:
    void write(const LogMessage &msg) override { fmt::print(stderr, "{}", format_message(msg)); }
    void flush() override { fflush(stderr); }
    [[nodiscard]] std::string description() const override { return "Console"; }
};

#if defined(RELAYHUB_IS_POSIX)
/** @brief Appends log messages to a file. */
class FileSink : public Sink
{
  public:
    FileSink(const std::string &path, bool use_flock) : path_(path), use_flock_(use_flock)
    {
        fd_ = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ == -1)
        {
            throw std::runtime_error("Failed to open log file: " + path);
        }
    }

    ~FileSink() override
    {
        if (fd_ != -1)
            ::close(fd_);
    }

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override
    {
        const auto formatted = format_message(msg);
        if (use_flock_)
            ::flock(fd_, LOCK_EX);
        const ssize_t n = ::write(fd_, formatted.data(), formatted.size());
        if (use_flock_)
            ::flock(fd_, LOCK_UN);
        if (n < 0 || static_cast<size_t>(n) != formatted.size())
        {
            throw std::runtime_error(fmt::format("short write to log file '{}'", path_));
        }
    }

    void flush() override { ::fsync(fd_); }

    [[nodiscard]] std::string description() const override { return "File: " + path_; }

  private:
    std::string path_;
    bool use_flock_;
    int fd_ = -1;
};

/** @brief Writes to the POSIX syslog service. */
class SyslogSink : public Sink
{
  public:
    SyslogSink(const char *ident, int option, int facility) { openlog(ident, option, facility); }

    ~SyslogSink() override { closelog(); }

    void write(const LogMessage &msg) override
    {
        syslog(level_to_syslog_priority(msg.level), "%.*s", static_cast<int>(msg.body.size()),
               msg.body.data());
    }

    void flush() override {} // Not buffered in the application.

    [[nodiscard]] std::string description() const override { return "Syslog"; }

  private:
    static int level_to_syslog_priority(Logger::Level level)
    {
        switch (level)
        {
        case Logger::Level::L_TRACE: return LOG_DEBUG;
        case Logger::Level::L_DEBUG: return LOG_DEBUG;
        case Logger::Level::L_INFO: return LOG_INFO;
        case Logger::Level::L_WARNING: return LOG_WARNING;
        case Logger::Level::L_ERROR: return LOG_ERR;
        case Logger::Level::L_SYSTEM: return LOG_CRIT;
        default: return LOG_INFO;
        }
    }
};
#endif // RELAYHUB_IS_POSIX

// --- Command Definitions ---
struct SetSinkCommand { std::unique_ptr<Sink> new_sink; };
struct SinkCreationErrorCommand { std::string error_message; };
struct FlushCommand { std::shared_ptr<std::promise<void>> promise; };
struct SetErrorCallbackCommand { std::function<void(const std::string &)> callback; };

using Command = std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand,
                             SetErrorCallbackCommand>;

// ============================================================================
// LoggerImpl
// ============================================================================

class LoggerImpl
{
  public:
    LoggerImpl();
    ~LoggerImpl();

    LoggerImpl(const LoggerImpl &) = delete;
    LoggerImpl &operator=(const LoggerImpl &) = delete;

    void worker_loop();
    void enqueue_command(Command &&cmd);
    void shutdown();
    void report_error(std::string message);

    std::thread worker_thread_;
    std::vector<Command> queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_completed_{false};
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};

    // Worker-thread-owned state.
    std::unique_ptr<Sink> sink_;
    std::function<void(const std::string &)> error_callback_;
    CallbackDispatcher callback_dispatcher_;
};

LoggerImpl::LoggerImpl() : sink_(std::make_unique<ConsoleSink>())
{
    worker_thread_ = std::thread(&LoggerImpl::worker_loop, this);
}

LoggerImpl::~LoggerImpl()
{
    shutdown();
}

void LoggerImpl::enqueue_command(Command &&cmd)
{
    if (!shutdown_requested_.load(std::memory_order_relaxed))
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        // Re-check under the lock: shutdown may have started in between.
        if (!shutdown_requested_.load(std::memory_order_acquire))
        {
            queue_.emplace_back(std::move(cmd));
            cv_.notify_one();
            return;
        }
    }
    // After shutdown, print log messages directly so they are not silently lost.
    if (const auto *msg = std::get_if<LogMessage>(&cmd))
    {
        fmt::print(stderr, "[relayhub::Logger-fallback] {}", format_message(*msg));
    }
    else if (auto *flush = std::get_if<FlushCommand>(&cmd))
    {
        flush->promise->set_value();
    }
}

void LoggerImpl::report_error(std::string message)
{
    if (error_callback_)
    {
        auto cb = error_callback_;
        callback_dispatcher_.post([cb, msg = std::move(message)]() { cb(msg); });
    }
}

void LoggerImpl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool do_final_flush_and_break = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });

            if (shutdown_requested_.load() && queue_.empty())
            {
                do_final_flush_and_break = true;
            }
            local_queue.swap(queue_);
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
                            if (sink_ && arg.level >= level_.load(std::memory_order_relaxed))
                                sink_->write(arg);
                        }
                        else if constexpr (std::is_same_v<T, SetSinkCommand>)
                        {
                            const std::string old_desc = sink_ ? sink_->description() : "null";
                            const std::string new_desc =
                                arg.new_sink ? arg.new_sink->description() : "null";
                            if (sink_)
                            {
                                sink_->write(make_system_message("Switching log sink to: " + new_desc));
                                sink_->flush();
                            }
                            sink_ = std::move(arg.new_sink);
                            if (sink_)
                            {
                                sink_->write(make_system_message("Log sink switched from: " + old_desc));
                            }
                        }
                        else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
                        {
                            report_error(arg.error_message);
                        }
                        else if constexpr (std::is_same_v<T, FlushCommand>)
                        {
                            if (sink_)
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

        if (do_final_flush_and_break)
        {
            if (sink_)
                sink_->flush();
            break;
        }
    }
}

void LoggerImpl::shutdown()
{
    if (shutdown_completed_.load() || shutdown_requested_.exchange(true))
    {
        return;
    }

    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }

    // No more callbacks can be generated now.
    callback_dispatcher_.shutdown();
    shutdown_completed_.store(true);
}

// ============================================================================
// Logger Public API
// ============================================================================

Logger::Logger() : pImpl(std::make_unique<LoggerImpl>()) {}

Logger::~Logger() = default;

Logger &Logger::instance()
{
    // Function-local static: constructed on first use, destroyed (and drained)
    // at process exit.
    static Logger s_instance;
    return s_instance;
}

void Logger::set_console()
{
    pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>()});
}

void Logger::set_logfile(const std::string &utf8_path, bool use_flock)
{
#if defined(RELAYHUB_IS_POSIX)
    try
    {
        pImpl->enqueue_command(SetSinkCommand{std::make_unique<FileSink>(utf8_path, use_flock)});
    }
    catch (const std::exception &e)
    {
        pImpl->enqueue_command(
            SinkCreationErrorCommand{fmt::format("Failed to create FileSink: {}", e.what())});
    }
#else
    (void)use_flock;
    pImpl->enqueue_command(
        SinkCreationErrorCommand{"FileSink is not supported on this platform: " + utf8_path});
#endif
}

void Logger::set_syslog(const char *ident, int option, int facility)
{
#if defined(RELAYHUB_IS_POSIX)
    pImpl->enqueue_command(
        SetSinkCommand{std::make_unique<SyslogSink>(ident ? ident : "relayhub", option, facility)});
#else
    (void)ident; (void)option; (void)facility;
    pImpl->enqueue_command(SinkCreationErrorCommand{"Syslog is not supported on this platform"});
#endif
}

void Logger::shutdown()
{
    pImpl->shutdown();
}

void Logger::flush()
{
    if (pImpl->shutdown_requested_.load())
        return;

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

std::optional<Logger::Level> Logger::level_from_string(std::string_view name) noexcept
{
    if (name == "trace") return Level::L_TRACE;
    if (name == "debug") return Level::L_DEBUG;
    if (name == "info") return Level::L_INFO;
    if (name == "warn" || name == "warning") return Level::L_WARNING;
    if (name == "error") return Level::L_ERROR;
    if (name == "system") return Level::L_SYSTEM;
    return std::nullopt;
}

bool Logger::should_log(Level lvl) const noexcept
{
    return static_cast<int>(lvl) >=
           static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

void Logger::enqueue_log(Level lvl, std::string &&body) noexcept
{
    try
    {
        pImpl->enqueue_command(LogMessage{lvl, std::chrono::system_clock::now(),
                                          platform::get_native_thread_id(), std::move(body)});
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[relayhub::Logger] failed to enqueue message: {}\n", e.what());
    }
}

} // namespace relayhub::utils
