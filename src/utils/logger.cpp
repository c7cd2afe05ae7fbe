/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 *
 * `Command` is a `std::variant` of log messages and control requests. API calls
 * push commands; `worker_loop` swaps the whole queue into a local vector under the
 * lock and processes the batch without holding it. Control commands that the caller
 * waits on carry a shared promise.
 *
 * User error callbacks run on `CallbackDispatcher`'s own thread so a callback that
 * logs cannot deadlock the worker.
 ******************************************************************************/

#include "utils/logger.hpp"
#include "utils/format_tools.hpp"
#include "utils/platform.hpp"

#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

namespace simpub::utils
{

/**
 * @class CallbackDispatcher
 * @brief Runs user-provided callbacks on a separate thread.
 */
class CallbackDispatcher
{
  public:
    CallbackDispatcher() : shutdown_requested_(false)
    {
        worker_ = std::thread([this] { this->run(); });
    }

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
        {
            return;
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
                fmt::print(stderr, "[SIMPUB] logger error callback threw: {}\n", e.what());
            }
        }
    }

    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> shutdown_requested_;
};

// Command Definitions
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
    std::shared_ptr<std::promise<bool>> promise;
};
struct SinkCreationErrorCommand
{
    std::string error_message;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<bool>> promise;
};

using Command = std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand>;

namespace
{
void promise_set_safe(const std::shared_ptr<std::promise<bool>> &p, bool value)
{
    if (!p)
        return;
    try
    {
        p->set_value(value);
    }
    catch (const std::future_error &)
    {
        // Already satisfied: the command was rejected once before.
    }
}

void reject_command(Command &cmd)
{
    if (auto *set_sink = std::get_if<SetSinkCommand>(&cmd))
    {
        promise_set_safe(set_sink->promise, false);
    }
    else if (auto *flush = std::get_if<FlushCommand>(&cmd))
    {
        promise_set_safe(flush->promise, false);
    }
}
} // namespace

struct Logger::Impl
{
    Impl() : sink_(std::make_unique<ConsoleSink>()) {}

    void start_worker();
    void worker_loop();
    bool enqueue_command(Command &&cmd);
    void report_error(const std::string &message);
    void shutdown();

    std::unique_ptr<Sink> sink_;
    std::function<void(const std::string &)> error_callback_;
    std::mutex callback_mutex_;
    std::thread worker_thread_;
    std::vector<Command> queue_;
    std::condition_variable cv_;
    std::mutex queue_mutex_;
    CallbackDispatcher callback_dispatcher_;
    size_t max_queue_size_{10000};
    std::atomic<size_t> messages_dropped_{0};
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    std::atomic<bool> shutdown_requested_{false};
};

void Logger::Impl::start_worker()
{
    if (!worker_thread_.joinable())
    {
        worker_thread_ = std::thread(&Logger::Impl::worker_loop, this);
    }
}

bool Logger::Impl::enqueue_command(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.load(std::memory_order_acquire))
        {
            reject_command(cmd);
            return false;
        }
        if (queue_.size() >= max_queue_size_ && std::holds_alternative<LogMessage>(cmd))
        {
            messages_dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
    return true;
}

void Logger::Impl::report_error(const std::string &message)
{
    std::function<void(const std::string &)> cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = error_callback_;
    }
    if (cb)
    {
        callback_dispatcher_.post([cb, message]() { cb(message); });
    }
    else
    {
        fmt::print(stderr, "[SIMPUB] logger: {}\n", message);
    }
}

void Logger::Impl::worker_loop()
{
    std::vector<Command> local_queue;
    bool draining = false;

    while (!draining)
    {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            local_queue.swap(queue_);
            draining = shutdown_requested_.load();
        }

        const size_t dropped = messages_dropped_.exchange(0, std::memory_order_relaxed);
        if (dropped > 0 && sink_)
        {
            sink_->write(LogMessage{
                .timestamp = std::chrono::system_clock::now(),
                .process_id = platform::get_pid(),
                .thread_id = platform::get_native_thread_id(),
                .level = static_cast<int>(Logger::Level::L_WARNING),
                .body = format_tools::make_buffer("Logger queue overflow: {} messages dropped",
                                                  dropped)});
        }

        for (auto &cmd : local_queue)
        {
            try
            {
                if (auto *msg = std::get_if<LogMessage>(&cmd))
                {
                    if (sink_ &&
                        msg->level >= static_cast<int>(level_.load(std::memory_order_relaxed)))
                    {
                        sink_->write(*msg);
                    }
                }
                else if (auto *set_sink = std::get_if<SetSinkCommand>(&cmd))
                {
                    if (sink_)
                    {
                        sink_->flush();
                    }
                    sink_ = std::move(set_sink->new_sink);
                    promise_set_safe(set_sink->promise, true);
                }
                else if (auto *err = std::get_if<SinkCreationErrorCommand>(&cmd))
                {
                    report_error(err->error_message);
                }
                else if (auto *flush = std::get_if<FlushCommand>(&cmd))
                {
                    if (sink_)
                    {
                        sink_->flush();
                    }
                    promise_set_safe(flush->promise, true);
                }
            }
            catch (const std::exception &e)
            {
                reject_command(cmd);
                report_error(fmt::format("Logger worker error: {}", e.what()));
            }
        }
        local_queue.clear();
    }

    if (sink_)
    {
        sink_->flush();
    }
}

void Logger::Impl::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.exchange(true))
        {
            return;
        }
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
    callback_dispatcher_.shutdown();
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}

Logger::~Logger()
{
    shutdown();
}

Logger &Logger::instance()
{
    static Logger logger;
    static std::once_flag started;
    std::call_once(started, [] { logger.pImpl->start_worker(); });
    return logger;
}

void Logger::set_console()
{
    pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>(), nullptr});
}

bool Logger::set_logfile(const std::string &utf8_path)
{
    try
    {
        auto promise = std::make_shared<std::promise<bool>>();
        auto future = promise->get_future();
        if (!pImpl->enqueue_command(SetSinkCommand{std::make_unique<FileSink>(utf8_path), promise}))
        {
            return false;
        }
        return future.get();
    }
    catch (const std::runtime_error &e)
    {
        pImpl->enqueue_command(
            SinkCreationErrorCommand{fmt::format("Failed to create FileSink: {}", e.what())});
    }
    return false;
}

void Logger::flush()
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    if (!pImpl->enqueue_command(FlushCommand{promise}))
    {
        return;
    }
    (void)future.get();
}

void Logger::shutdown()
{
    if (pImpl)
    {
        pImpl->shutdown();
    }
}

void Logger::set_level(Level lvl)
{
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

std::optional<Logger::Level> Logger::level_from_string(std::string_view name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace")
        return Level::L_TRACE;
    if (lower == "debug")
        return Level::L_DEBUG;
    if (lower == "info")
        return Level::L_INFO;
    if (lower == "warn" || lower == "warning")
        return Level::L_WARNING;
    if (lower == "error")
        return Level::L_ERROR;
    if (lower == "system")
        return Level::L_SYSTEM;
    return std::nullopt;
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    std::lock_guard<std::mutex> lock(pImpl->callback_mutex_);
    pImpl->error_callback_ = std::move(cb);
}

bool Logger::should_log(Level lvl) const noexcept
{
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

void Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    try
    {
        pImpl->enqueue_command(LogMessage{.timestamp = std::chrono::system_clock::now(),
                                          .process_id = platform::get_pid(),
                                          .thread_id = platform::get_native_thread_id(),
                                          .level = static_cast<int>(lvl),
                                          .body = std::move(body)});
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[SIMPUB] logger enqueue failed: {}\n", e.what());
    }
}

} // namespace simpub::utils
