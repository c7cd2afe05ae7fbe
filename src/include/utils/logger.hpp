/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logging utility.
 *
 * **Command-Queue Pattern**
 * Calls from application threads (e.g. `LOGGER_INFO(...)`) format the message on
 * the calling thread and push a command onto a queue. A single worker thread is
 * the sole consumer of that queue: it performs all I/O and owns the active sink.
 * Network loops therefore never block on console or file writes.
 *
 * - `Sink` is the destination abstraction (`ConsoleSink`, `FileSink`).
 * - Configuration changes (`set_logfile`, `set_console`) are commands too, so they
 *   are applied in order with the surrounding log messages.
 * - `flush()` blocks until everything queued before it has been written.
 * - `shutdown()` drains the queue and joins the worker. Messages logged after
 *   shutdown are dropped.
 *
 * **Usage**
 * ```cpp
 * LOGGER_INFO("Client {} registered {} topics", host, count);
 * simpub::utils::Logger::instance().set_level(Logger::Level::L_DEBUG);
 * ```
 ******************************************************************************/

#pragma once

#include "simpub_net_export.h"

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (256u)
#endif

namespace simpub::utils
{

class SIMPUB_NET_EXPORT Logger
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

    /// Singleton accessor. The worker thread is started on first use.
    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    // --- Sinks ---

    /** @brief Switch logging to the console (stderr). Non-blocking. */
    void set_console();

    /**
     * @brief Switch logging to a file (append mode).
     * Blocks until the worker has installed the new sink.
     * @return false if the file could not be opened; the current sink stays active.
     */
    bool set_logfile(const std::string &utf8_path);

    /**
     * @brief Waits until every message queued before this call has been written.
     */
    void flush();

    /**
     * @brief Drains the queue and stops the worker thread. Idempotent.
     */
    void shutdown();

    // --- Configuration ---
    void set_level(Level lvl);
    [[nodiscard]] Level level() const;

    /// Case-insensitive "trace" | "debug" | "info" | "warn" | "warning" | "error" | "system".
    [[nodiscard]] static std::optional<Level> level_from_string(std::string_view name);

    /**
     * @brief Callback invoked (from a helper thread) when a sink fails to open or write.
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

    struct Impl;
    std::unique_ptr<Impl> pImpl;

    void enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;
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
            enqueue_log(lvl, std::move(mb));
        }
        catch (const std::exception &ex)
        {
            fmt::memory_buffer mb;
            fmt::format_to(std::back_inserter(mb), "[FORMAT ERROR] {}", ex.what());
            enqueue_log(lvl, std::move(mb));
        }
    }
}

} // namespace simpub::utils

// --- Macro Implementation ---
#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::simpub::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::simpub::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::simpub::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::simpub::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::simpub::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::simpub::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
