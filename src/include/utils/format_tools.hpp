// Tools for formatting strings
#pragma once
#include "simpub_net_export.h"

#include <chrono>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace simpub::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us" (local time).
 */
SIMPUB_NET_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Creates a `fmt::memory_buffer` from a compile-time format string and arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128);
    fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Splits @p input at the first occurrence of @p delimiter.
 *
 * Returns {input, ""} when the delimiter is absent. Used by the colon-delimited
 * wire formats ("<service>:<body>", "<tag>:<json>", "<topic>:<data>").
 */
SIMPUB_NET_EXPORT std::pair<std::string_view, std::string_view>
split_first(std::string_view input, char delimiter) noexcept;

} // namespace simpub::format_tools
