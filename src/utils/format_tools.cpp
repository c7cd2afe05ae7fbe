// format_tools.cpp
#include "utils/format_tools.hpp"

#include <ctime>

#include <fmt/chrono.h>

namespace simpub::format_tools
{

// Formatted local time with microsecond resolution. The sub-second part is computed
// separately so the output does not depend on fmt's chrono subsecond support.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;

    const std::time_t tt = std::chrono::system_clock::to_time_t(secs);
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(tt));
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::pair<std::string_view, std::string_view> split_first(std::string_view input,
                                                          char delimiter) noexcept
{
    const auto pos = input.find(delimiter);
    if (pos == std::string_view::npos)
    {
        return {input, std::string_view{}};
    }
    return {input.substr(0, pos), input.substr(pos + 1)};
}

} // namespace simpub::format_tools
