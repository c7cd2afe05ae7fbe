#include "utils/logger_sinks/sink.hpp"
#include "utils/format_tools.hpp"

#include <array>
#include <string_view>

namespace simpub::utils
{

namespace
{
// Indexed by Logger::Level; sink.hpp stays independent of logger.hpp.
constexpr std::array<const char *, 6> kLevelNames{"TRACE", "DEBUG", "INFO",
                                                  "WARN",  "ERROR", "SYSTEM"};
} // namespace

const char *Sink::level_to_string_internal(int lvl)
{
    if (lvl < 0 || static_cast<size_t>(lvl) >= kLevelNames.size())
    {
        return "UNK";
    }
    return kLevelNames[static_cast<size_t>(lvl)];
}

// [SIMPUB] [LEVEL ] [timestamp] [PID:..... TID:.....] body
std::string Sink::format_logmsg(const LogMessage &msg)
{
    return fmt::format("[SIMPUB] [{:<6}] [{}] [PID:{:5} TID:{:5}] {}\n",
                       level_to_string_internal(msg.level),
                       format_tools::formatted_time(msg.timestamp), msg.process_id,
                       msg.thread_id, std::string_view(msg.body.data(), msg.body.size()));
}

} // namespace simpub::utils
