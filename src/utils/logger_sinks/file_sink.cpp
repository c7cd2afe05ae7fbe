#include "utils/logger_sinks/file_sink.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fmt/format.h>

namespace simpub::utils
{

FileSink::FileSink(const std::string &path) : m_path(path)
{
    std::error_code ec;
    if (m_path.has_parent_path())
    {
        std::filesystem::create_directories(m_path.parent_path(), ec);
    }
    m_file = std::fopen(path.c_str(), "a");
    if (m_file == nullptr)
    {
        throw std::runtime_error(
            fmt::format("Failed to open log file '{}': {}", path, std::strerror(errno)));
    }
}

FileSink::~FileSink()
{
    if (m_file != nullptr)
    {
        std::fflush(m_file);
        std::fclose(m_file);
    }
}

void FileSink::write(const LogMessage &msg)
{
    const auto line = format_logmsg(msg);
    if (std::fwrite(line.data(), 1, line.size(), m_file) != line.size())
    {
        throw std::runtime_error(fmt::format("Short write to log file '{}'", m_path.string()));
    }
}

void FileSink::flush()
{
    std::fflush(m_file);
}

} // namespace simpub::utils
