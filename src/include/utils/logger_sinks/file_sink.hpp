#pragma once

#include "sink.hpp"

#include <cstdio>
#include <filesystem>
#include <string>

namespace simpub::utils
{

/// Appends formatted log lines to a file. Throws std::runtime_error if the file
/// cannot be opened.
class SIMPUB_NET_EXPORT FileSink : public Sink
{
  public:
    explicit FileSink(const std::string &path);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override;
    void flush() override;

  private:
    std::filesystem::path m_path;
    std::FILE *m_file{nullptr};
};

} // namespace simpub::utils
