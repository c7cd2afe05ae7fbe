#pragma once

#include "sink.hpp"

#include <cstdio>

#include <fmt/core.h>

namespace simpub::utils
{

class ConsoleSink : public Sink
{
  public:
    void write(const LogMessage &msg) override
    {
        fmt::print(stderr, "{}", Sink::format_logmsg(msg));
    }
    void flush() override { std::fflush(stderr); }
};

} // namespace simpub::utils
