#pragma once
/**
 * @file net_error.hpp
 * @brief Exception types raised while acquiring network or configuration resources.
 *
 * Only construction-time failures are thrown (socket creation, bind, invalid host
 * address, unreadable config). Per-request failures inside the background loops are
 * logged and answered on the wire instead.
 */
#include "simpub_net_export.h"

#include <stdexcept>
#include <string>

namespace simpub::net
{

class SIMPUB_NET_EXPORT NetError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

class SIMPUB_NET_EXPORT ConfigError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

} // namespace simpub::net
