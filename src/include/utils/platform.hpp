#pragma once
/**
 * @file platform.hpp
 * @brief Process/thread identity helpers used by the logger.
 */
#include "simpub_net_export.h"

#include <cstdint>

namespace simpub::platform
{

/// Current process id.
SIMPUB_NET_EXPORT uint64_t get_pid() noexcept;

/// Kernel-level id of the calling thread (gettid on Linux).
SIMPUB_NET_EXPORT uint64_t get_native_thread_id() noexcept;

} // namespace simpub::platform
