#include "utils/platform.hpp"

#include <functional>
#include <thread>

#include <unistd.h>
#if defined(__linux__)
#include <sys/syscall.h>
#elif defined(__APPLE__)
#include <pthread.h>
#endif

namespace simpub::platform
{

uint64_t get_pid() noexcept
{
    return static_cast<uint64_t>(::getpid());
}

uint64_t get_native_thread_id() noexcept
{
#if defined(__linux__)
    return static_cast<uint64_t>(::syscall(SYS_gettid));
#elif defined(__APPLE__)
    uint64_t tid = 0;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

} // namespace simpub::platform
