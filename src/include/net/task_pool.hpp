#pragma once
/**
 * @file task_pool.hpp
 * @brief Fixed-size worker pool owned by NetManager.
 *
 * Long-running loops (broadcast, service) and short tasks share the pool. Each
 * submitted task occupies one worker until it returns, so the pool must be sized
 * for the number of concurrent loops plus headroom.
 */
#include "simpub_net_export.h"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace simpub::net
{

class SIMPUB_NET_EXPORT TaskPool
{
  public:
    explicit TaskPool(size_t worker_count);
    ~TaskPool();

    TaskPool(const TaskPool &) = delete;
    TaskPool &operator=(const TaskPool &) = delete;

    /**
     * @brief Queue @p task under @p name. An exception escaping the task is logged
     *        and rethrown from the returned future.
     * @throws std::runtime_error if the pool is shutting down.
     */
    std::future<void> submit(std::string name, std::function<void()> task);

    /// Stops accepting work, lets queued and running tasks finish, joins workers. Idempotent.
    void shutdown();

    [[nodiscard]] size_t worker_count() const noexcept { return m_workers.size(); }

  private:
    void worker_loop();

    std::vector<std::thread> m_workers;
    std::deque<std::packaged_task<void()>> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_stopping{false};
};

} // namespace simpub::net
