#include "net/task_pool.hpp"

#include "utils/logger.hpp"

#include <stdexcept>

namespace simpub::net
{

TaskPool::TaskPool(size_t worker_count)
{
    m_workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i)
    {
        m_workers.emplace_back([this] { worker_loop(); });
    }
}

TaskPool::~TaskPool()
{
    shutdown();
}

std::future<void> TaskPool::submit(std::string name, std::function<void()> task)
{
    std::packaged_task<void()> wrapped(
        [name = std::move(name), task = std::move(task)]()
        {
            try
            {
                task();
            }
            catch (const std::exception &e)
            {
                LOGGER_ERROR("TaskPool: task '{}' terminated with exception: {}", name, e.what());
                throw;
            }
        });
    auto future = wrapped.get_future();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping)
        {
            throw std::runtime_error("TaskPool: submit() after shutdown");
        }
        m_queue.push_back(std::move(wrapped));
    }
    m_cv.notify_one();
    return future;
}

void TaskPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping)
        {
            return;
        }
        m_stopping = true;
    }
    m_cv.notify_all();
    for (auto &worker : m_workers)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
}

void TaskPool::worker_loop()
{
    for (;;)
    {
        std::packaged_task<void()> task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return m_stopping || !m_queue.empty(); });
            if (m_queue.empty())
            {
                return; // stopping and drained
            }
            task = std::move(m_queue.front());
            m_queue.pop_front();
        }
        task(); // exceptions are stored in the task's future
    }
}

} // namespace simpub::net
