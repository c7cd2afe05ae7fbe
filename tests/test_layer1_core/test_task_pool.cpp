/**
 * @file test_task_pool.cpp
 * @brief TaskPool: execution, exception capture, shutdown semantics.
 */
#include "test_patterns.h"
#include "net/task_pool.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <vector>

using namespace std::chrono_literals;
using simpub::net::TaskPool;

TEST(TaskPoolTest, RunsSubmittedTasks)
{
    TaskPool pool(3);
    EXPECT_EQ(pool.worker_count(), 3u);

    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 20; ++i)
    {
        futures.push_back(pool.submit("inc", [&counter] { ++counter; }));
    }
    for (auto &f : futures)
    {
        f.get();
    }
    EXPECT_EQ(counter.load(), 20);
}

TEST(TaskPoolTest, LongRunningTasksOccupyDistinctWorkers)
{
    TaskPool pool(3);
    std::atomic<bool> running{true};
    std::atomic<int> started{0};
    auto loop = [&] {
        ++started;
        while (running.load())
        {
            std::this_thread::sleep_for(5ms);
        }
    };
    auto a = pool.submit("loop-a", loop);
    auto b = pool.submit("loop-b", loop);
    auto quick = pool.submit("quick", [] {});

    EXPECT_EQ(quick.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(simpub::tests::wait_until([&] { return started.load() == 2; }));

    running = false;
    a.get();
    b.get();
}

TEST(TaskPoolTest, ExceptionIsCapturedInFuture)
{
    TaskPool pool(2);
    auto f = pool.submit("boom", [] { throw std::runtime_error("task failed"); });
    EXPECT_THROW(f.get(), std::runtime_error);

    // The worker survives the exception.
    auto g = pool.submit("after", [] {});
    EXPECT_NO_THROW(g.get());
}

TEST(TaskPoolTest, ShutdownDrainsQueueAndRejectsNewWork)
{
    TaskPool pool(2);
    std::atomic<int> done{0};
    for (int i = 0; i < 10; ++i)
    {
        (void)pool.submit("slow", [&done] {
            std::this_thread::sleep_for(2ms);
            ++done;
        });
    }
    pool.shutdown();
    EXPECT_EQ(done.load(), 10);
    EXPECT_THROW((void)pool.submit("late", [] {}), std::runtime_error);
    EXPECT_NO_THROW(pool.shutdown());
}
