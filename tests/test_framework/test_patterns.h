#pragma once
/**
 * @file test_patterns.h
 * @brief Shared fixtures for the simpub test suites.
 *
 * ## PureApiTest
 *
 * In-process, no sockets. For pure functions, data structures and codecs.
 *
 * ## LoopbackNetTest
 *
 * In-process tests that open real sockets. Every socket binds to 127.0.0.1 with an
 * OS-assigned port so suites can run in parallel without colliding on the
 * well-known 7720-7722 ports. `loopback_config()` returns a NetConfig set up that
 * way; the discovery port is taken from a DiscoveryListener the test binds first,
 * so the manager's announcements land on that listener.
 *
 * The logger is a process-wide singleton that keeps running across tests; tests
 * never shut it down.
 */
#include "net/net_config.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <thread>

namespace simpub::tests
{

class PureApiTest : public ::testing::Test
{
  protected:
    void SetUp() override {}
    void TearDown() override {}
};

/**
 * @brief Polls @p predicate every 10 ms until it holds or @p timeout elapses.
 * @return the final value of @p predicate.
 */
inline bool wait_until(const std::function<bool()> &predicate,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds{3000})
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (predicate())
        {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    return predicate();
}

class LoopbackNetTest : public ::testing::Test
{
  protected:
    static net::NetConfig loopback_config(int discovery_port)
    {
        net::NetConfig cfg;
        cfg.host = "127.0.0.1";
        // /32: the directed broadcast address is the host itself.
        cfg.netmask = "255.255.255.255";
        cfg.discovery_port = discovery_port;
        cfg.service_port = 0;
        cfg.topic_port = 0;
        cfg.broadcast_interval = std::chrono::milliseconds{50};
        cfg.poll_timeout = std::chrono::milliseconds{20};
        cfg.worker_count = 3;
        return cfg;
    }

    /// PUB/SUB joins are asynchronous; give a fresh subscription time to attach.
    static void settle() { std::this_thread::sleep_for(std::chrono::milliseconds{200}); }
};

} // namespace simpub::tests
