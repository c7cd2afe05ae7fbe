/**
 * @file test_discovery.cpp
 * @brief UDP discovery over loopback: socket, broadcaster and listener.
 *
 * A /32 netmask makes the directed broadcast address equal to 127.0.0.1, so the
 * announcements reach a listener on the same machine.
 */
#include "test_patterns.h"
#include "net/discovery.hpp"
#include "net/topic_registry.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace std::chrono_literals;
using namespace simpub::net;

class DiscoveryTest : public simpub::tests::LoopbackNetTest
{
};

TEST_F(DiscoveryTest, UdpSocketLoopbackDatagram)
{
    UdpSocket receiver;
    const int port = receiver.bind(0);
    ASSERT_GT(port, 0);

    UdpSocket sender;
    ASSERT_TRUE(sender.send_to("127.0.0.1", port, "hello"));

    auto dg = receiver.recv_from(2s);
    ASSERT_TRUE(dg.has_value());
    EXPECT_EQ(dg->payload, "hello");
    EXPECT_EQ(dg->sender, "127.0.0.1");
}

TEST_F(DiscoveryTest, UdpSocketRecvTimesOut)
{
    UdpSocket receiver;
    (void)receiver.bind(0);
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(receiver.recv_from(50ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 40ms);
}

TEST_F(DiscoveryTest, UdpSocketIsMovable)
{
    UdpSocket a;
    UdpSocket b(std::move(a));
    EXPECT_FALSE(a.is_open()); // NOLINT(bugprone-use-after-move)
    EXPECT_TRUE(b.is_open());
    b.close();
    EXPECT_FALSE(b.is_open());
}

TEST_F(DiscoveryTest, RepeatedSendFailuresAreCountedAndReset)
{
    UdpSocket receiver;
    const int port = receiver.bind(0);

    UdpSocket sender;
    for (int i = 0; i < 5; ++i)
    {
        EXPECT_FALSE(sender.send_to("not-an-address", port, "lost"));
    }
    EXPECT_EQ(sender.consecutive_send_failures(), 5u);

    EXPECT_TRUE(sender.send_to("127.0.0.1", port, "back"));
    EXPECT_EQ(sender.consecutive_send_failures(), 0u);
    auto dg = receiver.recv_from(2s);
    ASSERT_TRUE(dg.has_value());
    EXPECT_EQ(dg->payload, "back");
}

TEST_F(DiscoveryTest, ClosedSocketSendFailsWithoutThrowing)
{
    UdpSocket sender;
    sender.close();
    EXPECT_FALSE(sender.send_to("127.0.0.1", 9, "x"));
    EXPECT_FALSE(sender.send_to("127.0.0.1", 9, "x"));
    EXPECT_EQ(sender.consecutive_send_failures(), 2u);
}

TEST_F(DiscoveryTest, ListenerReceivesBroadcastAnnouncement)
{
    DiscoveryListener listener(0);
    DiscoveryBroadcaster broadcaster("127.0.0.1", "255.255.255.255", listener.port(), 50ms);
    EXPECT_EQ(broadcaster.broadcast_address(), "127.0.0.1");

    RegistrySnapshot snap;
    snap.topics["scene/updates"] = "127.0.0.1";
    snap.services["Register"] = "127.0.0.1";
    ASSERT_TRUE(broadcaster.broadcast_once(snap));

    auto announcement = listener.wait_for_announcement(2s);
    ASSERT_TRUE(announcement.has_value());
    EXPECT_EQ(announcement->sender, "127.0.0.1");
    EXPECT_EQ(announcement->registry, snap);
}

TEST_F(DiscoveryTest, ListenerSkipsForeignDatagrams)
{
    DiscoveryListener listener(0);
    UdpSocket noise;
    ASSERT_TRUE(noise.send_to("127.0.0.1", listener.port(), "not-simpub"));
    ASSERT_TRUE(noise.send_to("127.0.0.1", listener.port(), "SimPub:{broken"));

    DiscoveryBroadcaster broadcaster("127.0.0.1", "255.255.255.255", listener.port(), 50ms);
    ASSERT_TRUE(broadcaster.broadcast_once(RegistrySnapshot{}));

    auto announcement = listener.wait_for_announcement(2s);
    ASSERT_TRUE(announcement.has_value());
    EXPECT_TRUE(announcement->registry.topics.empty());
}

TEST_F(DiscoveryTest, ListenerTimesOutWithoutAnnouncement)
{
    DiscoveryListener listener(0);
    EXPECT_FALSE(listener.wait_for_announcement(100ms).has_value());
}

TEST_F(DiscoveryTest, BroadcastLoopReflectsRegistryAndStopsPromptly)
{
    DiscoveryListener listener(0);
    DiscoveryBroadcaster broadcaster("127.0.0.1", "255.255.255.255", listener.port(), 50ms);
    TopicRegistry registry;
    std::atomic<bool> running{true};
    std::thread loop([&] { broadcaster.run(running, registry, 10ms); });

    registry.register_topic("scene/late", "10.0.0.9");
    const bool seen = simpub::tests::wait_until(
        [&]
        {
            auto a = listener.wait_for_announcement(200ms);
            return a && a->registry.topics.count("scene/late") == 1;
        });
    EXPECT_TRUE(seen);

    const auto stop_at = std::chrono::steady_clock::now();
    running = false;
    loop.join();
    EXPECT_LT(std::chrono::steady_clock::now() - stop_at, 500ms);
}
