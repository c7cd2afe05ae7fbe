/**
 * @file test_net_manager.cpp
 * @brief NetManager end to end: announcements, registration, publishing,
 *        control dispatch, tasks and shutdown.
 */
#include "test_patterns.h"
#include "net/discovery.hpp"
#include "net/message_dispatcher.hpp"
#include "net/net_error.hpp"
#include "net/net_manager.hpp"
#include "net/stream.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using namespace simpub::net;
using simpub::tests::wait_until;

class NetManagerTest : public simpub::tests::LoopbackNetTest
{
  protected:
    DiscoveryListener listener_{0};
};

TEST_F(NetManagerTest, ConstructionReportsEffectiveEndpoints)
{
    NetManager manager(loopback_config(listener_.port()));
    EXPECT_EQ(manager.host(), "127.0.0.1");
    EXPECT_EQ(manager.broadcast_address(), "127.0.0.1");
    EXPECT_GT(manager.service_port(), 0);
    EXPECT_GT(manager.topic_port(), 0);
    EXPECT_NE(manager.service_port(), manager.topic_port());
    EXPECT_EQ(manager.discovery_port(), listener_.port());
    EXPECT_TRUE(manager.is_running());

    EXPECT_TRUE(manager.has_service("Register"));
    EXPECT_EQ(manager.service_owner("Register"), "127.0.0.1");
}

TEST_F(NetManagerTest, InvalidConfigThrowsConfigError)
{
    auto cfg = loopback_config(listener_.port());
    cfg.host = "localhost";
    EXPECT_THROW(NetManager{cfg}, ConfigError);
}

TEST_F(NetManagerTest, PortInUseThrowsNetError)
{
    NetManager first(loopback_config(listener_.port()));
    auto cfg = loopback_config(listener_.port());
    cfg.service_port = first.service_port();
    EXPECT_THROW({ NetManager second(cfg); }, NetError);
}

TEST_F(NetManagerTest, AnnouncementsCarryRegistry)
{
    NetManager manager(loopback_config(listener_.port()));
    manager.register_topic("scene/updates", manager.host());

    const bool seen = wait_until(
        [&]
        {
            auto a = listener_.wait_for_announcement(200ms);
            return a && a->sender == "127.0.0.1" &&
                   a->registry.topics.count("scene/updates") == 1 &&
                   a->registry.services.count("Register") == 1;
        });
    EXPECT_TRUE(seen);
}

TEST_F(NetManagerTest, SameHostRegisteringTwiceKeepsEachTopicOnce)
{
    NetManager manager(loopback_config(listener_.port()));
    manager.register_topic("hand/left", "192.168.1.50");
    manager.register_topic("hand/right", "192.168.1.50");
    manager.register_topic("hand/left", "192.168.1.50");

    EXPECT_EQ(manager.host_topics("192.168.1.50"),
              (std::vector<std::string>{"hand/left", "hand/right"}));
    EXPECT_EQ(manager.snapshot().topics.size(), 2u);
}

TEST_F(NetManagerTest, PublishPrefixesTopic)
{
    NetManager manager(loopback_config(listener_.port()));
    std::mutex mutex;
    std::vector<std::string> received;
    StreamReceiver receiver(manager.context(),
                            [&](const std::string &msg)
                            {
                                std::lock_guard<std::mutex> lock(mutex);
                                received.push_back(msg);
                            });
    receiver.connect("127.0.0.1", manager.topic_port(), "scene/updates:");

    const bool delivered = wait_until(
        [&]
        {
            (void)manager.publish("other/topic", "ignored");
            (void)manager.publish("scene/updates", R"({"frame":1})");
            std::lock_guard<std::mutex> lock(mutex);
            return !received.empty();
        });
    receiver.disconnect();
    ASSERT_TRUE(delivered);
    for (const auto &msg : received)
    {
        EXPECT_EQ(msg, R"(scene/updates:{"frame":1})");
    }
}

TEST_F(NetManagerTest, DispatcherServiceRoutesControlMessages)
{
    struct Control : ControlHandler
    {
        void on_start_stream(const Envelope &) override { ++starts; }
        void on_close_stream(const Envelope &) override { ++closes; }
        void on_manipulate_objects(const Envelope &) override {}
        std::atomic<int> starts{0};
        std::atomic<int> closes{0};
    } control;
    MessageDispatcher dispatcher;
    bind_control_handler(dispatcher, control);

    NetManager manager(loopback_config(listener_.port()));
    manager.register_dispatcher("Control", manager.host(), dispatcher);
    ServiceClient client(manager.context(), tcp_endpoint("127.0.0.1", manager.service_port()));

    auto reply = client.request("Control", R"({"message_type": "start_stream"})", 3s);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(nlohmann::json::parse(*reply).at("status"), "success");
    EXPECT_EQ(control.starts.load(), 1);

    reply = client.request("Control", R"({"message_type": "teleport"})", 3s);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(nlohmann::json::parse(*reply).at("error_code"), "UNKNOWN_MSG_TYPE");

    reply = client.request("Control", "garbage", 3s);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(nlohmann::json::parse(*reply).at("error_code"), "INVALID_REQUEST");
    EXPECT_EQ(control.closes.load(), 0);
}

TEST_F(NetManagerTest, SubmittedTasksStopWithManager)
{
    NetManager manager(loopback_config(listener_.port()));
    std::atomic<int> ticks{0};
    auto task = manager.submit_task("ticker",
                                    [&]
                                    {
                                        while (manager.is_running())
                                        {
                                            ++ticks;
                                            std::this_thread::sleep_for(5ms);
                                        }
                                    });
    EXPECT_TRUE(wait_until([&] { return ticks.load() > 0; }));

    manager.shutdown();
    EXPECT_EQ(task.wait_for(0s), std::future_status::ready);
    EXPECT_THROW((void)manager.submit_task("late", [] {}), std::runtime_error);
}

TEST_F(NetManagerTest, JoinRethrowsFirstTaskFailure)
{
    NetManager manager(loopback_config(listener_.port()));
    auto failing = manager.submit_task("failing",
                                       [] { throw std::runtime_error("task exploded"); });
    EXPECT_EQ(failing.wait_for(3s), std::future_status::ready);

    EXPECT_NO_THROW(manager.shutdown());
    try
    {
        manager.join();
        FAIL() << "join() should rethrow the task failure";
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_STREQ(e.what(), "task exploded");
    }
}

TEST_F(NetManagerTest, ShutdownIsPromptAndIdempotent)
{
    NetManager manager(loopback_config(listener_.port()));
    const auto start = std::chrono::steady_clock::now();
    manager.shutdown();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    EXPECT_FALSE(manager.is_running());
    EXPECT_FALSE(manager.publish("scene/updates", "late"));

    EXPECT_NO_THROW(manager.shutdown());
    EXPECT_NO_THROW(manager.join());
}

TEST_F(NetManagerTest, SeveralManagersCoexist)
{
    NetManager a(loopback_config(listener_.port()));
    NetManager b(loopback_config(listener_.port()));
    EXPECT_NE(a.service_port(), b.service_port());
    a.register_topic("only/a", a.host());
    EXPECT_FALSE(b.topic_owner("only/a").has_value());
}
