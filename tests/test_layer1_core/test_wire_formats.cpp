/**
 * @file test_wire_formats.cpp
 * @brief Discovery message codec, broadcast address math, JSON payloads, endpoints.
 */
#include "test_patterns.h"
#include "net/discovery.hpp"
#include "net/net_error.hpp"
#include "net/net_types.hpp"

using namespace simpub::net;

class WireFormatTest : public simpub::tests::PureApiTest
{
};

TEST_F(WireFormatTest, BroadcastAddressIsHostOrInverseMask)
{
    EXPECT_EQ(compute_broadcast_address("192.168.1.37", "255.255.255.0"), "192.168.1.255");
    EXPECT_EQ(compute_broadcast_address("10.20.30.40", "255.255.0.0"), "10.20.255.255");
    EXPECT_EQ(compute_broadcast_address("172.16.5.4", "255.255.255.252"), "172.16.5.7");
    EXPECT_EQ(compute_broadcast_address("127.0.0.1", "255.255.255.255"), "127.0.0.1");
}

TEST_F(WireFormatTest, BroadcastAddressRejectsNonIpv4)
{
    EXPECT_THROW((void)compute_broadcast_address("localhost", "255.255.255.0"), NetError);
    EXPECT_THROW((void)compute_broadcast_address("10.0.0.1", "255.255.0"), NetError);
}

TEST_F(WireFormatTest, DiscoveryMessageCarriesTagAndRegistry)
{
    RegistrySnapshot snap;
    snap.topics["scene/updates"] = "192.168.1.37";
    snap.services["Register"] = "192.168.1.37";

    const auto message = encode_discovery_message(snap);
    ASSERT_EQ(message.rfind("SimPub:", 0), 0u);

    const auto body = nlohmann::json::parse(message.substr(7));
    EXPECT_EQ(body.at("Topic").at("scene/updates"), "192.168.1.37");
    EXPECT_EQ(body.at("Service").at("Register"), "192.168.1.37");

    const auto parsed = parse_discovery_message(message);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, snap);
}

TEST_F(WireFormatTest, EmptyRegistryIsStillAnnounced)
{
    const auto message = encode_discovery_message(RegistrySnapshot{});
    EXPECT_EQ(message, R"(SimPub:{"Service":{},"Topic":{}})");
}

TEST_F(WireFormatTest, ParseDiscoveryMessageRejectsForeignDatagrams)
{
    EXPECT_FALSE(parse_discovery_message("OtherApp:{}").has_value());
    EXPECT_FALSE(parse_discovery_message("SimPub").has_value());
    EXPECT_FALSE(parse_discovery_message("SimPub:{broken").has_value());
    EXPECT_FALSE(parse_discovery_message(R"(SimPub:{"Topic": {}})").has_value());
}

TEST_F(WireFormatTest, ClientInfoUsesCapitalisedKeys)
{
    const ClientInfo info{"192.168.1.50", {"hand/left", "hand/right"}};
    const nlohmann::json j = info;
    EXPECT_EQ(j, nlohmann::json::parse(R"({"Host": "192.168.1.50", "Topics": ["hand/left", "hand/right"]})"));

    const auto back = j.get<ClientInfo>();
    EXPECT_EQ(back.host, info.host);
    EXPECT_EQ(back.topics, info.topics);

    EXPECT_THROW((void)nlohmann::json::parse(R"({"Topics": []})").get<ClientInfo>(),
                 nlohmann::json::exception);
}

TEST_F(WireFormatTest, TcpEndpointsAndBoundPorts)
{
    EXPECT_EQ(tcp_endpoint("192.168.1.37", 7721), "tcp://192.168.1.37:7721");
    EXPECT_EQ(tcp_endpoint("127.0.0.1", 0), "tcp://127.0.0.1:*");
    EXPECT_EQ(endpoint_port("tcp://127.0.0.1:40123"), 40123);
    EXPECT_EQ(endpoint_port("tcp://127.0.0.1:*"), -1);
    EXPECT_EQ(endpoint_port("no-port"), -1);
}
