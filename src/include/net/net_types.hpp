#pragma once
/**
 * @file net_types.hpp
 * @brief Shared vocabulary types and wire constants of the simpub network layer.
 */
#include "simpub_net_export.h"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace simpub::net
{

using IPAddress = std::string;
using Topic = std::string;

/// Default port assignment. NetConfig can override each of them.
inline constexpr int kDefaultDiscoveryPort = 7720; ///< UDP broadcast
inline constexpr int kDefaultServicePort = 7721;   ///< ZMQ REP
inline constexpr int kDefaultTopicPort = 7722;     ///< ZMQ PUB

/// Prefix of every discovery datagram: "SimPub:" + JSON.
inline constexpr std::string_view kDiscoveryTag = "SimPub";

/// Delimiter used by all colon-framed text messages.
inline constexpr char kFieldDelimiter = ':';

/// Reply to a request naming an unregistered service. Spelling kept for wire compatibility.
inline constexpr std::string_view kInvalidServiceReply = "Invild Service";

/// Name of the built-in client registration service.
inline constexpr std::string_view kRegisterService = "Register";

/// Payload of the "Register" service: {"Host": "...", "Topics": [...]}.
struct ClientInfo
{
    IPAddress host;
    std::vector<Topic> topics;
};

/// Serializable view of the registry broadcast during discovery.
struct RegistrySnapshot
{
    std::map<Topic, IPAddress> topics;
    std::map<std::string, IPAddress> services;

    bool operator==(const RegistrySnapshot &) const = default;
};

// nlohmann::json ADL hooks. from_json throws nlohmann::json::exception on missing
// or mistyped fields.
SIMPUB_NET_EXPORT void to_json(nlohmann::json &j, const ClientInfo &info);
SIMPUB_NET_EXPORT void from_json(const nlohmann::json &j, ClientInfo &info);
SIMPUB_NET_EXPORT void to_json(nlohmann::json &j, const RegistrySnapshot &snapshot);
SIMPUB_NET_EXPORT void from_json(const nlohmann::json &j, RegistrySnapshot &snapshot);

/// "tcp://<host>:<port>"; port 0 becomes "*" so ZeroMQ picks an ephemeral port.
[[nodiscard]] SIMPUB_NET_EXPORT std::string tcp_endpoint(const std::string &host, int port);

/// Port number of a bound ZeroMQ endpoint such as "tcp://127.0.0.1:40123"; -1 if absent.
[[nodiscard]] SIMPUB_NET_EXPORT int endpoint_port(std::string_view endpoint) noexcept;

} // namespace simpub::net
