#pragma once
/**
 * @file discovery.hpp
 * @brief Zero-configuration discovery over UDP broadcast.
 *
 * The producer announces its registry every broadcast interval:
 *
 *     "SimPub:" + {"Topic": {topic: host, ...}, "Service": {service: host, ...}}
 *
 * sent to the directed broadcast address of its subnet (host | ~netmask) on the
 * discovery port. A consumer binds the discovery port, waits for one tagged
 * datagram and reads the producer address from it. No request is ever sent back
 * on this port.
 */
#include "simpub_net_export.h"

#include "net/net_types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace simpub::net
{

class TopicRegistry;

/**
 * @brief Directed broadcast address of @p host's subnet: host | ~netmask.
 * @throws NetError if either argument is not a dotted-quad IPv4 address.
 */
SIMPUB_NET_EXPORT IPAddress compute_broadcast_address(const IPAddress &host,
                                                      const std::string &netmask);

/// "SimPub:" + JSON body of @p snapshot.
[[nodiscard]] SIMPUB_NET_EXPORT std::string encode_discovery_message(const RegistrySnapshot &snapshot);

/// Parses a discovery datagram; nullopt if the tag is missing or the body is malformed.
[[nodiscard]] SIMPUB_NET_EXPORT std::optional<RegistrySnapshot>
parse_discovery_message(std::string_view message);

/// One datagram received on a UdpSocket.
struct Datagram
{
    IPAddress sender;
    int sender_port{0};
    std::string payload;
};

/**
 * @class UdpSocket
 * @brief Owning wrapper of a broadcast-enabled IPv4 UDP socket.
 */
class SIMPUB_NET_EXPORT UdpSocket
{
  public:
    /// @throws NetError if the socket cannot be created or SO_BROADCAST fails.
    UdpSocket();
    ~UdpSocket();

    UdpSocket(const UdpSocket &) = delete;
    UdpSocket &operator=(const UdpSocket &) = delete;
    UdpSocket(UdpSocket &&other) noexcept;
    UdpSocket &operator=(UdpSocket &&other) noexcept;

    /**
     * @brief Bind to INADDR_ANY:@p port (0 = OS-assigned) with SO_REUSEADDR.
     * @return The bound port.
     * @throws NetError on failure.
     */
    int bind(int port);

    /**
     * @return false if the datagram could not be sent. Only the first failure of
     * a consecutive run is logged.
     */
    bool send_to(const IPAddress &address, int port, std::string_view payload);

    /// Failed sends since the last successful one.
    [[nodiscard]] size_t consecutive_send_failures() const noexcept { return m_send_failures; }

    /// Waits up to @p timeout for one datagram; nullopt on timeout or error.
    std::optional<Datagram> recv_from(std::chrono::milliseconds timeout);

    void close() noexcept;
    [[nodiscard]] bool is_open() const noexcept { return m_fd >= 0; }

  private:
    void note_send_failure(const IPAddress &address, int port, const std::string &reason);

    int m_fd{-1};
    size_t m_send_failures{0};
};

/**
 * @class DiscoveryBroadcaster
 * @brief Body of NetManager's broadcast loop.
 */
class SIMPUB_NET_EXPORT DiscoveryBroadcaster
{
  public:
    /// @throws NetError on invalid addresses or socket failure.
    DiscoveryBroadcaster(const IPAddress &host, const std::string &netmask, int port,
                         std::chrono::milliseconds interval);

    /**
     * @brief Announce @p registry every interval until @p running becomes false.
     * The flag is re-checked at least every @p poll_slice while sleeping.
     */
    void run(const std::atomic<bool> &running, const TopicRegistry &registry,
             std::chrono::milliseconds poll_slice);

    /// Send a single announcement of @p snapshot.
    bool broadcast_once(const RegistrySnapshot &snapshot);

    [[nodiscard]] const IPAddress &broadcast_address() const noexcept { return m_broadcast_address; }
    [[nodiscard]] int port() const noexcept { return m_port; }

    void close() noexcept { m_socket.close(); }

  private:
    UdpSocket m_socket;
    IPAddress m_broadcast_address;
    int m_port;
    std::chrono::milliseconds m_interval;
};

/// A parsed announcement and the address it came from.
struct DiscoveryAnnouncement
{
    IPAddress sender;
    RegistrySnapshot registry;
};

/**
 * @class DiscoveryListener
 * @brief Consumer side of discovery: listens on the discovery port.
 */
class SIMPUB_NET_EXPORT DiscoveryListener
{
  public:
    /// @throws NetError if the port cannot be bound.
    explicit DiscoveryListener(int port = kDefaultDiscoveryPort);

    /**
     * @brief Wait up to @p timeout for a valid announcement. Untagged or malformed
     *        datagrams are logged and skipped.
     */
    std::optional<DiscoveryAnnouncement> wait_for_announcement(std::chrono::milliseconds timeout);

    [[nodiscard]] int port() const noexcept { return m_port; }

  private:
    UdpSocket m_socket;
    int m_port;
};

} // namespace simpub::net
