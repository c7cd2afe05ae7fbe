/**
 * @file discovery.cpp
 * @brief UDP broadcast announcement and listening.
 */
#include "net/discovery.hpp"
#include "net/net_error.hpp"
#include "net/topic_registry.hpp"

#include "utils/format_tools.hpp"
#include "utils/logger.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>

#include <fmt/format.h>

namespace simpub::net
{

namespace
{
// Largest payload of a single IPv4 UDP datagram.
constexpr size_t kMaxDatagramSize = 65507;

uint32_t parse_ipv4(const std::string &text, const char *what)
{
    in_addr addr{};
    if (::inet_pton(AF_INET, text.c_str(), &addr) != 1)
    {
        throw NetError(fmt::format("{} '{}' is not an IPv4 address", what, text));
    }
    return ntohl(addr.s_addr);
}

IPAddress format_ipv4(uint32_t host_order)
{
    in_addr addr{};
    addr.s_addr = htonl(host_order);
    std::array<char, INET_ADDRSTRLEN> buf{};
    ::inet_ntop(AF_INET, &addr, buf.data(), buf.size());
    return IPAddress(buf.data());
}

std::string errno_message()
{
    return std::system_category().message(errno);
}
} // namespace

// ============================================================================
// Wire helpers
// ============================================================================

IPAddress compute_broadcast_address(const IPAddress &host, const std::string &netmask)
{
    const uint32_t ip = parse_ipv4(host, "host");
    const uint32_t mask = parse_ipv4(netmask, "netmask");
    return format_ipv4((ip | ~mask) & 0xFFFFFFFFu);
}

std::string encode_discovery_message(const RegistrySnapshot &snapshot)
{
    const nlohmann::json body = snapshot;
    return fmt::format("{}{}{}", kDiscoveryTag, kFieldDelimiter, body.dump());
}

std::optional<RegistrySnapshot> parse_discovery_message(std::string_view message)
{
    auto [tag, body] = format_tools::split_first(message, kFieldDelimiter);
    if (tag != kDiscoveryTag || body.empty())
    {
        return std::nullopt;
    }
    try
    {
        return nlohmann::json::parse(body).get<RegistrySnapshot>();
    }
    catch (const nlohmann::json::exception &e)
    {
        LOGGER_DEBUG("Discovery: malformed announcement body: {}", e.what());
        return std::nullopt;
    }
}

// ============================================================================
// UdpSocket
// ============================================================================

UdpSocket::UdpSocket()
{
    m_fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (m_fd < 0)
    {
        throw NetError(fmt::format("UdpSocket: socket() failed: {}", errno_message()));
    }
    int on = 1;
    if (::setsockopt(m_fd, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on)) != 0)
    {
        const auto msg = errno_message();
        close();
        throw NetError(fmt::format("UdpSocket: SO_BROADCAST failed: {}", msg));
    }
}

UdpSocket::~UdpSocket()
{
    close();
}

UdpSocket::UdpSocket(UdpSocket &&other) noexcept
    : m_fd(other.m_fd), m_send_failures(other.m_send_failures)
{
    other.m_fd = -1;
    other.m_send_failures = 0;
}

UdpSocket &UdpSocket::operator=(UdpSocket &&other) noexcept
{
    if (this != &other)
    {
        close();
        m_fd = other.m_fd;
        m_send_failures = other.m_send_failures;
        other.m_fd = -1;
        other.m_send_failures = 0;
    }
    return *this;
}

int UdpSocket::bind(int port)
{
    int on = 1;
    if (::setsockopt(m_fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) != 0)
    {
        throw NetError(fmt::format("UdpSocket: SO_REUSEADDR failed: {}", errno_message()));
    }

    sockaddr_in local{};
    local.sin_family = AF_INET;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    local.sin_port = htons(static_cast<uint16_t>(port));
    if (::bind(m_fd, reinterpret_cast<sockaddr *>(&local), sizeof(local)) != 0)
    {
        throw NetError(fmt::format("UdpSocket: bind to port {} failed: {}", port, errno_message()));
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(m_fd, reinterpret_cast<sockaddr *>(&bound), &len) != 0)
    {
        throw NetError(fmt::format("UdpSocket: getsockname failed: {}", errno_message()));
    }
    return ntohs(bound.sin_port);
}

bool UdpSocket::send_to(const IPAddress &address, int port, std::string_view payload)
{
    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(static_cast<uint16_t>(port));
    if (::inet_pton(AF_INET, address.c_str(), &dest.sin_addr) != 1)
    {
        note_send_failure(address, port, "invalid destination address");
        return false;
    }

    const ssize_t sent = ::sendto(m_fd, payload.data(), payload.size(), 0,
                                  reinterpret_cast<sockaddr *>(&dest), sizeof(dest));
    if (sent < 0 || static_cast<size_t>(sent) != payload.size())
    {
        note_send_failure(address, port, errno_message());
        return false;
    }
    if (m_send_failures > 0)
    {
        LOGGER_INFO("UdpSocket: sendto {}:{} recovered after {} failed attempt(s)", address, port,
                    m_send_failures);
        m_send_failures = 0;
    }
    return true;
}

// Only the first failure of a run is logged; the count is reported on recovery.
void UdpSocket::note_send_failure(const IPAddress &address, int port, const std::string &reason)
{
    if (m_send_failures++ == 0)
    {
        LOGGER_WARN("UdpSocket: sendto {}:{} failed: {} (repeats suppressed until recovery)",
                    address, port, reason);
    }
}

std::optional<Datagram> UdpSocket::recv_from(std::chrono::milliseconds timeout)
{
    pollfd pfd{m_fd, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready <= 0 || (pfd.revents & POLLIN) == 0)
    {
        return std::nullopt;
    }

    std::string buffer(kMaxDatagramSize, '\0');
    sockaddr_in from{};
    socklen_t from_len = sizeof(from);
    const ssize_t n = ::recvfrom(m_fd, buffer.data(), buffer.size(), 0,
                                 reinterpret_cast<sockaddr *>(&from), &from_len);
    if (n < 0)
    {
        LOGGER_WARN("UdpSocket: recvfrom failed: {}", errno_message());
        return std::nullopt;
    }
    buffer.resize(static_cast<size_t>(n));

    Datagram dg;
    dg.sender = format_ipv4(ntohl(from.sin_addr.s_addr));
    dg.sender_port = ntohs(from.sin_port);
    dg.payload = std::move(buffer);
    return dg;
}

void UdpSocket::close() noexcept
{
    if (m_fd >= 0)
    {
        ::close(m_fd);
        m_fd = -1;
    }
}

// ============================================================================
// DiscoveryBroadcaster
// ============================================================================

DiscoveryBroadcaster::DiscoveryBroadcaster(const IPAddress &host, const std::string &netmask,
                                           int port, std::chrono::milliseconds interval)
    : m_broadcast_address(compute_broadcast_address(host, netmask)), m_port(port),
      m_interval(interval)
{
}

bool DiscoveryBroadcaster::broadcast_once(const RegistrySnapshot &snapshot)
{
    return m_socket.send_to(m_broadcast_address, m_port, encode_discovery_message(snapshot));
}

void DiscoveryBroadcaster::run(const std::atomic<bool> &running, const TopicRegistry &registry,
                               std::chrono::milliseconds poll_slice)
{
    LOGGER_INFO("Discovery: broadcasting to {}:{} every {} ms", m_broadcast_address, m_port,
                m_interval.count());

    while (running.load(std::memory_order_acquire))
    {
        broadcast_once(registry.snapshot());

        // Sleep one interval in slices so shutdown is observed within poll_slice.
        const auto deadline = std::chrono::steady_clock::now() + m_interval;
        while (running.load(std::memory_order_acquire))
        {
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
            {
                break;
            }
            const auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            std::this_thread::sleep_for(std::min(remaining, poll_slice));
        }
    }
    LOGGER_INFO("Discovery: broadcasting has been stopped");
}

// ============================================================================
// DiscoveryListener
// ============================================================================

DiscoveryListener::DiscoveryListener(int port) : m_port(m_socket.bind(port)) {}

std::optional<DiscoveryAnnouncement>
DiscoveryListener::wait_for_announcement(std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;)
    {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
        {
            return std::nullopt;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto dg = m_socket.recv_from(remaining);
        if (!dg)
        {
            continue;
        }
        auto registry = parse_discovery_message(dg->payload);
        if (!registry)
        {
            LOGGER_DEBUG("Discovery: ignoring {}-byte datagram from {}", dg->payload.size(),
                         dg->sender);
            continue;
        }
        return DiscoveryAnnouncement{std::move(dg->sender), std::move(*registry)};
    }
}

} // namespace simpub::net
