#pragma once
/**
 * @file stream.hpp
 * @brief Publish/subscribe channel: text frames over ZeroMQ PUB/SUB.
 *
 * Delivery is best-effort. A subscriber that connects late misses earlier frames,
 * and a slow subscriber may drop frames at the high-water mark. Frames from one
 * publisher arrive in publish order.
 */
#include "simpub_net_export.h"

#include "net/net_types.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace simpub::net
{

/**
 * @class StreamSender
 * @brief Owns a bound PUB socket. `publish` may be called from any thread.
 */
class SIMPUB_NET_EXPORT StreamSender
{
  public:
    /**
     * @param port fixed port to bind on all interfaces; nullopt lets the OS choose.
     * @throws NetError if the bind fails.
     */
    StreamSender(zmq::context_t &context, std::optional<int> port);
    ~StreamSender();

    StreamSender(const StreamSender &) = delete;
    StreamSender &operator=(const StreamSender &) = delete;

    [[nodiscard]] int port() const noexcept { return m_port; }

    /// @return false if the sender is stopped or the frame could not be queued.
    bool publish(std::string_view text);
    /// Publishes the compact dump of @p message.
    bool publish_json(const nlohmann::json &message);

    /// Closes the socket. Later publish calls return false.
    void stop();

  private:
    zmq::socket_t m_socket;
    std::mutex m_mutex;
    int m_port{0};
    bool m_stopped{false};
};

/**
 * @class StreamReceiver
 * @brief SUB-side consumer running its own receive thread.
 *
 * The callback runs on the receiver thread. After `disconnect()` returns no
 * further callback is made. The context must outlive the receiver; if it is
 * shut down first the receive thread stops and `is_connected()` turns false.
 */
class SIMPUB_NET_EXPORT StreamReceiver
{
  public:
    using Callback = std::function<void(const std::string &message)>;

    StreamReceiver(zmq::context_t &context, Callback callback,
                   std::chrono::milliseconds receive_timeout = std::chrono::milliseconds{100});
    ~StreamReceiver();

    StreamReceiver(const StreamReceiver &) = delete;
    StreamReceiver &operator=(const StreamReceiver &) = delete;

    /**
     * @brief Subscribe to frames starting with @p prefix from @p address:@p port.
     *
     * A no-op if already connected.
     * @throws NetError if the SUB socket cannot connect.
     */
    void connect(const IPAddress &address, int port, const std::string &prefix = "");

    /// Stops the receive thread and closes the socket. Idempotent.
    void disconnect();

    [[nodiscard]] bool is_connected() const noexcept
    {
        return m_running.load(std::memory_order_acquire);
    }

  private:
    void receive_loop(zmq::socket_t socket);

    zmq::context_t &m_context;
    Callback m_callback;
    std::chrono::milliseconds m_receive_timeout;
    std::atomic<bool> m_running{false};
    std::thread m_thread;
};

} // namespace simpub::net
