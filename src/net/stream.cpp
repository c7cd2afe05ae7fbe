/**
 * @file stream.cpp
 * @brief StreamSender and StreamReceiver.
 */
#include "net/stream.hpp"
#include "net/net_error.hpp"

#include "utils/logger.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <vector>

namespace simpub::net
{

// ============================================================================
// StreamSender
// ============================================================================

StreamSender::StreamSender(zmq::context_t &context, std::optional<int> port)
    : m_socket(context, zmq::socket_type::pub)
{
    m_socket.set(zmq::sockopt::linger, 0);
    const std::string endpoint = tcp_endpoint("*", port.value_or(0));
    try
    {
        m_socket.bind(endpoint);
    }
    catch (const zmq::error_t &e)
    {
        throw NetError(fmt::format("StreamSender: bind {} failed: {}", endpoint, e.what()));
    }
    const std::string bound = m_socket.get(zmq::sockopt::last_endpoint);
    m_port = endpoint_port(bound);
    LOGGER_INFO("Stream: publishing on {}", bound);
}

StreamSender::~StreamSender()
{
    stop();
}

bool StreamSender::publish(std::string_view text)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_stopped)
    {
        return false;
    }
    try
    {
        const auto sent = m_socket.send(zmq::buffer(text), zmq::send_flags::dontwait);
        return sent.has_value();
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_WARN("Stream: publish failed: {}", e.what());
        return false;
    }
}

bool StreamSender::publish_json(const nlohmann::json &message)
{
    const std::string text = message.dump();
    return publish(std::string_view(text));
}

void StreamSender::stop()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_stopped)
    {
        return;
    }
    m_stopped = true;
    m_socket.close();
}

// ============================================================================
// StreamReceiver
// ============================================================================

StreamReceiver::StreamReceiver(zmq::context_t &context, Callback callback,
                               std::chrono::milliseconds receive_timeout)
    : m_context(context), m_callback(std::move(callback)), m_receive_timeout(receive_timeout)
{
}

StreamReceiver::~StreamReceiver()
{
    disconnect();
}

void StreamReceiver::connect(const IPAddress &address, int port, const std::string &prefix)
{
    if (m_running.load(std::memory_order_acquire))
    {
        return;
    }
    if (m_thread.joinable())
    {
        m_thread.join();
    }

    zmq::socket_t socket(m_context, zmq::socket_type::sub);
    socket.set(zmq::sockopt::linger, 0);
    socket.set(zmq::sockopt::subscribe, prefix);
    const std::string endpoint = tcp_endpoint(address, port);
    try
    {
        socket.connect(endpoint);
    }
    catch (const zmq::error_t &e)
    {
        throw NetError(fmt::format("StreamReceiver: connect {} failed: {}", endpoint, e.what()));
    }

    LOGGER_INFO("Stream: subscribed to {} (prefix '{}')", endpoint, prefix);
    m_running.store(true, std::memory_order_release);
    m_thread = std::thread(&StreamReceiver::receive_loop, this, std::move(socket));
}

void StreamReceiver::disconnect()
{
    m_running.store(false, std::memory_order_release);
    if (m_thread.joinable())
    {
        m_thread.join();
    }
}

void StreamReceiver::receive_loop(zmq::socket_t socket)
{
    while (m_running.load(std::memory_order_acquire))
    {
        zmq::message_t frame;
        try
        {
            std::vector<zmq::pollitem_t> items = {{socket.handle(), 0, ZMQ_POLLIN, 0}};
            zmq::poll(items, m_receive_timeout);
            if ((items[0].revents & ZMQ_POLLIN) == 0)
            {
                continue;
            }
            if (!socket.recv(frame, zmq::recv_flags::dontwait))
            {
                continue;
            }
        }
        catch (const zmq::error_t &e)
        {
            if (e.num() == ETERM)
            {
                LOGGER_WARN("Stream: context terminated, receiver stopping");
                break;
            }
            LOGGER_ERROR("Stream: receive failed: {}", e.what());
            continue;
        }

        if (!m_running.load(std::memory_order_acquire))
        {
            break;
        }
        try
        {
            m_callback(frame.to_string());
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("Stream: receive callback threw: {}", e.what());
        }
    }
    m_running.store(false, std::memory_order_release);
    socket.close();
    LOGGER_DEBUG("Stream: receiver stopped");
}

} // namespace simpub::net
