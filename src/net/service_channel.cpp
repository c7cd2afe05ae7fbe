/**
 * @file service_channel.cpp
 * @brief ServiceReply, ServiceTable and ServiceClient.
 */
#include "net/service_channel.hpp"

#include "utils/format_tools.hpp"
#include "utils/logger.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <vector>

namespace simpub::net
{

// ============================================================================
// ServiceReply
// ============================================================================

ServiceReply::ServiceReply(Writer writer) : m_writer(std::move(writer)) {}

void ServiceReply::send(std::string_view payload)
{
    if (m_sent)
    {
        throw std::logic_error("ServiceReply: reply already sent");
    }
    m_writer(payload);
    m_sent = true;
}

void ServiceReply::send_json(const nlohmann::json &payload)
{
    const std::string text = payload.dump();
    send(std::string_view(text));
}

nlohmann::json make_service_error(std::string_view code, std::string_view message)
{
    return {{"status", "error"},
            {"error_code", std::string(code)},
            {"message", std::string(message)}};
}

// ============================================================================
// ServiceTable
// ============================================================================

bool ServiceTable::add(const std::string &name, ServiceCallback callback)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto [it, inserted] = m_callbacks.insert_or_assign(name, std::move(callback));
    return !inserted;
}

bool ServiceTable::contains(const std::string &name) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_callbacks.count(name) != 0;
}

size_t ServiceTable::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_callbacks.size();
}

std::string ServiceTable::handle(std::string_view message) const
{
    auto [name_view, body_view] = format_tools::split_first(message, kFieldDelimiter);
    const std::string name(name_view);

    ServiceCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_callbacks.find(name);
        if (it != m_callbacks.end())
        {
            callback = it->second;
        }
    }
    if (!callback)
    {
        LOGGER_WARN("Service: unknown service '{}'", name);
        return std::string(kInvalidServiceReply);
    }

    std::string reply_text;
    ServiceReply reply([&reply_text](std::string_view payload) { reply_text.assign(payload); });
    try
    {
        callback(std::string(body_view), reply);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Service: '{}' threw: {}", name, e.what());
        if (!reply.sent())
        {
            return make_service_error("SERVICE_FAILED", e.what()).dump();
        }
    }

    if (!reply.sent())
    {
        LOGGER_ERROR("Service: '{}' returned without replying", name);
        return make_service_error("NO_REPLY", fmt::format("Service '{}' sent no reply", name)).dump();
    }
    return reply_text;
}

// ============================================================================
// ServiceClient
// ============================================================================

ServiceClient::ServiceClient(zmq::context_t &context, std::string endpoint)
    : m_context(context), m_endpoint(std::move(endpoint))
{
    reset_socket();
}

ServiceClient::~ServiceClient()
{
    if (m_socket)
    {
        m_socket->close();
    }
}

void ServiceClient::reset_socket()
{
    if (m_socket)
    {
        m_socket->close();
    }
    m_socket = std::make_unique<zmq::socket_t>(m_context, zmq::socket_type::req);
    m_socket->set(zmq::sockopt::linger, 0);
    m_socket->connect(m_endpoint);
}

std::optional<std::string> ServiceClient::request(std::string_view service, std::string_view body,
                                                  std::chrono::milliseconds timeout)
{
    const std::string message = fmt::format("{}{}{}", service, kFieldDelimiter, body);
    const auto sent = m_socket->send(zmq::buffer(message), zmq::send_flags::dontwait);
    if (!sent)
    {
        LOGGER_WARN("ServiceClient: send to {} would block", m_endpoint);
        reset_socket();
        return std::nullopt;
    }

    std::vector<zmq::pollitem_t> items = {{m_socket->handle(), 0, ZMQ_POLLIN, 0}};
    zmq::poll(items, timeout);
    if ((items[0].revents & ZMQ_POLLIN) == 0)
    {
        LOGGER_WARN("ServiceClient: no reply from {} for '{}' within {} ms", m_endpoint, service,
                    timeout.count());
        reset_socket();
        return std::nullopt;
    }

    zmq::message_t reply;
    if (!m_socket->recv(reply, zmq::recv_flags::none))
    {
        reset_socket();
        return std::nullopt;
    }
    return reply.to_string();
}

} // namespace simpub::net
