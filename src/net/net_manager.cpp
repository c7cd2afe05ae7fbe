/**
 * @file net_manager.cpp
 * @brief NetManager construction, registration, service loop and shutdown.
 */
#include "net/net_manager.hpp"
#include "net/net_error.hpp"

#include "utils/logger.hpp"

#include <fmt/format.h>

#include <cerrno>

namespace simpub::net
{

namespace
{
NetConfig validated(NetConfig config)
{
    config.validate();
    return config;
}

int bind_socket(zmq::socket_t &socket, const IPAddress &host, int port, const char *what)
{
    socket.set(zmq::sockopt::linger, 0);
    const std::string endpoint = tcp_endpoint(host, port);
    try
    {
        socket.bind(endpoint);
    }
    catch (const zmq::error_t &e)
    {
        throw NetError(fmt::format("NetManager: cannot bind {} socket to {}: {}", what, endpoint,
                                   e.what()));
    }
    const std::string bound = socket.get(zmq::sockopt::last_endpoint);
    LOGGER_INFO("NetManager: {} socket bound to {}", what, bound);
    return endpoint_port(bound);
}

const char *error_code_for(DispatchResult result) noexcept
{
    switch (result)
    {
    case DispatchResult::UnknownType:
        return "UNKNOWN_MSG_TYPE";
    case DispatchResult::Malformed:
        return "INVALID_REQUEST";
    case DispatchResult::HandlerFailed:
        return "HANDLER_FAILED";
    case DispatchResult::Handled:
        break;
    }
    return "INTERNAL_ERROR";
}
} // namespace

// ============================================================================
// Construction
// ============================================================================

NetManager::NetManager(NetConfig config)
    : m_config(validated(std::move(config))), m_context(1),
      m_pub_socket(m_context, zmq::socket_type::pub),
      m_rep_socket(m_context, zmq::socket_type::rep),
      m_broadcaster(m_config.host, m_config.netmask, m_config.discovery_port,
                    m_config.broadcast_interval),
      m_pool(m_config.worker_count)
{
    m_topic_port = bind_socket(m_pub_socket, m_config.host, m_config.topic_port, "topic");
    m_service_port = bind_socket(m_rep_socket, m_config.host, m_config.service_port, "service");

    register_service(std::string(kRegisterService), m_config.host,
                     [this](const std::string &body, ServiceReply &reply)
                     { handle_register(body, reply); });

    std::lock_guard<std::mutex> lock(m_tasks_mutex);
    m_tasks.push_back(m_pool
                          .submit("broadcast",
                                  [this]
                                  {
                                      m_broadcaster.run(m_running, m_registry,
                                                        m_config.poll_timeout);
                                  })
                          .share());
    m_tasks.push_back(m_pool.submit("service", [this] { service_loop(); }).share());

    LOGGER_INFO("NetManager: host {} (broadcast {}), service port {}, topic port {}",
                m_config.host, m_broadcaster.broadcast_address(), m_service_port, m_topic_port);
}

NetManager::~NetManager()
{
    shutdown();
}

// ============================================================================
// Registration
// ============================================================================

void NetManager::register_topic(const Topic &topic, const IPAddress &host)
{
    const TopicRegistration result = m_registry.register_topic(topic, host);
    if (result.host_already_registered)
    {
        LOGGER_WARN("Host {} is already registered", host);
    }
    if (result.previous_owner)
    {
        LOGGER_INFO("NetManager: topic '{}' moved from {} to {}", topic, *result.previous_owner,
                    host);
    }
}

void NetManager::register_service(const std::string &name, const IPAddress &host,
                                  ServiceCallback callback)
{
    m_registry.register_service(name, host);
    if (m_services.add(name, std::move(callback)))
    {
        LOGGER_DEBUG("NetManager: service '{}' replaced", name);
    }
}

void NetManager::register_dispatcher(const std::string &name, const IPAddress &host,
                                     MessageDispatcher &dispatcher)
{
    register_service(name, host,
                     [&dispatcher](const std::string &body, ServiceReply &reply)
                     {
                         const DispatchResult result = dispatcher.dispatch(body);
                         if (result == DispatchResult::Handled)
                         {
                             reply.send_json({{"status", "success"}});
                             return;
                         }
                         reply.send_json(make_service_error(error_code_for(result),
                                                            fmt::format("envelope dropped: {}",
                                                                        to_string(result))));
                     });
}

void NetManager::handle_register(const std::string &body, ServiceReply &reply)
{
    ClientInfo info;
    try
    {
        info = nlohmann::json::parse(body).get<ClientInfo>();
    }
    catch (const nlohmann::json::exception &e)
    {
        LOGGER_WARN("NetManager: malformed Register request: {}", e.what());
        reply.send_json(make_service_error("INVALID_REQUEST", e.what()));
        return;
    }
    if (info.host.empty())
    {
        reply.send_json(make_service_error("INVALID_REQUEST", "Missing or empty 'Host'"));
        return;
    }

    for (const auto &topic : info.topics)
    {
        register_topic(topic, info.host);
    }
    LOGGER_INFO("NetManager: client {} registered {} topic(s)", info.host, info.topics.size());
    reply.send_json({{"status", "success"}, {"topics", info.topics.size()}});
}

// ============================================================================
// Work and publishing
// ============================================================================

std::shared_future<void> NetManager::submit_task(std::string name, std::function<void()> task)
{
    auto future = m_pool.submit(std::move(name), std::move(task)).share();
    std::lock_guard<std::mutex> lock(m_tasks_mutex);
    m_tasks.push_back(future);
    return future;
}

bool NetManager::publish(std::string_view topic, std::string_view data)
{
    const std::string frame = fmt::format("{}{}{}", topic, kFieldDelimiter, data);
    std::lock_guard<std::mutex> lock(m_pub_mutex);
    if (m_pub_closed)
    {
        return false;
    }
    try
    {
        return m_pub_socket.send(zmq::buffer(frame), zmq::send_flags::dontwait).has_value();
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_WARN("NetManager: publish on '{}' failed: {}", topic, e.what());
        return false;
    }
}

// ============================================================================
// Registry views
// ============================================================================

std::optional<IPAddress> NetManager::topic_owner(const Topic &topic) const
{
    return m_registry.topic_owner(topic);
}

std::vector<Topic> NetManager::host_topics(const IPAddress &host) const
{
    return m_registry.host_topics(host);
}

std::optional<IPAddress> NetManager::service_owner(const std::string &name) const
{
    return m_registry.service_owner(name);
}

bool NetManager::has_service(const std::string &name) const
{
    return m_registry.has_service(name) && m_services.contains(name);
}

// ============================================================================
// Service loop
// ============================================================================

void NetManager::service_loop()
{
    LOGGER_INFO("NetManager: service loop running");
    while (m_running.load(std::memory_order_acquire))
    {
        try
        {
            std::vector<zmq::pollitem_t> items = {{m_rep_socket.handle(), 0, ZMQ_POLLIN, 0}};
            zmq::poll(items, m_config.poll_timeout);
            if ((items[0].revents & ZMQ_POLLIN) == 0)
            {
                continue;
            }

            zmq::message_t request;
            if (!m_rep_socket.recv(request, zmq::recv_flags::dontwait))
            {
                continue;
            }
            // One request at a time: the REP socket cannot accept another until we reply.
            const std::string reply = m_services.handle(request.to_string_view());
            if (!m_rep_socket.send(zmq::buffer(reply), zmq::send_flags::none))
            {
                LOGGER_WARN("NetManager: service reply could not be sent");
            }
        }
        catch (const zmq::error_t &e)
        {
            if (e.num() == ETERM)
            {
                break;
            }
            LOGGER_ERROR("NetManager: service loop socket error: {}", e.what());
        }
    }
    LOGGER_INFO("NetManager: service loop stopped");
}

// ============================================================================
// Lifecycle
// ============================================================================

std::vector<std::shared_future<void>> NetManager::pending_tasks() const
{
    std::lock_guard<std::mutex> lock(m_tasks_mutex);
    return m_tasks;
}

void NetManager::shutdown()
{
    std::call_once(m_shutdown_once,
                   [this]
                   {
                       LOGGER_INFO("NetManager: shutting down");
                       m_running.store(false, std::memory_order_release);
                       wait_for_tasks();

                       m_rep_socket.close();
                       {
                           std::lock_guard<std::mutex> lock(m_pub_mutex);
                           m_pub_closed = true;
                           m_pub_socket.close();
                       }
                       m_broadcaster.close();
                       m_pool.shutdown();
                       LOGGER_INFO("NetManager: shut down");
                   });
}

void NetManager::wait_for_tasks() const
{
    for (const auto &task : pending_tasks())
    {
        task.wait();
    }
}

void NetManager::join()
{
    const auto tasks = pending_tasks();
    for (const auto &task : tasks)
    {
        task.wait();
    }
    for (const auto &task : tasks)
    {
        task.get();
    }
}

} // namespace simpub::net
