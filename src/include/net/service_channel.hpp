#pragma once
/**
 * @file service_channel.hpp
 * @brief Request/reply service channel: callback table, reply handle and client.
 *
 * Wire format of a request is "<service>:<body>", split at the first ':'. A
 * request without ':' names a service with an empty body. The reply is whatever
 * the service callback sends, or the literal "Invild Service" for an unknown name.
 *
 * The REP socket demands exactly one reply per request. `ServiceTable::handle`
 * enforces that: a callback that throws or returns without replying is answered
 * with an error object instead of leaving the socket stuck.
 */
#include "simpub_net_export.h"

#include "net/net_types.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace simpub::net
{

/**
 * @class ServiceReply
 * @brief One-shot reply handle passed to a service callback.
 */
class SIMPUB_NET_EXPORT ServiceReply
{
  public:
    using Writer = std::function<void(std::string_view)>;

    explicit ServiceReply(Writer writer);

    /**
     * @brief Send the reply payload.
     * @throws std::logic_error if a reply has already been sent.
     */
    void send(std::string_view payload);
    /// Sends the compact dump of @p payload.
    void send_json(const nlohmann::json &payload);

    [[nodiscard]] bool sent() const noexcept { return m_sent; }

  private:
    Writer m_writer;
    bool m_sent{false};
};

/// Service callback: receives the request body and must reply exactly once.
using ServiceCallback = std::function<void(const std::string &body, ServiceReply &reply)>;

/// `{"status":"error","error_code":code,"message":message}`
[[nodiscard]] SIMPUB_NET_EXPORT nlohmann::json make_service_error(std::string_view code,
                                                                  std::string_view message);

/**
 * @class ServiceTable
 * @brief Name → callback table consulted by the service loop.
 *
 * Entries are normally installed during setup; installing one while the loop runs
 * is allowed and takes effect on the next request.
 */
class SIMPUB_NET_EXPORT ServiceTable
{
  public:
    /// Installs @p callback under @p name. @return true if an entry was replaced.
    bool add(const std::string &name, ServiceCallback callback);

    [[nodiscard]] bool contains(const std::string &name) const;
    [[nodiscard]] size_t size() const;

    /**
     * @brief Runs one request through the table and returns the reply to send.
     *
     * Never throws for per-request failures: unknown services, throwing callbacks
     * and callbacks that do not reply are all answered here.
     */
    [[nodiscard]] std::string handle(std::string_view message) const;

  private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, ServiceCallback> m_callbacks;
};

/**
 * @class ServiceClient
 * @brief REQ-side helper for calling services on a remote NetManager.
 *
 * A REQ socket that timed out waiting for its reply cannot send again, so the
 * socket is discarded and recreated after every timeout.
 */
class SIMPUB_NET_EXPORT ServiceClient
{
  public:
    /// @param endpoint e.g. "tcp://192.168.0.10:7721"
    ServiceClient(zmq::context_t &context, std::string endpoint);
    ~ServiceClient();

    ServiceClient(const ServiceClient &) = delete;
    ServiceClient &operator=(const ServiceClient &) = delete;

    /**
     * @brief Sends "<service>:<body>" and waits up to @p timeout for the reply.
     * @return the reply text, or nullopt on timeout.
     */
    [[nodiscard]] std::optional<std::string> request(std::string_view service, std::string_view body,
                                                     std::chrono::milliseconds timeout);

    [[nodiscard]] const std::string &endpoint() const noexcept { return m_endpoint; }

  private:
    void reset_socket();

    zmq::context_t &m_context;
    std::string m_endpoint;
    std::unique_ptr<zmq::socket_t> m_socket;
};

} // namespace simpub::net
