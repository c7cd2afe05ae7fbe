#pragma once
/**
 * @file net_manager.hpp
 * @brief NetManager: owns the sockets, the registry and the background loops.
 *
 * Construction binds everything and starts two supervised loops on the task pool:
 *
 *   - broadcast loop: announces the registry over UDP every broadcast interval;
 *   - service loop:   answers "<service>:<body>" requests on the REP socket, one at
 *                     a time, through the service table.
 *
 * The built-in "Register" service accepts `{"Host": "...", "Topics": [...]}` and
 * records each topic against the declared host.
 *
 * There is no process-wide instance. Collaborators receive a NetManager by
 * reference; several managers may coexist when bound to different ports.
 *
 * Thread safety: every public method may be called from any thread. `shutdown()`
 * and `join()` must not be called from inside a service callback or a pool task.
 */
#include "simpub_net_export.h"

#include "net/discovery.hpp"
#include "net/message_dispatcher.hpp"
#include "net/net_config.hpp"
#include "net/net_types.hpp"
#include "net/service_channel.hpp"
#include "net/task_pool.hpp"
#include "net/topic_registry.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace simpub::net
{

class SIMPUB_NET_EXPORT NetManager
{
  public:
    /**
     * @brief Validates @p config, binds the PUB and REP sockets, opens the UDP
     *        broadcast socket and starts the broadcast and service loops.
     * @throws ConfigError if @p config is invalid.
     * @throws NetError if a socket cannot be created or bound.
     */
    explicit NetManager(NetConfig config);
    ~NetManager();

    NetManager(const NetManager &) = delete;
    NetManager &operator=(const NetManager &) = delete;

    // --- Registration ---

    /// Records @p host as owner of @p topic. Warns if @p host already owns a topic.
    void register_topic(const Topic &topic, const IPAddress &host);

    /// Records @p host as owner of service @p name and installs @p callback.
    void register_service(const std::string &name, const IPAddress &host,
                          ServiceCallback callback);

    /**
     * @brief Exposes @p dispatcher as service @p name.
     *
     * The request body is dispatched as an envelope. The reply is
     * `{"status":"success"}` or an error object naming why it was dropped.
     * @p dispatcher must outlive this manager.
     */
    void register_dispatcher(const std::string &name, const IPAddress &host,
                             MessageDispatcher &dispatcher);

    // --- Work and publishing ---

    /**
     * @brief Runs @p task on the manager's pool. Long-running tasks should poll
     *        is_running() and return once it turns false.
     * @throws std::runtime_error after shutdown.
     */
    std::shared_future<void> submit_task(std::string name, std::function<void()> task);

    /**
     * @brief Sends "<topic>:<data>" on the manager's PUB socket.
     * @return false after shutdown or if the frame could not be queued.
     */
    bool publish(std::string_view topic, std::string_view data);

    // --- Registry views ---
    [[nodiscard]] RegistrySnapshot snapshot() const { return m_registry.snapshot(); }
    [[nodiscard]] std::optional<IPAddress> topic_owner(const Topic &topic) const;
    [[nodiscard]] std::vector<Topic> host_topics(const IPAddress &host) const;
    [[nodiscard]] std::optional<IPAddress> service_owner(const std::string &name) const;
    [[nodiscard]] bool has_service(const std::string &name) const;

    // --- Endpoint data ---
    [[nodiscard]] const IPAddress &host() const noexcept { return m_config.host; }
    [[nodiscard]] int service_port() const noexcept { return m_service_port; }
    [[nodiscard]] int topic_port() const noexcept { return m_topic_port; }
    [[nodiscard]] int discovery_port() const noexcept { return m_config.discovery_port; }
    [[nodiscard]] const IPAddress &broadcast_address() const noexcept
    {
        return m_broadcaster.broadcast_address();
    }
    [[nodiscard]] const NetConfig &config() const noexcept { return m_config; }

    /// Shared ZeroMQ context for StreamSender/StreamReceiver/ServiceClient.
    [[nodiscard]] zmq::context_t &context() noexcept { return m_context; }

    [[nodiscard]] bool is_running() const noexcept
    {
        return m_running.load(std::memory_order_acquire);
    }

    // --- Lifecycle ---

    /**
     * @brief Stops the loops, waits for them (bounded by the poll timeout) and
     *        closes every owned socket. A second call is a no-op.
     */
    void shutdown();

    /**
     * @brief Blocks until every background task has returned.
     * @throws the first exception stored by a failed task, in submission order.
     *         shutdown() itself never rethrows task failures; they are only logged.
     */
    void join();

  private:
    void service_loop();
    void handle_register(const std::string &body, ServiceReply &reply);
    std::vector<std::shared_future<void>> pending_tasks() const;
    void wait_for_tasks() const;

    NetConfig m_config;
    std::atomic<bool> m_running{true};

    zmq::context_t m_context;
    zmq::socket_t m_pub_socket;
    std::mutex m_pub_mutex;
    bool m_pub_closed{false};
    zmq::socket_t m_rep_socket;
    int m_service_port{0};
    int m_topic_port{0};

    DiscoveryBroadcaster m_broadcaster;
    TopicRegistry m_registry;
    ServiceTable m_services;

    mutable std::mutex m_tasks_mutex;
    std::vector<std::shared_future<void>> m_tasks;
    std::once_flag m_shutdown_once;

    // Declared last: destroyed first, after its workers have been joined.
    TaskPool m_pool;
};

} // namespace simpub::net
