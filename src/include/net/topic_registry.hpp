#pragma once
/**
 * @file topic_registry.hpp
 * @brief In-memory topic→host and service→host registry.
 *
 * Mutated by setup code and by the service loop (client registration); read
 * concurrently by the broadcast loop. A single mutex guards all three maps so a
 * snapshot always reflects one consistent moment.
 *
 * Invariant: every topic in the topic→host map appears exactly once in its owning
 * host's topic list, and in no other host's list. Re-registering a topic from the
 * same host is idempotent; registering it from another host moves it.
 */
#include "simpub_net_export.h"

#include "net/net_types.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace simpub::net
{

/// Outcome of TopicRegistry::register_topic.
struct TopicRegistration
{
    /// The host already owned at least one topic before this call.
    bool host_already_registered{false};
    /// Set when the topic was owned by a different host and has been moved.
    std::optional<IPAddress> previous_owner;
};

class SIMPUB_NET_EXPORT TopicRegistry
{
  public:
    TopicRegistration register_topic(const Topic &topic, const IPAddress &host);

    /**
     * @brief Record @p host as owner of service @p name.
     * @return true if an earlier registration of the same name was overwritten.
     */
    bool register_service(const std::string &name, const IPAddress &host);

    [[nodiscard]] std::optional<IPAddress> topic_owner(const Topic &topic) const;
    [[nodiscard]] std::optional<IPAddress> service_owner(const std::string &name) const;
    [[nodiscard]] bool has_service(const std::string &name) const;

    /// Topics owned by @p host in registration order (empty if unknown).
    [[nodiscard]] std::vector<Topic> host_topics(const IPAddress &host) const;
    [[nodiscard]] bool has_host(const IPAddress &host) const;

    [[nodiscard]] RegistrySnapshot snapshot() const;

    [[nodiscard]] size_t topic_count() const;
    [[nodiscard]] size_t service_count() const;

  private:
    mutable std::mutex m_mutex;
    std::unordered_map<Topic, IPAddress> m_topic_host;
    std::unordered_map<IPAddress, std::vector<Topic>> m_host_topics;
    std::unordered_map<std::string, IPAddress> m_service_host;
};

} // namespace simpub::net
