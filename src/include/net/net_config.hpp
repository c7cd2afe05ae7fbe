#pragma once
/**
 * @file net_config.hpp
 * @brief NetConfig: endpoint and timing settings of a NetManager.
 *
 * Loading is layered (priority low → high):
 *  1. Built-in defaults (the member initializers below)
 *  2. A JSON file, either passed explicitly or named by `SIMPUB_CONFIG_FILE`
 *  3. Environment overrides: `SIMPUB_HOST`, `SIMPUB_DISCOVERY_PORT`,
 *     `SIMPUB_SERVICE_PORT`, `SIMPUB_TOPIC_PORT`
 *
 * File layout (every key optional):
 * @code{.json}
 * {
 *   "host": "192.168.0.10",
 *   "netmask": "255.255.255.0",
 *   "ports": { "discovery": 7720, "service": 7721, "topic": 7722 },
 *   "broadcast_interval_ms": 500,
 *   "poll_timeout_ms": 100,
 *   "worker_count": 5,
 *   "log": { "level": "info", "file": "" }
 * }
 * @endcode
 */
#include "simpub_net_export.h"

#include "net/net_types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace simpub::net
{

struct SIMPUB_NET_EXPORT NetConfig
{
    IPAddress host{"127.0.0.1"};
    std::string netmask{"255.255.255.0"};

    int discovery_port{kDefaultDiscoveryPort};
    /// 0 lets the OS choose; NetManager::service_port() reports the result.
    int service_port{kDefaultServicePort};
    /// 0 lets the OS choose; NetManager::topic_port() reports the result.
    int topic_port{kDefaultTopicPort};

    std::chrono::milliseconds broadcast_interval{500};
    /// Upper bound on how long a loop may block before re-checking the running flag.
    std::chrono::milliseconds poll_timeout{100};
    size_t worker_count{5};

    std::string log_level{"info"};
    std::string log_file;

    /**
     * @brief Applies the keys present in @p j on top of the current values.
     * @throws ConfigError on mistyped or out-of-range values.
     */
    void merge_json(const nlohmann::json &j);

    /**
     * @brief Applies SIMPUB_* environment overrides.
     * @throws ConfigError if a port override is not a valid port number.
     */
    void apply_env_overrides();

    /**
     * @brief Checks cross-field constraints (valid IPv4 host/netmask, ports, counts).
     * @throws ConfigError describing the first violation.
     */
    void validate() const;

    [[nodiscard]] nlohmann::json to_json() const;

    /**
     * @brief Defaults → file (@p path, else $SIMPUB_CONFIG_FILE, else none) → env.
     * @throws ConfigError if the file cannot be read or parsed, or validation fails.
     */
    static NetConfig load(const std::optional<std::filesystem::path> &path = std::nullopt);
};

} // namespace simpub::net
