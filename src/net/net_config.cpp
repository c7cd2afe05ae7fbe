/**
 * @file net_config.cpp
 * @brief NetConfig loading: defaults, JSON file, then environment overrides.
 */
#include "net/net_config.hpp"
#include "net/net_error.hpp"

#include "utils/logger.hpp"

#include <arpa/inet.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <fstream>

#include <fmt/format.h>

namespace simpub::net
{

namespace
{
constexpr int kMaxPort = 65535;
constexpr size_t kMinWorkers = 2;
constexpr size_t kMaxWorkers = 64;

bool is_ipv4(const std::string &text)
{
    in_addr addr{};
    return ::inet_pton(AF_INET, text.c_str(), &addr) == 1;
}

int parse_port(const char *name, const std::string &text)
{
    int value = -1;
    const auto *first = text.data();
    const auto *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || value < 0 || value > kMaxPort)
    {
        throw ConfigError(fmt::format("{}: '{}' is not a valid port", name, text));
    }
    return value;
}

template <typename T>
void read_if_present(const nlohmann::json &j, const char *key, T &out)
{
    if (j.contains(key))
    {
        try
        {
            j.at(key).get_to(out);
        }
        catch (const nlohmann::json::exception &e)
        {
            throw ConfigError(fmt::format("config key '{}': {}", key, e.what()));
        }
    }
}
} // namespace

void NetConfig::merge_json(const nlohmann::json &j)
{
    if (!j.is_object())
    {
        throw ConfigError("config root must be a JSON object");
    }

    read_if_present(j, "host", host);
    read_if_present(j, "netmask", netmask);

    if (j.contains("ports"))
    {
        const auto &ports = j.at("ports");
        if (!ports.is_object())
        {
            throw ConfigError("config key 'ports' must be an object");
        }
        read_if_present(ports, "discovery", discovery_port);
        read_if_present(ports, "service", service_port);
        read_if_present(ports, "topic", topic_port);
    }

    int64_t interval_ms = broadcast_interval.count();
    read_if_present(j, "broadcast_interval_ms", interval_ms);
    broadcast_interval = std::chrono::milliseconds{interval_ms};

    int64_t poll_ms = poll_timeout.count();
    read_if_present(j, "poll_timeout_ms", poll_ms);
    poll_timeout = std::chrono::milliseconds{poll_ms};

    auto workers = static_cast<int64_t>(worker_count);
    read_if_present(j, "worker_count", workers);
    if (workers < 0)
    {
        throw ConfigError(fmt::format("worker_count {} is negative", workers));
    }
    worker_count = static_cast<size_t>(workers);

    if (j.contains("log"))
    {
        const auto &log = j.at("log");
        if (!log.is_object())
        {
            throw ConfigError("config key 'log' must be an object");
        }
        read_if_present(log, "level", log_level);
        read_if_present(log, "file", log_file);
    }
}

void NetConfig::apply_env_overrides()
{
    if (const char *v = std::getenv("SIMPUB_HOST"); v != nullptr && *v != '\0')
    {
        host = v;
    }
    if (const char *v = std::getenv("SIMPUB_DISCOVERY_PORT"); v != nullptr && *v != '\0')
    {
        discovery_port = parse_port("SIMPUB_DISCOVERY_PORT", v);
    }
    if (const char *v = std::getenv("SIMPUB_SERVICE_PORT"); v != nullptr && *v != '\0')
    {
        service_port = parse_port("SIMPUB_SERVICE_PORT", v);
    }
    if (const char *v = std::getenv("SIMPUB_TOPIC_PORT"); v != nullptr && *v != '\0')
    {
        topic_port = parse_port("SIMPUB_TOPIC_PORT", v);
    }
}

void NetConfig::validate() const
{
    if (!is_ipv4(host))
    {
        throw ConfigError(fmt::format("host '{}' is not an IPv4 address", host));
    }
    if (!is_ipv4(netmask))
    {
        throw ConfigError(fmt::format("netmask '{}' is not an IPv4 address", netmask));
    }
    // The discovery port is a send destination and cannot be OS-assigned.
    if (discovery_port <= 0 || discovery_port > kMaxPort)
    {
        throw ConfigError(fmt::format("discovery port {} out of range", discovery_port));
    }
    if (service_port < 0 || service_port > kMaxPort)
    {
        throw ConfigError(fmt::format("service port {} out of range", service_port));
    }
    if (topic_port < 0 || topic_port > kMaxPort)
    {
        throw ConfigError(fmt::format("topic port {} out of range", topic_port));
    }
    if (broadcast_interval.count() <= 0 || poll_timeout.count() <= 0)
    {
        throw ConfigError("broadcast_interval_ms and poll_timeout_ms must be positive");
    }
    if (!utils::Logger::level_from_string(log_level))
    {
        throw ConfigError(fmt::format("log level '{}' is not recognised", log_level));
    }
    // broadcast loop + service loop need a worker each
    if (worker_count < kMinWorkers || worker_count > kMaxWorkers)
    {
        throw ConfigError(fmt::format("worker_count {} is outside [{}, {}]", worker_count,
                                      kMinWorkers, kMaxWorkers));
    }
}

nlohmann::json NetConfig::to_json() const
{
    return nlohmann::json{
        {"host", host},
        {"netmask", netmask},
        {"ports", {{"discovery", discovery_port}, {"service", service_port}, {"topic", topic_port}}},
        {"broadcast_interval_ms", broadcast_interval.count()},
        {"poll_timeout_ms", poll_timeout.count()},
        {"worker_count", worker_count},
        {"log", {{"level", log_level}, {"file", log_file}}},
    };
}

NetConfig NetConfig::load(const std::optional<std::filesystem::path> &path)
{
    NetConfig cfg;

    std::optional<std::filesystem::path> file = path;
    if (!file)
    {
        if (const char *env = std::getenv("SIMPUB_CONFIG_FILE"); env != nullptr && *env != '\0')
        {
            file = std::filesystem::path(env);
        }
    }

    if (file)
    {
        std::ifstream in(*file);
        if (!in)
        {
            throw ConfigError(fmt::format("cannot open config file '{}'", file->string()));
        }
        nlohmann::json j;
        try
        {
            j = nlohmann::json::parse(in);
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw ConfigError(fmt::format("config file '{}': {}", file->string(), e.what()));
        }
        cfg.merge_json(j);
    }

    cfg.apply_env_overrides();
    cfg.validate();
    return cfg;
}

} // namespace simpub::net
