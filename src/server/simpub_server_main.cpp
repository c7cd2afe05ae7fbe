/**
 * @file simpub_server_main.cpp
 * @brief simpub-server: stand-alone scene producer.
 *
 * Usage: simpub-server [config.json] [--demo]
 *
 * Builds a NetManager from the layered configuration, registers the
 * "scene/updates" topic and a "Control" service, and blocks until SIGINT or
 * SIGTERM. With --demo a pool task publishes a counter frame on
 * "scene/updates" every broadcast interval while a consumer has the stream
 * started through the Control service.
 *
 * A second SIGINT while shutdown is in progress exits immediately.
 */
#include "net/message_dispatcher.hpp"
#include "net/net_config.hpp"
#include "net/net_error.hpp"
#include "net/net_manager.hpp"

#include "utils/logger.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <optional>
#include <string_view>
#include <thread>

using namespace simpub;

namespace
{
constexpr std::string_view kSceneTopic = "scene/updates";
constexpr std::string_view kControlService = "Control";

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int /*sig*/) noexcept
{
    if (g_shutdown_requested.load(std::memory_order_relaxed))
    {
        std::_Exit(1);
    }
    g_shutdown_requested.store(true, std::memory_order_relaxed);
}

/// Turns the demo stream on and off on request of a consumer.
class DemoControl final : public net::ControlHandler
{
  public:
    void on_start_stream(const net::Envelope &envelope) override
    {
        LOGGER_INFO("Control: start_stream {}", envelope.body.dump());
        m_streaming.store(true, std::memory_order_release);
    }
    void on_close_stream(const net::Envelope &envelope) override
    {
        LOGGER_INFO("Control: close_stream {}", envelope.body.dump());
        m_streaming.store(false, std::memory_order_release);
    }
    void on_manipulate_objects(const net::Envelope &envelope) override
    {
        LOGGER_INFO("Control: manipulate_objects {}", envelope.body.dump());
    }

    [[nodiscard]] bool streaming() const noexcept
    {
        return m_streaming.load(std::memory_order_acquire);
    }

  private:
    std::atomic<bool> m_streaming{false};
};

void configure_logger(const net::NetConfig &cfg)
{
    auto &logger = utils::Logger::instance();
    if (auto level = utils::Logger::level_from_string(cfg.log_level))
    {
        logger.set_level(*level);
    }
    if (!cfg.log_file.empty() && !logger.set_logfile(cfg.log_file))
    {
        LOGGER_WARN("simpub-server: cannot open log file '{}', logging to console", cfg.log_file);
    }
}
} // namespace

int main(int argc, char *argv[])
{
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::optional<std::filesystem::path> config_path;
    bool demo = false;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i]; // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == "--demo")
        {
            demo = true;
        }
        else
        {
            config_path = std::filesystem::path(arg);
        }
    }

    int exit_code = EXIT_SUCCESS;
    try
    {
        const net::NetConfig cfg = net::NetConfig::load(config_path);
        configure_logger(cfg);

        // Outlive the manager: its service loop holds references to both.
        DemoControl control;
        net::MessageDispatcher dispatcher;
        net::bind_control_handler(dispatcher, control);

        net::NetManager manager(cfg);
        manager.register_topic(net::Topic(kSceneTopic), manager.host());
        manager.register_dispatcher(std::string(kControlService), manager.host(), dispatcher);

        if (demo)
        {
            manager.submit_task("demo-publisher",
                                [&manager, &control]
                                {
                                    uint64_t frame = 0;
                                    while (manager.is_running())
                                    {
                                        if (control.streaming())
                                        {
                                            const nlohmann::json update{{"frame", frame++}};
                                            manager.publish(kSceneTopic, update.dump());
                                        }
                                        std::this_thread::sleep_for(
                                            manager.config().broadcast_interval);
                                    }
                                });
        }

        LOGGER_INFO("simpub-server: running on {} (service {}, topic {}). Send SIGINT to stop.",
                    manager.host(), manager.service_port(), manager.topic_port());

        while (!g_shutdown_requested.load(std::memory_order_relaxed))
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        LOGGER_INFO("simpub-server: shutdown requested");
        manager.shutdown();
    }
    catch (const net::ConfigError &e)
    {
        LOGGER_ERROR("simpub-server: configuration error: {}", e.what());
        exit_code = EXIT_FAILURE;
    }
    catch (const net::NetError &e)
    {
        LOGGER_ERROR("simpub-server: network error: {}", e.what());
        exit_code = EXIT_FAILURE;
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("simpub-server: fatal: {}", e.what());
        exit_code = EXIT_FAILURE;
    }

    utils::Logger::instance().shutdown();
    return exit_code;
}
