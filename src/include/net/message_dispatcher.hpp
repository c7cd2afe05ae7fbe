#pragma once
/**
 * @file message_dispatcher.hpp
 * @brief Routes inbound JSON envelopes to handlers by their "message_type".
 *
 * An envelope is a JSON object carrying at least `"message_type": "<kind>"`; the
 * remaining keys are the payload and are passed to the handler untouched.
 *
 * Unknown kinds are logged and dropped. Handlers are registered during setup and
 * then read concurrently, so `register_handler` must not race `dispatch`.
 *
 * The typed control layer maps the three known control kinds onto
 * `ControlHandler` virtuals:
 *
 *     start_stream        -> on_start_stream
 *     close_stream        -> on_close_stream
 *     manipulate_objects  -> on_manipulate_objects
 */
#include "simpub_net_export.h"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace simpub::net
{

struct Envelope
{
    std::string message_type;
    /// The full envelope object, "message_type" included.
    nlohmann::json body;
};

/// nullopt if @p text is not a JSON object with a string "message_type".
[[nodiscard]] SIMPUB_NET_EXPORT std::optional<Envelope> decode_envelope(std::string_view text);

enum class DispatchResult
{
    Handled,
    UnknownType,
    Malformed,
    HandlerFailed,
};

[[nodiscard]] SIMPUB_NET_EXPORT const char *to_string(DispatchResult result) noexcept;

class SIMPUB_NET_EXPORT MessageDispatcher
{
  public:
    using Handler = std::function<void(const Envelope &)>;

    /// Installs @p handler for @p message_type, replacing an earlier one.
    void register_handler(const std::string &message_type, Handler handler);

    [[nodiscard]] bool has_handler(const std::string &message_type) const;

    /// Decodes @p text and dispatches it. Never throws.
    DispatchResult dispatch(std::string_view text) const;
    DispatchResult dispatch(const Envelope &envelope) const;

  private:
    std::unordered_map<std::string, Handler> m_handlers;
};

// ============================================================================
// Typed control messages
// ============================================================================

enum class ControlMessageType
{
    StartStream,
    CloseStream,
    ManipulateObjects,
    Unknown,
};

[[nodiscard]] SIMPUB_NET_EXPORT ControlMessageType to_control_message_type(std::string_view kind) noexcept;
[[nodiscard]] SIMPUB_NET_EXPORT std::string_view to_string(ControlMessageType type) noexcept;

/**
 * @class ControlHandler
 * @brief Receiver of control requests from a consumer.
 *
 * No ordering is enforced between kinds; a close_stream may arrive before any
 * start_stream.
 */
class SIMPUB_NET_EXPORT ControlHandler
{
  public:
    virtual ~ControlHandler() = default;

    virtual void on_start_stream(const Envelope &envelope) = 0;
    virtual void on_close_stream(const Envelope &envelope) = 0;
    virtual void on_manipulate_objects(const Envelope &envelope) = 0;

    /// Called for any kind without a dedicated virtual. Default: ignore.
    virtual void on_unhandled(const Envelope &envelope) { (void)envelope; }
};

/**
 * @brief Registers @p handler for every known control kind on @p dispatcher.
 *
 * @p handler must outlive @p dispatcher.
 */
SIMPUB_NET_EXPORT void bind_control_handler(MessageDispatcher &dispatcher, ControlHandler &handler);

/// Invokes the ControlHandler virtual matching @p envelope's kind.
SIMPUB_NET_EXPORT void route_control_message(ControlHandler &handler, const Envelope &envelope);

} // namespace simpub::net
