/**
 * @file message_dispatcher.cpp
 * @brief Envelope decoding, dispatch table and typed control routing.
 */
#include "net/message_dispatcher.hpp"

#include "utils/logger.hpp"

#include <array>
#include <utility>

namespace simpub::net
{

namespace
{
constexpr std::array<std::pair<std::string_view, ControlMessageType>, 3> kControlKinds{{
    {"start_stream", ControlMessageType::StartStream},
    {"close_stream", ControlMessageType::CloseStream},
    {"manipulate_objects", ControlMessageType::ManipulateObjects},
}};
} // namespace

std::optional<Envelope> decode_envelope(std::string_view text)
{
    nlohmann::json body = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (body.is_discarded() || !body.is_object())
    {
        return std::nullopt;
    }
    auto it = body.find("message_type");
    if (it == body.end() || !it->is_string())
    {
        return std::nullopt;
    }
    Envelope envelope;
    envelope.message_type = it->get<std::string>();
    envelope.body = std::move(body);
    return envelope;
}

const char *to_string(DispatchResult result) noexcept
{
    switch (result)
    {
    case DispatchResult::Handled:
        return "handled";
    case DispatchResult::UnknownType:
        return "unknown_type";
    case DispatchResult::Malformed:
        return "malformed";
    case DispatchResult::HandlerFailed:
        return "handler_failed";
    }
    return "invalid";
}

// ============================================================================
// MessageDispatcher
// ============================================================================

void MessageDispatcher::register_handler(const std::string &message_type, Handler handler)
{
    m_handlers.insert_or_assign(message_type, std::move(handler));
}

bool MessageDispatcher::has_handler(const std::string &message_type) const
{
    return m_handlers.count(message_type) != 0;
}

DispatchResult MessageDispatcher::dispatch(std::string_view text) const
{
    auto envelope = decode_envelope(text);
    if (!envelope)
    {
        LOGGER_WARN("Dispatcher: dropping malformed envelope ({} bytes)", text.size());
        return DispatchResult::Malformed;
    }
    return dispatch(*envelope);
}

DispatchResult MessageDispatcher::dispatch(const Envelope &envelope) const
{
    auto it = m_handlers.find(envelope.message_type);
    if (it == m_handlers.end())
    {
        LOGGER_WARN("Dispatcher: no handler for message_type '{}'", envelope.message_type);
        return DispatchResult::UnknownType;
    }
    try
    {
        it->second(envelope);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Dispatcher: handler for '{}' threw: {}", envelope.message_type, e.what());
        return DispatchResult::HandlerFailed;
    }
    return DispatchResult::Handled;
}

// ============================================================================
// Typed control messages
// ============================================================================

ControlMessageType to_control_message_type(std::string_view kind) noexcept
{
    for (const auto &[name, type] : kControlKinds)
    {
        if (name == kind)
        {
            return type;
        }
    }
    return ControlMessageType::Unknown;
}

std::string_view to_string(ControlMessageType type) noexcept
{
    for (const auto &[name, known] : kControlKinds)
    {
        if (known == type)
        {
            return name;
        }
    }
    return "unknown";
}

void route_control_message(ControlHandler &handler, const Envelope &envelope)
{
    switch (to_control_message_type(envelope.message_type))
    {
    case ControlMessageType::StartStream:
        handler.on_start_stream(envelope);
        break;
    case ControlMessageType::CloseStream:
        handler.on_close_stream(envelope);
        break;
    case ControlMessageType::ManipulateObjects:
        handler.on_manipulate_objects(envelope);
        break;
    case ControlMessageType::Unknown:
        handler.on_unhandled(envelope);
        break;
    }
}

void bind_control_handler(MessageDispatcher &dispatcher, ControlHandler &handler)
{
    for (const auto &[name, type] : kControlKinds)
    {
        dispatcher.register_handler(std::string(name), [&handler](const Envelope &envelope)
                                    { route_control_message(handler, envelope); });
    }
}

} // namespace simpub::net
