#pragma once

#include "bridge/Result.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace wb::rpc
{

// Methods the event subsystem understands in addition to window actions.
inline constexpr std::string_view kEventListenMethod = "event|listen";
inline constexpr std::string_view kEventUnlistenMethod = "event|unlisten";
inline constexpr std::string_view kEventEmitMethod = "event|emit";

// Client to host.
struct RequestFrame
{
    std::uint64_t tag = 0;
    std::string method;
    std::string arguments = "{}";
};

// Host to client, answering the request with the same tag.
struct ReplyFrame
{
    std::uint64_t tag = 0;
    bool success = false;
    std::string value = "null";
    std::string message;
};

// Host to client. `id` is the listener id the client registered.
struct EventFrame
{
    std::string event;
    std::string window_label;
    std::int64_t id = 0;
    std::string payload = "null";
};

using Frame = std::variant<RequestFrame, ReplyFrame, EventFrame>;

std::string serialize_request(RequestFrame const &frame);
std::string serialize_reply(ReplyFrame const &frame);
std::string serialize_success(std::uint64_t tag, std::string_view value);
std::string serialize_error(std::uint64_t tag, std::string_view message);
std::string serialize_event(EventFrame const &frame);

std::string serialize_listen_arguments(std::string_view event,
                                       std::string_view target,
                                       std::int64_t handler);
std::string serialize_unlisten_arguments(std::string_view event,
                                         std::int64_t handler);
std::string serialize_emit_arguments(std::string_view event,
                                     std::string_view target,
                                     std::string_view payload);

// Fails with ProtocolError when the payload is not one of the three frame
// shapes.
Result<Frame> parse_frame(std::string_view payload);

} // namespace wb::rpc
