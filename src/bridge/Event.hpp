#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace wb::bridge
{

// Local events never come from the host, so they carry no real id.
inline constexpr std::int64_t kLocalEventId = -1;

struct Event
{
    std::string event;
    std::string window_label;
    std::int64_t id = kLocalEventId;
    // JSON text; "null" when the emitter sent nothing.
    std::string payload = "null";
};

template <typename T> struct TypedEvent
{
    std::string event;
    std::string window_label;
    std::int64_t id = kLocalEventId;
    T payload;
};

using EventHandler = std::function<void(Event const &)>;
template <typename T>
using TypedEventHandler = std::function<void(TypedEvent<T> const &)>;

template <typename T> TypedEvent<T> retyped(Event const &event, T payload)
{
    return TypedEvent<T>{event.event, event.window_label, event.id,
                         std::move(payload)};
}

} // namespace wb::bridge
