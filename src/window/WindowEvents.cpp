#include "window/Window.hpp"

#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <utility>
#include <vector>

namespace wb::window
{

namespace
{

struct Subscription
{
    std::string event;
    bridge::EventHandler handler;
};

struct CompositeState
{
    std::shared_ptr<bridge::EventBridge> events;
    std::vector<Subscription> subscriptions;
    std::vector<bridge::Unlisten> registered;
    std::size_t next = 0;
    Callback<bridge::Unlisten> cb;
};

// Subscribes one event at a time. On the first failure everything
// registered so far is removed again.
void listen_next(std::shared_ptr<CompositeState> state)
{
    if (state->next == state->subscriptions.size())
    {
        auto combined = bridge::Unlisten::combine(std::move(state->registered));
        if (state->cb)
        {
            state->cb(Result<bridge::Unlisten>::success(std::move(combined)));
        }
        return;
    }
    auto &subscription = state->subscriptions[state->next++];
    auto event = subscription.event;
    state->events->listen(
        event, std::move(subscription.handler),
        [state, event](Result<bridge::Unlisten> result)
        {
            if (!result)
            {
                WB_LOG_WARN("subscribing {} failed, rolling back {} "
                            "listener(s): {}",
                            event, state->registered.size(),
                            result.error().message);
                for (auto const &unlisten : state->registered)
                {
                    unlisten();
                }
                state->registered.clear();
                if (state->cb)
                {
                    state->cb(Result<bridge::Unlisten>::failure(result.error()));
                }
                return;
            }
            state->registered.push_back(result.value());
            listen_next(state);
        });
}

void listen_all(std::shared_ptr<bridge::EventBridge> events,
                std::vector<Subscription> subscriptions,
                Callback<bridge::Unlisten> cb)
{
    auto state = std::make_shared<CompositeState>();
    state->events = std::move(events);
    state->subscriptions = std::move(subscriptions);
    state->cb = std::move(cb);
    listen_next(state);
}

// Reshapes the raw payload with `decode` and hands it on; undecodable
// payloads never reach the client handler.
template <typename T, typename Decode>
bridge::EventHandler reshaping(bridge::TypedEventHandler<T> handler,
                               Decode decode)
{
    return [handler = std::move(handler),
            decode = std::move(decode)](bridge::Event const &event)
    {
        Result<T> payload = decode(event.payload);
        if (!payload)
        {
            WB_LOG_WARN("dropping {} from {}: {}", event.event,
                        event.window_label, payload.error().message);
            return;
        }
        handler(bridge::retyped(event, std::move(payload.value())));
    };
}

template <typename T>
bridge::EventHandler constant(bridge::TypedEventHandler<T> handler, T value)
{
    return [handler = std::move(handler),
            value = std::move(value)](bridge::Event const &event)
    { handler(bridge::retyped(event, value)); };
}

Result<FileDropEvent> decode_drop(std::string const &json)
{
    auto paths = decode_paths(json);
    if (!paths)
    {
        return Result<FileDropEvent>::failure(paths.error());
    }
    return Result<FileDropEvent>::success(
        FileDrop{std::move(paths.value())});
}

Result<FileDropEvent> decode_hover(std::string const &json)
{
    auto paths = decode_paths(json);
    if (!paths)
    {
        return Result<FileDropEvent>::failure(paths.error());
    }
    return Result<FileDropEvent>::success(
        FileDropHover{std::move(paths.value())});
}

} // namespace

void Window::on_resized(
    bridge::TypedEventHandler<geometry::PhysicalSize> handler,
    Callback<bridge::Unlisten> cb)
{
    listen_all(events_,
               {{event_name(bridge::RemoteEvent::Resized),
                 reshaping<geometry::PhysicalSize>(
                     std::move(handler), &geometry::decode_physical_size)}},
               std::move(cb));
}

void Window::on_moved(
    bridge::TypedEventHandler<geometry::PhysicalPosition> handler,
    Callback<bridge::Unlisten> cb)
{
    listen_all(events_,
               {{event_name(bridge::RemoteEvent::Moved),
                 reshaping<geometry::PhysicalPosition>(
                     std::move(handler),
                     &geometry::decode_physical_position)}},
               std::move(cb));
}

void Window::on_focus_changed(bridge::TypedEventHandler<bool> handler,
                              Callback<bridge::Unlisten> cb)
{
    listen_all(events_,
               {{event_name(bridge::RemoteEvent::FocusGained),
                 constant<bool>(handler, true)},
                {event_name(bridge::RemoteEvent::FocusLost),
                 constant<bool>(handler, false)}},
               std::move(cb));
}

void Window::on_scale_changed(
    bridge::TypedEventHandler<ScaleFactorChanged> handler,
    Callback<bridge::Unlisten> cb)
{
    listen_all(events_,
               {{event_name(bridge::RemoteEvent::ScaleFactorChanged),
                 reshaping<ScaleFactorChanged>(std::move(handler),
                                               &decode_scale_factor_changed)}},
               std::move(cb));
}

void Window::on_menu_clicked(bridge::TypedEventHandler<std::string> handler,
                             Callback<bridge::Unlisten> cb)
{
    listen_all(events_,
               {{event_name(bridge::RemoteEvent::MenuItemClicked),
                 reshaping<std::string>(std::move(handler),
                                        &bridge::decode_string)}},
               std::move(cb));
}

void Window::on_file_drop(bridge::TypedEventHandler<FileDropEvent> handler,
                          Callback<bridge::Unlisten> cb)
{
    listen_all(events_,
               {{event_name(bridge::RemoteEvent::FileDrop),
                 reshaping<FileDropEvent>(handler, &decode_drop)},
                {event_name(bridge::RemoteEvent::FileDropHover),
                 reshaping<FileDropEvent>(handler, &decode_hover)},
                {event_name(bridge::RemoteEvent::FileDropCancelled),
                 constant<FileDropEvent>(handler, FileDropCancelled{})}},
               std::move(cb));
}

void Window::on_theme_changed(bridge::TypedEventHandler<Theme> handler,
                              Callback<bridge::Unlisten> cb)
{
    listen_all(events_,
               {{event_name(bridge::RemoteEvent::ThemeChanged),
                 reshaping<Theme>(std::move(handler),
                                  &decode_required_theme)}},
               std::move(cb));
}

void Window::on_close_requested(CloseRequestedHandler handler,
                                Callback<bridge::Unlisten> cb)
{
    on_close_requested_async(
        [handler = std::move(handler)](CloseRequestedEvent &event,
                                       std::function<void()> done)
        {
            handler(event);
            done();
        },
        std::move(cb));
}

void Window::on_close_requested_async(AsyncCloseRequestedHandler handler,
                                      Callback<bridge::Unlisten> cb)
{
    auto invoker = invoker_;
    listen_all(
        events_,
        {{event_name(bridge::RemoteEvent::CloseRequested),
          [handler = std::move(handler),
           invoker](bridge::Event const &event)
          {
              auto negotiation = std::make_shared<CloseNegotiation>(
                  event, [invoker](Callback<void> closed)
                  { invoker.invoke_void("close", std::nullopt,
                                        std::move(closed)); });
              handler(negotiation->event(),
                      [negotiation]() { negotiation->resolve(); });
          }}},
        std::move(cb));
}

} // namespace wb::window
