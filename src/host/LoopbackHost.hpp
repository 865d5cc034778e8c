#pragma once

#include "bridge/EventLoop.hpp"
#include "bridge/EventNames.hpp"
#include "bridge/HostChannel.hpp"
#include "bridge/Result.hpp"
#include "config/BridgeSettings.hpp"
#include "geometry/Geometry.hpp"
#include "geometry/Monitor.hpp"
#include "window/WindowTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

struct yyjson_val;

namespace wb::host
{

struct WindowState
{
    std::string label;
    std::string title;
    std::string url;
    double scale_factor = 1.0;
    geometry::PhysicalPosition position;
    geometry::PhysicalSize size{800, 600};
    std::optional<geometry::PhysicalSize> min_size;
    std::optional<geometry::PhysicalSize> max_size;
    bool fullscreen = false;
    bool minimized = false;
    bool maximized = false;
    bool focused = false;
    bool decorated = true;
    bool resizable = true;
    bool maximizable = true;
    bool minimizable = true;
    bool closable = true;
    bool visible = true;
    bool always_on_top = false;
    bool content_protected = false;
    bool skip_taskbar = false;
    bool shadow = true;
    bool cursor_grab = false;
    bool cursor_visible = true;
    bool ignore_cursor_events = false;
    std::optional<window::Theme> theme;
    // Raw JSON as the client sent it.
    std::string effects = "null";
    std::string icon = "null";
    std::string attention = "null";
    std::string cursor_icon = "default";
    std::optional<geometry::PhysicalPosition> cursor_position;
};

using Sender = std::function<void(std::string)>;
using CommandHandler = std::function<void(yyjson_val *, Callback<std::string>)>;

// In-process stand-in for the native window host. Requests arrive as JSON
// frames through receive(); replies and events go back through the sender
// given to connect(), always from a task on the event loop.
class LoopbackHost
{
  public:
    explicit LoopbackHost(bridge::EventLoop &loop,
                          config::BridgeSettings settings = {});

    LoopbackHost(LoopbackHost const &) = delete;
    LoopbackHost &operator=(LoopbackHost const &) = delete;

    void connect(Sender send);
    void receive(std::string frame);

    // "<command_namespace>|<verb>"
    std::string action(std::string_view verb) const;
    bridge::HostMetadata metadata(std::string current_label = {}) const;

    void add_window(WindowState state);
    WindowState const *window(std::string const &label) const;
    std::size_t window_count() const noexcept;

    void set_monitors(std::vector<geometry::Monitor> monitors,
                      std::optional<std::size_t> primary = 0);

    // Delivers "<event_namespace>://<kind>" to listeners targeting `label`.
    void emit_window_event(std::string const &label, bridge::RemoteEvent kind,
                           std::string payload = "null");
    void emit_event(std::string const &event, std::string const &target,
                    std::string payload = "null");

    // The next request for `method` is rejected with `message` and not
    // executed.
    void fail_next(std::string method, std::string message);
    // Replies for `method` are held until release().
    void defer(std::string method);
    void release(std::string const &method);

    std::size_t command_count(std::string const &method) const;
    std::vector<std::string> const &commands() const noexcept;
    std::size_t listener_count(std::string const &event,
                               std::string const &target) const;

  private:
    struct Subscription
    {
        std::string event;
        std::string target;
    };

    using WindowCommand =
        std::function<Result<std::string>(WindowState &, yyjson_val *value)>;

    void register_handlers();
    void add_handler(std::string method, CommandHandler handler);
    void add_window_command(std::string_view verb, WindowCommand command);
    void dispatch(std::string const &payload);
    void reply(std::string const &method, std::uint64_t tag,
               Result<std::string> const &result);
    void post_frame(std::string frame);

    WindowState *find_window(std::string_view label);
    void handle_create(yyjson_val *arguments, Callback<std::string> cb);
    void set_focus(WindowState &state);

    bridge::EventLoop &loop_;
    config::BridgeSettings settings_;
    Sender send_;
    std::unordered_map<std::string, CommandHandler> handlers_;
    std::vector<WindowState> windows_;
    std::vector<geometry::Monitor> monitors_;
    std::optional<std::size_t> primary_monitor_;
    std::map<std::int64_t, Subscription> subscriptions_;
    std::unordered_map<std::string, std::string> failures_;
    std::unordered_map<std::string, std::vector<std::string>> deferred_;
    std::vector<std::string> commands_;
};

} // namespace wb::host
