#include "window/Window.hpp"

#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <utility>

namespace wb::window
{

namespace
{

std::string json_bool(bool value)
{
    return value ? "true" : "false";
}

// Fires the local creation event that matches the outcome. Runs from the
// reply callback, so the handle may already be gone.
void settle_creation(std::weak_ptr<bridge::LocalListeners> table,
                     std::string const &label,
                     Result<std::string> const &outcome)
{
    auto listeners = table.lock();
    if (!outcome)
    {
        WB_LOG_WARN("creating window {} failed: {}", label,
                    outcome.error().message);
    }
    if (!listeners)
    {
        return;
    }
    bridge::Event event;
    event.window_label = label;
    if (outcome)
    {
        event.event = std::string(bridge::kHandleCreated);
    }
    else
    {
        event.event = std::string(bridge::kHandleCreateError);
        event.payload = wb::json::quote(outcome.error().message);
    }
    try
    {
        listeners->dispatch(event);
    }
    catch (std::exception const &ex)
    {
        WB_LOG_WARN("{} listener for {} threw: {}", event.event, label,
                    ex.what());
    }
}

struct FocusSearch
{
    std::shared_ptr<bridge::HostChannel> channel;
    config::BridgeSettings settings;
    std::vector<std::string> labels;
    std::size_t next = 0;
    Callback<std::unique_ptr<Window>> cb;
};

void check_next_focus(std::shared_ptr<FocusSearch> search)
{
    if (search->next == search->labels.size())
    {
        search->cb(Result<std::unique_ptr<Window>>::success(nullptr));
        return;
    }
    auto candidate = Window::attach(search->channel,
                                    search->labels[search->next++],
                                    search->settings);
    auto *window = candidate.get();
    auto holder =
        std::make_shared<std::unique_ptr<Window>>(std::move(candidate));
    window->is_focused(
        [search, holder](Result<bool> focused)
        {
            if (!focused)
            {
                search->cb(
                    Result<std::unique_ptr<Window>>::failure(focused.error()));
                return;
            }
            if (focused.value())
            {
                search->cb(Result<std::unique_ptr<Window>>::success(
                    std::move(*holder)));
                return;
            }
            check_next_focus(search);
        });
}

} // namespace

Window::Window(std::shared_ptr<bridge::HostChannel> channel, std::string label,
               WindowOptions const &options, config::BridgeSettings settings)
    : Window(std::move(channel), std::move(label), std::move(settings),
             Existing{})
{
    request_creation(options, {});
}

Window::Window(std::shared_ptr<bridge::HostChannel> channel, std::string label,
               config::BridgeSettings settings, Existing)
    : invoker_(channel, label, std::move(settings)),
      events_(std::make_shared<bridge::EventBridge>(std::move(channel),
                                                    std::move(label)))
{
}

std::unique_ptr<Window> Window::attach(
    std::shared_ptr<bridge::HostChannel> channel, std::string label,
    config::BridgeSettings settings)
{
    return std::unique_ptr<Window>(new Window(
        std::move(channel), std::move(label), std::move(settings), Existing{}));
}

void Window::create(std::shared_ptr<bridge::HostChannel> channel,
                    std::string label, WindowOptions const &options,
                    config::BridgeSettings settings,
                    Callback<std::unique_ptr<Window>> cb)
{
    auto window = attach(std::move(channel), std::move(label),
                         std::move(settings));
    auto *raw = window.get();
    auto holder = std::make_shared<std::unique_ptr<Window>>(std::move(window));
    raw->request_creation(
        options,
        [holder, cb = std::move(cb)](Result<void> settled)
        {
            if (!cb)
            {
                return;
            }
            if (!settled)
            {
                cb(Result<std::unique_ptr<Window>>::failure(
                    ErrorKind::CreationError, settled.error().message));
                return;
            }
            cb(Result<std::unique_ptr<Window>>::success(std::move(*holder)));
        });
}

std::unique_ptr<Window> Window::get_by_label(
    std::shared_ptr<bridge::HostChannel> channel, std::string const &label,
    config::BridgeSettings settings)
{
    auto labels = channel->metadata().labels;
    if (std::find(labels.begin(), labels.end(), label) == labels.end())
    {
        return nullptr;
    }
    return attach(std::move(channel), label, std::move(settings));
}

void Window::request_creation(WindowOptions const &options,
                              Callback<void> settled)
{
    std::weak_ptr<bridge::LocalListeners> table = events_->local_listeners();
    auto label = invoker_.label();
    invoker_.invoke_raw(
        "create", encode_create_arguments(label, options),
        [table, label, settled = std::move(settled)](Result<std::string> reply)
        {
            settle_creation(table, label, reply);
            if (!settled)
            {
                return;
            }
            if (!reply)
            {
                settled(Result<void>::failure(reply.error()));
                return;
            }
            settled(Result<void>::success());
        });
}

std::string const &Window::label() const noexcept
{
    return invoker_.label();
}

config::BridgeSettings const &Window::settings() const noexcept
{
    return invoker_.settings();
}

std::string Window::event_name(bridge::RemoteEvent event) const
{
    return bridge::remote_event_name(settings().event_namespace, event);
}

void Window::listen(std::string const &event, bridge::EventHandler handler,
                    Callback<bridge::Unlisten> cb)
{
    events_->listen(event, std::move(handler), std::move(cb));
}

void Window::once(std::string const &event, bridge::EventHandler handler,
                  Callback<bridge::Unlisten> cb)
{
    events_->once(event, std::move(handler), std::move(cb));
}

void Window::emit(std::string const &event, std::string payload,
                  Callback<void> cb)
{
    events_->emit(event, std::move(payload), std::move(cb));
}

std::size_t Window::local_listener_count(std::string const &event) const
{
    return events_->local_listener_count(event);
}

void Window::command(std::string_view verb, std::optional<std::string> value,
                     Callback<void> cb) const
{
    invoker_.invoke_void(verb, std::move(value), std::move(cb));
}

void Window::set_flag(std::string_view verb, bool value,
                      Callback<void> cb) const
{
    command(verb, json_bool(value), std::move(cb));
}

void Window::query_flag(std::string_view verb, Callback<bool> cb) const
{
    invoker_.invoke_as<bool>(verb, std::nullopt, &bridge::decode_bool,
                             std::move(cb));
}

void Window::scale_factor(Callback<double> cb) const
{
    invoker_.invoke_as<double>("scale_factor", std::nullopt,
                               &bridge::decode_number, std::move(cb));
}

void Window::inner_position(Callback<geometry::PhysicalPosition> cb) const
{
    invoker_.invoke_as<geometry::PhysicalPosition>(
        "inner_position", std::nullopt, &geometry::decode_physical_position,
        std::move(cb));
}

void Window::outer_position(Callback<geometry::PhysicalPosition> cb) const
{
    invoker_.invoke_as<geometry::PhysicalPosition>(
        "outer_position", std::nullopt, &geometry::decode_physical_position,
        std::move(cb));
}

void Window::inner_size(Callback<geometry::PhysicalSize> cb) const
{
    invoker_.invoke_as<geometry::PhysicalSize>(
        "inner_size", std::nullopt, &geometry::decode_physical_size,
        std::move(cb));
}

void Window::outer_size(Callback<geometry::PhysicalSize> cb) const
{
    invoker_.invoke_as<geometry::PhysicalSize>(
        "outer_size", std::nullopt, &geometry::decode_physical_size,
        std::move(cb));
}

void Window::is_fullscreen(Callback<bool> cb) const
{
    query_flag("is_fullscreen", std::move(cb));
}

void Window::is_minimized(Callback<bool> cb) const
{
    query_flag("is_minimized", std::move(cb));
}

void Window::is_maximized(Callback<bool> cb) const
{
    query_flag("is_maximized", std::move(cb));
}

void Window::is_focused(Callback<bool> cb) const
{
    query_flag("is_focused", std::move(cb));
}

void Window::is_decorated(Callback<bool> cb) const
{
    query_flag("is_decorated", std::move(cb));
}

void Window::is_resizable(Callback<bool> cb) const
{
    query_flag("is_resizable", std::move(cb));
}

void Window::is_maximizable(Callback<bool> cb) const
{
    query_flag("is_maximizable", std::move(cb));
}

void Window::is_minimizable(Callback<bool> cb) const
{
    query_flag("is_minimizable", std::move(cb));
}

void Window::is_closable(Callback<bool> cb) const
{
    query_flag("is_closable", std::move(cb));
}

void Window::is_visible(Callback<bool> cb) const
{
    query_flag("is_visible", std::move(cb));
}

void Window::title(Callback<std::string> cb) const
{
    invoker_.invoke_as<std::string>("title", std::nullopt,
                                    &bridge::decode_string, std::move(cb));
}

void Window::theme(Callback<std::optional<Theme>> cb) const
{
    invoker_.invoke_as<std::optional<Theme>>("theme", std::nullopt,
                                             &decode_theme, std::move(cb));
}

void Window::center(Callback<void> cb) const
{
    command("center", std::nullopt, std::move(cb));
}

void Window::request_user_attention(std::optional<UserAttentionType> type,
                                    Callback<void> cb) const
{
    command("request_user_attention", encode_attention(type), std::move(cb));
}

void Window::set_resizable(bool resizable, Callback<void> cb) const
{
    set_flag("set_resizable", resizable, std::move(cb));
}

void Window::set_maximizable(bool maximizable, Callback<void> cb) const
{
    set_flag("set_maximizable", maximizable, std::move(cb));
}

void Window::set_minimizable(bool minimizable, Callback<void> cb) const
{
    set_flag("set_minimizable", minimizable, std::move(cb));
}

void Window::set_closable(bool closable, Callback<void> cb) const
{
    set_flag("set_closable", closable, std::move(cb));
}

void Window::set_title(std::string_view title, Callback<void> cb) const
{
    command("set_title", wb::json::quote(title), std::move(cb));
}

void Window::maximize(Callback<void> cb) const
{
    command("maximize", std::nullopt, std::move(cb));
}

void Window::unmaximize(Callback<void> cb) const
{
    command("unmaximize", std::nullopt, std::move(cb));
}

void Window::toggle_maximize(Callback<void> cb) const
{
    command("toggle_maximize", std::nullopt, std::move(cb));
}

void Window::minimize(Callback<void> cb) const
{
    command("minimize", std::nullopt, std::move(cb));
}

void Window::unminimize(Callback<void> cb) const
{
    command("unminimize", std::nullopt, std::move(cb));
}

void Window::show(Callback<void> cb) const
{
    command("show", std::nullopt, std::move(cb));
}

void Window::hide(Callback<void> cb) const
{
    command("hide", std::nullopt, std::move(cb));
}

void Window::close(Callback<void> cb) const
{
    command("close", std::nullopt, std::move(cb));
}

void Window::set_decorations(bool decorations, Callback<void> cb) const
{
    set_flag("set_decorations", decorations, std::move(cb));
}

void Window::set_shadow(bool enable, Callback<void> cb) const
{
    set_flag("set_shadow", enable, std::move(cb));
}

void Window::set_effects(Effects const &effects, Callback<void> cb) const
{
    command("set_effects", encode_effects(effects), std::move(cb));
}

void Window::clear_effects(Callback<void> cb) const
{
    command("set_effects", std::string("null"), std::move(cb));
}

void Window::set_always_on_top(bool always_on_top, Callback<void> cb) const
{
    set_flag("set_always_on_top", always_on_top, std::move(cb));
}

void Window::set_content_protected(bool protect, Callback<void> cb) const
{
    set_flag("set_content_protected", protect, std::move(cb));
}

void Window::set_size(geometry::Size const &size, Callback<void> cb) const
{
    command("set_size", geometry::encode(size), std::move(cb));
}

void Window::set_size(std::string_view unit, double width, double height,
                      Callback<void> cb) const
{
    set_size(geometry::make_size(unit, width, height), std::move(cb));
}

void Window::set_min_size(std::optional<geometry::Size> const &size,
                          Callback<void> cb) const
{
    command("set_min_size", encode_optional_size(size), std::move(cb));
}

void Window::set_max_size(std::optional<geometry::Size> const &size,
                          Callback<void> cb) const
{
    command("set_max_size", encode_optional_size(size), std::move(cb));
}

void Window::set_position(geometry::Position const &position,
                          Callback<void> cb) const
{
    command("set_position", geometry::encode(position), std::move(cb));
}

void Window::set_position(std::string_view unit, double x, double y,
                          Callback<void> cb) const
{
    set_position(geometry::make_position(unit, x, y), std::move(cb));
}

void Window::set_fullscreen(bool fullscreen, Callback<void> cb) const
{
    set_flag("set_fullscreen", fullscreen, std::move(cb));
}

void Window::set_focus(Callback<void> cb) const
{
    command("set_focus", std::nullopt, std::move(cb));
}

void Window::set_icon(Icon const &icon, Callback<void> cb) const
{
    command("set_icon", encode_icon(icon), std::move(cb));
}

void Window::set_skip_taskbar(bool skip, Callback<void> cb) const
{
    set_flag("set_skip_taskbar", skip, std::move(cb));
}

void Window::set_cursor_grab(bool grab, Callback<void> cb) const
{
    set_flag("set_cursor_grab", grab, std::move(cb));
}

void Window::set_cursor_visible(bool visible, Callback<void> cb) const
{
    set_flag("set_cursor_visible", visible, std::move(cb));
}

void Window::set_cursor_icon(CursorIcon icon, Callback<void> cb) const
{
    command("set_cursor_icon", wb::json::quote(to_string(icon)),
            std::move(cb));
}

void Window::set_cursor_position(geometry::Position const &position,
                                 Callback<void> cb) const
{
    command("set_cursor_position", geometry::encode(position), std::move(cb));
}

void Window::set_ignore_cursor_events(bool ignore, Callback<void> cb) const
{
    set_flag("set_ignore_cursor_events", ignore, std::move(cb));
}

void Window::start_dragging(Callback<void> cb) const
{
    command("start_dragging", std::nullopt, std::move(cb));
}

std::unique_ptr<Window> current_window(
    std::shared_ptr<bridge::HostChannel> channel,
    config::BridgeSettings settings)
{
    auto label = channel->metadata().current_label;
    return Window::attach(std::move(channel), std::move(label),
                          std::move(settings));
}

std::vector<std::unique_ptr<Window>> all_windows(
    std::shared_ptr<bridge::HostChannel> channel,
    config::BridgeSettings settings)
{
    std::vector<std::unique_ptr<Window>> windows;
    for (auto const &label : channel->metadata().labels)
    {
        windows.push_back(Window::attach(channel, label, settings));
    }
    return windows;
}

void focused_window(std::shared_ptr<bridge::HostChannel> channel,
                    config::BridgeSettings settings,
                    Callback<std::unique_ptr<Window>> cb)
{
    auto search = std::make_shared<FocusSearch>();
    search->labels = channel->metadata().labels;
    search->channel = std::move(channel);
    search->settings = std::move(settings);
    search->cb = std::move(cb);
    if (!search->cb)
    {
        return;
    }
    check_next_focus(search);
}

} // namespace wb::window
