#include "host/LoopbackHost.hpp"

#include "rpc/Serializer.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <variant>

namespace wb::host
{

namespace
{

template <typename Build> std::string build_json(Build build)
{
    wb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "null";
    }
    doc.set_root(build(doc.doc()));
    return doc.write("null");
}

std::string size_json(geometry::PhysicalSize const &size)
{
    return build_json(
        [&size](yyjson_mut_doc *doc)
        {
            auto *value = yyjson_mut_obj(doc);
            yyjson_mut_obj_add_real(doc, value, "width", size.width);
            yyjson_mut_obj_add_real(doc, value, "height", size.height);
            return value;
        });
}

std::string position_json(geometry::PhysicalPosition const &position)
{
    return build_json(
        [&position](yyjson_mut_doc *doc)
        {
            auto *value = yyjson_mut_obj(doc);
            yyjson_mut_obj_add_real(doc, value, "x", position.x);
            yyjson_mut_obj_add_real(doc, value, "y", position.y);
            return value;
        });
}

std::string monitor_json(std::optional<geometry::Monitor> const &monitor)
{
    if (!monitor)
    {
        return "null";
    }
    return build_json([&monitor](yyjson_mut_doc *doc)
                      { return geometry::to_json(doc, *monitor); });
}

std::string bool_json(bool value)
{
    return value ? "true" : "false";
}

Result<std::string> ok(std::string value = "null")
{
    return Result<std::string>::success(std::move(value));
}

Result<std::string> rejected(std::string message)
{
    return Result<std::string>::failure(ErrorKind::HostError,
                                        std::move(message));
}

geometry::PhysicalSize to_physical(geometry::Size const &size,
                                   double scale_factor)
{
    if (auto const *logical = std::get_if<geometry::LogicalSize>(&size))
    {
        return {logical->width * scale_factor, logical->height * scale_factor};
    }
    return std::get<geometry::PhysicalSize>(size);
}

geometry::PhysicalPosition to_physical(geometry::Position const &position,
                                       double scale_factor)
{
    if (auto const *logical =
            std::get_if<geometry::LogicalPosition>(&position))
    {
        return {logical->x * scale_factor, logical->y * scale_factor};
    }
    return std::get<geometry::PhysicalPosition>(position);
}

void apply_flag(yyjson_val *options, char const *key, bool &target)
{
    if (auto value = wb::json::get_bool(options, key))
    {
        target = *value;
    }
}

} // namespace

LoopbackHost::LoopbackHost(bridge::EventLoop &loop,
                           config::BridgeSettings settings)
    : loop_(loop), settings_(std::move(settings))
{
    register_handlers();
}

void LoopbackHost::connect(Sender send)
{
    send_ = std::move(send);
}

void LoopbackHost::receive(std::string frame)
{
    loop_.post([this, frame = std::move(frame)]() { dispatch(frame); });
}

std::string LoopbackHost::action(std::string_view verb) const
{
    return std::format("{}|{}", settings_.command_namespace, verb);
}

bridge::HostMetadata LoopbackHost::metadata(std::string current_label) const
{
    bridge::HostMetadata metadata;
    metadata.current_label = std::move(current_label);
    for (auto const &state : windows_)
    {
        metadata.labels.push_back(state.label);
    }
    return metadata;
}

void LoopbackHost::add_window(WindowState state)
{
    windows_.push_back(std::move(state));
}

WindowState const *LoopbackHost::window(std::string const &label) const
{
    auto it = std::find_if(windows_.begin(), windows_.end(),
                           [&label](WindowState const &state)
                           { return state.label == label; });
    return it == windows_.end() ? nullptr : &*it;
}

WindowState *LoopbackHost::find_window(std::string_view label)
{
    auto it = std::find_if(windows_.begin(), windows_.end(),
                           [label](WindowState const &state)
                           { return state.label == label; });
    return it == windows_.end() ? nullptr : &*it;
}

std::size_t LoopbackHost::window_count() const noexcept
{
    return windows_.size();
}

void LoopbackHost::set_monitors(std::vector<geometry::Monitor> monitors,
                                std::optional<std::size_t> primary)
{
    monitors_ = std::move(monitors);
    primary_monitor_ = primary;
}

void LoopbackHost::emit_window_event(std::string const &label,
                                     bridge::RemoteEvent kind,
                                     std::string payload)
{
    emit_event(bridge::remote_event_name(settings_.event_namespace, kind),
               label, std::move(payload));
}

void LoopbackHost::emit_event(std::string const &event,
                              std::string const &target, std::string payload)
{
    for (auto const &[id, subscription] : subscriptions_)
    {
        if (subscription.event != event || subscription.target != target)
        {
            continue;
        }
        post_frame(rpc::serialize_event(
            rpc::EventFrame{event, target, id, payload}));
    }
}

void LoopbackHost::fail_next(std::string method, std::string message)
{
    failures_[std::move(method)] = std::move(message);
}

void LoopbackHost::defer(std::string method)
{
    deferred_.try_emplace(std::move(method));
}

void LoopbackHost::release(std::string const &method)
{
    auto it = deferred_.find(method);
    if (it == deferred_.end())
    {
        return;
    }
    auto held = std::move(it->second);
    deferred_.erase(it);
    for (auto &frame : held)
    {
        post_frame(std::move(frame));
    }
}

std::size_t LoopbackHost::command_count(std::string const &method) const
{
    return static_cast<std::size_t>(
        std::count(commands_.begin(), commands_.end(), method));
}

std::vector<std::string> const &LoopbackHost::commands() const noexcept
{
    return commands_;
}

std::size_t LoopbackHost::listener_count(std::string const &event,
                                         std::string const &target) const
{
    return static_cast<std::size_t>(std::count_if(
        subscriptions_.begin(), subscriptions_.end(),
        [&](auto const &entry)
        {
            return entry.second.event == event &&
                   entry.second.target == target;
        }));
}

void LoopbackHost::post_frame(std::string frame)
{
    loop_.post(
        [this, frame = std::move(frame)]()
        {
            if (send_)
            {
                send_(frame);
            }
        });
}

void LoopbackHost::reply(std::string const &method, std::uint64_t tag,
                         Result<std::string> const &result)
{
    auto frame = result ? rpc::serialize_success(tag, result.value())
                        : rpc::serialize_error(tag, result.error().message);
    if (auto it = deferred_.find(method); it != deferred_.end())
    {
        it->second.push_back(std::move(frame));
        return;
    }
    post_frame(std::move(frame));
}

void LoopbackHost::dispatch(std::string const &payload)
{
    auto parsed = rpc::parse_frame(payload);
    if (!parsed)
    {
        WB_LOG_WARN("loopback host dropped frame: {}", parsed.error().message);
        return;
    }
    auto const *request = std::get_if<rpc::RequestFrame>(&parsed.value());
    if (request == nullptr)
    {
        WB_LOG_WARN("loopback host only accepts requests");
        return;
    }
    auto const method = request->method;
    auto const tag = request->tag;
    commands_.push_back(method);
    WB_LOG_DEBUG("loopback host dispatching {}", method);

    if (auto failure = failures_.find(method); failure != failures_.end())
    {
        auto message = std::move(failure->second);
        failures_.erase(failure);
        reply(method, tag, rejected(std::move(message)));
        return;
    }
    auto handler_it = handlers_.find(method);
    if (handler_it == handlers_.end())
    {
        reply(method, tag, rejected("unsupported command"));
        return;
    }
    auto doc = wb::json::Document::parse(request->arguments);
    try
    {
        handler_it->second(doc.root(),
                           [this, method, tag](Result<std::string> result)
                           { reply(method, tag, result); });
    }
    catch (std::exception const &ex)
    {
        WB_LOG_INFO("loopback handler for {} failed: {}", method, ex.what());
        reply(method, tag, rejected(ex.what()));
    }
}

void LoopbackHost::add_handler(std::string method, CommandHandler handler)
{
    handlers_.emplace(std::move(method), std::move(handler));
}

void LoopbackHost::add_window_command(std::string_view verb,
                                      WindowCommand command)
{
    add_handler(action(verb),
                [this, command = std::move(command)](yyjson_val *arguments,
                                                     Callback<std::string> cb)
                {
                    auto label = wb::json::get_string(arguments, "label");
                    if (!label)
                    {
                        cb(rejected("missing label"));
                        return;
                    }
                    auto *state = find_window(*label);
                    if (state == nullptr)
                    {
                        cb(rejected("window not found"));
                        return;
                    }
                    auto *value =
                        arguments ? yyjson_obj_get(arguments, "value") : nullptr;
                    cb(command(*state, value));
                });
}

void LoopbackHost::set_focus(WindowState &state)
{
    for (auto &other : windows_)
    {
        if (&other != &state && other.focused)
        {
            other.focused = false;
            emit_window_event(other.label, bridge::RemoteEvent::FocusLost);
        }
    }
    if (!state.focused)
    {
        state.focused = true;
        emit_window_event(state.label, bridge::RemoteEvent::FocusGained);
    }
}

void LoopbackHost::handle_create(yyjson_val *arguments,
                                 Callback<std::string> cb)
{
    auto *options =
        arguments ? yyjson_obj_get(arguments, "options") : nullptr;
    auto label = wb::json::get_string(options, "label");
    if (!label || label->empty())
    {
        cb(rejected("missing label"));
        return;
    }
    if (find_window(*label) != nullptr)
    {
        cb(rejected(
            std::format("a window with label `{}` already exists", *label)));
        return;
    }

    WindowState state;
    state.label = *label;
    if (primary_monitor_ && *primary_monitor_ < monitors_.size())
    {
        state.scale_factor = monitors_[*primary_monitor_].scale_factor;
    }
    auto const scale = state.scale_factor;
    state.title = wb::json::get_string(options, "title").value_or("");
    state.url = wb::json::get_string(options, "url").value_or("index.html");
    state.position.x = wb::json::get_number(options, "x").value_or(0) * scale;
    state.position.y = wb::json::get_number(options, "y").value_or(0) * scale;
    state.size.width =
        wb::json::get_number(options, "width").value_or(800) * scale;
    state.size.height =
        wb::json::get_number(options, "height").value_or(600) * scale;
    auto min_width = wb::json::get_number(options, "minWidth");
    auto min_height = wb::json::get_number(options, "minHeight");
    if (min_width && min_height)
    {
        state.min_size =
            geometry::PhysicalSize{*min_width * scale, *min_height * scale};
    }
    auto max_width = wb::json::get_number(options, "maxWidth");
    auto max_height = wb::json::get_number(options, "maxHeight");
    if (max_width && max_height)
    {
        state.max_size =
            geometry::PhysicalSize{*max_width * scale, *max_height * scale};
    }
    apply_flag(options, "resizable", state.resizable);
    apply_flag(options, "maximizable", state.maximizable);
    apply_flag(options, "minimizable", state.minimizable);
    apply_flag(options, "closable", state.closable);
    apply_flag(options, "fullscreen", state.fullscreen);
    apply_flag(options, "maximized", state.maximized);
    apply_flag(options, "visible", state.visible);
    apply_flag(options, "decorations", state.decorated);
    apply_flag(options, "alwaysOnTop", state.always_on_top);
    apply_flag(options, "contentProtected", state.content_protected);
    apply_flag(options, "skipTaskbar", state.skip_taskbar);
    apply_flag(options, "shadow", state.shadow);
    if (auto theme = wb::json::get_string(options, "theme"))
    {
        state.theme = window::parse_theme(*theme);
    }
    auto const focus = wb::json::get_bool(options, "focus").value_or(false);

    windows_.push_back(std::move(state));
    WB_LOG_INFO("loopback host created window {}", *label);
    if (focus)
    {
        set_focus(windows_.back());
    }
    cb(ok());
}

void LoopbackHost::register_handlers()
{
    auto flag_getter = [this](std::string_view verb, bool WindowState::*member)
    {
        add_window_command(verb, [member](WindowState &state, yyjson_val *)
                           { return ok(bool_json(state.*member)); });
    };
    auto flag_setter = [this](std::string_view verb, bool WindowState::*member)
    {
        add_window_command(verb,
                           [member](WindowState &state, yyjson_val *value)
                           {
                               if (value == nullptr || !yyjson_is_bool(value))
                               {
                                   return rejected("expected a boolean value");
                               }
                               state.*member = yyjson_get_bool(value);
                               return ok();
                           });
    };
    auto raw_setter =
        [this](std::string_view verb, std::string WindowState::*member)
    {
        add_window_command(verb,
                           [member](WindowState &state, yyjson_val *value)
                           {
                               state.*member = wb::json::write_value(value);
                               return ok();
                           });
    };

    add_handler(action("create"),
                [this](yyjson_val *arguments, Callback<std::string> cb)
                { handle_create(arguments, std::move(cb)); });
    add_handler(action("close"),
                [this](yyjson_val *arguments, Callback<std::string> cb)
                {
                    auto label = wb::json::get_string(arguments, "label");
                    auto it = std::find_if(
                        windows_.begin(), windows_.end(),
                        [&label](WindowState const &state)
                        { return label && state.label == *label; });
                    if (it == windows_.end())
                    {
                        cb(rejected("window not found"));
                        return;
                    }
                    WB_LOG_INFO("loopback host closed window {}", it->label);
                    windows_.erase(it);
                    cb(ok());
                });

    add_window_command("scale_factor",
                       [](WindowState &state, yyjson_val *)
                       {
                           return ok(build_json(
                               [&state](yyjson_mut_doc *doc)
                               {
                                   return yyjson_mut_real(doc,
                                                          state.scale_factor);
                               }));
                       });
    add_window_command("inner_position", [](WindowState &state, yyjson_val *)
                       { return ok(position_json(state.position)); });
    add_window_command("outer_position", [](WindowState &state, yyjson_val *)
                       { return ok(position_json(state.position)); });
    add_window_command("inner_size", [](WindowState &state, yyjson_val *)
                       { return ok(size_json(state.size)); });
    add_window_command("outer_size", [](WindowState &state, yyjson_val *)
                       { return ok(size_json(state.size)); });
    add_window_command("title", [](WindowState &state, yyjson_val *)
                       { return ok(wb::json::quote(state.title)); });
    add_window_command("theme",
                       [](WindowState &state, yyjson_val *)
                       {
                           return ok(state.theme ? wb::json::quote(window::to_string(
                                                       *state.theme))
                                                 : std::string("null"));
                       });

    flag_getter("is_fullscreen", &WindowState::fullscreen);
    flag_getter("is_minimized", &WindowState::minimized);
    flag_getter("is_maximized", &WindowState::maximized);
    flag_getter("is_focused", &WindowState::focused);
    flag_getter("is_decorated", &WindowState::decorated);
    flag_getter("is_resizable", &WindowState::resizable);
    flag_getter("is_maximizable", &WindowState::maximizable);
    flag_getter("is_minimizable", &WindowState::minimizable);
    flag_getter("is_closable", &WindowState::closable);
    flag_getter("is_visible", &WindowState::visible);

    flag_setter("set_resizable", &WindowState::resizable);
    flag_setter("set_maximizable", &WindowState::maximizable);
    flag_setter("set_minimizable", &WindowState::minimizable);
    flag_setter("set_closable", &WindowState::closable);
    flag_setter("set_decorations", &WindowState::decorated);
    flag_setter("set_shadow", &WindowState::shadow);
    flag_setter("set_always_on_top", &WindowState::always_on_top);
    flag_setter("set_content_protected", &WindowState::content_protected);
    flag_setter("set_fullscreen", &WindowState::fullscreen);
    flag_setter("set_skip_taskbar", &WindowState::skip_taskbar);
    flag_setter("set_cursor_grab", &WindowState::cursor_grab);
    flag_setter("set_cursor_visible", &WindowState::cursor_visible);
    flag_setter("set_ignore_cursor_events", &WindowState::ignore_cursor_events);

    raw_setter("set_effects", &WindowState::effects);
    raw_setter("set_icon", &WindowState::icon);
    raw_setter("request_user_attention", &WindowState::attention);

    add_window_command("set_title",
                       [](WindowState &state, yyjson_val *value)
                       {
                           if (value == nullptr || !yyjson_is_str(value))
                           {
                               return rejected("expected a string value");
                           }
                           state.title.assign(yyjson_get_str(value),
                                              yyjson_get_len(value));
                           return ok();
                       });
    add_window_command("set_cursor_icon",
                       [](WindowState &state, yyjson_val *value)
                       {
                           if (value == nullptr || !yyjson_is_str(value) ||
                               !window::parse_cursor_icon(yyjson_get_str(value)))
                           {
                               return rejected("unknown cursor icon");
                           }
                           state.cursor_icon = yyjson_get_str(value);
                           return ok();
                       });

    add_window_command("center",
                       [this](WindowState &state, yyjson_val *)
                       {
                           if (!primary_monitor_ ||
                               *primary_monitor_ >= monitors_.size())
                           {
                               return ok();
                           }
                           auto const &monitor = monitors_[*primary_monitor_];
                           state.position.x =
                               monitor.position.x +
                               (monitor.size.width - state.size.width) / 2;
                           state.position.y =
                               monitor.position.y +
                               (monitor.size.height - state.size.height) / 2;
                           emit_window_event(state.label,
                                             bridge::RemoteEvent::Moved,
                                             position_json(state.position));
                           return ok();
                       });
    add_window_command("maximize", [](WindowState &state, yyjson_val *)
                       {
                           state.maximized = true;
                           return ok();
                       });
    add_window_command("unmaximize", [](WindowState &state, yyjson_val *)
                       {
                           state.maximized = false;
                           return ok();
                       });
    add_window_command("toggle_maximize", [](WindowState &state, yyjson_val *)
                       {
                           state.maximized = !state.maximized;
                           return ok();
                       });
    add_window_command("minimize", [](WindowState &state, yyjson_val *)
                       {
                           state.minimized = true;
                           return ok();
                       });
    add_window_command("unminimize", [](WindowState &state, yyjson_val *)
                       {
                           state.minimized = false;
                           return ok();
                       });
    add_window_command("show", [](WindowState &state, yyjson_val *)
                       {
                           state.visible = true;
                           return ok();
                       });
    add_window_command("hide", [](WindowState &state, yyjson_val *)
                       {
                           state.visible = false;
                           return ok();
                       });
    add_window_command("set_focus",
                       [this](WindowState &state, yyjson_val *)
                       {
                           set_focus(state);
                           return ok();
                       });
    add_window_command("start_dragging",
                       [](WindowState &, yyjson_val *) { return ok(); });

    add_window_command("set_size",
                       [this](WindowState &state, yyjson_val *value)
                       {
                           auto size = geometry::size_from_json(value);
                           if (!size)
                           {
                               return rejected("expected a size");
                           }
                           state.size = to_physical(*size, state.scale_factor);
                           emit_window_event(state.label,
                                             bridge::RemoteEvent::Resized,
                                             size_json(state.size));
                           return ok();
                       });
    auto limit_setter =
        [this](std::string_view verb,
               std::optional<geometry::PhysicalSize> WindowState::*member)
    {
        add_window_command(verb,
                           [member](WindowState &state, yyjson_val *value)
                           {
                               if (value == nullptr || yyjson_is_null(value))
                               {
                                   state.*member = std::nullopt;
                                   return ok();
                               }
                               auto size = geometry::size_from_json(value);
                               if (!size)
                               {
                                   return rejected("expected a size or null");
                               }
                               state.*member =
                                   to_physical(*size, state.scale_factor);
                               return ok();
                           });
    };
    limit_setter("set_min_size", &WindowState::min_size);
    limit_setter("set_max_size", &WindowState::max_size);
    add_window_command("set_position",
                       [this](WindowState &state, yyjson_val *value)
                       {
                           auto position = geometry::position_from_json(value);
                           if (!position)
                           {
                               return rejected("expected a position");
                           }
                           state.position =
                               to_physical(*position, state.scale_factor);
                           emit_window_event(state.label,
                                             bridge::RemoteEvent::Moved,
                                             position_json(state.position));
                           return ok();
                       });
    add_window_command("set_cursor_position",
                       [](WindowState &state, yyjson_val *value)
                       {
                           auto position = geometry::position_from_json(value);
                           if (!position)
                           {
                               return rejected("expected a position");
                           }
                           state.cursor_position =
                               to_physical(*position, state.scale_factor);
                           return ok();
                       });

    add_handler(action("current_monitor"),
                [this](yyjson_val *, Callback<std::string> cb)
                {
                    std::optional<geometry::Monitor> monitor;
                    if (!monitors_.empty())
                    {
                        monitor = monitors_.front();
                    }
                    cb(ok(monitor_json(monitor)));
                });
    add_handler(action("primary_monitor"),
                [this](yyjson_val *, Callback<std::string> cb)
                {
                    std::optional<geometry::Monitor> monitor;
                    if (primary_monitor_ && *primary_monitor_ < monitors_.size())
                    {
                        monitor = monitors_[*primary_monitor_];
                    }
                    cb(ok(monitor_json(monitor)));
                });
    add_handler(action("available_monitors"),
                [this](yyjson_val *, Callback<std::string> cb)
                {
                    cb(ok(build_json(
                        [this](yyjson_mut_doc *doc)
                        {
                            auto *list = yyjson_mut_arr(doc);
                            for (auto const &monitor : monitors_)
                            {
                                yyjson_mut_arr_append(
                                    list, geometry::to_json(doc, monitor));
                            }
                            return list;
                        })));
                });

    add_handler(std::string(rpc::kEventListenMethod),
                [this](yyjson_val *arguments, Callback<std::string> cb)
                {
                    auto event = wb::json::get_string(arguments, "event");
                    auto target = wb::json::get_string(arguments, "target");
                    auto handler = wb::json::as_int64(
                        arguments ? yyjson_obj_get(arguments, "handler")
                                  : nullptr);
                    if (!event || !target || !handler)
                    {
                        cb(rejected("invalid listen arguments"));
                        return;
                    }
                    subscriptions_[*handler] =
                        Subscription{*event, *target};
                    cb(ok());
                });
    add_handler(std::string(rpc::kEventUnlistenMethod),
                [this](yyjson_val *arguments, Callback<std::string> cb)
                {
                    auto handler = wb::json::as_int64(
                        arguments ? yyjson_obj_get(arguments, "handler")
                                  : nullptr);
                    if (!handler)
                    {
                        cb(rejected("invalid unlisten arguments"));
                        return;
                    }
                    subscriptions_.erase(*handler);
                    cb(ok());
                });
    add_handler(std::string(rpc::kEventEmitMethod),
                [this](yyjson_val *arguments, Callback<std::string> cb)
                {
                    auto event = wb::json::get_string(arguments, "event");
                    if (!event)
                    {
                        cb(rejected("invalid emit arguments"));
                        return;
                    }
                    auto target =
                        wb::json::get_string(arguments, "target").value_or("");
                    emit_event(*event, target,
                               wb::json::write_value(
                                   yyjson_obj_get(arguments, "payload")));
                    cb(ok());
                });
}

} // namespace wb::host
