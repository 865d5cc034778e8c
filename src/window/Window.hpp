#pragma once

#include "bridge/CommandInvoker.hpp"
#include "bridge/Event.hpp"
#include "bridge/EventBridge.hpp"
#include "bridge/EventNames.hpp"
#include "bridge/HostChannel.hpp"
#include "bridge/Result.hpp"
#include "bridge/Unlisten.hpp"
#include "config/BridgeSettings.hpp"
#include "geometry/Geometry.hpp"
#include "window/CloseRequest.hpp"
#include "window/WindowTypes.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wb::window
{

// Client-side handle for one host window, addressed by label. Every
// observation is a round trip; nothing about the window is cached here.
//
// Handles with the same label alias the same host window but keep separate
// local listener tables. The creation events ("handle-created" and
// "handle-create-error") only reach listeners registered on the instance
// that requested creation, and only if they were registered before the
// creation command settled.
class Window
{
  public:
    // Sends the creation command and returns immediately. The handle is
    // provisional until one of the local creation events fires; creation
    // failure is reported only through "handle-create-error".
    Window(std::shared_ptr<bridge::HostChannel> channel, std::string label,
           WindowOptions const &options = {},
           config::BridgeSettings settings = {});

    Window(Window const &) = delete;
    Window &operator=(Window const &) = delete;

    // Refers to a window that already exists on the host; sends nothing.
    static std::unique_ptr<Window> attach(
        std::shared_ptr<bridge::HostChannel> channel, std::string label,
        config::BridgeSettings settings = {});

    // Completes with the handle once the host has created the window, or
    // with CreationError. The local creation events still fire on the new
    // handle before `cb` runs.
    static void create(std::shared_ptr<bridge::HostChannel> channel,
                       std::string label, WindowOptions const &options,
                       config::BridgeSettings settings,
                       Callback<std::unique_ptr<Window>> cb);

    // nullptr when the host metadata does not list `label`.
    static std::unique_ptr<Window> get_by_label(
        std::shared_ptr<bridge::HostChannel> channel, std::string const &label,
        config::BridgeSettings settings = {});

    std::string const &label() const noexcept;
    config::BridgeSettings const &settings() const noexcept;

    void listen(std::string const &event, bridge::EventHandler handler,
                Callback<bridge::Unlisten> cb);
    void once(std::string const &event, bridge::EventHandler handler,
              Callback<bridge::Unlisten> cb);
    // Local events dispatch synchronously and handler exceptions escape.
    void emit(std::string const &event, std::string payload = "null",
              Callback<void> cb = {});

    std::size_t local_listener_count(std::string const &event) const;

    // Getters. Geometry comes back in physical pixels.
    void scale_factor(Callback<double> cb) const;
    void inner_position(Callback<geometry::PhysicalPosition> cb) const;
    void outer_position(Callback<geometry::PhysicalPosition> cb) const;
    void inner_size(Callback<geometry::PhysicalSize> cb) const;
    void outer_size(Callback<geometry::PhysicalSize> cb) const;
    void is_fullscreen(Callback<bool> cb) const;
    void is_minimized(Callback<bool> cb) const;
    void is_maximized(Callback<bool> cb) const;
    void is_focused(Callback<bool> cb) const;
    void is_decorated(Callback<bool> cb) const;
    void is_resizable(Callback<bool> cb) const;
    void is_maximizable(Callback<bool> cb) const;
    void is_minimizable(Callback<bool> cb) const;
    void is_closable(Callback<bool> cb) const;
    void is_visible(Callback<bool> cb) const;
    void title(Callback<std::string> cb) const;
    void theme(Callback<std::optional<Theme>> cb) const;

    // Mutators.
    void center(Callback<void> cb = {}) const;
    void request_user_attention(std::optional<UserAttentionType> type,
                                Callback<void> cb = {}) const;
    void set_resizable(bool resizable, Callback<void> cb = {}) const;
    void set_maximizable(bool maximizable, Callback<void> cb = {}) const;
    void set_minimizable(bool minimizable, Callback<void> cb = {}) const;
    void set_closable(bool closable, Callback<void> cb = {}) const;
    void set_title(std::string_view title, Callback<void> cb = {}) const;
    void maximize(Callback<void> cb = {}) const;
    void unmaximize(Callback<void> cb = {}) const;
    void toggle_maximize(Callback<void> cb = {}) const;
    void minimize(Callback<void> cb = {}) const;
    void unminimize(Callback<void> cb = {}) const;
    void show(Callback<void> cb = {}) const;
    void hide(Callback<void> cb = {}) const;
    void close(Callback<void> cb = {}) const;
    void set_decorations(bool decorations, Callback<void> cb = {}) const;
    void set_shadow(bool enable, Callback<void> cb = {}) const;
    void set_effects(Effects const &effects, Callback<void> cb = {}) const;
    void clear_effects(Callback<void> cb = {}) const;
    void set_always_on_top(bool always_on_top, Callback<void> cb = {}) const;
    void set_content_protected(bool protect, Callback<void> cb = {}) const;
    void set_size(geometry::Size const &size, Callback<void> cb = {}) const;
    // Throws InvalidArgument for an unknown unit before anything is sent.
    void set_size(std::string_view unit, double width, double height,
                  Callback<void> cb = {}) const;
    void set_min_size(std::optional<geometry::Size> const &size,
                      Callback<void> cb = {}) const;
    void set_max_size(std::optional<geometry::Size> const &size,
                      Callback<void> cb = {}) const;
    void set_position(geometry::Position const &position,
                      Callback<void> cb = {}) const;
    void set_position(std::string_view unit, double x, double y,
                      Callback<void> cb = {}) const;
    void set_fullscreen(bool fullscreen, Callback<void> cb = {}) const;
    void set_focus(Callback<void> cb = {}) const;
    void set_icon(Icon const &icon, Callback<void> cb = {}) const;
    void set_skip_taskbar(bool skip, Callback<void> cb = {}) const;
    void set_cursor_grab(bool grab, Callback<void> cb = {}) const;
    void set_cursor_visible(bool visible, Callback<void> cb = {}) const;
    void set_cursor_icon(CursorIcon icon, Callback<void> cb = {}) const;
    void set_cursor_position(geometry::Position const &position,
                             Callback<void> cb = {}) const;
    void set_ignore_cursor_events(bool ignore, Callback<void> cb = {}) const;
    void start_dragging(Callback<void> cb = {}) const;

    // Composite listeners. Payloads that cannot be decoded are dropped
    // with a warning. If one underlying subscription fails, the ones
    // already made are removed and `cb` gets that failure.
    void on_resized(bridge::TypedEventHandler<geometry::PhysicalSize> handler,
                    Callback<bridge::Unlisten> cb);
    void on_moved(
        bridge::TypedEventHandler<geometry::PhysicalPosition> handler,
        Callback<bridge::Unlisten> cb);
    void on_focus_changed(bridge::TypedEventHandler<bool> handler,
                          Callback<bridge::Unlisten> cb);
    void on_scale_changed(
        bridge::TypedEventHandler<ScaleFactorChanged> handler,
        Callback<bridge::Unlisten> cb);
    void on_menu_clicked(bridge::TypedEventHandler<std::string> handler,
                         Callback<bridge::Unlisten> cb);
    void on_file_drop(bridge::TypedEventHandler<FileDropEvent> handler,
                      Callback<bridge::Unlisten> cb);
    void on_theme_changed(bridge::TypedEventHandler<Theme> handler,
                          Callback<bridge::Unlisten> cb);

    // The window is closed after the handler returns unless it called
    // prevent_default(). A handler that throws leaves the window open.
    void on_close_requested(CloseRequestedHandler handler,
                            Callback<bridge::Unlisten> cb);
    void on_close_requested_async(AsyncCloseRequestedHandler handler,
                                  Callback<bridge::Unlisten> cb);

  private:
    struct Existing
    {
    };

    Window(std::shared_ptr<bridge::HostChannel> channel, std::string label,
           config::BridgeSettings settings, Existing);

    void request_creation(WindowOptions const &options,
                          Callback<void> settled);
    std::string event_name(bridge::RemoteEvent event) const;

    void command(std::string_view verb, std::optional<std::string> value,
                 Callback<void> cb) const;
    void set_flag(std::string_view verb, bool value, Callback<void> cb) const;
    void query_flag(std::string_view verb, Callback<bool> cb) const;

    bridge::CommandInvoker invoker_;
    std::shared_ptr<bridge::EventBridge> events_;
};

// The window this process is embedded in, per host metadata.
std::unique_ptr<Window> current_window(
    std::shared_ptr<bridge::HostChannel> channel,
    config::BridgeSettings settings = {});

std::vector<std::unique_ptr<Window>> all_windows(
    std::shared_ptr<bridge::HostChannel> channel,
    config::BridgeSettings settings = {});

// Asks each known window in metadata order whether it is focused and
// completes with the first that is, or nullptr. A failed query fails the
// whole lookup.
void focused_window(std::shared_ptr<bridge::HostChannel> channel,
                    config::BridgeSettings settings,
                    Callback<std::unique_ptr<Window>> cb);

} // namespace wb::window
