#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace wb::bridge
{

// Fired in-process after the creation command settles. Never sent over
// the remote channel.
inline constexpr std::string_view kHandleCreated = "handle-created";
inline constexpr std::string_view kHandleCreateError = "handle-create-error";

bool is_local_event(std::string_view name) noexcept;

enum class RemoteEvent
{
    Resized,
    Moved,
    CloseRequested,
    FocusGained,
    FocusLost,
    ScaleFactorChanged,
    MenuItemClicked,
    FileDrop,
    FileDropHover,
    FileDropCancelled,
    ThemeChanged,
};

char const *kind_name(RemoteEvent event) noexcept;
std::optional<RemoteEvent> parse_kind_name(std::string_view kind) noexcept;

// "<event_namespace>://<kind>", e.g. "window://resized".
std::string remote_event_name(std::string_view event_namespace,
                              RemoteEvent event);

} // namespace wb::bridge
