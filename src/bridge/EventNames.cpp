#include "bridge/EventNames.hpp"

#include <array>
#include <utility>

namespace wb::bridge
{

namespace
{

constexpr std::array<std::pair<RemoteEvent, char const *>, 11> kKinds = {{
    {RemoteEvent::Resized, "resized"},
    {RemoteEvent::Moved, "moved"},
    {RemoteEvent::CloseRequested, "close-requested"},
    {RemoteEvent::FocusGained, "focus-gained"},
    {RemoteEvent::FocusLost, "focus-lost"},
    {RemoteEvent::ScaleFactorChanged, "scale-factor-changed"},
    {RemoteEvent::MenuItemClicked, "menu-item-clicked"},
    {RemoteEvent::FileDrop, "file-drop"},
    {RemoteEvent::FileDropHover, "file-drop-hover"},
    {RemoteEvent::FileDropCancelled, "file-drop-cancelled"},
    {RemoteEvent::ThemeChanged, "theme-changed"},
}};

} // namespace

bool is_local_event(std::string_view name) noexcept
{
    return name == kHandleCreated || name == kHandleCreateError;
}

char const *kind_name(RemoteEvent event) noexcept
{
    for (auto const &[kind, name] : kKinds)
    {
        if (kind == event)
        {
            return name;
        }
    }
    return "unknown";
}

std::optional<RemoteEvent> parse_kind_name(std::string_view kind) noexcept
{
    for (auto const &[event, name] : kKinds)
    {
        if (kind == name)
        {
            return event;
        }
    }
    return std::nullopt;
}

std::string remote_event_name(std::string_view event_namespace,
                              RemoteEvent event)
{
    std::string name(event_namespace);
    name.append("://");
    name.append(kind_name(event));
    return name;
}

} // namespace wb::bridge
