#pragma once

#include "bridge/Result.hpp"
#include "geometry/Geometry.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace wb::window
{

enum class Theme
{
    Light,
    Dark,
};

char const *to_string(Theme theme) noexcept;
std::optional<Theme> parse_theme(std::string_view text) noexcept;

enum class UserAttentionType
{
    // Bounces the dock icon / flashes the taskbar until focused.
    Critical = 1,
    Informational = 2,
};

enum class CursorIcon
{
    Default,
    Crosshair,
    Hand,
    Arrow,
    Move,
    Text,
    Wait,
    Help,
    Progress,
    NotAllowed,
    ContextMenu,
    Cell,
    VerticalText,
    Alias,
    Copy,
    NoDrop,
    Grab,
    Grabbing,
    AllScroll,
    ZoomIn,
    ZoomOut,
    EResize,
    NResize,
    NeResize,
    NwResize,
    SResize,
    SeResize,
    SwResize,
    WResize,
    EwResize,
    NsResize,
    NeswResize,
    NwseResize,
    ColResize,
    RowResize,
};

char const *to_string(CursorIcon icon) noexcept;
std::optional<CursorIcon> parse_cursor_icon(std::string_view text) noexcept;

// Platform window effects (macOS vibrancy, Windows mica/acrylic/blur).
enum class Effect
{
    AppearanceBased,
    Light,
    Dark,
    MediumLight,
    UltraDark,
    Titlebar,
    Selection,
    Menu,
    Popover,
    Sidebar,
    HeaderView,
    Sheet,
    WindowBackground,
    HudWindow,
    FullScreenUI,
    Tooltip,
    ContentBackground,
    UnderWindowBackground,
    UnderPageBackground,
    Mica,
    Blur,
    Acrylic,
};

char const *to_string(Effect effect) noexcept;

enum class EffectState
{
    FollowsWindowActiveState,
    Active,
    Inactive,
};

char const *to_string(EffectState state) noexcept;

struct Effects
{
    std::vector<Effect> effects;
    std::optional<EffectState> state;
    std::optional<double> radius;
    std::optional<std::array<std::uint8_t, 4>> color;
};

// Either a path the host can read or raw image bytes; decoding is the
// host's job.
using Icon = std::variant<std::string, std::vector<std::uint8_t>>;

struct FileDrop
{
    std::vector<std::string> paths;
};

struct FileDropHover
{
    std::vector<std::string> paths;
};

struct FileDropCancelled
{
};

using FileDropEvent = std::variant<FileDrop, FileDropHover, FileDropCancelled>;

struct ScaleFactorChanged
{
    double scale_factor = 1.0;
    geometry::PhysicalSize size;
};

struct WindowOptions
{
    std::optional<std::string> url;
    std::optional<std::string> title;
    std::optional<double> x;
    std::optional<double> y;
    std::optional<double> width;
    std::optional<double> height;
    std::optional<double> min_width;
    std::optional<double> min_height;
    std::optional<double> max_width;
    std::optional<double> max_height;
    std::optional<bool> center;
    std::optional<bool> resizable;
    std::optional<bool> maximizable;
    std::optional<bool> minimizable;
    std::optional<bool> closable;
    std::optional<bool> fullscreen;
    std::optional<bool> focus;
    std::optional<bool> transparent;
    std::optional<bool> maximized;
    std::optional<bool> visible;
    std::optional<bool> decorations;
    std::optional<bool> always_on_top;
    std::optional<bool> content_protected;
    std::optional<bool> skip_taskbar;
    std::optional<bool> shadow;
    std::optional<Theme> theme;
};

// Payload encoders return JSON text for the "value" argument.
std::string encode_attention(std::optional<UserAttentionType> type);
std::string encode_effects(Effects const &effects);
std::string encode_icon(Icon const &icon);
std::string encode_optional_size(std::optional<geometry::Size> const &size);
std::string encode_create_arguments(std::string_view label,
                                    WindowOptions const &options);

Result<std::optional<Theme>> decode_theme(std::string const &json);
Result<Theme> decode_required_theme(std::string const &json);
Result<ScaleFactorChanged> decode_scale_factor_changed(std::string const &json);
Result<std::vector<std::string>> decode_paths(std::string const &json);

} // namespace wb::window
