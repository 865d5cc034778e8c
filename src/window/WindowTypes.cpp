#include "window/WindowTypes.hpp"

#include "utils/Json.hpp"

#include <format>
#include <type_traits>
#include <utility>

namespace wb::window
{

namespace
{

constexpr std::array<std::pair<CursorIcon, char const *>, 35> kCursorIcons = {{
    {CursorIcon::Default, "default"},
    {CursorIcon::Crosshair, "crosshair"},
    {CursorIcon::Hand, "hand"},
    {CursorIcon::Arrow, "arrow"},
    {CursorIcon::Move, "move"},
    {CursorIcon::Text, "text"},
    {CursorIcon::Wait, "wait"},
    {CursorIcon::Help, "help"},
    {CursorIcon::Progress, "progress"},
    {CursorIcon::NotAllowed, "notAllowed"},
    {CursorIcon::ContextMenu, "contextMenu"},
    {CursorIcon::Cell, "cell"},
    {CursorIcon::VerticalText, "verticalText"},
    {CursorIcon::Alias, "alias"},
    {CursorIcon::Copy, "copy"},
    {CursorIcon::NoDrop, "noDrop"},
    {CursorIcon::Grab, "grab"},
    {CursorIcon::Grabbing, "grabbing"},
    {CursorIcon::AllScroll, "allScroll"},
    {CursorIcon::ZoomIn, "zoomIn"},
    {CursorIcon::ZoomOut, "zoomOut"},
    {CursorIcon::EResize, "eResize"},
    {CursorIcon::NResize, "nResize"},
    {CursorIcon::NeResize, "neResize"},
    {CursorIcon::NwResize, "nwResize"},
    {CursorIcon::SResize, "sResize"},
    {CursorIcon::SeResize, "seResize"},
    {CursorIcon::SwResize, "swResize"},
    {CursorIcon::WResize, "wResize"},
    {CursorIcon::EwResize, "ewResize"},
    {CursorIcon::NsResize, "nsResize"},
    {CursorIcon::NeswResize, "neswResize"},
    {CursorIcon::NwseResize, "nwseResize"},
    {CursorIcon::ColResize, "colResize"},
    {CursorIcon::RowResize, "rowResize"},
}};

constexpr std::array<char const *, 22> kEffectNames = {
    "appearanceBased",
    "light",
    "dark",
    "mediumLight",
    "ultraDark",
    "titlebar",
    "selection",
    "menu",
    "popover",
    "sidebar",
    "headerView",
    "sheet",
    "windowBackground",
    "hudWindow",
    "fullScreenUI",
    "tooltip",
    "contentBackground",
    "underWindowBackground",
    "underPageBackground",
    "mica",
    "blur",
    "acrylic",
};

void add_optional(yyjson_mut_doc *doc, yyjson_mut_val *object, char const *key,
                  std::optional<double> const &value)
{
    if (value)
    {
        yyjson_mut_obj_add_real(doc, object, key, *value);
    }
}

void add_optional(yyjson_mut_doc *doc, yyjson_mut_val *object, char const *key,
                  std::optional<bool> const &value)
{
    if (value)
    {
        yyjson_mut_obj_add_bool(doc, object, key, *value);
    }
}

void add_optional(yyjson_mut_doc *doc, yyjson_mut_val *object, char const *key,
                  std::optional<std::string> const &value)
{
    if (value)
    {
        yyjson_mut_obj_add_strncpy(doc, object, key, value->data(),
                                   value->size());
    }
}

} // namespace

char const *to_string(Theme theme) noexcept
{
    return theme == Theme::Dark ? "dark" : "light";
}

std::optional<Theme> parse_theme(std::string_view text) noexcept
{
    if (text == "light")
    {
        return Theme::Light;
    }
    if (text == "dark")
    {
        return Theme::Dark;
    }
    return std::nullopt;
}

char const *to_string(CursorIcon icon) noexcept
{
    for (auto const &[value, name] : kCursorIcons)
    {
        if (value == icon)
        {
            return name;
        }
    }
    return "default";
}

std::optional<CursorIcon> parse_cursor_icon(std::string_view text) noexcept
{
    for (auto const &[value, name] : kCursorIcons)
    {
        if (text == name)
        {
            return value;
        }
    }
    return std::nullopt;
}

char const *to_string(Effect effect) noexcept
{
    auto index = static_cast<std::size_t>(effect);
    return index < kEffectNames.size() ? kEffectNames[index] : "blur";
}

char const *to_string(EffectState state) noexcept
{
    switch (state)
    {
    case EffectState::FollowsWindowActiveState:
        return "followsWindowActiveState";
    case EffectState::Active:
        return "active";
    case EffectState::Inactive:
        return "inactive";
    }
    return "followsWindowActiveState";
}

std::string encode_attention(std::optional<UserAttentionType> type)
{
    if (!type)
    {
        return "null";
    }
    return *type == UserAttentionType::Critical
               ? R"({"type":"Critical"})"
               : R"({"type":"Informational"})";
}

std::string encode_effects(Effects const &effects)
{
    wb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "null";
    }
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    auto *list = yyjson_mut_arr(native);
    for (auto effect : effects.effects)
    {
        yyjson_mut_arr_add_str(native, list, to_string(effect));
    }
    yyjson_mut_obj_add_val(native, root, "effects", list);
    if (effects.state)
    {
        yyjson_mut_obj_add_str(native, root, "state",
                               to_string(*effects.state));
    }
    add_optional(native, root, "radius", effects.radius);
    if (effects.color)
    {
        auto *color = yyjson_mut_arr(native);
        for (auto channel : *effects.color)
        {
            yyjson_mut_arr_add_uint(native, color, channel);
        }
        yyjson_mut_obj_add_val(native, root, "color", color);
    }
    return doc.write("null");
}

std::string encode_icon(Icon const &icon)
{
    wb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "null";
    }
    auto *native = doc.doc();
    std::visit(
        [&](auto const &value)
        {
            using V = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<V, std::string>)
            {
                doc.set_root(
                    yyjson_mut_strncpy(native, value.data(), value.size()));
            }
            else
            {
                auto *bytes = yyjson_mut_arr(native);
                for (auto byte : value)
                {
                    yyjson_mut_arr_add_uint(native, bytes, byte);
                }
                doc.set_root(bytes);
            }
        },
        icon);
    return doc.write("null");
}

std::string encode_optional_size(std::optional<geometry::Size> const &size)
{
    return size ? geometry::encode(*size) : std::string("null");
}

std::string encode_create_arguments(std::string_view label,
                                    WindowOptions const &options)
{
    wb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    auto *object = yyjson_mut_obj(native);
    yyjson_mut_obj_add_val(native, root, "options", object);

    add_optional(native, object, "url", options.url);
    add_optional(native, object, "title", options.title);
    add_optional(native, object, "x", options.x);
    add_optional(native, object, "y", options.y);
    add_optional(native, object, "width", options.width);
    add_optional(native, object, "height", options.height);
    add_optional(native, object, "minWidth", options.min_width);
    add_optional(native, object, "minHeight", options.min_height);
    add_optional(native, object, "maxWidth", options.max_width);
    add_optional(native, object, "maxHeight", options.max_height);
    add_optional(native, object, "center", options.center);
    add_optional(native, object, "resizable", options.resizable);
    add_optional(native, object, "maximizable", options.maximizable);
    add_optional(native, object, "minimizable", options.minimizable);
    add_optional(native, object, "closable", options.closable);
    add_optional(native, object, "fullscreen", options.fullscreen);
    add_optional(native, object, "focus", options.focus);
    add_optional(native, object, "transparent", options.transparent);
    add_optional(native, object, "maximized", options.maximized);
    add_optional(native, object, "visible", options.visible);
    add_optional(native, object, "decorations", options.decorations);
    add_optional(native, object, "alwaysOnTop", options.always_on_top);
    add_optional(native, object, "contentProtected",
                 options.content_protected);
    add_optional(native, object, "skipTaskbar", options.skip_taskbar);
    add_optional(native, object, "shadow", options.shadow);
    if (options.theme)
    {
        yyjson_mut_obj_add_str(native, object, "theme",
                               to_string(*options.theme));
    }
    yyjson_mut_obj_add_strncpy(native, object, "label", label.data(),
                               label.size());
    return doc.write();
}

Result<std::optional<Theme>> decode_theme(std::string const &json)
{
    using R = Result<std::optional<Theme>>;
    auto doc = wb::json::Document::parse(json);
    if (!doc.is_valid())
    {
        return R::failure(ErrorKind::ProtocolError, "theme: invalid JSON");
    }
    if (yyjson_is_null(doc.root()))
    {
        return R::success(std::nullopt);
    }
    if (yyjson_is_str(doc.root()))
    {
        if (auto theme = parse_theme(yyjson_get_str(doc.root())))
        {
            return R::success(theme);
        }
    }
    return R::failure(ErrorKind::ProtocolError,
                      std::format("theme: unexpected value {}", json));
}

Result<Theme> decode_required_theme(std::string const &json)
{
    auto theme = decode_theme(json);
    if (!theme)
    {
        return Result<Theme>::failure(theme.error());
    }
    if (!theme.value())
    {
        return Result<Theme>::failure(ErrorKind::ProtocolError,
                                      "theme: missing value");
    }
    return Result<Theme>::success(*theme.value());
}

Result<ScaleFactorChanged> decode_scale_factor_changed(std::string const &json)
{
    using R = Result<ScaleFactorChanged>;
    auto doc = wb::json::Document::parse(json);
    auto *root = doc.root();
    auto scale = wb::json::get_number(root, "scaleFactor");
    auto size = geometry::physical_size_from_json(
        root ? yyjson_obj_get(root, "size") : nullptr);
    if (!scale || !size)
    {
        return R::failure(
            ErrorKind::ProtocolError,
            std::format("scale factor change: unexpected payload {}", json));
    }
    return R::success(ScaleFactorChanged{*scale, *size});
}

Result<std::vector<std::string>> decode_paths(std::string const &json)
{
    using R = Result<std::vector<std::string>>;
    auto doc = wb::json::Document::parse(json);
    if (!doc.is_valid() || !yyjson_is_arr(doc.root()))
    {
        return R::failure(ErrorKind::ProtocolError,
                          std::format("file drop: expected paths, got {}",
                                      json));
    }
    std::vector<std::string> paths;
    size_t idx, limit;
    yyjson_val *entry = nullptr;
    yyjson_arr_foreach(doc.root(), idx, limit, entry)
    {
        if (!yyjson_is_str(entry))
        {
            return R::failure(ErrorKind::ProtocolError,
                              "file drop: non-string path");
        }
        paths.emplace_back(yyjson_get_str(entry), yyjson_get_len(entry));
    }
    return R::success(std::move(paths));
}

} // namespace wb::window
