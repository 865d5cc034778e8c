#include "geometry/Geometry.hpp"

#include "utils/Json.hpp"

#include <cmath>
#include <format>
#include <type_traits>

namespace wb::geometry
{

namespace
{

void check_scale_factor(double scale_factor)
{
    if (!(scale_factor > 0) || !std::isfinite(scale_factor))
    {
        throw InvalidArgument(
            std::format("scale factor must be positive, got {}", scale_factor));
    }
}

yyjson_mut_val *tagged(yyjson_mut_doc *doc, Unit unit, yyjson_mut_val *data)
{
    auto *value = yyjson_mut_obj(doc);
    yyjson_mut_obj_add_str(doc, value, "type", to_string(unit));
    yyjson_mut_obj_add_val(doc, value, "data", data);
    return value;
}

template <typename T> std::string write_root(T const &value)
{
    wb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "null";
    }
    doc.set_root(to_json(doc.doc(), value));
    return doc.write("null");
}

template <typename T, typename Decode>
Result<T> decode_text(std::string const &json, char const *what, Decode decode)
{
    auto doc = wb::json::Document::parse(json);
    if (!doc.is_valid())
    {
        return Result<T>::failure(ErrorKind::ProtocolError,
                                  std::format("{}: invalid JSON", what));
    }
    if (auto value = decode(doc.root()))
    {
        return Result<T>::success(*value);
    }
    return Result<T>::failure(ErrorKind::ProtocolError,
                              std::format("{}: unexpected shape {}", what,
                                          json));
}

} // namespace

char const *to_string(Unit unit) noexcept
{
    switch (unit)
    {
    case Unit::Logical:
        return "Logical";
    case Unit::Physical:
        return "Physical";
    }
    return "Physical";
}

Unit parse_unit(std::string_view tag)
{
    if (tag == "Logical")
    {
        return Unit::Logical;
    }
    if (tag == "Physical")
    {
        return Unit::Physical;
    }
    throw InvalidArgument(std::format(
        "geometry tag must be either Logical or Physical, got \"{}\"", tag));
}

Size make_size(std::string_view tag, double width, double height)
{
    if (parse_unit(tag) == Unit::Logical)
    {
        return LogicalSize{width, height};
    }
    return PhysicalSize{width, height};
}

Position make_position(std::string_view tag, double x, double y)
{
    if (parse_unit(tag) == Unit::Logical)
    {
        return LogicalPosition{x, y};
    }
    return PhysicalPosition{x, y};
}

Unit unit_of(Size const &size) noexcept
{
    return std::holds_alternative<LogicalSize>(size) ? Unit::Logical
                                                     : Unit::Physical;
}

Unit unit_of(Position const &position) noexcept
{
    return std::holds_alternative<LogicalPosition>(position) ? Unit::Logical
                                                             : Unit::Physical;
}

LogicalSize to_logical(PhysicalSize const &size, double scale_factor)
{
    check_scale_factor(scale_factor);
    return LogicalSize{size.width / scale_factor, size.height / scale_factor};
}

LogicalPosition to_logical(PhysicalPosition const &position,
                           double scale_factor)
{
    check_scale_factor(scale_factor);
    return LogicalPosition{position.x / scale_factor,
                           position.y / scale_factor};
}

yyjson_mut_val *to_json(yyjson_mut_doc *doc, Size const &size)
{
    return std::visit(
        [doc](auto const &value)
        {
            auto *data = yyjson_mut_obj(doc);
            yyjson_mut_obj_add_real(doc, data, "width", value.width);
            yyjson_mut_obj_add_real(doc, data, "height", value.height);
            using V = std::decay_t<decltype(value)>;
            return tagged(doc,
                          std::is_same_v<V, LogicalSize> ? Unit::Logical
                                                         : Unit::Physical,
                          data);
        },
        size);
}

yyjson_mut_val *to_json(yyjson_mut_doc *doc, Position const &position)
{
    return std::visit(
        [doc](auto const &value)
        {
            auto *data = yyjson_mut_obj(doc);
            yyjson_mut_obj_add_real(doc, data, "x", value.x);
            yyjson_mut_obj_add_real(doc, data, "y", value.y);
            using V = std::decay_t<decltype(value)>;
            return tagged(doc,
                          std::is_same_v<V, LogicalPosition> ? Unit::Logical
                                                             : Unit::Physical,
                          data);
        },
        position);
}

std::string encode(Size const &size)
{
    return write_root(size);
}

std::string encode(Position const &position)
{
    return write_root(position);
}

std::optional<Size> size_from_json(yyjson_val *value)
{
    if (value == nullptr || !yyjson_is_obj(value))
    {
        return std::nullopt;
    }
    auto type = wb::json::get_string(value, "type");
    auto *data = yyjson_obj_get(value, "data");
    if (!type)
    {
        return std::nullopt;
    }
    auto unit = parse_unit(*type);
    auto width = wb::json::get_number(data, "width");
    auto height = wb::json::get_number(data, "height");
    if (!width || !height)
    {
        return std::nullopt;
    }
    if (unit == Unit::Logical)
    {
        return Size{LogicalSize{*width, *height}};
    }
    return Size{PhysicalSize{*width, *height}};
}

std::optional<Position> position_from_json(yyjson_val *value)
{
    if (value == nullptr || !yyjson_is_obj(value))
    {
        return std::nullopt;
    }
    auto type = wb::json::get_string(value, "type");
    auto *data = yyjson_obj_get(value, "data");
    if (!type)
    {
        return std::nullopt;
    }
    auto unit = parse_unit(*type);
    auto x = wb::json::get_number(data, "x");
    auto y = wb::json::get_number(data, "y");
    if (!x || !y)
    {
        return std::nullopt;
    }
    if (unit == Unit::Logical)
    {
        return Position{LogicalPosition{*x, *y}};
    }
    return Position{PhysicalPosition{*x, *y}};
}

std::optional<PhysicalSize> physical_size_from_json(yyjson_val *value)
{
    auto width = wb::json::get_number(value, "width");
    auto height = wb::json::get_number(value, "height");
    if (!width || !height)
    {
        return std::nullopt;
    }
    return PhysicalSize{*width, *height};
}

std::optional<PhysicalPosition> physical_position_from_json(yyjson_val *value)
{
    auto x = wb::json::get_number(value, "x");
    auto y = wb::json::get_number(value, "y");
    if (!x || !y)
    {
        return std::nullopt;
    }
    return PhysicalPosition{*x, *y};
}

Result<PhysicalSize> decode_physical_size(std::string const &json)
{
    return decode_text<PhysicalSize>(json, "physical size",
                                     physical_size_from_json);
}

Result<PhysicalPosition> decode_physical_position(std::string const &json)
{
    return decode_text<PhysicalPosition>(json, "physical position",
                                         physical_position_from_json);
}

} // namespace wb::geometry
