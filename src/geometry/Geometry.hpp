#pragma once

#include "bridge/Result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

struct yyjson_val;
struct yyjson_mut_doc;
struct yyjson_mut_val;

namespace wb::geometry
{

enum class Unit
{
    Logical,
    Physical,
};

struct LogicalSize
{
    double width = 0;
    double height = 0;
    bool operator==(LogicalSize const &) const = default;
};

struct PhysicalSize
{
    double width = 0;
    double height = 0;
    bool operator==(PhysicalSize const &) const = default;
};

struct LogicalPosition
{
    double x = 0;
    double y = 0;
    bool operator==(LogicalPosition const &) const = default;
};

struct PhysicalPosition
{
    double x = 0;
    double y = 0;
    bool operator==(PhysicalPosition const &) const = default;
};

using Size = std::variant<LogicalSize, PhysicalSize>;
using Position = std::variant<LogicalPosition, PhysicalPosition>;

char const *to_string(Unit unit) noexcept;

// Throws InvalidArgument for anything other than "Logical" or "Physical".
Unit parse_unit(std::string_view tag);

Size make_size(std::string_view tag, double width, double height);
Position make_position(std::string_view tag, double x, double y);

Unit unit_of(Size const &size) noexcept;
Unit unit_of(Position const &position) noexcept;

// Only the physical to logical direction exists; callers needing physical
// pixels from logical ones multiply by the scale factor themselves.
LogicalSize to_logical(PhysicalSize const &size, double scale_factor);
LogicalPosition to_logical(PhysicalPosition const &position,
                           double scale_factor);

// {"type": "Logical"|"Physical", "data": {...}}
yyjson_mut_val *to_json(yyjson_mut_doc *doc, Size const &size);
yyjson_mut_val *to_json(yyjson_mut_doc *doc, Position const &position);
std::string encode(Size const &size);
std::string encode(Position const &position);

// Reverse of to_json; throws InvalidArgument on an unknown tag and returns
// nullopt when the shape is wrong.
std::optional<Size> size_from_json(yyjson_val *value);
std::optional<Position> position_from_json(yyjson_val *value);

// Untagged host payloads ({"width","height"} / {"x","y"}) are always
// physical.
std::optional<PhysicalSize> physical_size_from_json(yyjson_val *value);
std::optional<PhysicalPosition> physical_position_from_json(yyjson_val *value);

Result<PhysicalSize> decode_physical_size(std::string const &json);
Result<PhysicalPosition> decode_physical_position(std::string const &json);

} // namespace wb::geometry
