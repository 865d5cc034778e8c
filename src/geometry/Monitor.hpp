#pragma once

#include "bridge/Result.hpp"
#include "geometry/Geometry.hpp"

#include <optional>
#include <string>
#include <vector>

namespace wb::geometry
{

// Rebuilt from the host reply on every query.
struct Monitor
{
    std::optional<std::string> name;
    double scale_factor = 1.0;
    PhysicalPosition position;
    PhysicalSize size;
};

std::optional<Monitor> monitor_from_json(yyjson_val *value);
yyjson_mut_val *to_json(yyjson_mut_doc *doc, Monitor const &monitor);

// A JSON null reply means no monitor could be resolved.
Result<std::optional<Monitor>> decode_monitor(std::string const &json);
Result<std::vector<Monitor>> decode_monitors(std::string const &json);

} // namespace wb::geometry
