#include "geometry/Monitor.hpp"

#include "utils/Json.hpp"

#include <format>
#include <utility>

namespace wb::geometry
{

std::optional<Monitor> monitor_from_json(yyjson_val *value)
{
    if (value == nullptr || !yyjson_is_obj(value))
    {
        return std::nullopt;
    }
    auto scale = wb::json::get_number(value, "scaleFactor");
    auto position = physical_position_from_json(yyjson_obj_get(value, "position"));
    auto size = physical_size_from_json(yyjson_obj_get(value, "size"));
    if (!scale || !position || !size)
    {
        return std::nullopt;
    }
    Monitor monitor;
    monitor.name = wb::json::get_string(value, "name");
    monitor.scale_factor = *scale;
    monitor.position = *position;
    monitor.size = *size;
    return monitor;
}

yyjson_mut_val *to_json(yyjson_mut_doc *doc, Monitor const &monitor)
{
    auto *value = yyjson_mut_obj(doc);
    if (monitor.name)
    {
        yyjson_mut_obj_add_strncpy(doc, value, "name", monitor.name->data(),
                                   monitor.name->size());
    }
    else
    {
        yyjson_mut_obj_add_null(doc, value, "name");
    }
    yyjson_mut_obj_add_real(doc, value, "scaleFactor", monitor.scale_factor);
    auto *position = yyjson_mut_obj(doc);
    yyjson_mut_obj_add_real(doc, position, "x", monitor.position.x);
    yyjson_mut_obj_add_real(doc, position, "y", monitor.position.y);
    yyjson_mut_obj_add_val(doc, value, "position", position);
    auto *size = yyjson_mut_obj(doc);
    yyjson_mut_obj_add_real(doc, size, "width", monitor.size.width);
    yyjson_mut_obj_add_real(doc, size, "height", monitor.size.height);
    yyjson_mut_obj_add_val(doc, value, "size", size);
    return value;
}

Result<std::optional<Monitor>> decode_monitor(std::string const &json)
{
    using R = Result<std::optional<Monitor>>;
    auto doc = wb::json::Document::parse(json);
    if (!doc.is_valid())
    {
        return R::failure(ErrorKind::ProtocolError, "monitor: invalid JSON");
    }
    if (yyjson_is_null(doc.root()))
    {
        return R::success(std::nullopt);
    }
    auto monitor = monitor_from_json(doc.root());
    if (!monitor)
    {
        return R::failure(ErrorKind::ProtocolError,
                          std::format("monitor: unexpected shape {}", json));
    }
    return R::success(std::move(monitor));
}

Result<std::vector<Monitor>> decode_monitors(std::string const &json)
{
    using R = Result<std::vector<Monitor>>;
    auto doc = wb::json::Document::parse(json);
    if (!doc.is_valid() || !yyjson_is_arr(doc.root()))
    {
        return R::failure(ErrorKind::ProtocolError,
                          "monitors: expected a JSON array");
    }
    std::vector<Monitor> monitors;
    size_t idx, limit;
    yyjson_val *entry = nullptr;
    yyjson_arr_foreach(doc.root(), idx, limit, entry)
    {
        auto monitor = monitor_from_json(entry);
        if (!monitor)
        {
            return R::failure(ErrorKind::ProtocolError,
                              std::format("monitors: entry {} is malformed", idx));
        }
        monitors.push_back(std::move(*monitor));
    }
    return R::success(std::move(monitors));
}

} // namespace wb::geometry
