#include "rpc/Serializer.hpp"

#include "utils/Json.hpp"

#include <utility>
#include <yyjson.h>

namespace wb::rpc
{

namespace
{

void add_string(yyjson_mut_doc *doc, yyjson_mut_val *object, char const *key,
                std::string_view value)
{
    yyjson_mut_obj_add_strncpy(doc, object, key, value.data(), value.size());
}

Result<Frame> protocol_error(char const *message)
{
    return Result<Frame>::failure(ErrorKind::ProtocolError, message);
}

std::optional<std::uint64_t> get_tag(yyjson_val *root)
{
    auto *tag = yyjson_obj_get(root, "tag");
    if (tag == nullptr || !yyjson_is_uint(tag))
    {
        return std::nullopt;
    }
    return yyjson_get_uint(tag);
}

} // namespace

std::string serialize_request(RequestFrame const &frame)
{
    wb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    add_string(native, root, "method", frame.method);
    yyjson_mut_obj_add_val(native, root, "arguments",
                           doc.embed(frame.arguments));
    yyjson_mut_obj_add_uint(native, root, "tag", frame.tag);
    return doc.write();
}

std::string serialize_reply(ReplyFrame const &frame)
{
    wb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    if (frame.success)
    {
        yyjson_mut_obj_add_str(native, root, "result", "success");
        yyjson_mut_obj_add_val(native, root, "value", doc.embed(frame.value));
    }
    else
    {
        yyjson_mut_obj_add_str(native, root, "result", "error");
        auto *arguments = yyjson_mut_obj(native);
        yyjson_mut_obj_add_val(native, root, "arguments", arguments);
        add_string(native, arguments, "message", frame.message);
    }
    yyjson_mut_obj_add_uint(native, root, "tag", frame.tag);
    return doc.write();
}

std::string serialize_success(std::uint64_t tag, std::string_view value)
{
    return serialize_reply(ReplyFrame{tag, true, std::string(value), {}});
}

std::string serialize_error(std::uint64_t tag, std::string_view message)
{
    return serialize_reply(ReplyFrame{tag, false, "null", std::string(message)});
}

std::string serialize_event(EventFrame const &frame)
{
    wb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    add_string(native, root, "event", frame.event);
    add_string(native, root, "windowLabel", frame.window_label);
    yyjson_mut_obj_add_int(native, root, "id", frame.id);
    yyjson_mut_obj_add_val(native, root, "payload", doc.embed(frame.payload));
    return doc.write();
}

std::string serialize_listen_arguments(std::string_view event,
                                       std::string_view target,
                                       std::int64_t handler)
{
    wb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    add_string(native, root, "event", event);
    add_string(native, root, "target", target);
    yyjson_mut_obj_add_int(native, root, "handler", handler);
    return doc.write();
}

std::string serialize_unlisten_arguments(std::string_view event,
                                         std::int64_t handler)
{
    wb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    add_string(native, root, "event", event);
    yyjson_mut_obj_add_int(native, root, "handler", handler);
    return doc.write();
}

std::string serialize_emit_arguments(std::string_view event,
                                     std::string_view target,
                                     std::string_view payload)
{
    wb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    add_string(native, root, "event", event);
    add_string(native, root, "target", target);
    yyjson_mut_obj_add_val(native, root, "payload", doc.embed(payload));
    return doc.write();
}

Result<Frame> parse_frame(std::string_view payload)
{
    if (payload.empty())
    {
        return protocol_error("empty frame");
    }
    auto doc = wb::json::Document::parse(payload);
    if (!doc.is_valid())
    {
        return protocol_error("invalid JSON");
    }
    yyjson_val *root = doc.root();
    if (root == nullptr || !yyjson_is_obj(root))
    {
        return protocol_error("expected JSON object");
    }

    if (auto method = wb::json::get_string(root, "method"))
    {
        auto tag = get_tag(root);
        if (!tag)
        {
            return protocol_error("request without tag");
        }
        RequestFrame frame;
        frame.tag = *tag;
        frame.method = std::move(*method);
        frame.arguments =
            wb::json::write_value(yyjson_obj_get(root, "arguments"), "{}");
        return Result<Frame>::success(std::move(frame));
    }

    if (auto result = wb::json::get_string(root, "result"))
    {
        auto tag = get_tag(root);
        if (!tag)
        {
            return protocol_error("reply without tag");
        }
        ReplyFrame frame;
        frame.tag = *tag;
        if (*result == "success")
        {
            frame.success = true;
            frame.value = wb::json::write_value(yyjson_obj_get(root, "value"));
        }
        else if (*result == "error")
        {
            auto *arguments = yyjson_obj_get(root, "arguments");
            frame.message = wb::json::get_string(arguments, "message")
                                .value_or("unknown host error");
        }
        else
        {
            return protocol_error("unknown result");
        }
        return Result<Frame>::success(std::move(frame));
    }

    if (auto event = wb::json::get_string(root, "event"))
    {
        auto id = wb::json::as_int64(yyjson_obj_get(root, "id"));
        if (!id)
        {
            return protocol_error("event without id");
        }
        EventFrame frame;
        frame.event = std::move(*event);
        frame.window_label =
            wb::json::get_string(root, "windowLabel").value_or(std::string{});
        frame.id = *id;
        frame.payload = wb::json::write_value(yyjson_obj_get(root, "payload"));
        return Result<Frame>::success(std::move(frame));
    }

    return protocol_error("unrecognised frame");
}

} // namespace wb::rpc
