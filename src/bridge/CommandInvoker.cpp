#include "bridge/CommandInvoker.hpp"

#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <format>

namespace wb::bridge
{

namespace
{

template <typename T>
Result<T> shape_error(char const *expected, std::string const &json)
{
    return Result<T>::failure(
        ErrorKind::ProtocolError,
        std::format("expected {} in host reply, got {}", expected, json));
}

} // namespace

std::string make_arguments(std::string_view label,
                           std::optional<std::string> const &value)
{
    wb::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    yyjson_mut_obj_add_strncpy(native, root, "label", label.data(),
                               label.size());
    if (value)
    {
        yyjson_mut_obj_add_val(native, root, "value", doc.embed(*value));
    }
    return doc.write();
}

CommandInvoker::CommandInvoker(std::shared_ptr<HostChannel> channel,
                               std::string label,
                               config::BridgeSettings settings)
    : channel_(std::move(channel)), label_(std::move(label)),
      settings_(std::move(settings))
{
}

std::string CommandInvoker::action(std::string_view verb) const
{
    std::string action = settings_.command_namespace;
    action.push_back('|');
    action.append(verb);
    return action;
}

void CommandInvoker::invoke(std::string_view verb,
                            std::optional<std::string> value,
                            Callback<std::string> cb) const
{
    invoke_raw(verb, make_arguments(label_, value), std::move(cb));
}

void CommandInvoker::invoke_raw(std::string_view verb, std::string arguments,
                                Callback<std::string> cb) const
{
    auto name = action(verb);
    if (settings_.trace_commands)
    {
        WB_LOG_DEBUG("invoke {} {}", name, arguments);
    }
    channel_->invoke(
        name, std::move(arguments),
        [name, cb = std::move(cb)](Result<std::string> reply)
        {
            if (!reply)
            {
                WB_LOG_WARN("{} rejected by host: {}", name,
                            reply.error().message);
            }
            if (cb)
            {
                cb(std::move(reply));
            }
        });
}

void CommandInvoker::invoke_void(std::string_view verb,
                                 std::optional<std::string> value,
                                 Callback<void> cb) const
{
    invoke(verb, std::move(value),
           [cb = std::move(cb)](Result<std::string> reply)
           {
               if (!cb)
               {
                   return;
               }
               if (!reply)
               {
                   cb(Result<void>::failure(reply.error()));
                   return;
               }
               cb(Result<void>::success());
           });
}

std::string const &CommandInvoker::label() const noexcept
{
    return label_;
}

config::BridgeSettings const &CommandInvoker::settings() const noexcept
{
    return settings_;
}

std::shared_ptr<HostChannel> const &CommandInvoker::channel() const noexcept
{
    return channel_;
}

Result<bool> decode_bool(std::string const &json)
{
    auto doc = wb::json::Document::parse(json);
    if (!doc.is_valid() || !yyjson_is_bool(doc.root()))
    {
        return shape_error<bool>("a boolean", json);
    }
    return Result<bool>::success(yyjson_get_bool(doc.root()));
}

Result<double> decode_number(std::string const &json)
{
    auto doc = wb::json::Document::parse(json);
    if (!doc.is_valid() || !yyjson_is_num(doc.root()))
    {
        return shape_error<double>("a number", json);
    }
    return Result<double>::success(yyjson_get_num(doc.root()));
}

Result<std::string> decode_string(std::string const &json)
{
    auto doc = wb::json::Document::parse(json);
    if (!doc.is_valid() || !yyjson_is_str(doc.root()))
    {
        return shape_error<std::string>("a string", json);
    }
    return Result<std::string>::success(
        std::string(yyjson_get_str(doc.root()), yyjson_get_len(doc.root())));
}

Result<std::optional<std::string>> decode_optional_string(
    std::string const &json)
{
    using R = Result<std::optional<std::string>>;
    auto doc = wb::json::Document::parse(json);
    if (doc.is_valid() && yyjson_is_null(doc.root()))
    {
        return R::success(std::nullopt);
    }
    auto text = decode_string(json);
    if (!text)
    {
        return R::failure(text.error());
    }
    return R::success(std::move(text.value()));
}

} // namespace wb::bridge
