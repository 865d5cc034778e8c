#include "rpc/JsonChannel.hpp"

#include "utils/Log.hpp"

#include <exception>
#include <utility>
#include <variant>

namespace wb::rpc
{

JsonChannel::JsonChannel(Sender send, bridge::HostMetadata metadata)
    : send_(std::move(send)), metadata_(std::move(metadata))
{
}

JsonChannel::~JsonChannel()
{
    if (!pending_.empty())
    {
        WB_LOG_DEBUG("json channel closed with {} unanswered request(s)",
                     pending_.size());
    }
}

void JsonChannel::receive(std::string_view payload)
{
    auto parsed = parse_frame(payload);
    if (!parsed)
    {
        WB_LOG_WARN("dropping host frame: {}", parsed.error().message);
        return;
    }
    auto &frame = parsed.value();
    if (auto *reply = std::get_if<ReplyFrame>(&frame))
    {
        handle_reply(*reply);
    }
    else if (auto *event = std::get_if<EventFrame>(&frame))
    {
        handle_event(*event);
    }
    else
    {
        WB_LOG_WARN("dropping request frame sent by the host");
    }
}

void JsonChannel::handle_reply(ReplyFrame const &reply)
{
    auto it = pending_.find(reply.tag);
    if (it == pending_.end())
    {
        WB_LOG_WARN("reply for unknown tag {}", reply.tag);
        return;
    }
    auto cb = std::move(it->second);
    pending_.erase(it);
    if (!cb)
    {
        return;
    }
    auto result = reply.success
                      ? Result<std::string>::success(reply.value)
                      : Result<std::string>::failure(ErrorKind::HostError,
                                                     reply.message);
    try
    {
        cb(std::move(result));
    }
    catch (std::exception const &ex)
    {
        WB_LOG_WARN("reply callback for tag {} threw: {}", reply.tag,
                    ex.what());
    }
}

void JsonChannel::handle_event(EventFrame const &frame)
{
    auto it = listeners_.find(frame.id);
    if (it == listeners_.end())
    {
        WB_LOG_DEBUG("event {} for removed listener {}", frame.event, frame.id);
        return;
    }
    auto handler = it->second.handler;
    if (it->second.once)
    {
        // Deregister before running so a redelivery can never reach it.
        unsubscribe(frame.id);
    }
    bridge::Event event{frame.event, frame.window_label, frame.id,
                        frame.payload};
    try
    {
        handler(event);
    }
    catch (std::exception const &ex)
    {
        WB_LOG_WARN("listener for {} threw: {}", frame.event, ex.what());
    }
}

void JsonChannel::request(std::string method, std::string arguments,
                          Callback<std::string> cb)
{
    auto tag = next_tag_++;
    pending_.emplace(tag, std::move(cb));
    send_(serialize_request(RequestFrame{tag, std::move(method),
                                         std::move(arguments)}));
}

void JsonChannel::invoke(std::string const &action, std::string arguments,
                         Callback<std::string> cb)
{
    request(action, std::move(arguments), std::move(cb));
}

void JsonChannel::subscribe(std::string const &event,
                            std::string const &target,
                            bridge::EventHandler handler, bool once,
                            Callback<bridge::Unlisten> cb)
{
    auto id = next_listener_id_++;
    listeners_.emplace(id, Listener{event, std::move(handler), once});
    std::weak_ptr<int> alive = alive_;
    request(std::string(kEventListenMethod),
            serialize_listen_arguments(event, target, id),
            [this, alive, id, cb = std::move(cb)](Result<std::string> result)
            {
                if (alive.expired())
                {
                    return;
                }
                if (!result)
                {
                    listeners_.erase(id);
                    if (cb)
                    {
                        cb(Result<bridge::Unlisten>::failure(result.error()));
                    }
                    return;
                }
                auto unlisten = make_unlisten(id);
                if (cb)
                {
                    cb(Result<bridge::Unlisten>::success(std::move(unlisten)));
                }
            });
}

bridge::Unlisten JsonChannel::make_unlisten(std::int64_t id)
{
    std::weak_ptr<int> alive = alive_;
    return bridge::Unlisten(
        [this, alive, id]()
        {
            if (alive.expired())
            {
                return;
            }
            unsubscribe(id);
        });
}

void JsonChannel::unsubscribe(std::int64_t id)
{
    auto it = listeners_.find(id);
    if (it == listeners_.end())
    {
        return;
    }
    auto event = std::move(it->second.event);
    listeners_.erase(it);
    request(std::string(kEventUnlistenMethod),
            serialize_unlisten_arguments(event, id),
            [event, id](Result<std::string> result)
            {
                if (!result)
                {
                    WB_LOG_WARN("host refused to unlisten {} ({}): {}", event,
                                id, result.error().message);
                }
            });
}

void JsonChannel::listen(std::string const &event, std::string const &target,
                         bridge::EventHandler handler,
                         Callback<bridge::Unlisten> cb)
{
    subscribe(event, target, std::move(handler), false, std::move(cb));
}

void JsonChannel::once(std::string const &event, std::string const &target,
                       bridge::EventHandler handler,
                       Callback<bridge::Unlisten> cb)
{
    subscribe(event, target, std::move(handler), true, std::move(cb));
}

void JsonChannel::emit(std::string const &event, std::string const &target,
                       std::string payload, Callback<void> cb)
{
    request(std::string(kEventEmitMethod),
            serialize_emit_arguments(event, target, payload),
            [cb = std::move(cb)](Result<std::string> result)
            {
                if (!cb)
                {
                    return;
                }
                if (!result)
                {
                    cb(Result<void>::failure(result.error()));
                    return;
                }
                cb(Result<void>::success());
            });
}

bridge::HostMetadata JsonChannel::metadata() const
{
    return metadata_;
}

void JsonChannel::set_metadata(bridge::HostMetadata metadata)
{
    metadata_ = std::move(metadata);
}

std::size_t JsonChannel::pending_requests() const noexcept
{
    return pending_.size();
}

std::size_t JsonChannel::active_listeners() const noexcept
{
    return listeners_.size();
}

} // namespace wb::rpc
