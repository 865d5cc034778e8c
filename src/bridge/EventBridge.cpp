#include "bridge/EventBridge.hpp"

#include "bridge/EventNames.hpp"

#include <algorithm>
#include <utility>

namespace wb::bridge
{

std::uint64_t LocalListeners::add(std::string const &event,
                                  EventHandler handler, bool once)
{
    auto id = next_id_++;
    Entry entry;
    entry.id = id;
    entry.handler = std::make_shared<EventHandler>(std::move(handler));
    if (once)
    {
        entry.fired = std::make_shared<bool>(false);
    }
    entries_[event].push_back(std::move(entry));
    return id;
}

void LocalListeners::remove(std::string const &event, std::uint64_t id)
{
    auto it = entries_.find(event);
    if (it == entries_.end())
    {
        return;
    }
    auto &list = it->second;
    auto found = std::find_if(list.begin(), list.end(),
                              [id](Entry const &entry)
                              { return entry.id == id; });
    if (found != list.end())
    {
        list.erase(found);
    }
    if (list.empty())
    {
        entries_.erase(it);
    }
}

void LocalListeners::dispatch(Event const &event)
{
    auto it = entries_.find(event.event);
    if (it == entries_.end())
    {
        return;
    }
    auto const snapshot = it->second;
    for (auto const &entry : snapshot)
    {
        if (entry.fired)
        {
            if (*entry.fired)
            {
                continue;
            }
            *entry.fired = true;
            remove(event.event, entry.id);
        }
        (*entry.handler)(event);
    }
}

std::size_t LocalListeners::count(std::string const &event) const
{
    auto it = entries_.find(event);
    return it == entries_.end() ? 0 : it->second.size();
}

EventBridge::EventBridge(std::shared_ptr<HostChannel> channel,
                         std::string label)
    : channel_(std::move(channel)), label_(std::move(label)),
      local_(std::make_shared<LocalListeners>())
{
}

Unlisten EventBridge::add_local(std::string const &event, EventHandler handler,
                                bool once)
{
    auto id = local_->add(event, std::move(handler), once);
    std::weak_ptr<LocalListeners> table = local_;
    return Unlisten(
        [table, event, id]()
        {
            if (auto listeners = table.lock())
            {
                listeners->remove(event, id);
            }
        });
}

void EventBridge::listen(std::string const &event, EventHandler handler,
                         Callback<Unlisten> cb)
{
    if (is_local_event(event))
    {
        auto unlisten = add_local(event, std::move(handler), false);
        if (cb)
        {
            cb(Result<Unlisten>::success(std::move(unlisten)));
        }
        return;
    }
    channel_->listen(event, label_, std::move(handler), std::move(cb));
}

void EventBridge::once(std::string const &event, EventHandler handler,
                       Callback<Unlisten> cb)
{
    if (is_local_event(event))
    {
        auto unlisten = add_local(event, std::move(handler), true);
        if (cb)
        {
            cb(Result<Unlisten>::success(std::move(unlisten)));
        }
        return;
    }
    channel_->once(event, label_, std::move(handler), std::move(cb));
}

void EventBridge::emit(std::string const &event, std::string payload,
                       Callback<void> cb)
{
    if (is_local_event(event))
    {
        local_->dispatch(Event{event, label_, kLocalEventId, std::move(payload)});
        if (cb)
        {
            cb(Result<void>::success());
        }
        return;
    }
    channel_->emit(event, label_, std::move(payload), std::move(cb));
}

std::string const &EventBridge::label() const noexcept
{
    return label_;
}

std::size_t EventBridge::local_listener_count(std::string const &event) const
{
    return local_->count(event);
}

std::weak_ptr<LocalListeners> EventBridge::local_listeners() const noexcept
{
    return local_;
}

} // namespace wb::bridge
