#pragma once

#include "bridge/Event.hpp"
#include "bridge/HostChannel.hpp"
#include "bridge/Result.hpp"
#include "bridge/Unlisten.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace wb::bridge
{

// Handlers for the local bootstrap events of one handle. Never shared
// between handles, even handles with the same label.
class LocalListeners
{
  public:
    std::uint64_t add(std::string const &event, EventHandler handler,
                      bool once);
    void remove(std::string const &event, std::uint64_t id);

    // Runs a snapshot of the handlers registered for `event.event`, in
    // registration order. An exception from a handler stops the pass and
    // propagates to the caller.
    void dispatch(Event const &event);

    std::size_t count(std::string const &event) const;

  private:
    struct Entry
    {
        std::uint64_t id = 0;
        std::shared_ptr<EventHandler> handler;
        // Shared with every snapshot holding this entry.
        std::shared_ptr<bool> fired;
    };

    std::unordered_map<std::string, std::vector<Entry>> entries_;
    std::uint64_t next_id_ = 1;
};

// Routes listen/once/emit for one handle: local bootstrap events stay in
// process, every other event goes to the host scoped to the label.
class EventBridge
{
  public:
    EventBridge(std::shared_ptr<HostChannel> channel, std::string label);

    EventBridge(EventBridge const &) = delete;
    EventBridge &operator=(EventBridge const &) = delete;

    // Local registrations complete synchronously; remote ones complete
    // when the host acknowledges the subscription.
    void listen(std::string const &event, EventHandler handler,
                Callback<Unlisten> cb);
    void once(std::string const &event, EventHandler handler,
              Callback<Unlisten> cb);

    // Local events are dispatched before emit returns and handler
    // exceptions propagate out of emit without calling `cb`. Remote events
    // are forwarded to the host.
    void emit(std::string const &event, std::string payload = "null",
              Callback<void> cb = {});

    std::string const &label() const noexcept;
    std::size_t local_listener_count(std::string const &event) const;

    // For work that settles after the handle may be gone.
    std::weak_ptr<LocalListeners> local_listeners() const noexcept;

  private:
    Unlisten add_local(std::string const &event, EventHandler handler,
                       bool once);

    std::shared_ptr<HostChannel> channel_;
    std::string label_;
    std::shared_ptr<LocalListeners> local_;
};

} // namespace wb::bridge
