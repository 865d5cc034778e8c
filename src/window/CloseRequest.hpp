#pragma once

#include "bridge/Event.hpp"
#include "bridge/Result.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace wb::window
{

// Built fresh for every close-requested delivery. The decision is read
// once, after the handler has settled.
class CloseRequestedEvent
{
  public:
    explicit CloseRequestedEvent(bridge::Event const &event);

    std::string const &event() const noexcept;
    std::string const &window_label() const noexcept;
    std::int64_t id() const noexcept;

    void prevent_default() noexcept;
    bool is_prevent_default() const noexcept;

  private:
    std::string event_;
    std::string window_label_;
    std::int64_t id_ = 0;
    bool prevent_default_ = false;
};

enum class CloseState
{
    Requested,
    Proceeding,
    Cancelled,
};

char const *to_string(CloseState state) noexcept;

// One negotiation per delivery. Overlapping deliveries each get their own
// instance and are never coalesced.
class CloseNegotiation
{
  public:
    using CloseAction = std::function<void(Callback<void>)>;

    CloseNegotiation(bridge::Event const &event, CloseAction close);

    CloseRequestedEvent &event() noexcept;
    CloseState state() const noexcept;

    // Requested -> Cancelled when the handler prevented the default,
    // Requested -> Proceeding plus one close command otherwise. Later calls
    // do nothing.
    void resolve();

  private:
    CloseRequestedEvent event_;
    CloseAction close_;
    CloseState state_ = CloseState::Requested;
};

using CloseRequestedHandler = std::function<void(CloseRequestedEvent &)>;

// The handler owns `done` and calls it when it has made up its mind; the
// event stays alive until then. If `done` is never called the window is
// never closed.
using AsyncCloseRequestedHandler =
    std::function<void(CloseRequestedEvent &, std::function<void()> done)>;

} // namespace wb::window
