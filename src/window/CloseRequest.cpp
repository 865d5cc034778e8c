#include "window/CloseRequest.hpp"

#include "utils/Log.hpp"

#include <utility>

namespace wb::window
{

CloseRequestedEvent::CloseRequestedEvent(bridge::Event const &event)
    : event_(event.event), window_label_(event.window_label), id_(event.id)
{
}

std::string const &CloseRequestedEvent::event() const noexcept
{
    return event_;
}

std::string const &CloseRequestedEvent::window_label() const noexcept
{
    return window_label_;
}

std::int64_t CloseRequestedEvent::id() const noexcept
{
    return id_;
}

void CloseRequestedEvent::prevent_default() noexcept
{
    prevent_default_ = true;
}

bool CloseRequestedEvent::is_prevent_default() const noexcept
{
    return prevent_default_;
}

char const *to_string(CloseState state) noexcept
{
    switch (state)
    {
    case CloseState::Requested:
        return "requested";
    case CloseState::Proceeding:
        return "proceeding";
    case CloseState::Cancelled:
        return "cancelled";
    }
    return "requested";
}

CloseNegotiation::CloseNegotiation(bridge::Event const &event,
                                   CloseAction close)
    : event_(event), close_(std::move(close))
{
}

CloseRequestedEvent &CloseNegotiation::event() noexcept
{
    return event_;
}

CloseState CloseNegotiation::state() const noexcept
{
    return state_;
}

void CloseNegotiation::resolve()
{
    if (state_ != CloseState::Requested)
    {
        WB_LOG_DEBUG("close negotiation for {} already {}",
                     event_.window_label(), to_string(state_));
        return;
    }
    if (event_.is_prevent_default())
    {
        state_ = CloseState::Cancelled;
        WB_LOG_DEBUG("close of {} cancelled by handler", event_.window_label());
        return;
    }
    state_ = CloseState::Proceeding;
    WB_LOG_DEBUG("close of {} proceeding", event_.window_label());
    if (!close_)
    {
        return;
    }
    auto label = event_.window_label();
    close_(
        [label](Result<void> result)
        {
            if (!result)
            {
                WB_LOG_WARN("close of {} failed: {}", label,
                            result.error().message);
            }
        });
}

} // namespace wb::window
