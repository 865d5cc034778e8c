#include "bridge/Unlisten.hpp"

#include <utility>

namespace wb::bridge
{

Unlisten::Unlisten(std::function<void()> action)
    : state_(std::make_shared<State>())
{
    state_->action = std::move(action);
}

void Unlisten::operator()() const
{
    if (!state_ || state_->done)
    {
        return;
    }
    state_->done = true;
    auto action = std::move(state_->action);
    state_->action = nullptr;
    if (action)
    {
        action();
    }
}

bool Unlisten::active() const noexcept
{
    return state_ && !state_->done;
}

Unlisten::operator bool() const noexcept
{
    return state_ != nullptr;
}

Unlisten Unlisten::combine(std::vector<Unlisten> parts)
{
    return Unlisten(
        [parts = std::move(parts)]()
        {
            for (auto const &part : parts)
            {
                part();
            }
        });
}

} // namespace wb::bridge
