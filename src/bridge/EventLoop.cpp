#include "bridge/EventLoop.hpp"

#include "utils/Log.hpp"

#include <exception>
#include <utility>

namespace wb::bridge
{

void EventLoop::post(std::function<void()> task)
{
    if (!task)
    {
        return;
    }
    tasks_.push_back(std::move(task));
}

bool EventLoop::run_one()
{
    if (tasks_.empty())
    {
        return false;
    }
    auto task = std::move(tasks_.front());
    tasks_.pop_front();
    try
    {
        task();
    }
    catch (std::exception const &ex)
    {
        WB_LOG_WARN("event loop task exception: {}", ex.what());
    }
    return true;
}

std::size_t EventLoop::run_pending()
{
    std::size_t count = 0;
    while (run_one())
    {
        ++count;
    }
    return count;
}

bool EventLoop::empty() const noexcept
{
    return tasks_.empty();
}

std::size_t EventLoop::size() const noexcept
{
    return tasks_.size();
}

} // namespace wb::bridge
