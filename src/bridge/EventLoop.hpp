#pragma once

#include <cstddef>
#include <deque>
#include <functional>

namespace wb::bridge
{

// Cooperative task queue for a single logical thread. Round trips to the
// host are modelled as tasks posted here; nothing runs until the owner
// drains the queue.
class EventLoop
{
  public:
    EventLoop() = default;
    EventLoop(EventLoop const &) = delete;
    EventLoop &operator=(EventLoop const &) = delete;

    void post(std::function<void()> task);

    // Runs tasks until the queue is empty, including tasks posted by the
    // tasks themselves. Returns how many ran.
    std::size_t run_pending();
    bool run_one();

    bool empty() const noexcept;
    std::size_t size() const noexcept;

  private:
    std::deque<std::function<void()>> tasks_;
};

} // namespace wb::bridge
