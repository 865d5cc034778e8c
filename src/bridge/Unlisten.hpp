#pragma once

#include <functional>
#include <memory>
#include <vector>

namespace wb::bridge
{

// Removes one registration. Copies share state, so whichever copy runs
// first performs the removal and every later call is a no-op.
class Unlisten
{
  public:
    Unlisten() = default;
    explicit Unlisten(std::function<void()> action);

    void operator()() const;

    // True until the removal has run.
    bool active() const noexcept;
    explicit operator bool() const noexcept;

    static Unlisten combine(std::vector<Unlisten> parts);

  private:
    struct State
    {
        std::function<void()> action;
        bool done = false;
    };
    std::shared_ptr<State> state_;
};

} // namespace wb::bridge
