#pragma once

#include "bridge/Event.hpp"
#include "bridge/Result.hpp"
#include "bridge/Unlisten.hpp"

#include <string>
#include <vector>

namespace wb::bridge
{

// Window labels the embedder knows about when the client starts. The host
// injects this; it is not queried over the channel.
struct HostMetadata
{
    std::string current_label;
    std::vector<std::string> labels;
};

// The only way to reach the native host. Every call is one round trip and
// completes through its callback; no call is retried.
class HostChannel
{
  public:
    virtual ~HostChannel() = default;

    // `arguments` is a JSON object. The reply is JSON text.
    virtual void invoke(std::string const &action, std::string arguments,
                        Callback<std::string> cb) = 0;

    // Handlers are scoped to events targeted at `target`.
    virtual void listen(std::string const &event, std::string const &target,
                        EventHandler handler, Callback<Unlisten> cb) = 0;

    // Like listen, but the handler runs at most once and is then
    // deregistered.
    virtual void once(std::string const &event, std::string const &target,
                      EventHandler handler, Callback<Unlisten> cb) = 0;

    virtual void emit(std::string const &event, std::string const &target,
                      std::string payload, Callback<void> cb) = 0;

    virtual HostMetadata metadata() const = 0;
};

} // namespace wb::bridge
