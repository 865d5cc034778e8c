#pragma once

#include "bridge/HostChannel.hpp"
#include "rpc/Serializer.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace wb::rpc
{

// HostChannel over JSON text frames. Outgoing frames go to `send`; the
// embedder feeds every frame coming back from the host into receive().
class JsonChannel : public bridge::HostChannel
{
  public:
    using Sender = std::function<void(std::string)>;

    explicit JsonChannel(Sender send, bridge::HostMetadata metadata = {});
    ~JsonChannel() override;

    JsonChannel(JsonChannel const &) = delete;
    JsonChannel &operator=(JsonChannel const &) = delete;

    void receive(std::string_view frame);

    void invoke(std::string const &action, std::string arguments,
                Callback<std::string> cb) override;
    void listen(std::string const &event, std::string const &target,
                bridge::EventHandler handler,
                Callback<bridge::Unlisten> cb) override;
    void once(std::string const &event, std::string const &target,
              bridge::EventHandler handler,
              Callback<bridge::Unlisten> cb) override;
    void emit(std::string const &event, std::string const &target,
              std::string payload, Callback<void> cb) override;

    bridge::HostMetadata metadata() const override;
    void set_metadata(bridge::HostMetadata metadata);

    std::size_t pending_requests() const noexcept;
    std::size_t active_listeners() const noexcept;

  private:
    struct Listener
    {
        std::string event;
        bridge::EventHandler handler;
        bool once = false;
    };

    void request(std::string method, std::string arguments,
                 Callback<std::string> cb);
    void subscribe(std::string const &event, std::string const &target,
                   bridge::EventHandler handler, bool once,
                   Callback<bridge::Unlisten> cb);
    void unsubscribe(std::int64_t id);
    bridge::Unlisten make_unlisten(std::int64_t id);
    void handle_reply(ReplyFrame const &reply);
    void handle_event(EventFrame const &frame);

    Sender send_;
    bridge::HostMetadata metadata_;
    std::uint64_t next_tag_ = 1;
    std::int64_t next_listener_id_ = 1;
    std::unordered_map<std::uint64_t, Callback<std::string>> pending_;
    std::unordered_map<std::int64_t, Listener> listeners_;
    // Unlisten actions may outlive the channel.
    std::shared_ptr<int> alive_ = std::make_shared<int>(0);
};

} // namespace wb::rpc
