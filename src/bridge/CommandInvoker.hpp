#pragma once

#include "bridge/HostChannel.hpp"
#include "bridge/Result.hpp"
#include "config/BridgeSettings.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

struct yyjson_val;

namespace wb::bridge
{

// Turns (label, verb, optional value) into one request to the host. Calls
// are at-most-once: nothing here retries or times out.
class CommandInvoker
{
  public:
    CommandInvoker(std::shared_ptr<HostChannel> channel, std::string label,
                   config::BridgeSettings settings = {});

    // "<namespace>|<verb>"
    std::string action(std::string_view verb) const;

    // Sends {"label": ..., "value": ...}; `value` is JSON text and is left
    // out when absent.
    void invoke(std::string_view verb, std::optional<std::string> value,
                Callback<std::string> cb) const;

    // Sends `arguments` verbatim.
    void invoke_raw(std::string_view verb, std::string arguments,
                    Callback<std::string> cb) const;

    // Replies are decoded; a reply of the wrong shape fails with
    // ProtocolError.
    template <typename T>
    void invoke_as(std::string_view verb, std::optional<std::string> value,
                   Result<T> (*decode)(std::string const &),
                   std::type_identity_t<Callback<T>> cb) const
    {
        invoke(verb, std::move(value),
               [decode, cb = std::move(cb)](Result<std::string> reply)
               {
                   if (!cb)
                   {
                       return;
                   }
                   if (!reply)
                   {
                       cb(Result<T>::failure(reply.error()));
                       return;
                   }
                   cb(decode(reply.value()));
               });
    }

    // For commands whose reply carries nothing of interest.
    void invoke_void(std::string_view verb, std::optional<std::string> value,
                     Callback<void> cb) const;

    std::string const &label() const noexcept;
    config::BridgeSettings const &settings() const noexcept;
    std::shared_ptr<HostChannel> const &channel() const noexcept;

  private:
    std::shared_ptr<HostChannel> channel_;
    std::string label_;
    config::BridgeSettings settings_;
};

std::string make_arguments(std::string_view label,
                           std::optional<std::string> const &value);

Result<bool> decode_bool(std::string const &json);
Result<double> decode_number(std::string const &json);
Result<std::string> decode_string(std::string const &json);
Result<std::optional<std::string>> decode_optional_string(
    std::string const &json);

} // namespace wb::bridge
