#include "window/Monitors.hpp"

#include "bridge/CommandInvoker.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace wb::window
{

namespace
{

template <typename T>
void query(std::shared_ptr<bridge::HostChannel> channel,
           config::BridgeSettings const &settings, std::string_view verb,
           Result<T> (*decode)(std::string const &), Callback<T> cb)
{
    bridge::CommandInvoker invoker(std::move(channel), std::string(),
                                   settings);
    invoker.invoke_raw(verb, "{}",
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

} // namespace

void current_monitor(std::shared_ptr<bridge::HostChannel> channel,
                     config::BridgeSettings const &settings,
                     Callback<std::optional<geometry::Monitor>> cb)
{
    query<std::optional<geometry::Monitor>>(std::move(channel), settings,
                                            "current_monitor",
                                            &geometry::decode_monitor,
                                            std::move(cb));
}

void primary_monitor(std::shared_ptr<bridge::HostChannel> channel,
                     config::BridgeSettings const &settings,
                     Callback<std::optional<geometry::Monitor>> cb)
{
    query<std::optional<geometry::Monitor>>(std::move(channel), settings,
                                            "primary_monitor",
                                            &geometry::decode_monitor,
                                            std::move(cb));
}

void available_monitors(std::shared_ptr<bridge::HostChannel> channel,
                        config::BridgeSettings const &settings,
                        Callback<std::vector<geometry::Monitor>> cb)
{
    query<std::vector<geometry::Monitor>>(std::move(channel), settings,
                                          "available_monitors",
                                          &geometry::decode_monitors,
                                          std::move(cb));
}

} // namespace wb::window
