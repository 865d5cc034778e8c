#pragma once

#include "bridge/HostChannel.hpp"
#include "bridge/Result.hpp"
#include "config/BridgeSettings.hpp"
#include "geometry/Monitor.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace wb::window
{

// Monitor queries are not tied to a window label. Every call returns
// fresh descriptors; positions and sizes are physical.
void current_monitor(std::shared_ptr<bridge::HostChannel> channel,
                     config::BridgeSettings const &settings,
                     Callback<std::optional<geometry::Monitor>> cb);
void primary_monitor(std::shared_ptr<bridge::HostChannel> channel,
                     config::BridgeSettings const &settings,
                     Callback<std::optional<geometry::Monitor>> cb);
void available_monitors(std::shared_ptr<bridge::HostChannel> channel,
                        config::BridgeSettings const &settings,
                        Callback<std::vector<geometry::Monitor>> cb);

} // namespace wb::window
