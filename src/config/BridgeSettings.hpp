#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace wb::config
{

struct BridgeSettings
{
    // Actions are sent as "<command_namespace>|<verb>".
    std::string command_namespace = "plugin:window";
    // Remote events are named "<event_namespace>://<kind>".
    std::string event_namespace = "window";
    std::optional<std::filesystem::path> log_file;
    bool trace_commands = false;
};

// Reads WB_COMMAND_NAMESPACE, WB_EVENT_NAMESPACE, WB_LOG_FILE and
// WB_TRACE_COMMANDS. Unset or unparsable variables keep the defaults.
BridgeSettings load_settings_from_env(BridgeSettings defaults = {});

// Same keys in camelCase inside a JSON object.
BridgeSettings parse_settings_json(std::string_view text,
                                   BridgeSettings defaults = {});

void apply_settings(BridgeSettings const &settings);

std::optional<bool> parse_bool(std::string_view value);

} // namespace wb::config
