#include "config/BridgeSettings.hpp"

#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <utility>

namespace wb::config
{

namespace
{

std::optional<std::string> read_env(char const *key)
{
    auto value = std::getenv(key);
    if (value == nullptr)
    {
        return std::nullopt;
    }
    return std::string(value);
}

std::string trim_whitespace(std::string value)
{
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
    {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

} // namespace

std::optional<bool> parse_bool(std::string_view value)
{
    if (value.empty())
    {
        return std::nullopt;
    }
    if (value == "1")
    {
        return true;
    }
    if (value == "0")
    {
        return false;
    }
    std::string lowercase(value);
    std::transform(lowercase.begin(), lowercase.end(), lowercase.begin(),
                   [](unsigned char ch)
                   {
                       return static_cast<char>(std::tolower(ch));
                   });
    if (lowercase == "true" || lowercase == "yes")
    {
        return true;
    }
    if (lowercase == "false" || lowercase == "no")
    {
        return false;
    }
    return std::nullopt;
}

BridgeSettings load_settings_from_env(BridgeSettings defaults)
{
    auto result = std::move(defaults);
    if (auto ns = read_env("WB_COMMAND_NAMESPACE"))
    {
        auto trimmed = trim_whitespace(*ns);
        if (!trimmed.empty())
        {
            result.command_namespace = std::move(trimmed);
        }
    }
    if (auto ns = read_env("WB_EVENT_NAMESPACE"))
    {
        auto trimmed = trim_whitespace(*ns);
        if (!trimmed.empty())
        {
            result.event_namespace = std::move(trimmed);
        }
    }
    if (auto path = read_env("WB_LOG_FILE"))
    {
        auto trimmed = trim_whitespace(*path);
        if (!trimmed.empty())
        {
            result.log_file = std::filesystem::path(trimmed);
        }
    }
    if (auto trace = read_env("WB_TRACE_COMMANDS"))
    {
        if (auto parsed = parse_bool(trim_whitespace(*trace)))
        {
            result.trace_commands = *parsed;
        }
        else
        {
            WB_LOG_WARN("ignoring WB_TRACE_COMMANDS={}", *trace);
        }
    }
    return result;
}

BridgeSettings parse_settings_json(std::string_view text,
                                   BridgeSettings defaults)
{
    auto result = std::move(defaults);
    auto doc = wb::json::Document::parse(text);
    if (!doc.is_valid() || !yyjson_is_obj(doc.root()))
    {
        WB_LOG_WARN("bridge settings: expected a JSON object");
        return result;
    }
    auto *root = doc.root();
    if (auto ns = wb::json::get_string(root, "commandNamespace");
        ns && !ns->empty())
    {
        result.command_namespace = std::move(*ns);
    }
    if (auto ns = wb::json::get_string(root, "eventNamespace");
        ns && !ns->empty())
    {
        result.event_namespace = std::move(*ns);
    }
    if (auto path = wb::json::get_string(root, "logFile"); path && !path->empty())
    {
        result.log_file = std::filesystem::path(*path);
    }
    if (auto trace = wb::json::get_bool(root, "traceCommands"))
    {
        result.trace_commands = *trace;
    }
    return result;
}

void apply_settings(BridgeSettings const &settings)
{
    if (settings.log_file)
    {
        wb::log::set_log_file(*settings.log_file);
    }
}

} // namespace wb::config
