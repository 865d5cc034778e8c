#include "BridgeTestUtils.hpp"
#include "config/BridgeSettings.hpp"
#include "utils/Log.hpp"
#include "window/Window.hpp"

#include <doctest/doctest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace
{

struct ScopedEnv
{
    ScopedEnv(char const *key, char const *value) : key_(key)
    {
        ::setenv(key, value, 1);
    }

    ~ScopedEnv()
    {
        ::unsetenv(key_);
    }

    char const *key_;
};

} // namespace

TEST_CASE("bool parsing accepts common spellings")
{
    using wb::config::parse_bool;
    CHECK(parse_bool("1") == true);
    CHECK(parse_bool("YES") == true);
    CHECK(parse_bool("True") == true);
    CHECK(parse_bool("0") == false);
    CHECK(parse_bool("no") == false);
    CHECK_FALSE(parse_bool("maybe").has_value());
    CHECK_FALSE(parse_bool("").has_value());
}

TEST_CASE("settings load from the environment")
{
    ScopedEnv commands("WB_COMMAND_NAMESPACE", " plugin:shell ");
    ScopedEnv events("WB_EVENT_NAMESPACE", "shell");
    ScopedEnv trace("WB_TRACE_COMMANDS", "yes");
    ScopedEnv log("WB_LOG_FILE", "bridge-test.log");

    auto settings = wb::config::load_settings_from_env();
    CHECK(settings.command_namespace == "plugin:shell");
    CHECK(settings.event_namespace == "shell");
    CHECK(settings.trace_commands);
    REQUIRE(settings.log_file.has_value());
    CHECK(*settings.log_file == std::filesystem::path("bridge-test.log"));
}

TEST_CASE("unparsable environment values keep the defaults")
{
    ScopedEnv trace("WB_TRACE_COMMANDS", "sometimes");
    ScopedEnv commands("WB_COMMAND_NAMESPACE", "   ");
    wb::config::BridgeSettings defaults;
    defaults.trace_commands = true;

    auto settings = wb::config::load_settings_from_env(defaults);
    CHECK(settings.trace_commands);
    CHECK(settings.command_namespace == "plugin:window");
}

TEST_CASE("settings parse from JSON")
{
    auto settings = wb::config::parse_settings_json(
        R"({"commandNamespace":"plugin:alt","eventNamespace":"alt",)"
        R"("traceCommands":true})");
    CHECK(settings.command_namespace == "plugin:alt");
    CHECK(settings.event_namespace == "alt");
    CHECK(settings.trace_commands);
    CHECK_FALSE(settings.log_file.has_value());

    auto fallback = wb::config::parse_settings_json("[oops");
    CHECK(fallback.command_namespace == "plugin:window");
    CHECK(fallback.event_namespace == "window");
}

TEST_CASE("namespaces flow into actions and event names")
{
    wb::config::BridgeSettings settings;
    settings.command_namespace = "plugin:alt";
    settings.event_namespace = "alt";
    wb::tests::LoopbackHarness harness(settings);
    harness.add_window("w1");
    auto window = wb::window::Window::attach(harness.channel, "w1", settings);

    int moves = 0;
    wb::tests::Capture<wb::bridge::Unlisten> capture;
    window->on_moved([&](wb::bridge::TypedEvent<
                         wb::geometry::PhysicalPosition> const &) { ++moves; },
                     capture.callback());
    window->set_position("Logical", 1, 1);
    harness.run();

    CHECK(harness.loopback.command_count("plugin:alt|set_position") == 1);
    CHECK(harness.loopback.listener_count("alt://moved", "w1") == 1);
    CHECK(moves == 1);
}

TEST_CASE("apply_settings redirects the log file")
{
    auto path = std::filesystem::temp_directory_path() / "windowbridge-log-test";
    std::error_code ec;
    std::filesystem::remove(path, ec);

    wb::config::BridgeSettings settings;
    settings.log_file = path;
    wb::config::apply_settings(settings);
    WB_LOG_INFO("log redirect check {}", 1);
#if WB_LOGGING_ACTIVE
    std::ifstream in(path);
    std::string line;
    std::getline(in, line);
    CHECK(line.find("log redirect check 1") != std::string::npos);
#endif

    wb::log::set_log_file("windowbridge.log");
    std::filesystem::remove(path, ec);
}
