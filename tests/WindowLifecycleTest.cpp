#include "BridgeTestUtils.hpp"
#include "bridge/EventNames.hpp"
#include "window/Monitors.hpp"
#include "window/Window.hpp"

#include <doctest/doctest.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace
{

using namespace wb::tests;
using wb::bridge::Event;
using wb::bridge::Unlisten;
using wb::window::Window;

std::string const kCreated(wb::bridge::kHandleCreated);
std::string const kCreateError(wb::bridge::kHandleCreateError);
std::string const kCreate = "plugin:window|create";

void listen_local(Window &window, std::string const &event,
                  wb::bridge::EventHandler handler)
{
    Capture<Unlisten> capture;
    window.once(event, std::move(handler), capture.callback());
    REQUIRE(capture.ok());
}

} // namespace

TEST_CASE("handle-created reaches listeners registered before the reply")
{
    LoopbackHarness harness;
    harness.loopback.defer(kCreate);
    wb::window::WindowOptions options;
    options.title = "Settings";
    options.width = 400;
    options.height = 300;
    Window window(harness.channel, "w1", options);

    std::vector<Event> created;
    int errors = 0;
    listen_local(window, kCreated,
                 [&](Event const &event) { created.push_back(event); });
    listen_local(window, kCreateError, [&](Event const &) { ++errors; });
    harness.run();
    CHECK(created.empty());
    CHECK(harness.loopback.command_count(kCreate) == 1);

    harness.loopback.release(kCreate);
    harness.run();
    REQUIRE(created.size() == 1);
    CHECK(created[0].window_label == "w1");
    CHECK(created[0].id == wb::bridge::kLocalEventId);
    CHECK(errors == 0);

    auto const *state = harness.loopback.window("w1");
    REQUIRE(state != nullptr);
    CHECK(state->title == "Settings");
    CHECK(state->size == wb::geometry::PhysicalSize{400, 300});
}

TEST_CASE("a failed creation only fires handle-create-error")
{
    LoopbackHarness harness;
    harness.add_window("w1");
    Window duplicate(harness.channel, "w1");

    int created = 0;
    std::vector<std::string> errors;
    listen_local(duplicate, kCreated, [&](Event const &) { ++created; });
    listen_local(duplicate, kCreateError,
                 [&](Event const &event) { errors.push_back(event.payload); });
    harness.run();

    CHECK(created == 0);
    REQUIRE(errors.size() == 1);
    CHECK(errors[0] == R"("a window with label `w1` already exists")");
}

TEST_CASE("creation events stay on the creating handle")
{
    LoopbackHarness harness;
    harness.loopback.defer(kCreate);
    Window creator(harness.channel, "w1");
    auto alias = Window::attach(harness.channel, "w1");

    int creator_calls = 0;
    int alias_calls = 0;
    listen_local(creator, kCreated, [&](Event const &) { ++creator_calls; });
    listen_local(*alias, kCreated, [&](Event const &) { ++alias_calls; });
    harness.loopback.release(kCreate);
    harness.run();

    CHECK(creator_calls == 1);
    CHECK(alias_calls == 0);
}

TEST_CASE("the creation outcome is harmless once the handle is gone")
{
    LoopbackHarness harness;
    {
        Window window(harness.channel, "w1");
    }
    CHECK_NOTHROW(harness.run());
    CHECK(harness.loopback.window("w1") != nullptr);
}

TEST_CASE("the async factory resolves to a handle or a CreationError")
{
    LoopbackHarness harness;
    Capture<std::unique_ptr<Window>> created;
    Window::create(harness.channel, "w2", {}, {}, created.callback());
    harness.run();
    REQUIRE(created.ok());
    REQUIRE(created.result->value() != nullptr);
    CHECK(created.result->value()->label() == "w2");

    Capture<std::unique_ptr<Window>> duplicate;
    Window::create(harness.channel, "w2", {}, {}, duplicate.callback());
    harness.run();
    REQUIRE(duplicate.result.has_value());
    REQUIRE_FALSE(duplicate.result->ok());
    CHECK(duplicate.result->error().kind == wb::ErrorKind::CreationError);
}

TEST_CASE("getters and mutators round trip through the host")
{
    LoopbackHarness harness;
    harness.add_window("w1");
    auto window = Window::attach(harness.channel, "w1");

    window->set_title("Editor");
    window->set_resizable(false);
    window->set_position("Physical", 10, 20);
    window->maximize();
    Capture<std::string> title;
    Capture<bool> resizable;
    Capture<bool> maximized;
    Capture<wb::geometry::PhysicalPosition> position;
    Capture<std::optional<wb::window::Theme>> theme;
    window->title(title.callback());
    window->is_resizable(resizable.callback());
    window->is_maximized(maximized.callback());
    window->inner_position(position.callback());
    window->theme(theme.callback());
    harness.run();

    REQUIRE(title.ok());
    CHECK(title.result->value() == "Editor");
    REQUIRE(resizable.ok());
    CHECK_FALSE(resizable.result->value());
    REQUIRE(maximized.ok());
    CHECK(maximized.result->value());
    REQUIRE(position.ok());
    CHECK(position.result->value() == wb::geometry::PhysicalPosition{10, 20});
    REQUIRE(theme.ok());
    CHECK_FALSE(theme.result->value().has_value());
}

TEST_CASE("extended mutators reach the host")
{
    LoopbackHarness harness;
    harness.add_window("w1");
    auto window = Window::attach(harness.channel, "w1");

    wb::window::Effects effects;
    effects.effects = {wb::window::Effect::Mica};
    effects.state = wb::window::EffectState::Active;
    window->set_effects(effects);
    window->set_cursor_icon(wb::window::CursorIcon::NotAllowed);
    window->set_icon(std::vector<std::uint8_t>{1, 2, 3});
    window->set_min_size(wb::geometry::Size{wb::geometry::LogicalSize{50, 40}});
    window->request_user_attention(wb::window::UserAttentionType::Critical);
    Capture<void> cleared;
    window->set_max_size(std::nullopt);
    window->clear_effects(cleared.callback());
    harness.run();

    REQUIRE(cleared.ok());
    auto const *state = harness.loopback.window("w1");
    REQUIRE(state != nullptr);
    CHECK(state->cursor_icon == "notAllowed");
    CHECK(state->icon == "[1,2,3]");
    CHECK(state->effects == "null");
    CHECK(state->attention == R"({"type":"Critical"})");
    REQUIRE(state->min_size.has_value());
    CHECK(*state->min_size == wb::geometry::PhysicalSize{50, 40});
    CHECK_FALSE(state->max_size.has_value());
}

TEST_CASE("commands for unknown labels fail with HostError")
{
    LoopbackHarness harness;
    auto window = Window::attach(harness.channel, "ghost");
    Capture<bool> visible;
    Capture<void> hidden;
    window->is_visible(visible.callback());
    window->hide(hidden.callback());
    harness.run();

    REQUIRE(visible.result.has_value());
    CHECK(visible.result->error().kind == wb::ErrorKind::HostError);
    CHECK(visible.result->error().message == "window not found");
    REQUIRE(hidden.result.has_value());
    CHECK_FALSE(hidden.result->ok());
}

TEST_CASE("lookups use the host metadata")
{
    LoopbackHarness harness;
    harness.add_window("main");
    harness.add_window("aux");
    harness.refresh_metadata("main");

    CHECK(wb::window::current_window(harness.channel)->label() == "main");
    CHECK(Window::get_by_label(harness.channel, "aux") != nullptr);
    CHECK(Window::get_by_label(harness.channel, "missing") == nullptr);
    auto windows = wb::window::all_windows(harness.channel);
    REQUIRE(windows.size() == 2);
    CHECK(windows[1]->label() == "aux");

    Capture<std::unique_ptr<Window>> none;
    wb::window::focused_window(harness.channel, {}, none.callback());
    harness.run();
    REQUIRE(none.ok());
    CHECK(none.result->value() == nullptr);

    windows[1]->set_focus();
    harness.run();
    Capture<std::unique_ptr<Window>> focused;
    wb::window::focused_window(harness.channel, {}, focused.callback());
    harness.run();
    REQUIRE(focused.ok());
    REQUIRE(focused.result->value() != nullptr);
    CHECK(focused.result->value()->label() == "aux");
}

TEST_CASE("monitor queries return physical descriptors")
{
    LoopbackHarness harness;
    wb::geometry::Monitor laptop;
    laptop.name = "eDP-1";
    laptop.scale_factor = 2.0;
    laptop.size = {2880, 1800};
    wb::geometry::Monitor external;
    external.scale_factor = 1.0;
    external.position = {2880, 0};
    external.size = {1920, 1080};
    harness.loopback.set_monitors({laptop, external}, 1);

    Capture<std::optional<wb::geometry::Monitor>> current;
    Capture<std::optional<wb::geometry::Monitor>> primary;
    Capture<std::vector<wb::geometry::Monitor>> all;
    wb::window::current_monitor(harness.channel, {}, current.callback());
    wb::window::primary_monitor(harness.channel, {}, primary.callback());
    wb::window::available_monitors(harness.channel, {}, all.callback());
    harness.run();

    REQUIRE(current.ok());
    REQUIRE(current.result->value().has_value());
    CHECK(current.result->value()->name == std::string("eDP-1"));
    REQUIRE(primary.ok());
    REQUIRE(primary.result->value().has_value());
    CHECK_FALSE(primary.result->value()->name.has_value());
    CHECK(primary.result->value()->position ==
          wb::geometry::PhysicalPosition{2880, 0});
    REQUIRE(all.ok());
    CHECK(all.result->value().size() == 2);

    auto logical = wb::geometry::to_logical(laptop.size, laptop.scale_factor);
    CHECK(logical.width == doctest::Approx(1440));

    harness.loopback.set_monitors({}, std::nullopt);
    Capture<std::optional<wb::geometry::Monitor>> missing;
    wb::window::primary_monitor(harness.channel, {}, missing.callback());
    harness.run();
    REQUIRE(missing.ok());
    CHECK_FALSE(missing.result->value().has_value());
}
