#include "BridgeTestUtils.hpp"
#include "window/CloseRequest.hpp"
#include "window/Window.hpp"

#include <doctest/doctest.h>

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

using namespace wb::tests;
using wb::window::CloseRequestedEvent;
using wb::window::CloseState;

std::string const kCloseRequested = "window://close-requested";
std::string const kClose = "plugin:window|close";

struct CloseFixture
{
    std::shared_ptr<ScriptedChannel> channel =
        std::make_shared<ScriptedChannel>();
    std::unique_ptr<wb::window::Window> window =
        wb::window::Window::attach(channel, "w1");

    void request_close()
    {
        channel->deliver(kCloseRequested, "w1");
    }
};

} // namespace

TEST_CASE("a handler that does not prevent default closes exactly once")
{
    CloseFixture fixture;
    int seen = 0;
    Capture<wb::bridge::Unlisten> capture;
    fixture.window->on_close_requested(
        [&](CloseRequestedEvent &event)
        {
            ++seen;
            CHECK(event.window_label() == "w1");
            CHECK_FALSE(event.is_prevent_default());
        },
        capture.callback());
    REQUIRE(capture.ok());

    fixture.request_close();
    CHECK(seen == 1);
    CHECK(fixture.channel->count(kClose) == 1);
}

TEST_CASE("prevent_default cancels the close")
{
    CloseFixture fixture;
    Capture<wb::bridge::Unlisten> capture;
    fixture.window->on_close_requested([](CloseRequestedEvent &event)
                                       { event.prevent_default(); },
                                       capture.callback());

    fixture.request_close();
    CHECK(fixture.channel->count(kClose) == 0);
}

TEST_CASE("the decision is read only after an async handler settles")
{
    CloseFixture fixture;
    std::vector<std::function<void()>> pending;
    std::vector<CloseRequestedEvent *> events;
    Capture<wb::bridge::Unlisten> capture;
    fixture.window->on_close_requested_async(
        [&](CloseRequestedEvent &event, std::function<void()> done)
        {
            events.push_back(&event);
            pending.push_back(std::move(done));
        },
        capture.callback());

    fixture.request_close();
    REQUIRE(pending.size() == 1);
    CHECK(fixture.channel->count(kClose) == 0);

    events[0]->prevent_default();
    pending[0]();
    CHECK(fixture.channel->count(kClose) == 0);

    fixture.request_close();
    REQUIRE(pending.size() == 2);
    pending[1]();
    pending[1]();
    CHECK(fixture.channel->count(kClose) == 1);
}

TEST_CASE("overlapping close requests negotiate independently")
{
    CloseFixture fixture;
    std::vector<std::function<void()>> pending;
    std::vector<CloseRequestedEvent *> events;
    Capture<wb::bridge::Unlisten> capture;
    fixture.window->on_close_requested_async(
        [&](CloseRequestedEvent &event, std::function<void()> done)
        {
            events.push_back(&event);
            pending.push_back(std::move(done));
        },
        capture.callback());

    fixture.request_close();
    fixture.request_close();
    REQUIRE(pending.size() == 2);
    CHECK(events[0] != events[1]);

    events[0]->prevent_default();
    pending[1]();
    pending[0]();
    CHECK(fixture.channel->count(kClose) == 1);
}

TEST_CASE("a throwing handler leaves the window open")
{
    CloseFixture fixture;
    Capture<wb::bridge::Unlisten> capture;
    fixture.window->on_close_requested([](CloseRequestedEvent &)
                                       { throw std::runtime_error("veto"); },
                                       capture.callback());

    CHECK_THROWS_AS(fixture.request_close(), std::runtime_error);
    CHECK(fixture.channel->count(kClose) == 0);
}

TEST_CASE("unlisten stops close negotiation")
{
    CloseFixture fixture;
    Capture<wb::bridge::Unlisten> capture;
    fixture.window->on_close_requested([](CloseRequestedEvent &) {},
                                       capture.callback());
    REQUIRE(capture.ok());

    capture.result->value()();
    fixture.request_close();
    CHECK(fixture.channel->count(kClose) == 0);
}

TEST_CASE("negotiation state machine is one-shot")
{
    int closes = 0;
    wb::bridge::Event delivery{kCloseRequested, "w1", 7, "null"};

    wb::window::CloseNegotiation proceed(delivery,
                                         [&](wb::Callback<void> done)
                                         {
                                             ++closes;
                                             done(wb::Result<void>::success());
                                         });
    CHECK(proceed.state() == CloseState::Requested);
    CHECK(proceed.event().id() == 7);
    proceed.resolve();
    proceed.event().prevent_default();
    proceed.resolve();
    CHECK(proceed.state() == CloseState::Proceeding);
    CHECK(closes == 1);

    wb::window::CloseNegotiation cancel(delivery,
                                        [&](wb::Callback<void>) { ++closes; });
    cancel.event().prevent_default();
    cancel.resolve();
    CHECK(cancel.state() == CloseState::Cancelled);
    CHECK(closes == 1);
}

TEST_CASE("close over the loopback host removes the window")
{
    LoopbackHarness harness;
    harness.add_window("w1");
    auto window = wb::window::Window::attach(harness.channel, "w1");
    Capture<wb::bridge::Unlisten> capture;
    window->on_close_requested([](CloseRequestedEvent &) {},
                               capture.callback());
    harness.run();
    REQUIRE(capture.ok());

    harness.loopback.emit_window_event(
        "w1", wb::bridge::RemoteEvent::CloseRequested);
    harness.run();
    CHECK(harness.loopback.command_count(kClose) == 1);
    CHECK(harness.loopback.window("w1") == nullptr);
}
