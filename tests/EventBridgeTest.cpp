#include "BridgeTestUtils.hpp"
#include "bridge/EventBridge.hpp"
#include "bridge/EventLoop.hpp"
#include "bridge/EventNames.hpp"

#include <doctest/doctest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

using namespace wb::tests;
using wb::bridge::Event;
using wb::bridge::EventBridge;
using wb::bridge::Unlisten;

std::string const kCreated(wb::bridge::kHandleCreated);
std::string const kCreateError(wb::bridge::kHandleCreateError);

Unlisten listen_now(EventBridge &bridge, std::string const &event,
                    wb::bridge::EventHandler handler)
{
    Capture<Unlisten> capture;
    bridge.listen(event, std::move(handler), capture.callback());
    REQUIRE(capture.ok());
    return capture.result->value();
}

Unlisten once_now(EventBridge &bridge, std::string const &event,
                  wb::bridge::EventHandler handler)
{
    Capture<Unlisten> capture;
    bridge.once(event, std::move(handler), capture.callback());
    REQUIRE(capture.ok());
    return capture.result->value();
}

} // namespace

TEST_CASE("local handlers run in registration order")
{
    auto channel = std::make_shared<ScriptedChannel>();
    EventBridge bridge(channel, "w1");
    std::vector<std::string> calls;
    listen_now(bridge, kCreated, [&](Event const &) { calls.push_back("h1"); });
    listen_now(bridge, kCreated, [&](Event const &) { calls.push_back("h2"); });

    bridge.emit(kCreated);
    CHECK(calls == std::vector<std::string>{"h1", "h2"});
    CHECK(channel->emitted.empty());
}

TEST_CASE("local envelope carries the label and no real id")
{
    auto channel = std::make_shared<ScriptedChannel>();
    EventBridge bridge(channel, "w1");
    Event seen;
    listen_now(bridge, kCreateError, [&](Event const &event) { seen = event; });

    bridge.emit(kCreateError, R"("boom")");
    CHECK(seen.event == kCreateError);
    CHECK(seen.window_label == "w1");
    CHECK(seen.id == wb::bridge::kLocalEventId);
    CHECK(seen.payload == R"("boom")");
}

TEST_CASE("unlisten stops future local dispatch and is idempotent")
{
    auto channel = std::make_shared<ScriptedChannel>();
    EventBridge bridge(channel, "w1");
    int calls = 0;
    auto unlisten = listen_now(bridge, kCreated, [&](Event const &) { ++calls; });

    bridge.emit(kCreated);
    unlisten();
    unlisten();
    bridge.emit(kCreated);
    CHECK(calls == 1);
    CHECK_FALSE(unlisten.active());
    CHECK(bridge.local_listener_count(kCreated) == 0);
}

TEST_CASE("unlisten removes only its own registration of a shared handler")
{
    auto channel = std::make_shared<ScriptedChannel>();
    EventBridge bridge(channel, "w1");
    int calls = 0;
    wb::bridge::EventHandler handler = [&](Event const &) { ++calls; };
    auto first = listen_now(bridge, kCreated, handler);
    listen_now(bridge, kCreated, handler);

    first();
    first();
    bridge.emit(kCreated);
    CHECK(calls == 1);
    CHECK(bridge.local_listener_count(kCreated) == 1);
}

TEST_CASE("once fires a single time")
{
    auto channel = std::make_shared<ScriptedChannel>();
    EventBridge bridge(channel, "w1");
    int calls = 0;
    once_now(bridge, kCreated, [&](Event const &) { ++calls; });

    bridge.emit(kCreated);
    bridge.emit(kCreated);
    CHECK(calls == 1);
    CHECK(bridge.local_listener_count(kCreated) == 0);
}

TEST_CASE("once does not fire again when re-emitted from its own handler")
{
    auto channel = std::make_shared<ScriptedChannel>();
    EventBridge bridge(channel, "w1");
    int calls = 0;
    once_now(bridge, kCreated,
             [&](Event const &)
             {
                 ++calls;
                 bridge.emit(kCreated);
             });

    bridge.emit(kCreated);
    CHECK(calls == 1);
}

TEST_CASE("dispatch runs over a snapshot")
{
    auto channel = std::make_shared<ScriptedChannel>();
    EventBridge bridge(channel, "w1");
    std::vector<std::string> calls;
    Unlisten second;
    listen_now(bridge, kCreated,
               [&](Event const &)
               {
                   calls.push_back("first");
                   second();
                   listen_now(bridge, kCreated, [&](Event const &)
                              { calls.push_back("late"); });
               });
    second = listen_now(bridge, kCreated,
                        [&](Event const &) { calls.push_back("second"); });

    bridge.emit(kCreated);
    CHECK(calls == std::vector<std::string>{"first", "second"});

    calls.clear();
    bridge.emit(kCreated);
    CHECK(calls == std::vector<std::string>{"first", "late"});
}

TEST_CASE("a throwing local handler aborts the pass and reaches the emitter")
{
    auto channel = std::make_shared<ScriptedChannel>();
    EventBridge bridge(channel, "w1");
    bool later_ran = false;
    bool emitted = false;
    listen_now(bridge, kCreated,
               [](Event const &) { throw std::runtime_error("handler"); });
    listen_now(bridge, kCreated, [&](Event const &) { later_ran = true; });

    CHECK_THROWS_AS(bridge.emit(kCreated, "null",
                                [&](wb::Result<void>) { emitted = true; }),
                    std::runtime_error);
    CHECK_FALSE(later_ran);
    CHECK_FALSE(emitted);
}

TEST_CASE("handles with the same label keep separate local tables")
{
    auto channel = std::make_shared<ScriptedChannel>();
    EventBridge creator(channel, "w1");
    EventBridge alias(channel, "w1");
    int creator_calls = 0;
    int alias_calls = 0;
    listen_now(creator, kCreated, [&](Event const &) { ++creator_calls; });
    listen_now(alias, kCreated, [&](Event const &) { ++alias_calls; });

    creator.emit(kCreated);
    CHECK(creator_calls == 1);
    CHECK(alias_calls == 0);
}

TEST_CASE("remote events go to the host scoped to the label")
{
    auto channel = std::make_shared<ScriptedChannel>();
    EventBridge bridge(channel, "w1");
    std::string payload;
    listen_now(bridge, "window://moved",
               [&](Event const &event) { payload = event.payload; });

    REQUIRE(channel->listeners.size() == 1);
    CHECK(channel->listeners[0].target == "w1");
    CHECK(bridge.local_listener_count("window://moved") == 0);

    channel->deliver("window://moved", "w1", R"({"x":1,"y":2})");
    CHECK(payload == R"({"x":1,"y":2})");

    bridge.emit("custom", R"({"n":1})");
    REQUIRE(channel->emitted.size() == 1);
    CHECK(channel->emitted[0].event == "custom");
    CHECK(channel->emitted[0].target == "w1");
}

TEST_CASE("unlisten outliving its handle is harmless")
{
    auto channel = std::make_shared<ScriptedChannel>();
    Unlisten unlisten;
    {
        EventBridge bridge(channel, "w1");
        unlisten = listen_now(bridge, kCreated, [](Event const &) {});
    }
    CHECK_NOTHROW(unlisten());
}

TEST_CASE("combined unlisten runs every part once")
{
    int a = 0;
    int b = 0;
    Unlisten first([&a]() { ++a; });
    Unlisten second([&b]() { ++b; });
    auto combined = Unlisten::combine({first, second});

    second();
    combined();
    combined();
    CHECK(a == 1);
    CHECK(b == 1);
    CHECK_NOTHROW(Unlisten{}());
}

TEST_CASE("event loop drains nested tasks and survives throwing ones")
{
    wb::bridge::EventLoop loop;
    std::vector<int> order;
    loop.post(
        [&]()
        {
            order.push_back(1);
            loop.post([&]() { order.push_back(3); });
        });
    loop.post([]() { throw std::runtime_error("task"); });
    loop.post([&]() { order.push_back(2); });

    CHECK(loop.size() == 3);
    CHECK(loop.run_pending() == 4);
    CHECK(order == std::vector<int>{1, 2, 3});
    CHECK(loop.empty());
    CHECK_FALSE(loop.run_one());
}
