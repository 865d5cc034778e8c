#include "rpc/Serializer.hpp"
#include "utils/Json.hpp"

#include <doctest/doctest.h>

#include <string>
#include <variant>

using namespace wb::rpc;

TEST_CASE("requests carry method, arguments and tag")
{
    auto text = serialize_request(
        RequestFrame{42, "plugin:window|set_title", R"({"label":"w1"})"});
    auto doc = wb::json::Document::parse(text);
    REQUIRE(doc.is_valid());
    CHECK(wb::json::get_string(doc.root(), "method") ==
          std::string("plugin:window|set_title"));
    CHECK(wb::json::get_number(doc.root(), "tag").value_or(0) == 42);
    auto *arguments = yyjson_obj_get(doc.root(), "arguments");
    CHECK(wb::json::get_string(arguments, "label") == std::string("w1"));
}

TEST_CASE("replies parse back into frames")
{
    auto success = parse_frame(serialize_success(7, R"({"width":1})"));
    REQUIRE(success.ok());
    auto const *ok = std::get_if<ReplyFrame>(&success.value());
    REQUIRE(ok != nullptr);
    CHECK(ok->tag == 7);
    CHECK(ok->success);
    CHECK(ok->value == R"({"width":1})");

    auto failure = parse_frame(serialize_error(8, "window not found"));
    REQUIRE(failure.ok());
    auto const *error = std::get_if<ReplyFrame>(&failure.value());
    REQUIRE(error != nullptr);
    CHECK_FALSE(error->success);
    CHECK(error->message == "window not found");
}

TEST_CASE("event frames keep the listener id")
{
    auto parsed = parse_frame(serialize_event(
        EventFrame{"window://moved", "w1", 3, R"({"x":1,"y":2})"}));
    REQUIRE(parsed.ok());
    auto const *event = std::get_if<EventFrame>(&parsed.value());
    REQUIRE(event != nullptr);
    CHECK(event->event == "window://moved");
    CHECK(event->window_label == "w1");
    CHECK(event->id == 3);
    CHECK(event->payload == R"({"x":1,"y":2})");
}

TEST_CASE("event subsystem arguments")
{
    auto listen = wb::json::Document::parse(
        serialize_listen_arguments("window://resized", "w1", 5));
    CHECK(wb::json::get_string(listen.root(), "target") == std::string("w1"));
    CHECK(wb::json::as_int64(yyjson_obj_get(listen.root(), "handler")) == 5);

    auto emit = wb::json::Document::parse(
        serialize_emit_arguments("custom", "w1", "not json"));
    CHECK(yyjson_is_null(yyjson_obj_get(emit.root(), "payload")));
}

TEST_CASE("malformed frames are protocol errors")
{
    char const *cases[] = {
        "",
        "{",
        "[1]",
        R"({"method":"x"})",
        R"({"result":"success"})",
        R"({"result":"maybe","tag":1})",
        R"({"event":"e"})",
        R"({"something":"else"})",
    };
    for (auto const *text : cases)
    {
        CAPTURE(text);
        auto parsed = parse_frame(text);
        REQUIRE_FALSE(parsed.ok());
        CHECK(parsed.error().kind == wb::ErrorKind::ProtocolError);
    }
}
