#include "geometry/Geometry.hpp"
#include "geometry/Monitor.hpp"
#include "utils/Json.hpp"

#include <doctest/doctest.h>

#include <limits>
#include <string>
#include <variant>

using namespace wb::geometry;

TEST_CASE("to_logical divides each component by the scale factor")
{
    double const scales[] = {0.5, 1.0, 1.25, 1.5, 2.0, 3.0};
    double const values[][2] = {{0, 0}, {1920, 1080}, {-640, 333}, {7, 13.5}};
    for (auto scale : scales)
    {
        for (auto const &value : values)
        {
            auto position =
                to_logical(PhysicalPosition{value[0], value[1]}, scale);
            CHECK(position.x == doctest::Approx(value[0] / scale));
            CHECK(position.y == doctest::Approx(value[1] / scale));

            auto size = to_logical(PhysicalSize{value[0], value[1]}, scale);
            CHECK(size.width == doctest::Approx(value[0] / scale));
            CHECK(size.height == doctest::Approx(value[1] / scale));
        }
    }
}

TEST_CASE("to_logical rejects unusable scale factors")
{
    CHECK_THROWS_AS(to_logical(PhysicalSize{10, 10}, 0.0), wb::InvalidArgument);
    CHECK_THROWS_AS(to_logical(PhysicalPosition{10, 10}, -1.0),
                    wb::InvalidArgument);
    CHECK_THROWS_AS(to_logical(PhysicalSize{10, 10},
                               std::numeric_limits<double>::infinity()),
                    wb::InvalidArgument);
}

TEST_CASE("geometry tags are validated at construction")
{
    CHECK(unit_of(make_size("Logical", 1, 2)) == Unit::Logical);
    CHECK(unit_of(make_size("Physical", 1, 2)) == Unit::Physical);
    CHECK(unit_of(make_position("Logical", 1, 2)) == Unit::Logical);
    CHECK_THROWS_AS(make_size("Device", 1, 2), wb::InvalidArgument);
    CHECK_THROWS_AS(make_position("logical", 1, 2), wb::InvalidArgument);
    CHECK_THROWS_AS(parse_unit(""), wb::InvalidArgument);
}

TEST_CASE("sizes and positions encode with their tag")
{
    auto size = wb::json::Document::parse(encode(Size{LogicalSize{800, 600}}));
    REQUIRE(size.is_valid());
    CHECK(wb::json::get_string(size.root(), "type") == std::string("Logical"));
    auto *size_data = yyjson_obj_get(size.root(), "data");
    CHECK(wb::json::get_number(size_data, "width").value_or(0) ==
          doctest::Approx(800));
    CHECK(wb::json::get_number(size_data, "height").value_or(0) ==
          doctest::Approx(600));

    auto position =
        wb::json::Document::parse(encode(Position{PhysicalPosition{-5, 12.5}}));
    REQUIRE(position.is_valid());
    CHECK(wb::json::get_string(position.root(), "type") ==
          std::string("Physical"));
    auto *position_data = yyjson_obj_get(position.root(), "data");
    CHECK(wb::json::get_number(position_data, "x").value_or(0) ==
          doctest::Approx(-5));
    CHECK(wb::json::get_number(position_data, "y").value_or(0) ==
          doctest::Approx(12.5));

    auto decoded = size_from_json(size.root());
    REQUIRE(decoded.has_value());
    CHECK(std::get<LogicalSize>(*decoded) == LogicalSize{800, 600});
}

TEST_CASE("physical host payloads decode strictly")
{
    auto size = decode_physical_size(R"({"width":1024,"height":768})");
    REQUIRE(size.ok());
    CHECK(size.value() == PhysicalSize{1024, 768});

    auto position = decode_physical_position(R"({"x":-10,"y":20})");
    REQUIRE(position.ok());
    CHECK(position.value() == PhysicalPosition{-10, 20});

    auto wrong = decode_physical_size(R"("big")");
    REQUIRE_FALSE(wrong.ok());
    CHECK(wrong.error().kind == wb::ErrorKind::ProtocolError);

    auto broken = decode_physical_position("{");
    REQUIRE_FALSE(broken.ok());
    CHECK(broken.error().kind == wb::ErrorKind::ProtocolError);
}

TEST_CASE("monitor replies decode to fresh descriptors")
{
    auto none = decode_monitor("null");
    REQUIRE(none.ok());
    CHECK_FALSE(none.value().has_value());

    auto one = decode_monitor(
        R"({"name":"DP-1","scaleFactor":2,"position":{"x":0,"y":0},)"
        R"("size":{"width":3840,"height":2160}})");
    REQUIRE(one.ok());
    REQUIRE(one.value().has_value());
    CHECK(one.value()->name == std::string("DP-1"));
    CHECK(one.value()->scale_factor == doctest::Approx(2.0));
    CHECK(one.value()->size == PhysicalSize{3840, 2160});

    auto unnamed = decode_monitor(
        R"({"name":null,"scaleFactor":1,"position":{"x":1,"y":2},)"
        R"("size":{"width":3,"height":4}})");
    REQUIRE(unnamed.ok());
    REQUIRE(unnamed.value().has_value());
    CHECK_FALSE(unnamed.value()->name.has_value());

    auto list = decode_monitors(
        R"([{"name":"a","scaleFactor":1,"position":{"x":0,"y":0},)"
        R"("size":{"width":1,"height":1}}])");
    REQUIRE(list.ok());
    CHECK(list.value().size() == 1);

    CHECK_FALSE(decode_monitors(R"({"name":"a"})").ok());
}
