#include <doctest/doctest.h>

#include "geovalid/geovalid.hpp"

#include <boost/json.hpp>

#include <vector>

using namespace geovalid;

namespace {
    LinearRing unitSquare() { return {Position(0, 0), Position(0, 1), Position(1, 1), Position(1, 0), Position(0, 0)}; }
} // namespace

TEST_CASE("Writer - Geometry encoding") {
    SUBCASE("Point") {
        CHECK(serialize(Point(Position(1, 2))) == R"({"type":"Point","coordinates":[1,2]})");
        CHECK(serialize(Point(Position(1, 2, 3))) == R"({"type":"Point","coordinates":[1,2,3]})");
    }

    SUBCASE("MultiPoint and LineString") {
        CHECK(serialize(MultiPoint({Position(0, 0), Position(-1, 1)})) ==
              R"({"type":"MultiPoint","coordinates":[[0,0],[-1,1]]})");
        CHECK(serialize(LineString({Position(0, 0), Position(1, 1)})) ==
              R"({"type":"LineString","coordinates":[[0,0],[1,1]]})");
    }

    SUBCASE("MultiLineString") {
        MultiLineString mls({{Position(0, 0), Position(1, 1)}, {Position(2, 2), Position(3, 3)}});
        CHECK(serialize(mls) == R"({"type":"MultiLineString","coordinates":[[[0,0],[1,1]],[[2,2],[3,3]]]})");
    }

    SUBCASE("Polygon exterior first") {
        CHECK(serialize(Polygon::of(unitSquare())) ==
              R"({"type":"Polygon","coordinates":[[[0,0],[0,1],[1,1],[1,0],[0,0]]]})");
    }

    SUBCASE("MultiPolygon") {
        auto mp = MultiPolygon::of({PolygonCoordinates::of(unitSquare())});
        CHECK(serialize(mp) == R"({"type":"MultiPolygon","coordinates":[[[[0,0],[0,1],[1,1],[1,0],[0,0]]]]})");
    }

    SUBCASE("GeometryCollection") {
        std::vector<Geometry> members{Point(Position(1, 2))};
        CHECK(serialize(GeometryCollection(members)) ==
              R"({"type":"GeometryCollection","geometries":[{"type":"Point","coordinates":[1,2]}]})");
        CHECK(serialize(GeometryCollection()) == R"({"type":"GeometryCollection","geometries":[]})");
    }

    SUBCASE("Through the Geometry variant") {
        Geometry geometry = Point(Position(1, 2));
        CHECK(serialize(geometry) == serialize(Point(Position(1, 2))));
    }
}

TEST_CASE("Writer - Coordinates") {
    SUBCASE("Integral values are written as integers") {
        auto arr = toJson(Position(1.5, 2)).as_array();
        REQUIRE(arr.size() == 2);
        CHECK(arr[0].is_double());
        CHECK(arr[0].as_double() == doctest::Approx(1.5));
        CHECK(arr[1].is_int64());
        CHECK(arr[1].as_int64() == 2);
    }

    SUBCASE("Huge values stay floating point") {
        auto arr = toJson(Position(std::vector<double>{1e20, 0})).as_array();
        CHECK(arr[0].is_double());
    }

    SUBCASE("Absent point coordinates are written as null") {
        CHECK(serialize(Point()) == R"({"type":"Point","coordinates":null})");
        CHECK(parse<Point>(serialize(Point())) == Point());
    }

    SUBCASE("Non-finite coordinates do not survive a round-trip") {
        auto text = serialize(Point(Position()));
        CHECK_THROWS_AS(parseGeoJson(text), DecodeError);
    }

    SUBCASE("Invalid values are encoded as they are") {
        CHECK(serialize(Point(Position(200, 0))) == R"({"type":"Point","coordinates":[200,0]})");
        CHECK(serialize(Point("point", Position(1, 2))) == R"({"type":"point","coordinates":[1,2]})");
    }
}

TEST_CASE("Writer - Feature encoding") {
    SUBCASE("Full feature") {
        Feature feature("f1", Point(Position(1, 2)), Properties{{"name", "x"}});
        CHECK(serialize(feature) ==
              R"({"type":"Feature","id":"f1","geometry":{"type":"Point","coordinates":[1,2]},"properties":{"name":"x"}})");
    }

    SUBCASE("Absent id is omitted, absent geometry is null") {
        Feature feature(std::nullopt, std::nullopt);
        CHECK(serialize(feature) == R"({"type":"Feature","geometry":null,"properties":{}})");
    }

    SUBCASE("FeatureCollection") {
        CHECK(serialize(FeatureCollection()) == R"({"type":"FeatureCollection","features":[]})");

        FeatureCollection fc(std::vector<Feature>{Feature("a", Point(Position(0, 0)))});
        auto j = toJson(fc).as_object();
        REQUIRE(j.at("features").as_array().size() == 1);
        CHECK(j.at("features").as_array()[0].as_object().at("id").as_string() == "a");
    }
}

TEST_CASE("Writer - boost::json::value_from") {
    Point point(Position(1, 2));
    CHECK(boost::json::value_from(point) == toJson(point));

    GeoJson geojson = Feature("f", Point(Position(1, 2)));
    CHECK(boost::json::value_from(geojson) == toJson(geojson));
}
