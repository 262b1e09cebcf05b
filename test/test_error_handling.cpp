#include <doctest/doctest.h>

#include "geovalid/geovalid.hpp"

#include <stdexcept>
#include <string>

using namespace geovalid;

namespace {
    std::string decodeMessage(const std::string &text) {
        try {
            (void)parseGeoJson(text);
        } catch (const DecodeError &e) {
            return e.what();
        }
        return {};
    }
} // namespace

TEST_CASE("Error Handling - Malformed JSON") {
    CHECK_THROWS_AS(parseJson("{not json"), DecodeError);
    CHECK_THROWS_AS(parseGeoJson(""), DecodeError);
    CHECK_THROWS_AS(parseGeoJson(R"({"type":"Point","coordinates":[1,2])"), DecodeError);
    CHECK(decodeMessage("{not json").find("failed to parse JSON") != std::string::npos);
}

TEST_CASE("Error Handling - Discriminator") {
    SUBCASE("Not an object") {
        CHECK_THROWS_AS(parseGeoJson("[1, 2]"), DecodeError);
        CHECK_THROWS_AS(parseGeoJson("\"Point\""), DecodeError);
        CHECK_THROWS_AS(parseGeoJson("null"), DecodeError);
    }

    SUBCASE("Missing or non-string type") {
        CHECK_THROWS_AS(parseGeoJson(R"({"coordinates":[1,2]})"), DecodeError);
        CHECK_THROWS_AS(parseGeoJson(R"({"type":7,"coordinates":[1,2]})"), DecodeError);
        CHECK(decodeMessage(R"({"coordinates":[1,2]})").find("no string 'type'") != std::string::npos);
    }

    SUBCASE("Unknown type") {
        CHECK_THROWS_AS(parseGeoJson(R"({"type":"Circle","coordinates":[1,2]})"), DecodeError);
        CHECK_THROWS_AS(parseGeoJson(R"({"type":"point","coordinates":[1,2]})"), DecodeError);
        CHECK(decodeMessage(R"({"type":"Circle"})").find("unknown GeoJSON type 'Circle'") != std::string::npos);
    }

    SUBCASE("Requested type does not match") {
        auto jv = parseJson(R"({"type":"LineString","coordinates":[[0,0],[1,1]]})");
        CHECK_THROWS_AS(decode<Point>(jv), DecodeError);
        CHECK_THROWS_AS(decode<Feature>(jv), DecodeError);
        CHECK_NOTHROW(decode<LineString>(jv));
    }

    SUBCASE("Features are not geometries") {
        CHECK_THROWS_AS(parseGeometry(R"({"type":"Feature","geometry":null,"properties":{}})"), DecodeError);
        CHECK_THROWS_AS(parseGeometry(R"({"type":"FeatureCollection","features":[]})"), DecodeError);
    }
}

TEST_CASE("Error Handling - Coordinates") {
    SUBCASE("Missing or null coordinates are left to validation") {
        CHECK_NOTHROW(parseGeoJson(R"({"type":"Point"})"));
        CHECK_NOTHROW(parseGeoJson(R"({"type":"Polygon","coordinates":null})"));
        CHECK(decodeMessage(R"({"type":"LineString"})").empty());
    }

    SUBCASE("Coordinates of the wrong kind") {
        CHECK_THROWS_AS(parseGeoJson(R"({"type":"Point","coordinates":"1,2"})"), DecodeError);
        CHECK(decodeMessage(R"({"type":"LineString","coordinates":7})").find("must be a JSON array") !=
              std::string::npos);
    }

    SUBCASE("Wrong nesting depth") {
        CHECK_THROWS_AS(parseGeoJson(R"({"type":"Point","coordinates":[[1,2]]})"), DecodeError);
        CHECK_THROWS_AS(parseGeoJson(R"({"type":"LineString","coordinates":[1,2]})"), DecodeError);
        CHECK_THROWS_AS(parseGeoJson(R"({"type":"Polygon","coordinates":[[0,0],[0,1],[1,1],[0,0]]})"), DecodeError);
        CHECK_THROWS_AS(parseGeoJson(R"({"type":"MultiPolygon","coordinates":[[[0,0],[0,1],[1,1],[0,0]]]})"),
                        DecodeError);
    }

    SUBCASE("Non-numeric coordinate") {
        CHECK_THROWS_AS(parseGeoJson(R"({"type":"Point","coordinates":["1",2]})"), DecodeError);
        CHECK_THROWS_AS(parseGeoJson(R"({"type":"Point","coordinates":[null,2]})"), DecodeError);
        CHECK_THROWS_AS(parseGeoJson(R"({"type":"Point","coordinates":{"lon":1,"lat":2}})"), DecodeError);
    }

    SUBCASE("Bad member of a collection") {
        CHECK_THROWS_AS(parseGeoJson(R"({"type":"GeometryCollection","geometries":{}})"), DecodeError);
        CHECK_THROWS_AS(parseGeoJson(R"({"type":"GeometryCollection","geometries":[{"type":"Point","coordinates":{}}]})"),
                        DecodeError);
        CHECK_THROWS_AS(parseGeoJson(R"({"type":"GeometryCollection","geometries":[{"coordinates":[1,2]}]})"),
                        DecodeError);
    }
}

TEST_CASE("Error Handling - Features") {
    SUBCASE("Properties must be an object") {
        CHECK_THROWS_AS(parseGeoJson(R"({"type":"Feature","geometry":null,"properties":[1,2]})"), DecodeError);
        CHECK_THROWS_AS(parseGeoJson(R"({"type":"Feature","geometry":null,"properties":"x"})"), DecodeError);
    }

    SUBCASE("Id must be a string or a number") {
        CHECK_THROWS_AS(parseGeoJson(R"({"type":"Feature","id":true,"geometry":null})"), DecodeError);
        CHECK_THROWS_AS(parseGeoJson(R"({"type":"Feature","id":{},"geometry":null})"), DecodeError);
    }

    SUBCASE("Geometry must be a geometry") {
        CHECK_THROWS_AS(parseGeoJson(R"({"type":"Feature","geometry":{"type":"Feature"}})"), DecodeError);
        CHECK_THROWS_AS(parseGeoJson(R"({"type":"Feature","geometry":42})"), DecodeError);
    }

    SUBCASE("Collection members must be features") {
        CHECK_THROWS_AS(parseGeoJson(R"({"type":"FeatureCollection","features":[{"type":"Point","coordinates":[1,2]}]})"),
                        DecodeError);
        CHECK_THROWS_AS(parseGeoJson(R"({"type":"FeatureCollection","features":{}})"), DecodeError);
    }
}

TEST_CASE("Error Handling - Validating factories") {
    SUBCASE("Exception carries every error") {
        LinearRing open{Position(0, 0), Position(0, 1), Position(200, 1)};
        try {
            (void)Polygon::of(open);
            FAIL("expected ValidationException");
        } catch (const ValidationException &e) {
            ValidationResult result(e.errors());
            CHECK(result.contains("coordinates.ring.length.invalid"));
            CHECK(result.contains("coordinates.ring.circle.invalid"));
            CHECK(result.contains("coordinates.longitude.invalid"));
        }
    }

    SUBCASE("ValidationException is a runtime_error") {
        CHECK_THROWS_AS(MultiPolygon::of({}), std::runtime_error);
        CHECK_THROWS_AS(GeometryCollection::of({GeometryCollection()}), ValidationException);
    }

    SUBCASE("Decoding never throws ValidationException") {
        CHECK_NOTHROW(parseGeoJson(R"({"type":"Point","coordinates":[500,500]})"));
        CHECK_NOTHROW(parseGeoJson(R"({"type":"Point","coordinates":[]})"));
        CHECK_NOTHROW(parseGeoJson(R"({"type":"GeometryCollection","geometries":[{"type":"GeometryCollection"}]})"));
    }
}
