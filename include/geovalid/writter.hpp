#pragma once

#include "geovalid/feature.hpp"
#include "geovalid/geometry.hpp"
#include "geovalid/types.hpp"
#include "geovalid/validation.hpp"

#include <boost/json/value.hpp>
#include <boost/json/value_from.hpp>

#include <string>
#include <type_traits>

namespace geovalid {

    // Canonical RFC 7946 encoding. The stored `type` string is emitted as is.
    // NaN and infinite coordinates have no JSON form; text written from such a Position does not decode.
    boost::json::value toJson(const Position &position);
    boost::json::value toJson(const PolygonCoordinates &coordinates);
    boost::json::value toJson(const Point &point);
    boost::json::value toJson(const MultiPoint &multi_point);
    boost::json::value toJson(const LineString &line_string);
    boost::json::value toJson(const MultiLineString &multi_line_string);
    boost::json::value toJson(const Polygon &polygon);
    boost::json::value toJson(const MultiPolygon &multi_polygon);
    boost::json::value toJson(const GeometryCollection &collection);
    boost::json::value toJson(const Feature &feature);
    boost::json::value toJson(const FeatureCollection &fc);
    boost::json::value toJson(const Geometry &geometry);
    boost::json::value toJson(const GeoJson &geojson);

    // {"valid": bool, "errors": [{"field", "message", "key"}, ...]}
    boost::json::value toJson(const ValidationResult &result);

    template <typename T> struct is_geojson_encodable : std::false_type {};
    template <> struct is_geojson_encodable<Position> : std::true_type {};
    template <> struct is_geojson_encodable<PolygonCoordinates> : std::true_type {};
    template <> struct is_geojson_encodable<Point> : std::true_type {};
    template <> struct is_geojson_encodable<MultiPoint> : std::true_type {};
    template <> struct is_geojson_encodable<LineString> : std::true_type {};
    template <> struct is_geojson_encodable<MultiLineString> : std::true_type {};
    template <> struct is_geojson_encodable<Polygon> : std::true_type {};
    template <> struct is_geojson_encodable<MultiPolygon> : std::true_type {};
    template <> struct is_geojson_encodable<GeometryCollection> : std::true_type {};
    template <> struct is_geojson_encodable<Feature> : std::true_type {};
    template <> struct is_geojson_encodable<FeatureCollection> : std::true_type {};
    template <> struct is_geojson_encodable<Geometry> : std::true_type {};
    template <> struct is_geojson_encodable<GeoJson> : std::true_type {};
    template <> struct is_geojson_encodable<ValidationResult> : std::true_type {};

    std::string serialize(const boost::json::value &jv);

    template <typename T, typename = std::enable_if_t<is_geojson_encodable<T>::value>>
    std::string serialize(const T &value) {
        return serialize(toJson(value));
    }

    // boost::json::value_from() support.
    template <typename T, typename = std::enable_if_t<is_geojson_encodable<T>::value>>
    void tag_invoke(const boost::json::value_from_tag &, boost::json::value &jv, const T &value) {
        jv = toJson(value);
    }

} // namespace geovalid
