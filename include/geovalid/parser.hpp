#pragma once

#include "geovalid/feature.hpp"
#include "geovalid/geometry.hpp"
#include "geovalid/types.hpp"

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_to.hpp>

#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace geovalid {

    // Malformed JSON, unknown or missing discriminator, or a member of the wrong shape.
    // Never produced by validate().
    class DecodeError : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    // Maps each discriminator to the decoder of its concrete type. Decoders build values
    // without validating them.
    class TypeResolver {
      public:
        using Decoder = std::function<GeoJson(const boost::json::object &)>;

        static const TypeResolver &instance();

        bool contains(const std::string &type) const;
        std::vector<std::string> types() const;

        // Throws DecodeError when `jv` is not an object, has no string `type`, or the type is unknown.
        GeoJson resolve(const boost::json::value &jv) const;

      private:
        TypeResolver();

        std::unordered_map<std::string, Decoder> decoders_;
    };

    GeoJson decodeGeoJson(const boost::json::value &jv);
    // Rejects Feature and FeatureCollection.
    Geometry decodeGeometry(const boost::json::value &jv);

    // Decodes a concrete type, rejecting any other discriminator.
    template <typename T> T decode(const boost::json::value &jv) {
        GeoJson geojson = decodeGeoJson(jv);
        if (auto *value = std::get_if<T>(&geojson))
            return std::move(*value);
        throw DecodeError("geovalid::decode(): type '" + typeOf(geojson) + "' does not match the requested type");
    }

    template <> Position decode<Position>(const boost::json::value &jv);
    template <> PolygonCoordinates decode<PolygonCoordinates>(const boost::json::value &jv);
    template <> Geometry decode<Geometry>(const boost::json::value &jv);
    template <> GeoJson decode<GeoJson>(const boost::json::value &jv);

    // Text entry points. Parse errors surface as DecodeError.
    boost::json::value parseJson(const std::string &text);
    GeoJson parseGeoJson(const std::string &text);
    Geometry parseGeometry(const std::string &text);

    template <typename T> T parse(const std::string &text) { return decode<T>(parseJson(text)); }

    template <typename T> struct is_geojson_value : std::false_type {};
    template <> struct is_geojson_value<Position> : std::true_type {};
    template <> struct is_geojson_value<PolygonCoordinates> : std::true_type {};
    template <> struct is_geojson_value<Point> : std::true_type {};
    template <> struct is_geojson_value<MultiPoint> : std::true_type {};
    template <> struct is_geojson_value<LineString> : std::true_type {};
    template <> struct is_geojson_value<MultiLineString> : std::true_type {};
    template <> struct is_geojson_value<Polygon> : std::true_type {};
    template <> struct is_geojson_value<MultiPolygon> : std::true_type {};
    template <> struct is_geojson_value<GeometryCollection> : std::true_type {};
    template <> struct is_geojson_value<Feature> : std::true_type {};
    template <> struct is_geojson_value<FeatureCollection> : std::true_type {};
    template <> struct is_geojson_value<Geometry> : std::true_type {};
    template <> struct is_geojson_value<GeoJson> : std::true_type {};

    // boost::json::value_to<T>() support.
    template <typename T, typename = std::enable_if_t<is_geojson_value<T>::value>>
    T tag_invoke(const boost::json::value_to_tag<T> &, const boost::json::value &jv) {
        return decode<T>(jv);
    }

} // namespace geovalid
