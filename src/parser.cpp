#include "geovalid/parser.hpp"

#include <boost/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace geovalid {

    using json = boost::json::value;

    namespace detail {
        const boost::json::object &expect_object(const json &jv, const std::string &what) {
            if (!jv.is_object())
                throw DecodeError("geovalid::decode(): " + what + " must be a JSON object");
            return jv.as_object();
        }

        const boost::json::array &expect_array(const json &jv, const std::string &what) {
            if (!jv.is_array())
                throw DecodeError("geovalid::decode(): " + what + " must be a JSON array");
            return jv.as_array();
        }

        // nullptr when `coordinates` is missing or null; validate() reports the absence.
        const json *coordinates_member(const boost::json::object &obj) {
            auto const *member = obj.if_contains("coordinates");
            if (!member || member->is_null())
                return nullptr;
            return member;
        }

        std::string read_type(const boost::json::object &obj) {
            auto const *type = obj.if_contains("type");
            if (!type || !type->is_string())
                throw DecodeError("geovalid::decode(): object has no string 'type' field");
            return std::string(type->as_string());
        }

        double parse_number(const json &jv) {
            if (!jv.is_number())
                throw DecodeError("geovalid::decode(): coordinate must be a number, got " + boost::json::serialize(jv));
            return boost::json::value_to<double>(jv);
        }

        // Arity is not checked here; Position::validate() reports it.
        Position parse_position(const json &jv) {
            auto const &arr = expect_array(jv, "position");
            std::vector<double> coords;
            coords.reserve(arr.size());
            for (auto const &c : arr)
                coords.push_back(parse_number(c));
            return Position(std::move(coords));
        }

        std::vector<Position> parse_positions(const json &jv) {
            auto const &arr = expect_array(jv, "coordinates");
            std::vector<Position> positions;
            positions.reserve(arr.size());
            for (auto const &p : arr)
                positions.push_back(parse_position(p));
            return positions;
        }

        std::vector<std::vector<Position>> parse_lines(const json &jv) {
            auto const &arr = expect_array(jv, "coordinates");
            std::vector<std::vector<Position>> lines;
            lines.reserve(arr.size());
            for (auto const &line : arr)
                lines.push_back(parse_positions(line));
            return lines;
        }

        PolygonCoordinates parse_polygon(const json &jv) { return PolygonCoordinates(parse_lines(jv)); }

        std::vector<PolygonCoordinates> parse_polygons(const json &jv) {
            auto const &arr = expect_array(jv, "coordinates");
            std::vector<PolygonCoordinates> polygons;
            polygons.reserve(arr.size());
            for (auto const &poly : arr)
                polygons.push_back(parse_polygon(poly));
            return polygons;
        }

        std::optional<std::string> parse_id(const boost::json::object &obj) {
            auto const *id = obj.if_contains("id");
            if (!id || id->is_null())
                return std::nullopt;
            if (id->is_string())
                return std::string(id->as_string());
            if (id->is_number())
                return boost::json::serialize(*id);
            throw DecodeError("geovalid::decode(): Feature 'id' must be a string or a number");
        }

        Properties parse_properties(const boost::json::object &obj) {
            auto const *props = obj.if_contains("properties");
            if (!props || props->is_null())
                return {};
            return expect_object(*props, "Feature 'properties'");
        }

        std::optional<Geometry> parse_feature_geometry(const boost::json::object &obj) {
            auto const *geom = obj.if_contains("geometry");
            if (!geom || geom->is_null())
                return std::nullopt;
            return decodeGeometry(*geom);
        }

        // Missing or null `geometries` decodes as an empty collection.
        std::vector<Geometry> parse_geometries(const boost::json::object &obj) {
            std::vector<Geometry> out;
            auto const *geoms = obj.if_contains("geometries");
            if (!geoms || geoms->is_null())
                return out;
            auto const &arr = expect_array(*geoms, "GeometryCollection 'geometries'");
            out.reserve(arr.size());
            for (auto const &sub : arr)
                out.push_back(decodeGeometry(sub));
            return out;
        }

        Feature parse_feature(const boost::json::object &obj) {
            return Feature(read_type(obj), parse_id(obj), parse_feature_geometry(obj), parse_properties(obj));
        }

        // Missing or null `features` decodes as an empty collection.
        std::vector<Feature> parse_features(const boost::json::object &obj) {
            std::vector<Feature> out;
            auto const *features = obj.if_contains("features");
            if (!features || features->is_null())
                return out;
            auto const &arr = expect_array(*features, "FeatureCollection 'features'");
            out.reserve(arr.size());
            for (auto const &feat : arr)
                out.push_back(decode<Feature>(feat));
            return out;
        }
    } // namespace detail

    TypeResolver::TypeResolver() {
        decoders_[GeoJsonType::POINT] = [](const boost::json::object &obj) -> GeoJson {
            std::optional<Position> position;
            if (auto const *coords = detail::coordinates_member(obj))
                position = detail::parse_position(*coords);
            return Point(detail::read_type(obj), std::move(position));
        };
        decoders_[GeoJsonType::MULTI_POINT] = [](const boost::json::object &obj) -> GeoJson {
            auto const *coords = detail::coordinates_member(obj);
            return MultiPoint(detail::read_type(obj),
                              coords ? detail::parse_positions(*coords) : std::vector<Position>{});
        };
        decoders_[GeoJsonType::LINE_STRING] = [](const boost::json::object &obj) -> GeoJson {
            auto const *coords = detail::coordinates_member(obj);
            return LineString(detail::read_type(obj),
                              coords ? detail::parse_positions(*coords) : std::vector<Position>{});
        };
        decoders_[GeoJsonType::MULTI_LINE_STRING] = [](const boost::json::object &obj) -> GeoJson {
            auto const *coords = detail::coordinates_member(obj);
            return MultiLineString(detail::read_type(obj),
                                   coords ? detail::parse_lines(*coords) : std::vector<std::vector<Position>>{});
        };
        decoders_[GeoJsonType::POLYGON] = [](const boost::json::object &obj) -> GeoJson {
            auto const *coords = detail::coordinates_member(obj);
            return Polygon(detail::read_type(obj), coords ? detail::parse_polygon(*coords) : PolygonCoordinates{});
        };
        decoders_[GeoJsonType::MULTI_POLYGON] = [](const boost::json::object &obj) -> GeoJson {
            auto const *coords = detail::coordinates_member(obj);
            return MultiPolygon(detail::read_type(obj),
                                coords ? detail::parse_polygons(*coords) : std::vector<PolygonCoordinates>{});
        };
        decoders_[GeoJsonType::GEOMETRY_COLLECTION] = [](const boost::json::object &obj) -> GeoJson {
            return GeometryCollection(detail::read_type(obj), detail::parse_geometries(obj));
        };
        decoders_[GeoJsonType::FEATURE] = [](const boost::json::object &obj) -> GeoJson {
            return detail::parse_feature(obj);
        };
        decoders_[GeoJsonType::FEATURE_COLLECTION] = [](const boost::json::object &obj) -> GeoJson {
            return FeatureCollection(detail::read_type(obj), detail::parse_features(obj));
        };
    }

    const TypeResolver &TypeResolver::instance() {
        static const TypeResolver resolver;
        return resolver;
    }

    bool TypeResolver::contains(const std::string &type) const { return decoders_.count(type) > 0; }

    std::vector<std::string> TypeResolver::types() const {
        std::vector<std::string> out;
        out.reserve(decoders_.size());
        for (auto const &[type, decoder] : decoders_)
            out.push_back(type);
        std::sort(out.begin(), out.end());
        return out;
    }

    GeoJson TypeResolver::resolve(const json &jv) const {
        auto const &obj = detail::expect_object(jv, "GeoJSON value");
        auto type = detail::read_type(obj);
        auto it = decoders_.find(type);
        if (it == decoders_.end())
            throw DecodeError("geovalid::decode(): unknown GeoJSON type '" + type + "'");
        spdlog::debug("geovalid: resolved type '{}'", type);
        return it->second(obj);
    }

    GeoJson decodeGeoJson(const json &jv) { return TypeResolver::instance().resolve(jv); }

    Geometry decodeGeometry(const json &jv) {
        auto geojson = decodeGeoJson(jv);
        auto geometry = asGeometry(geojson);
        if (!geometry)
            throw DecodeError("geovalid::decodeGeometry(): type '" + typeOf(geojson) + "' is not a geometry");
        return std::move(*geometry);
    }

    template <> Position decode<Position>(const json &jv) { return detail::parse_position(jv); }

    template <> PolygonCoordinates decode<PolygonCoordinates>(const json &jv) { return detail::parse_polygon(jv); }

    template <> Geometry decode<Geometry>(const json &jv) { return decodeGeometry(jv); }

    template <> GeoJson decode<GeoJson>(const json &jv) { return decodeGeoJson(jv); }

    json parseJson(const std::string &text) {
        boost::json::error_code ec;
        json jv = boost::json::parse(text, ec);
        if (ec)
            throw DecodeError("geovalid::parseJson(): failed to parse JSON: " + ec.message());
        return jv;
    }

    GeoJson parseGeoJson(const std::string &text) { return decodeGeoJson(parseJson(text)); }

    Geometry parseGeometry(const std::string &text) { return decodeGeometry(parseJson(text)); }

} // namespace geovalid
