#include "geovalid/writter.hpp"

#include <boost/json.hpp>

#include <cmath>
#include <cstdint>
#include <type_traits>
#include <variant>

namespace geovalid {

    namespace detail {
        // Integral coordinates are written without an exponent, e.g. [0,0] rather than [0E0,0E0].
        boost::json::value coord_to_json(double c) {
            if (std::isfinite(c) && std::trunc(c) == c && std::fabs(c) < 9.0e15)
                return static_cast<std::int64_t>(c);
            return c;
        }

        template <typename Positions> boost::json::array positions_to_json(const Positions &positions) {
            boost::json::array arr;
            arr.reserve(positions.size());
            for (auto const &p : positions)
                arr.push_back(toJson(p));
            return arr;
        }

        boost::json::object coordinates_object(const std::string &type, boost::json::value coordinates) {
            boost::json::object j;
            j["type"] = type;
            j["coordinates"] = std::move(coordinates);
            return j;
        }
    } // namespace detail

    boost::json::value toJson(const Position &position) {
        boost::json::array arr;
        arr.reserve(position.size());
        for (double c : position.coordinates())
            arr.push_back(detail::coord_to_json(c));
        return arr;
    }

    boost::json::value toJson(const PolygonCoordinates &coordinates) {
        boost::json::array rings;
        for (auto const &ring : coordinates.coordinates())
            rings.push_back(detail::positions_to_json(ring));
        return rings;
    }

    // Absent coordinates are written as null.
    boost::json::value toJson(const Point &point) {
        if (!point.coordinates())
            return detail::coordinates_object(point.type(), nullptr);
        return detail::coordinates_object(point.type(), toJson(*point.coordinates()));
    }

    boost::json::value toJson(const MultiPoint &multi_point) {
        return detail::coordinates_object(multi_point.type(), detail::positions_to_json(multi_point.coordinates()));
    }

    boost::json::value toJson(const LineString &line_string) {
        return detail::coordinates_object(line_string.type(), detail::positions_to_json(line_string.coordinates()));
    }

    boost::json::value toJson(const MultiLineString &multi_line_string) {
        boost::json::array lines;
        for (auto const &line : multi_line_string.coordinates())
            lines.push_back(detail::positions_to_json(line));
        return detail::coordinates_object(multi_line_string.type(), std::move(lines));
    }

    boost::json::value toJson(const Polygon &polygon) {
        return detail::coordinates_object(polygon.type(), toJson(polygon.coordinates()));
    }

    boost::json::value toJson(const MultiPolygon &multi_polygon) {
        return detail::coordinates_object(multi_polygon.type(), detail::positions_to_json(multi_polygon.coordinates()));
    }

    boost::json::value toJson(const GeometryCollection &collection) {
        boost::json::object j;
        j["type"] = collection.type();
        boost::json::array geometries;
        for (auto const &geometry : collection.geometries())
            geometries.push_back(toJson(geometry));
        j["geometries"] = std::move(geometries);
        return j;
    }

    // `id` is omitted when absent, `geometry` is written as null.
    boost::json::value toJson(const Feature &feature) {
        boost::json::object j;
        j["type"] = feature.type();
        if (feature.id())
            j["id"] = *feature.id();
        if (feature.geometry())
            j["geometry"] = toJson(*feature.geometry());
        else
            j["geometry"] = nullptr;
        j["properties"] = feature.properties();
        return j;
    }

    boost::json::value toJson(const FeatureCollection &fc) {
        boost::json::object j;
        j["type"] = fc.type();
        boost::json::array features;
        for (auto const &f : fc.features())
            features.push_back(toJson(f));
        j["features"] = std::move(features);
        return j;
    }

    boost::json::value toJson(const Geometry &geometry) {
        return std::visit([](auto const &shape) { return toJson(shape); }, geometry);
    }

    boost::json::value toJson(const GeoJson &geojson) {
        return std::visit([](auto const &g) { return toJson(g); }, geojson);
    }

    boost::json::value toJson(const ValidationResult &result) {
        boost::json::object j;
        j["valid"] = !result.hasErrors();
        boost::json::array errors;
        for (auto const &e : result) {
            boost::json::object err;
            err["field"] = e.field();
            err["message"] = e.message();
            err["key"] = e.key();
            errors.push_back(std::move(err));
        }
        j["errors"] = std::move(errors);
        return j;
    }

    std::string serialize(const boost::json::value &jv) { return boost::json::serialize(jv); }

} // namespace geovalid
