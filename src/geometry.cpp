#include "geovalid/geometry.hpp"

#include <algorithm>
#include <ostream>
#include <utility>

namespace geovalid {

    namespace detail {
        template <typename Positions> void validatePositions(ValidationResult &result, const Positions &positions) {
            for (auto const &position : positions)
                result.merge(position.validate());
        }

        void validateMinLength(ValidationResult &result, const std::vector<Position> &positions) {
            if (positions.empty())
                result.add("coordinates", "coordinates should not be empty/blank", "coordinates.invalid.empty");
            if (positions.size() < 2)
                result.add("coordinates", "coordinates is not valid, minimum 2 positions required",
                           "coordinates.invalid.min.length");
        }
    } // namespace detail

    // Point

    Point::Point() : type_(GeoJsonType::POINT) {}

    Point::Point(Position coordinates) : type_(GeoJsonType::POINT), coordinates_(std::move(coordinates)) {}

    Point::Point(std::string type, std::optional<Position> coordinates)
        : type_(std::move(type)), coordinates_(std::move(coordinates)) {}

    Point Point::of(const Position &coordinates) { return validateOrThrow(Point(coordinates)); }

    Point Point::of(double longitude, double latitude) { return validateOrThrow(Point(Position(longitude, latitude))); }

    Point Point::of(double longitude, double latitude, double altitude) {
        return validateOrThrow(Point(Position(longitude, latitude, altitude)));
    }

    ValidationResult Point::validate() const {
        ValidationResult result;
        detail::validateType(result, type_, GeoJsonType::POINT);
        if (!coordinates_) {
            result.add("coordinates", "coordinates should not be empty/blank", "coordinates.invalid.empty");
        } else {
            result.merge(coordinates_->validate());
        }
        return result;
    }

    bool Point::operator==(const Point &other) const {
        return type_ == other.type_ && coordinates_ == other.coordinates_;
    }

    // MultiPoint

    MultiPoint::MultiPoint() : type_(GeoJsonType::MULTI_POINT) {}

    MultiPoint::MultiPoint(std::vector<Position> coordinates)
        : type_(GeoJsonType::MULTI_POINT), coordinates_(std::move(coordinates)) {}

    MultiPoint::MultiPoint(std::string type, std::vector<Position> coordinates)
        : type_(std::move(type)), coordinates_(std::move(coordinates)) {}

    MultiPoint MultiPoint::of(const std::vector<Position> &coordinates) {
        return validateOrThrow(MultiPoint(coordinates));
    }

    ValidationResult MultiPoint::validate() const {
        ValidationResult result;
        detail::validateType(result, type_, GeoJsonType::MULTI_POINT);
        detail::validateMinLength(result, coordinates_);
        detail::validatePositions(result, coordinates_);
        return result;
    }

    bool MultiPoint::operator==(const MultiPoint &other) const {
        return type_ == other.type_ && coordinates_ == other.coordinates_;
    }

    // LineString

    LineString::LineString() : type_(GeoJsonType::LINE_STRING) {}

    LineString::LineString(std::vector<Position> coordinates)
        : type_(GeoJsonType::LINE_STRING), coordinates_(std::move(coordinates)) {}

    LineString::LineString(std::string type, std::vector<Position> coordinates)
        : type_(std::move(type)), coordinates_(std::move(coordinates)) {}

    LineString LineString::of(const std::vector<Position> &coordinates) {
        return validateOrThrow(LineString(coordinates));
    }

    ValidationResult LineString::validate() const {
        ValidationResult result;
        detail::validateType(result, type_, GeoJsonType::LINE_STRING);
        detail::validateMinLength(result, coordinates_);
        detail::validatePositions(result, coordinates_);
        return result;
    }

    bool LineString::operator==(const LineString &other) const {
        return type_ == other.type_ && coordinates_ == other.coordinates_;
    }

    // MultiLineString

    MultiLineString::MultiLineString() : type_(GeoJsonType::MULTI_LINE_STRING) {}

    MultiLineString::MultiLineString(std::vector<std::vector<Position>> coordinates)
        : type_(GeoJsonType::MULTI_LINE_STRING), coordinates_(std::move(coordinates)) {}

    MultiLineString::MultiLineString(std::string type, std::vector<std::vector<Position>> coordinates)
        : type_(std::move(type)), coordinates_(std::move(coordinates)) {}

    MultiLineString MultiLineString::of(const std::vector<std::vector<Position>> &coordinates) {
        return validateOrThrow(MultiLineString(coordinates));
    }

    ValidationResult MultiLineString::validate() const {
        ValidationResult result;
        detail::validateType(result, type_, GeoJsonType::MULTI_LINE_STRING);
        if (coordinates_.empty()) {
            result.add("coordinates", "coordinates should not be empty/blank", "coordinates.invalid.empty");
        }
        if (std::any_of(coordinates_.begin(), coordinates_.end(),
                        [](const std::vector<Position> &line) { return line.size() < 2; })) {
            result.add("coordinates", "coordinates is not valid, minimum 2 positions required",
                       "coordinates.invalid.min.length");
        }
        for (auto const &line : coordinates_)
            detail::validatePositions(result, line);
        return result;
    }

    bool MultiLineString::operator==(const MultiLineString &other) const {
        return type_ == other.type_ && coordinates_ == other.coordinates_;
    }

    // Polygon

    Polygon::Polygon() : type_(GeoJsonType::POLYGON) {}

    Polygon::Polygon(PolygonCoordinates coordinates)
        : type_(GeoJsonType::POLYGON), coordinates_(std::move(coordinates)) {}

    Polygon::Polygon(std::string type, PolygonCoordinates coordinates)
        : type_(std::move(type)), coordinates_(std::move(coordinates)) {}

    Polygon Polygon::of(const PolygonCoordinates &coordinates) { return validateOrThrow(Polygon(coordinates)); }

    Polygon Polygon::of(const std::vector<LinearRing> &linear_rings) {
        return validateOrThrow(Polygon(PolygonCoordinates(linear_rings)));
    }

    Polygon Polygon::of(const LinearRing &exterior, const std::vector<LinearRing> &holes) {
        return validateOrThrow(Polygon(PolygonCoordinates(exterior, holes)));
    }

    ValidationResult Polygon::validate() const {
        ValidationResult result;
        detail::validateType(result, type_, GeoJsonType::POLYGON);
        if (coordinates_.exterior().empty()) {
            result.add("coordinates", "coordinates is not valid, at least one position required",
                       "coordinates.invalid.min.length");
        }
        result.merge(coordinates_.validate());
        return result;
    }

    bool Polygon::operator==(const Polygon &other) const {
        return type_ == other.type_ && coordinates_ == other.coordinates_;
    }

    // MultiPolygon

    MultiPolygon::MultiPolygon() : type_(GeoJsonType::MULTI_POLYGON) {}

    MultiPolygon::MultiPolygon(std::vector<PolygonCoordinates> coordinates)
        : type_(GeoJsonType::MULTI_POLYGON), coordinates_(std::move(coordinates)) {}

    MultiPolygon::MultiPolygon(std::string type, std::vector<PolygonCoordinates> coordinates)
        : type_(std::move(type)), coordinates_(std::move(coordinates)) {}

    MultiPolygon MultiPolygon::of(const std::vector<PolygonCoordinates> &coordinates) {
        return validateOrThrow(MultiPolygon(coordinates));
    }

    ValidationResult MultiPolygon::validate() const {
        ValidationResult result;
        detail::validateType(result, type_, GeoJsonType::MULTI_POLYGON);
        if (coordinates_.empty()) {
            result.add("coordinates", "coordinates is not valid, at least one polygon required",
                       "coordinates.invalid.min.length");
        }
        for (auto const &polygon : coordinates_)
            result.merge(polygon.validate());
        return result;
    }

    bool MultiPolygon::operator==(const MultiPolygon &other) const {
        return type_ == other.type_ && coordinates_ == other.coordinates_;
    }

    // GeometryCollection

    GeometryCollection::GeometryCollection() : type_(GeoJsonType::GEOMETRY_COLLECTION) {}

    GeometryCollection::GeometryCollection(std::vector<Geometry> geometries)
        : type_(GeoJsonType::GEOMETRY_COLLECTION), geometries_(std::move(geometries)) {}

    GeometryCollection::GeometryCollection(std::string type, std::vector<Geometry> geometries)
        : type_(std::move(type)), geometries_(std::move(geometries)) {}

    GeometryCollection::GeometryCollection(const GeometryCollection &other) = default;
    GeometryCollection::GeometryCollection(GeometryCollection &&other) noexcept = default;
    GeometryCollection &GeometryCollection::operator=(const GeometryCollection &other) = default;
    GeometryCollection &GeometryCollection::operator=(GeometryCollection &&other) noexcept = default;
    GeometryCollection::~GeometryCollection() = default;

    GeometryCollection GeometryCollection::of(const std::vector<Geometry> &geometries) {
        return validateOrThrow(GeometryCollection(geometries));
    }

    size_t GeometryCollection::size() const { return geometries_.size(); }

    bool GeometryCollection::empty() const { return geometries_.empty(); }

    // The nesting check looks at the member's shape and tag only, never at its validity.
    ValidationResult GeometryCollection::validate() const {
        ValidationResult result;
        detail::validateType(result, type_, GeoJsonType::GEOMETRY_COLLECTION);
        bool nested = std::any_of(geometries_.begin(), geometries_.end(), [](const Geometry &g) {
            return std::holds_alternative<GeometryCollection>(g) || typeOf(g) == GeoJsonType::GEOMETRY_COLLECTION;
        });
        if (nested) {
            result.add("geometries", "Field 'geometries' must not have nested 'GeometryCollection'",
                       "geometries.invalid.nested.geometry");
        }
        for (auto const &geometry : geometries_)
            result.merge(geovalid::validate(geometry));
        return result;
    }

    bool GeometryCollection::operator==(const GeometryCollection &other) const {
        return type_ == other.type_ && geometries_ == other.geometries_;
    }

    // Variant helpers

    ValidationResult validate(const Geometry &geometry) {
        return std::visit([](auto const &g) { return g.validate(); }, geometry);
    }

    bool isValid(const Geometry &geometry) { return !validate(geometry).hasErrors(); }

    const std::string &typeOf(const Geometry &geometry) {
        return std::visit([](auto const &g) -> const std::string & { return g.type(); }, geometry);
    }

    std::ostream &operator<<(std::ostream &os, Point const &point) {
        os << "Point{type='" << point.type() << "', coordinates=";
        if (point.coordinates())
            os << *point.coordinates();
        else
            os << "null";
        os << "}";
        return os;
    }

    std::ostream &operator<<(std::ostream &os, MultiPoint const &multi_point) {
        os << "MultiPoint{type='" << multi_point.type() << "', coordinates=" << multi_point.coordinates() << "}";
        return os;
    }

    std::ostream &operator<<(std::ostream &os, LineString const &line_string) {
        os << "LineString{type='" << line_string.type() << "', coordinates=" << line_string.coordinates() << "}";
        return os;
    }

    std::ostream &operator<<(std::ostream &os, MultiLineString const &multi_line_string) {
        os << "MultiLineString{type='" << multi_line_string.type() << "', coordinates=[";
        bool first = true;
        for (auto const &line : multi_line_string.coordinates()) {
            if (!first)
                os << ", ";
            first = false;
            os << line;
        }
        os << "]}";
        return os;
    }

    std::ostream &operator<<(std::ostream &os, Polygon const &polygon) {
        os << "Polygon{type='" << polygon.type() << "', coordinates=" << polygon.coordinates() << "}";
        return os;
    }

    std::ostream &operator<<(std::ostream &os, MultiPolygon const &multi_polygon) {
        os << "MultiPolygon{type='" << multi_polygon.type() << "', coordinates=[";
        bool first = true;
        for (auto const &polygon : multi_polygon.coordinates()) {
            if (!first)
                os << ", ";
            first = false;
            os << polygon;
        }
        os << "]}";
        return os;
    }

    std::ostream &operator<<(std::ostream &os, GeometryCollection const &collection) {
        os << "GeometryCollection{type='" << collection.type() << "', geometries=[";
        bool first = true;
        for (auto const &geometry : collection.geometries()) {
            if (!first)
                os << ", ";
            first = false;
            os << geometry;
        }
        os << "]}";
        return os;
    }

    std::ostream &operator<<(std::ostream &os, Geometry const &geometry) {
        std::visit([&](auto const &g) { os << g; }, geometry);
        return os;
    }

} // namespace geovalid
