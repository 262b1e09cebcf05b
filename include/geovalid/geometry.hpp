#pragma once

#include "geovalid/types.hpp"
#include "geovalid/validation.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace geovalid {

    class Point;
    class MultiPoint;
    class LineString;
    class MultiLineString;
    class Polygon;
    class MultiPolygon;
    class GeometryCollection;

    // Closed set of geometry shapes. GeometryCollection may hold any of them except itself.
    using Geometry = std::variant<Point, MultiPoint, LineString, MultiLineString, Polygon, MultiPolygon,
                                  GeometryCollection>;

    // Every geometry keeps the `type` string it was built or decoded with. Constructors never
    // validate; the static of(...) factories do and throw ValidationException.

    // Coordinates may be absent, as after decoding `{"type":"Point"}`.
    class Point : public Validatable {
      private:
        std::string type_;
        std::optional<Position> coordinates_;

      public:
        Point();
        explicit Point(Position coordinates);
        Point(std::string type, std::optional<Position> coordinates);

        static Point of(const Position &coordinates);
        static Point of(double longitude, double latitude);
        static Point of(double longitude, double latitude, double altitude);

        const std::string &type() const { return type_; }
        const std::optional<Position> &coordinates() const { return coordinates_; }
        bool hasCoordinates() const { return coordinates_.has_value(); }

        ValidationResult validate() const override;

        bool operator==(const Point &other) const;
        bool operator!=(const Point &other) const { return !(*this == other); }
    };

    class MultiPoint : public Validatable {
      private:
        std::string type_;
        std::vector<Position> coordinates_;

      public:
        MultiPoint();
        explicit MultiPoint(std::vector<Position> coordinates);
        MultiPoint(std::string type, std::vector<Position> coordinates);

        static MultiPoint of(const std::vector<Position> &coordinates);

        const std::string &type() const { return type_; }
        const std::vector<Position> &coordinates() const { return coordinates_; }

        ValidationResult validate() const override;

        bool operator==(const MultiPoint &other) const;
        bool operator!=(const MultiPoint &other) const { return !(*this == other); }
    };

    class LineString : public Validatable {
      private:
        std::string type_;
        std::vector<Position> coordinates_;

      public:
        LineString();
        explicit LineString(std::vector<Position> coordinates);
        LineString(std::string type, std::vector<Position> coordinates);

        static LineString of(const std::vector<Position> &coordinates);

        const std::string &type() const { return type_; }
        const std::vector<Position> &coordinates() const { return coordinates_; }

        ValidationResult validate() const override;

        bool operator==(const LineString &other) const;
        bool operator!=(const LineString &other) const { return !(*this == other); }
    };

    class MultiLineString : public Validatable {
      private:
        std::string type_;
        std::vector<std::vector<Position>> coordinates_;

      public:
        MultiLineString();
        explicit MultiLineString(std::vector<std::vector<Position>> coordinates);
        MultiLineString(std::string type, std::vector<std::vector<Position>> coordinates);

        static MultiLineString of(const std::vector<std::vector<Position>> &coordinates);

        const std::string &type() const { return type_; }
        const std::vector<std::vector<Position>> &coordinates() const { return coordinates_; }

        ValidationResult validate() const override;

        bool operator==(const MultiLineString &other) const;
        bool operator!=(const MultiLineString &other) const { return !(*this == other); }
    };

    class Polygon : public Validatable {
      private:
        std::string type_;
        PolygonCoordinates coordinates_;

      public:
        Polygon();
        explicit Polygon(PolygonCoordinates coordinates);
        Polygon(std::string type, PolygonCoordinates coordinates);

        static Polygon of(const PolygonCoordinates &coordinates);
        static Polygon of(const std::vector<LinearRing> &linear_rings);
        static Polygon of(const LinearRing &exterior, const std::vector<LinearRing> &holes = {});

        const std::string &type() const { return type_; }
        const PolygonCoordinates &coordinates() const { return coordinates_; }

        ValidationResult validate() const override;

        bool operator==(const Polygon &other) const;
        bool operator!=(const Polygon &other) const { return !(*this == other); }
    };

    class MultiPolygon : public Validatable {
      private:
        std::string type_;
        std::vector<PolygonCoordinates> coordinates_;

      public:
        MultiPolygon();
        explicit MultiPolygon(std::vector<PolygonCoordinates> coordinates);
        MultiPolygon(std::string type, std::vector<PolygonCoordinates> coordinates);

        static MultiPolygon of(const std::vector<PolygonCoordinates> &coordinates);

        const std::string &type() const { return type_; }
        const std::vector<PolygonCoordinates> &coordinates() const { return coordinates_; }

        ValidationResult validate() const override;

        bool operator==(const MultiPolygon &other) const;
        bool operator!=(const MultiPolygon &other) const { return !(*this == other); }
    };

    // Special members are defined out of line, where Geometry is a complete type.
    class GeometryCollection : public Validatable {
      private:
        std::string type_;
        std::vector<Geometry> geometries_;

      public:
        GeometryCollection();
        explicit GeometryCollection(std::vector<Geometry> geometries);
        GeometryCollection(std::string type, std::vector<Geometry> geometries);
        GeometryCollection(const GeometryCollection &other);
        GeometryCollection(GeometryCollection &&other) noexcept;
        GeometryCollection &operator=(const GeometryCollection &other);
        GeometryCollection &operator=(GeometryCollection &&other) noexcept;
        ~GeometryCollection() override;

        static GeometryCollection of(const std::vector<Geometry> &geometries);

        const std::string &type() const { return type_; }
        const std::vector<Geometry> &geometries() const { return geometries_; }
        size_t size() const;
        bool empty() const;

        ValidationResult validate() const override;

        bool operator==(const GeometryCollection &other) const;
        bool operator!=(const GeometryCollection &other) const { return !(*this == other); }
    };

    ValidationResult validate(const Geometry &geometry);
    bool isValid(const Geometry &geometry);
    const std::string &typeOf(const Geometry &geometry);

    std::ostream &operator<<(std::ostream &os, Point const &point);
    std::ostream &operator<<(std::ostream &os, MultiPoint const &multi_point);
    std::ostream &operator<<(std::ostream &os, LineString const &line_string);
    std::ostream &operator<<(std::ostream &os, MultiLineString const &multi_line_string);
    std::ostream &operator<<(std::ostream &os, Polygon const &polygon);
    std::ostream &operator<<(std::ostream &os, MultiPolygon const &multi_polygon);
    std::ostream &operator<<(std::ostream &os, GeometryCollection const &collection);
    std::ostream &operator<<(std::ostream &os, Geometry const &geometry);

} // namespace geovalid
