#pragma once

#include "geovalid/validation.hpp"

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace geovalid {

    // Canonical discriminator values, case-sensitive.
    namespace GeoJsonType {
        inline constexpr const char *POINT = "Point";
        inline constexpr const char *MULTI_POINT = "MultiPoint";
        inline constexpr const char *LINE_STRING = "LineString";
        inline constexpr const char *MULTI_LINE_STRING = "MultiLineString";
        inline constexpr const char *POLYGON = "Polygon";
        inline constexpr const char *MULTI_POLYGON = "MultiPolygon";
        inline constexpr const char *GEOMETRY_COLLECTION = "GeometryCollection";
        inline constexpr const char *FEATURE = "Feature";
        inline constexpr const char *FEATURE_COLLECTION = "FeatureCollection";
    } // namespace GeoJsonType

    // [longitude, latitude, altitude?]. Any arity is representable so that decoded data
    // can be reported by validate() instead of being rejected.
    class Position : public Validatable {
      private:
        std::vector<double> coordinates_;

      public:
        // [NaN, NaN]
        Position();
        explicit Position(std::vector<double> coordinates);
        Position(double longitude, double latitude);
        Position(double longitude, double latitude, double altitude);

        static Position of(const std::vector<double> &coordinates);
        static Position of(double longitude, double latitude);
        static Position of(double longitude, double latitude, double altitude);

        const std::vector<double> &coordinates() const { return coordinates_; }
        size_t size() const { return coordinates_.size(); }
        bool empty() const { return coordinates_.empty(); }

        // Absent elements read as NaN.
        double longitude() const;
        double latitude() const;
        double altitude() const;
        bool hasAltitude() const { return coordinates_.size() > 2; }

        ValidationResult validate() const override;

        bool operator==(const Position &other) const;
        bool operator!=(const Position &other) const { return !(*this == other); }
    };

    std::ostream &operator<<(std::ostream &os, Position const &position);
    std::ostream &operator<<(std::ostream &os, std::vector<Position> const &positions);

    using LinearRing = std::vector<Position>;

    class PolygonCoordinates : public Validatable {
      private:
        LinearRing exterior_;
        std::vector<LinearRing> holes_;

      public:
        PolygonCoordinates() = default;
        explicit PolygonCoordinates(LinearRing exterior, std::vector<LinearRing> holes = {});
        // Ring 0 is the exterior, the rest are holes. No rings gives an empty exterior.
        explicit PolygonCoordinates(const std::vector<LinearRing> &linear_rings);

        static PolygonCoordinates of(const std::vector<LinearRing> &linear_rings);
        static PolygonCoordinates of(const LinearRing &exterior, const std::vector<LinearRing> &holes = {});

        const LinearRing &exterior() const { return exterior_; }
        const std::vector<LinearRing> &holes() const { return holes_; }

        // [exterior, holes...]
        std::vector<LinearRing> coordinates() const;

        ValidationResult validate() const override;

        bool operator==(const PolygonCoordinates &other) const;
        bool operator!=(const PolygonCoordinates &other) const { return !(*this == other); }
    };

    std::ostream &operator<<(std::ostream &os, PolygonCoordinates const &coordinates);

} // namespace geovalid

namespace std {
    template <> struct hash<geovalid::Position> {
        size_t operator()(const geovalid::Position &position) const noexcept;
    };
} // namespace std
