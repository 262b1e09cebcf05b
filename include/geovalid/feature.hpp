#pragma once

#include "geovalid/geometry.hpp"
#include "geovalid/validation.hpp"

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace geovalid {

    // Free-form feature properties. Never validated.
    using Properties = boost::json::object;

    class Feature : public Validatable {
      private:
        std::string type_;
        std::optional<std::string> id_;
        std::optional<Geometry> geometry_;
        Properties properties_;

      public:
        Feature();
        Feature(std::optional<std::string> id, std::optional<Geometry> geometry, Properties properties = {});
        Feature(std::string type, std::optional<std::string> id, std::optional<Geometry> geometry,
                Properties properties);

        static Feature of(std::optional<std::string> id, std::optional<Geometry> geometry,
                          Properties properties = {});

        const std::string &type() const { return type_; }
        const std::optional<std::string> &id() const { return id_; }
        const std::optional<Geometry> &geometry() const { return geometry_; }
        const Properties &properties() const { return properties_; }

        // nullptr when the property is not set.
        const boost::json::value *property(const std::string &name) const;
        bool hasProperty(const std::string &name) const { return property(name) != nullptr; }

        ValidationResult validate() const override;

        bool operator==(const Feature &other) const;
        bool operator!=(const Feature &other) const { return !(*this == other); }
    };

    class FeatureCollection : public Validatable {
      private:
        std::string type_;
        std::vector<Feature> features_;

      public:
        FeatureCollection();
        explicit FeatureCollection(std::vector<Feature> features);
        FeatureCollection(std::string type, std::vector<Feature> features);

        static FeatureCollection of(const std::vector<Feature> &features);

        const std::string &type() const { return type_; }
        const std::vector<Feature> &features() const { return features_; }
        size_t size() const { return features_.size(); }
        bool empty() const { return features_.empty(); }

        ValidationResult validate() const override;

        bool operator==(const FeatureCollection &other) const;
        bool operator!=(const FeatureCollection &other) const { return !(*this == other); }

        auto begin() const { return features_.begin(); }
        auto end() const { return features_.end(); }
    };

    // Anything a GeoJSON document can hold at the top level, keyed by its `type` member.
    using GeoJson = std::variant<Point, MultiPoint, LineString, MultiLineString, Polygon, MultiPolygon,
                                 GeometryCollection, Feature, FeatureCollection>;

    ValidationResult validate(const GeoJson &geojson);
    bool isValid(const GeoJson &geojson);
    const std::string &typeOf(const GeoJson &geojson);

    // nullopt for Feature and FeatureCollection.
    std::optional<Geometry> asGeometry(const GeoJson &geojson);
    GeoJson toGeoJson(const Geometry &geometry);

    std::ostream &operator<<(std::ostream &os, Feature const &feature);
    std::ostream &operator<<(std::ostream &os, FeatureCollection const &fc);
    std::ostream &operator<<(std::ostream &os, GeoJson const &geojson);

} // namespace geovalid
