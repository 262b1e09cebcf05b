#include "geovalid/feature.hpp"

#include <boost/json/serialize.hpp>

#include <ostream>
#include <type_traits>
#include <utility>

namespace geovalid {

    // Feature

    Feature::Feature() : type_(GeoJsonType::FEATURE) {}

    Feature::Feature(std::optional<std::string> id, std::optional<Geometry> geometry, Properties properties)
        : type_(GeoJsonType::FEATURE), id_(std::move(id)), geometry_(std::move(geometry)),
          properties_(std::move(properties)) {}

    Feature::Feature(std::string type, std::optional<std::string> id, std::optional<Geometry> geometry,
                     Properties properties)
        : type_(std::move(type)), id_(std::move(id)), geometry_(std::move(geometry)),
          properties_(std::move(properties)) {}

    Feature Feature::of(std::optional<std::string> id, std::optional<Geometry> geometry, Properties properties) {
        return validateOrThrow(Feature(std::move(id), std::move(geometry), std::move(properties)));
    }

    const boost::json::value *Feature::property(const std::string &name) const {
        return properties_.if_contains(name);
    }

    // Geometry errors keep their key but are reported under "geometry.<field>".
    ValidationResult Feature::validate() const {
        ValidationResult result;
        detail::validateType(result, type_, GeoJsonType::FEATURE);
        if (!geometry_) {
            result.add("geometry", "geometry should not be empty/blank", "geometry.invalid.empty");
            return result;
        }
        for (auto const &e : geovalid::validate(*geometry_))
            result.add("geometry." + e.field(), e.message(), e.key());
        return result;
    }

    bool Feature::operator==(const Feature &other) const {
        return type_ == other.type_ && id_ == other.id_ && geometry_ == other.geometry_ &&
               properties_ == other.properties_;
    }

    // FeatureCollection

    FeatureCollection::FeatureCollection() : type_(GeoJsonType::FEATURE_COLLECTION) {}

    FeatureCollection::FeatureCollection(std::vector<Feature> features)
        : type_(GeoJsonType::FEATURE_COLLECTION), features_(std::move(features)) {}

    FeatureCollection::FeatureCollection(std::string type, std::vector<Feature> features)
        : type_(std::move(type)), features_(std::move(features)) {}

    FeatureCollection FeatureCollection::of(const std::vector<Feature> &features) {
        return validateOrThrow(FeatureCollection(features));
    }

    // An empty collection is valid.
    ValidationResult FeatureCollection::validate() const {
        ValidationResult result;
        detail::validateType(result, type_, GeoJsonType::FEATURE_COLLECTION);
        for (auto const &feature : features_)
            result.merge(feature.validate());
        return result;
    }

    bool FeatureCollection::operator==(const FeatureCollection &other) const {
        return type_ == other.type_ && features_ == other.features_;
    }

    // GeoJson helpers

    ValidationResult validate(const GeoJson &geojson) {
        return std::visit([](auto const &g) { return g.validate(); }, geojson);
    }

    bool isValid(const GeoJson &geojson) { return !validate(geojson).hasErrors(); }

    const std::string &typeOf(const GeoJson &geojson) {
        return std::visit([](auto const &g) -> const std::string & { return g.type(); }, geojson);
    }

    std::optional<Geometry> asGeometry(const GeoJson &geojson) {
        return std::visit(
            [](auto const &g) -> std::optional<Geometry> {
                using T = std::decay_t<decltype(g)>;
                if constexpr (std::is_same_v<T, Feature> || std::is_same_v<T, FeatureCollection>) {
                    return std::nullopt;
                } else {
                    return Geometry{g};
                }
            },
            geojson);
    }

    GeoJson toGeoJson(const Geometry &geometry) {
        return std::visit([](auto const &g) -> GeoJson { return g; }, geometry);
    }

    std::ostream &operator<<(std::ostream &os, Feature const &feature) {
        os << "Feature{type='" << feature.type() << "', id='" << feature.id().value_or("") << "', geometry=";
        if (feature.geometry())
            os << *feature.geometry();
        else
            os << "null";
        os << ", properties=" << boost::json::serialize(feature.properties()) << "}";
        return os;
    }

    std::ostream &operator<<(std::ostream &os, FeatureCollection const &fc) {
        os << "FeatureCollection{type='" << fc.type() << "', features=[";
        bool first = true;
        for (auto const &f : fc) {
            if (!first)
                os << ", ";
            first = false;
            os << f;
        }
        os << "]}";
        return os;
    }

    std::ostream &operator<<(std::ostream &os, GeoJson const &geojson) {
        std::visit([&](auto const &g) { os << g; }, geojson);
        return os;
    }

} // namespace geovalid
