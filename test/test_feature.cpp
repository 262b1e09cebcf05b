#include <doctest/doctest.h>

#include "geovalid/geovalid.hpp"

#include <optional>
#include <variant>
#include <vector>

using namespace geovalid;

TEST_CASE("Feature - Construction and properties") {
    Properties props{{"name", "Dam"}, {"height", 12}};
    auto feature = Feature::of("f1", Point::of(4.89, 52.37), props);

    CHECK(feature.type() == "Feature");
    REQUIRE(feature.id().has_value());
    CHECK(*feature.id() == "f1");
    REQUIRE(feature.geometry().has_value());
    CHECK(std::holds_alternative<Point>(*feature.geometry()));
    CHECK(feature.properties().size() == 2);

    SUBCASE("Property lookup") {
        REQUIRE(feature.hasProperty("name"));
        CHECK(feature.property("name")->as_string() == "Dam");
        CHECK(feature.property("height")->as_int64() == 12);
        CHECK(feature.property("missing") == nullptr);
        CHECK_FALSE(feature.hasProperty("missing"));
    }

    SUBCASE("Id and properties are optional") {
        Feature bare(std::nullopt, Point(Position(1, 2)));
        CHECK_FALSE(bare.id().has_value());
        CHECK(bare.properties().empty());
        CHECK(bare.isValid());
    }

    SUBCASE("Properties are never validated") {
        Properties odd{{"coordinates", 999}, {"type", "Nonsense"}};
        Feature f("x", Point(Position(1, 2)), odd);
        CHECK(f.isValid());
    }

    SUBCASE("Equality") {
        CHECK(feature == Feature("f1", Point(Position(4.89, 52.37)), props));
        CHECK(feature != Feature("f2", Point(Position(4.89, 52.37)), props));
        CHECK(feature != Feature("f1", Point(Position(4.89, 52.37))));
    }
}

TEST_CASE("Feature - Validation") {
    SUBCASE("Missing geometry") {
        Feature feature(std::string("f1"), std::nullopt);
        auto result = feature.validate();
        REQUIRE(result.size() == 1);
        CHECK(result.begin()->field() == "geometry");
        CHECK(result.begin()->key() == "geometry.invalid.empty");
        CHECK_THROWS_AS(Feature::of("f1", std::nullopt), ValidationException);
    }

    SUBCASE("Geometry errors are reported under the geometry field") {
        Feature feature(std::nullopt, Point(Position(200, 0)));
        auto result = feature.validate();
        REQUIRE(result.size() == 1);
        CHECK(result.begin()->field() == "geometry.coordinates");
        CHECK(result.begin()->key() == "coordinates.longitude.invalid");
    }

    SUBCASE("Geometry type errors keep their key") {
        Feature feature(std::nullopt, Point("point", Position(1, 2)));
        auto result = feature.validate();
        CHECK(result.containsField("geometry.type"));
        CHECK(result.contains("type.invalid"));
    }

    SUBCASE("Wrong feature type") {
        Feature feature("feature", std::nullopt, Point(Position(1, 2)), {});
        auto result = feature.validate();
        CHECK(result.size() == 1);
        CHECK(result.containsField("type"));
    }
}

TEST_CASE("Feature - FeatureCollection") {
    SUBCASE("Empty collection is valid") {
        FeatureCollection fc;
        CHECK(fc.type() == "FeatureCollection");
        CHECK(fc.empty());
        CHECK(fc.isValid());
    }

    SUBCASE("Feature without geometry invalidates the collection") {
        FeatureCollection fc(std::vector<Feature>{Feature(std::nullopt, std::nullopt)});
        auto result = fc.validate();
        CHECK(result.hasErrors());
        CHECK(result.containsField("geometry"));
        CHECK(result.contains("geometry.invalid.empty"));
    }

    SUBCASE("Errors of all features are merged") {
        std::vector<Feature> features{Feature("a", Point(Position(1, 2))), Feature("b", Point(Position(200, 2))),
                                      Feature("c", LineString({Position(0, 0)}))};
        FeatureCollection fc(features);
        CHECK(fc.size() == 3);

        auto result = fc.validate();
        CHECK(result.size() == 2);
        CHECK(result.contains("coordinates.longitude.invalid"));
        CHECK(result.contains("coordinates.invalid.min.length"));
        CHECK_THROWS_AS(FeatureCollection::of(features), ValidationException);
    }

    SUBCASE("Iteration") {
        auto fc = FeatureCollection::of({Feature::of("a", Point::of(1, 2)), Feature::of("b", Point::of(3, 4))});
        std::vector<std::string> ids;
        for (auto const &feature : fc)
            ids.push_back(feature.id().value_or(""));
        const std::vector<std::string> expected{"a", "b"};
        CHECK(ids == expected);
    }

    SUBCASE("Wrong type") {
        FeatureCollection fc("featureCollection", {});
        CHECK(fc.validate().contains("type.invalid"));
    }
}

TEST_CASE("Feature - GeoJson helpers") {
    GeoJson point = Point(Position(1, 2));
    GeoJson feature = Feature(std::nullopt, Point(Position(1, 2)));
    GeoJson fc = FeatureCollection();

    CHECK(typeOf(point) == "Point");
    CHECK(typeOf(feature) == "Feature");
    CHECK(typeOf(fc) == "FeatureCollection");

    CHECK(asGeometry(point).has_value());
    CHECK_FALSE(asGeometry(feature).has_value());
    CHECK_FALSE(asGeometry(fc).has_value());

    Geometry geometry = Polygon(PolygonCoordinates(LinearRing{}));
    GeoJson wrapped = toGeoJson(geometry);
    CHECK(std::holds_alternative<Polygon>(wrapped));
    CHECK(validate(wrapped) == validate(geometry));
    CHECK_FALSE(isValid(wrapped));
    CHECK(isValid(fc));
}
