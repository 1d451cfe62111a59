#include <doctest/doctest.h>
#include <memory>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "geo/coordinate_projector.hpp"
#include "index/street_index.hpp"
#include "io/geojson_reader.hpp"
#include "test_support.hpp"

using nlohmann::json;

using zonefind::geo::CoordinateProjector;
using zonefind::geo::GeospatialDataset;
using zonefind::geo::Point;
using zonefind::index::StreetSpatialIndex;
using zonefind::io::GeoJSONReader;

namespace {

StreetSpatialIndex buildFixtureIndex() {
    return StreetSpatialIndex::build(GeoJSONReader::readFromJson(test_support::streetCollection()), 0);
}

// 0.0018 degree of longitude east of the local street, about 199 m at this latitude
const Point TWO_HUNDRED_METERS_EAST(-35.2032, -5.805);

} // namespace

// -----------------------------------------------------------------------------
// Tests for StreetSpatialIndex
// -----------------------------------------------------------------------------

TEST_CASE("build projects streets to the UTM zone of the dataset") {
    StreetSpatialIndex index = buildFixtureIndex();

    CHECK(index.getStreetCount() == 2);
    CHECK(index.getSegmentCount() == 2);
    REQUIRE(index.getProjector());
    CHECK(index.getProjector()->getProjectedEPSG() == 32725);
}

TEST_CASE("findNearest returns the closest street within the radius") {
    StreetSpatialIndex index = buildFixtureIndex();

    auto match = index.findNearest(Point(-35.2045, -5.805), 120.0);
    REQUIRE(match.has_value());
    CHECK(match->street_index == 0);
    CHECK(match->properties["log_ofic"] == "Rua das Flores");
    CHECK(match->distance_m == doctest::Approx(55.4).epsilon(0.02));
}

TEST_CASE("findNearest honours the search radius") {
    StreetSpatialIndex index = buildFixtureIndex();

    CHECK_FALSE(index.findNearest(TWO_HUNDRED_METERS_EAST, 120.0).has_value());

    auto match = index.findNearest(TWO_HUNDRED_METERS_EAST, 250.0);
    REQUIRE(match.has_value());
    CHECK(match->street_index == 0);
    CHECK(match->distance_m > 190.0);
    CHECK(match->distance_m < 210.0);
}

TEST_CASE("findNearest without a radius always finds a street") {
    StreetSpatialIndex index = buildFixtureIndex();

    auto match = index.findNearest(Point(-35.10, -5.805));
    REQUIRE(match.has_value());
    CHECK(match->street_index == 1);
    CHECK(match->distance_m > 9000.0);
}

TEST_CASE("a point on a street vertex is at distance zero") {
    StreetSpatialIndex index = buildFixtureIndex();

    auto match = index.findNearest(Point(-35.195, -5.79), 1.0);
    REQUIRE(match.has_value());
    CHECK(match->street_index == 1);
    CHECK(match->distance_m < 1e-6);

    // Projected meridians bend slightly, so mid-segment points are within centimeters
    auto mid = index.findNearest(Point(-35.195, -5.80), 1.0);
    REQUIRE(mid.has_value());
    CHECK(mid->distance_m < 0.5);
}

TEST_CASE("equidistant streets resolve to the lowest index") {
    json collection = json::parse(R"({"type": "FeatureCollection", "features": [
        {"type": "Feature", "properties": {"name": "First"},
         "geometry": {"type": "LineString", "coordinates": [[-35.205, -5.82], [-35.205, -5.79]]}},
        {"type": "Feature", "properties": {"name": "Second"},
         "geometry": {"type": "LineString", "coordinates": [[-35.205, -5.82], [-35.205, -5.79]]}}
    ]})");
    StreetSpatialIndex index = StreetSpatialIndex::build(GeoJSONReader::readFromJson(collection), 32725);

    for (int i = 0; i < 5; ++i) {
        auto match = index.findNearest(Point(-35.2045, -5.805), 120.0);
        REQUIRE(match.has_value());
        CHECK(match->properties["name"] == "First");
    }
}

TEST_CASE("multi-line streets index every part") {
    json collection = json::parse(R"({"type": "FeatureCollection", "features": [
        {"type": "Feature", "properties": {"name": "Split"},
         "geometry": {"type": "MultiLineString", "coordinates": [
             [[-35.205, -5.82], [-35.205, -5.81], [-35.204, -5.80]],
             [[-35.195, -5.82], [-35.195, -5.79]]
         ]}},
        {"type": "Feature", "properties": {"name": "Zone"},
         "geometry": {"type": "Polygon", "coordinates": [[[0, 0], [1, 0], [1, 1], [0, 0]]]}}
    ]})");
    StreetSpatialIndex index = StreetSpatialIndex::build(GeoJSONReader::readFromJson(collection), 32725);

    CHECK(index.getStreetCount() == 1);
    CHECK(index.getSegmentCount() == 3);

    auto match = index.findNearest(Point(-35.1955, -5.805), 120.0);
    REQUIRE(match.has_value());
    CHECK(match->properties["name"] == "Split");
}

TEST_CASE("an empty street index answers every query with nothing") {
    StreetSpatialIndex index = StreetSpatialIndex::build(GeospatialDataset(), 0);

    CHECK(index.empty());
    CHECK_FALSE(index.getProjector());
    CHECK_FALSE(index.findNearest(Point(-35.2045, -5.805), 120.0).has_value());
}

TEST_CASE("a shared projector can serve several indexes") {
    auto projector = std::make_shared<const CoordinateProjector>(31985);
    auto dataset = GeoJSONReader::readFromJson(test_support::streetCollection());

    StreetSpatialIndex first = StreetSpatialIndex::build(dataset, projector);
    StreetSpatialIndex second = StreetSpatialIndex::build(dataset, projector);

    auto a = first.findNearest(Point(-35.2045, -5.805), 120.0);
    auto b = second.findNearest(Point(-35.2045, -5.805), 120.0);
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    CHECK(a->distance_m == doctest::Approx(b->distance_m));

    CHECK_THROWS_AS(StreetSpatialIndex::build(dataset, std::shared_ptr<const CoordinateProjector>()),
                    std::invalid_argument);
}
