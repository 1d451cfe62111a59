#include <doctest/doctest.h>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "index/location_resolver.hpp"
#include "index/street_index.hpp"
#include "index/zone_index.hpp"
#include "interface/tool_interface.hpp"
#include "io/geojson_reader.hpp"
#include "rules/rule_repository.hpp"
#include "test_support.hpp"

using nlohmann::json;

using zonefind::index::LocationResolver;
using zonefind::index::ResolverConfig;
using zonefind::index::StreetSpatialIndex;
using zonefind::index::ZoneSpatialIndex;
using zonefind::io::GeoJSONReader;
using zonefind::rules::JsonRuleRepository;

using tool_interface::parseParkingInputs;
using tool_interface::parseResolverConfig;
using tool_interface::parseStreetIndexConfig;
using tool_interface::parseUrbanismInput;
using tool_interface::processLocationTool;
using tool_interface::processViability;
using tool_interface::processViabilityTool;

namespace {

LocationResolver fixtureResolver() {
    auto zones = std::make_shared<const ZoneSpatialIndex>(
        ZoneSpatialIndex::build(GeoJSONReader::readFromJson(test_support::zoneCollection())));
    auto streets = std::make_shared<const StreetSpatialIndex>(
        StreetSpatialIndex::build(GeoJSONReader::readFromJson(test_support::streetCollection()), 0));
    return LocationResolver(zones, streets, ResolverConfig());
}

bool isError(const std::string& output) {
    return output.rfind("Error", 0) == 0;
}

// Redirects std::cout into a buffer for the lifetime of the guard
class CoutCapture {
public:
    CoutCapture() : previous_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(previous_); }

    std::string str() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

} // namespace

// -----------------------------------------------------------------------------
// Tests for the configuration parsers
// -----------------------------------------------------------------------------

TEST_CASE("configuration parsers read the recognised keys") {
    auto street = parseStreetIndexConfig(json::parse(R"({"file_path": "streets.geojson", "projected_epsg": 31985})"));
    CHECK(street.file_path == "streets.geojson");
    CHECK(street.projected_epsg == 31985);

    CHECK(parseResolverConfig(json::object()).max_street_distance_m == doctest::Approx(120.0));
    CHECK(parseResolverConfig(json::parse(R"({"max_street_distance_m": 60})")).max_street_distance_m ==
          doctest::Approx(60.0));
    CHECK_THROWS_AS(parseResolverConfig(json::parse(R"({"max_street_distance_m": 0})")), std::invalid_argument);
}

TEST_CASE("query inputs accept Portuguese keys and English aliases") {
    json query = json::parse(R"({
        "use_code": "RES_MULTI", "frontage_m": "12,5", "depth_m": 30, "is_corner": "true",
        "usable_area_m2": 900, "near_transit": true,
        "apartments": 10, "apartment_area_m2": 95, "leitos": 4
    })");

    auto urbanism = parseUrbanismInput(query);
    CHECK(urbanism.use.code == "RES_MULTI");
    CHECK(urbanism.frontage_m == doctest::Approx(12.5));
    CHECK(urbanism.is_corner);
    CHECK_FALSE(urbanism.attach_one_side);

    auto parking = parseParkingInputs(query);
    CHECK(parking.usable_area_m2 == doctest::Approx(900.0));
    CHECK(parking.near_transit);
    CHECK(parking.get("apartamentos") == doctest::Approx(10.0));
    CHECK(parking.get("apto_area_m2") == doctest::Approx(95.0));
    CHECK(parking.get("leitos") == doctest::Approx(4.0));
    CHECK(parking.get("lugares") == doctest::Approx(0.0));
}

// -----------------------------------------------------------------------------
// Tests for processViability
// -----------------------------------------------------------------------------

TEST_CASE("small retail on a local street is waived from parking") {
    LocationResolver resolver = fixtureResolver();
    JsonRuleRepository repository(test_support::ruleTables());

    json query = json::parse(R"({"lat": -5.805, "lon": -35.2045, "use_code": "COM_VAREJO",
                                "frontage_m": 10, "depth_m": 30, "usable_area_m2": 80})");
    json result = processViability(resolver, repository, query);

    CHECK(result["location"]["zone_code"] == "ZA");
    CHECK(result["location"]["street_class"] == "Local");
    CHECK(result["local_street"] == true);
    CHECK(result["urbanism"]["status"] == "computed");
    CHECK(result["urbanism"]["max_occupancy_area_m2"].get<double>() == doctest::Approx(180.0));
    CHECK(result["simulation"].is_null());
    CHECK(result["effective_usable_area_m2"].get<double>() == doctest::Approx(80.0));

    CHECK(result["parking"]["status"] == "waived");
    CHECK(result["parking"]["required"] == 0);
    CHECK(result["parking"]["source_ref"] == "LC 208/2022, Annex 5");
    CHECK(result["legacy_parking"].is_null());

    CHECK(result["sanitary"]["status"] == "computed");
    CHECK(result["sanitary"]["profile"] == "COMERCIO");
    CHECK(result["sanitary"]["groups"][0]["note"] == "Single unisex facility");
}

TEST_CASE("an explicit local_street key overrides the street hierarchy") {
    LocationResolver resolver = fixtureResolver();
    JsonRuleRepository repository(test_support::ruleTables());

    json query = json::parse(R"({"lat": -5.805, "lon": -35.2045, "use_code": "COM_VAREJO",
                                "frontage_m": 10, "depth_m": 30, "usable_area_m2": 250,
                                "local_street": false, "near_transit": true})");
    json result = processViability(resolver, repository, query);

    CHECK(result["local_street"] == false);
    CHECK(result["parking"]["status"] == "computed");
    CHECK(result["parking"]["required"] == 4);
    CHECK(result["parking"]["adjustments"].size() == 1);
}

TEST_CASE("single-family studies carry a simulation and the legacy waiver") {
    LocationResolver resolver = fixtureResolver();
    JsonRuleRepository repository(test_support::ruleTables());

    json query = json::parse(R"({"lat": -5.805, "lon": -35.2045, "use_code": "RES_UNI",
                                "frontage_m": 10, "depth_m": 30})");
    json result = processViability(resolver, repository, query);

    REQUIRE(result["simulation"].is_object());
    CHECK(result["simulation"]["mode"] == "automatic_limits");
    CHECK(result["simulation"]["viable"] == true);
    CHECK(result["effective_usable_area_m2"].get<double>() == doctest::Approx(360.0));
    CHECK(result["urbanism"]["implantation_options"].size() == 2);

    CHECK(result["parking"].is_null());
    CHECK(result["legacy_parking"]["status"] == "waived");
    CHECK(result["sanitary"]["status"] == "no_rule");
}

TEST_CASE("multi-family studies without a zone rule still size the parking") {
    LocationResolver resolver = fixtureResolver();
    JsonRuleRepository repository(test_support::ruleTables());

    json query = json::parse(R"({"lat": -5.805, "lon": -35.2045, "use_code": "RES_MULTI",
                                "frontage_m": 20, "depth_m": 30, "apartments": 10, "apartment_area_m2": 95})");
    json result = processViability(resolver, repository, query);

    CHECK(result["urbanism"]["status"] == "no_rule");
    CHECK(result["simulation"]["viable"] == false);
    CHECK(result["legacy_parking"]["status"] == "computed");
    CHECK(result["legacy_parking"]["stalls"] == 15);
}

TEST_CASE("points outside every zone produce a no-rule study") {
    LocationResolver resolver = fixtureResolver();
    JsonRuleRepository repository(test_support::ruleTables());

    json query = json::parse(R"({"lat": -5.70, "lon": -35.2045, "use_code": "COM_VAREJO",
                                "frontage_m": 10, "depth_m": 30, "usable_area_m2": 400})");
    json result = processViability(resolver, repository, query);

    CHECK(result["location"]["zone_found"] == false);
    CHECK(result["urbanism"]["status"] == "no_rule");
    CHECK(result["local_street"] == false);
    CHECK(result["parking"]["required"] == 8);
}

TEST_CASE("processViability requires coordinates") {
    LocationResolver resolver = fixtureResolver();
    JsonRuleRepository repository(test_support::ruleTables());

    CHECK_THROWS_AS(processViability(resolver, repository, json::parse(R"({"lon": -35.2})")),
                    std::invalid_argument);
    CHECK_THROWS_AS(processViability(resolver, repository, json::parse(R"({"lat": "north", "lon": -35.2})")),
                    std::invalid_argument);
}

// -----------------------------------------------------------------------------
// Tests for the string tools
// -----------------------------------------------------------------------------

TEST_CASE("processLocationTool resolves through dataset files") {
    test_support::TempFile zones(test_support::zoneCollection().dump(), ".geojson");
    test_support::TempFile streets(test_support::streetCollection().dump(), ".geojson");

    json zone_config = {{"file_path", zones.path()}};
    json street_config = {{"file_path", streets.path()}};
    std::string output = processLocationTool(zone_config.dump(), street_config.dump(),
                                             R"({"lat": -5.805, "lon": -35.2045})");

    REQUIRE_FALSE(isError(output));
    json result = json::parse(output);
    CHECK(result["zone_code"] == "ZA");
    CHECK(result["street_name"] == "Rua das Flores");

    // Without a street dataset only the zone is resolved
    json zone_only = json::parse(processLocationTool(zone_config.dump(), "", R"({"lat": -5.805, "lon": -35.1955})"));
    CHECK(zone_only["zone_code"] == "ZB");
    CHECK(zone_only["street_found"] == false);
}

TEST_CASE("processLocationTool reports failures as error strings") {
    test_support::TempFile zones(test_support::zoneCollection().dump(), ".geojson");
    json zone_config = {{"file_path", zones.path()}};

    CHECK(processLocationTool("", "", R"({"lat": -5.805, "lon": -35.2045})") ==
          "Error: Zone configuration must contain 'file_path'");
    CHECK(isError(processLocationTool(R"({"file_path": "/nonexistent/zones.geojson"})", "",
                                      R"({"lat": -5.805, "lon": -35.2045})")));
    CHECK(isError(processLocationTool(zone_config.dump(), "", R"({"lat": 95, "lon": -35.2045})")));
    CHECK(isError(processLocationTool(zone_config.dump(), "", R"({"lat": -5.805})")));
    CHECK(isError(processLocationTool(zone_config.dump(), "", "{not json")));
    CHECK(isError(processLocationTool(zone_config.dump(), "",
                                      R"({"lat": -5.805, "lon": -35.2045, "max_street_distance_m": -1})")));
}

TEST_CASE("processViabilityTool runs a complete study from files") {
    test_support::TempFile zones(test_support::zoneCollection().dump(), ".geojson");
    test_support::TempFile streets(test_support::streetCollection().dump(), ".geojson");
    test_support::TempFile rules(test_support::ruleTables().dump(), ".json");

    json zone_config = {{"file_path", zones.path()}};
    json street_config = {{"file_path", streets.path()}};
    json rules_config = {{"file_path", rules.path()}};
    std::string query = R"({"lat": -5.805, "lon": -35.2045, "use_code": "COM_VAREJO",
                            "frontage_m": 10, "depth_m": 30, "usable_area_m2": 400})";

    std::string output = processViabilityTool(zone_config.dump(), street_config.dump(), rules_config.dump(), query);
    REQUIRE_FALSE(isError(output));
    json result = json::parse(output);
    CHECK(result["urbanism"]["record"]["zone_code"] == "ZA");
    CHECK(result["parking"]["required"] == 8);
    CHECK(result["sanitary"]["totals"]["lavatórios"] == 3);

    CHECK(processViabilityTool(zone_config.dump(), street_config.dump(), "", query) ==
          "Error: Rules configuration must contain 'file_path'");
    CHECK(isError(processViabilityTool(zone_config.dump(), street_config.dump(),
                                       R"({"file_path": "/nonexistent/rules.json"})", query)));
}

TEST_CASE("the string tools leave standard output to the caller") {
    test_support::TempFile zones(test_support::zoneCollection().dump(), ".geojson");
    test_support::TempFile streets(test_support::streetCollection().dump(), ".geojson");
    test_support::TempFile rules(test_support::ruleTables().dump(), ".json");

    json zone_config = {{"file_path", zones.path()}};
    json street_config = {{"file_path", streets.path()}};
    json rules_config = {{"file_path", rules.path()}};
    std::string query = R"({"lat": -5.805, "lon": -35.2045, "use_code": "COM_VAREJO",
                            "frontage_m": 10, "depth_m": 30, "usable_area_m2": 400})";

    std::string location;
    std::string study;
    std::string printed;
    {
        CoutCapture capture;
        location = processLocationTool(zone_config.dump(), street_config.dump(), query);
        study = processViabilityTool(zone_config.dump(), street_config.dump(), rules_config.dump(), query);
        printed = capture.str();
    }

    REQUIRE_FALSE(isError(location));
    REQUIRE_FALSE(isError(study));
    CHECK(printed.empty());
    CHECK(json::parse(study)["parking"]["required"] == 8);
}
